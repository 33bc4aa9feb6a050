// Copyright 2021 The Caustic Authors. All Rights Reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//    http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef caustic_SoftwareContext_hpp
#define caustic_SoftwareContext_hpp

#include "Caustic/Context.hpp"
#include "Device/Renderer.hpp"
#include "System/CausticConfig.hpp"

#include "marl/scheduler.h"

#include <memory>

namespace caustic {

class Display;

// Context of the software backend. Rendering happens in a Renderer owned by
// the context.
//
// When the renderer uses more than one cluster and the creating thread has no
// marl scheduler bound, create() binds one to that thread and destroy()
// unbinds it, so both must be called from the same thread.
class SoftwareContext : public Context
{
public:
	explicit SoftwareContext(const Configuration &config);
	~SoftwareContext() override;

	void create() override;
	void destroy() override;

	std::unique_ptr<FrameBuffer> newFrameBuffer() override;
	std::unique_ptr<Program> newProgram() override;
	std::unique_ptr<Shader> newShader() override;
	std::unique_ptr<Texture> newTexture() override;
	std::unique_ptr<VertexArray> newVertexArray() override;

	void setWindowTitle(const std::string &title) override;
	std::string getWindowTitle() const override;
	void setWindowSize(int width, int height) override;
	int getWindowWidth() const override;
	int getWindowHeight() const override;
	bool isWindowCloseRequested() const override;

	void updateDisplay() override;

	void setClearColor(const float4 &color) override;
	void clearCurrentBuffer() override;

	void enableCapability(Capability capability) override;
	void disableCapability(Capability capability) override;
	bool isCapabilityEnabled(Capability capability) const override;

	void setDepthMask(bool enabled) override;

	using Context::setBlendingFunctions;
	void setBlendingFunctions(int bufferIndex, BlendFunction source, BlendFunction destination) override;

	void setViewPort(const Rectangle &viewPort) override;
	Rectangle getViewPort() const override;

	std::vector<uint8_t> readFrame(const Rectangle &region, InternalFormat format) const override;

	GLVersion getGLVersion() const override { return GLVersion::SOFTWARE; }

	// The display presented to by updateDisplay(). Not owned; null renders
	// off-screen.
	void setDisplay(Display *display);

	Renderer &getRenderer() { return renderer; }
	const Renderer &getRenderer() const { return renderer; }

private:
	const Configuration config;
	Renderer renderer;
	std::unique_ptr<marl::Scheduler> scheduler;
};

}  // namespace caustic

#endif  // caustic_SoftwareContext_hpp
