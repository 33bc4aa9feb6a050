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

#ifndef caustic_Context_hpp
#define caustic_Context_hpp

#include "Creatable.hpp"
#include "GLVersioned.hpp"
#include "Device/Primitive.hpp"
#include "Device/TextureFormat.hpp"
#include "System/Rectangle.hpp"
#include "System/Types.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace caustic {

class FrameBuffer;
class Program;
class Shader;
class Texture;
class VertexArray;

// The values match the OpenGL enumerants.
enum class BlendFunction : uint32_t
{
	ZERO = 0x0000,
	ONE = 0x0001,
	SRC_COLOR = 0x0300,
	ONE_MINUS_SRC_COLOR = 0x0301,
	SRC_ALPHA = 0x0302,
	ONE_MINUS_SRC_ALPHA = 0x0303,
	DST_ALPHA = 0x0304,
	ONE_MINUS_DST_ALPHA = 0x0305,
	DST_COLOR = 0x0306,
	ONE_MINUS_DST_COLOR = 0x0307,
	SRC_ALPHA_SATURATE = 0x0308,
	CONSTANT_COLOR = 0x8001,
	ONE_MINUS_CONSTANT_COLOR = 0x8002,
	CONSTANT_ALPHA = 0x8003,
	ONE_MINUS_CONSTANT_ALPHA = 0x8004,
};

// The entry point of a backend. Creates the other objects, and owns the
// window surface and the state that applies to draw calls.
//
// Objects created by a context must be destroyed before it.
class Context : public Creatable, public GLVersioned
{
public:
	virtual std::unique_ptr<FrameBuffer> newFrameBuffer() = 0;
	virtual std::unique_ptr<Program> newProgram() = 0;
	virtual std::unique_ptr<Shader> newShader() = 0;
	virtual std::unique_ptr<Texture> newTexture() = 0;
	virtual std::unique_ptr<VertexArray> newVertexArray() = 0;

	virtual void setWindowTitle(const std::string &title) = 0;
	virtual std::string getWindowTitle() const = 0;
	virtual void setWindowSize(int width, int height) = 0;
	virtual int getWindowWidth() const = 0;
	virtual int getWindowHeight() const = 0;
	virtual bool isWindowCloseRequested() const = 0;

	// Presents the current frame.
	virtual void updateDisplay() = 0;

	virtual void setClearColor(const float4 &color) = 0;
	virtual void clearCurrentBuffer() = 0;

	virtual void enableCapability(Capability capability) = 0;
	virtual void disableCapability(Capability capability) = 0;
	virtual bool isCapabilityEnabled(Capability capability) const = 0;

	virtual void setDepthMask(bool enabled) = 0;

	// A negative buffer index applies to all buffers.
	virtual void setBlendingFunctions(int bufferIndex, BlendFunction source, BlendFunction destination) = 0;
	void setBlendingFunctions(BlendFunction source, BlendFunction destination)
	{
		setBlendingFunctions(-1, source, destination);
	}

	virtual void setViewPort(const Rectangle &viewPort) = 0;
	virtual Rectangle getViewPort() const = 0;

	// Reads a region of the current frame, bottom row first.
	virtual std::vector<uint8_t> readFrame(const Rectangle &region, InternalFormat format) const = 0;
};

}  // namespace caustic

#endif  // caustic_Context_hpp
