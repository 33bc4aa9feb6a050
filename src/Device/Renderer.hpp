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

#ifndef caustic_Renderer_hpp
#define caustic_Renderer_hpp

#include "Primitive.hpp"
#include "ShaderBuffer.hpp"
#include "TextureFormat.hpp"
#include "System/CausticConfig.hpp"
#include "System/Rectangle.hpp"

#include <bitset>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace caustic {

class Display;
class ShaderImplementation;
class SoftwareProgram;
class Surface;
struct ClipVertex;

// The software rasterizer. Owns the color and depth buffers of the window
// surface and the state that applies to draw calls.
class Renderer
{
public:
	explicit Renderer(const Configuration &config);
	~Renderer();

	Renderer(const Renderer &) = delete;
	Renderer &operator=(const Renderer &) = delete;

	// Allocates the buffers at the current window size.
	void init();
	void dispose();
	bool isInitialized() const { return initialized; }

	void setDisplay(Display *display);
	void setWindowTitle(const std::string &title);
	const std::string &getWindowTitle() const { return title; }
	bool isCloseRequested() const;

	// Resizing discards the contents of the buffers.
	void setWindowSize(int width, int height);
	int getWidth() const { return width; }
	int getHeight() const { return height; }

	void setViewPort(const Rectangle &rectangle) { viewPort = rectangle; }
	const Rectangle &getViewPort() const { return viewPort; }

	void setCapabilityEnabled(Capability capability, bool enabled);
	bool isCapabilityEnabled(Capability capability) const;

	void setClearColor(uint32_t argb) { clearColor = argb; }
	uint32_t getClearColor() const { return clearColor; }

	void setDepthWriting(bool enabled) { depthWriting = enabled; }
	bool isDepthWriting() const { return depthWriting; }

	void setProgram(SoftwareProgram *newProgram) { program = newProgram; }
	SoftwareProgram *getProgram() const { return program; }

	// The renderer does not keep the texture alive.
	void bindTexture(int unit, const std::shared_ptr<const Surface> &texture);
	// Unbinds 'texture' from every unit it is bound to.
	void unbindTexture(const Surface *texture);
	// Returns null for an empty unit or a texture that no longer exists.
	std::shared_ptr<const Surface> getTexture(int unit) const;

	// Fills the color buffer with the clear color and the depth buffer with
	// the maximum depth.
	void clearPixels();

	// Presents the color buffer to the display.
	void render();

	// Passes if depth testing is disabled, or if z <= the stored depth.
	bool testDepth(int x, int y, int16_t z) const;
	// Writes the color, and the depth when testing and depth writing are on.
	void writePixel(int x, int y, int16_t z, uint32_t argb);

	uint32_t readPixel(int x, int y) const;
	int16_t readDepth(int x, int y) const;
	const std::vector<uint32_t> &getPixels() const { return pixels; }

	// Copies a region of the color buffer converted to 'format', bottom row first.
	std::vector<uint8_t> readFrame(const Rectangle &rectangle, TextureFormat format) const;

	// Rasterizes the vertex outputs, indexed in order, and shades the covered
	// pixels with the fragment shader.
	void draw(DrawingMode mode, PolygonMode polygonMode, std::vector<ShaderBuffer> &vertices, const ShaderImplementation &fragmentShader);

	int getClusterCount() const { return clusterCount; }

private:
	bool checkBounds(int x, int y) const;

	void setupPoints(const std::vector<float4> &positions, std::vector<Primitive> &primitives) const;
	void setupLines(const std::vector<float4> &positions, std::vector<Primitive> &primitives) const;
	void setupTriangles(const std::vector<float4> &positions, PolygonMode polygonMode, std::vector<Primitive> &primitives) const;

	void addPoint(const ClipVertex &v, const int *source, int sourceCount, std::vector<Primitive> &primitives) const;
	void addLine(const ClipVertex &v0, const ClipVertex &v1, const int *source, int sourceCount, std::vector<Primitive> &primitives) const;
	void setBounds(Primitive &primitive) const;
	float4 toWindow(const float4 &position) const;

	void processPixels(const std::vector<Primitive> &primitives, const std::vector<ShaderBuffer> &vertices, const ShaderImplementation &fragmentShader, int cluster);

	const bool boundsChecking;
	const int clusterCount;

	bool initialized = false;
	int width = 0;
	int height = 0;
	std::string title;
	Display *display = nullptr;

	Rectangle viewPort;
	std::bitset<4> capabilities;
	uint32_t clearColor = 0xFF000000;
	bool depthWriting = true;

	std::vector<uint32_t> pixels;
	std::vector<int16_t> depths;

	SoftwareProgram *program = nullptr;
	std::map<int, std::weak_ptr<const Surface>> textures;
};

}  // namespace caustic

#endif  // caustic_Renderer_hpp
