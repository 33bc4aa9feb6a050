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

#include "Renderer.hpp"

#include "Clipper.hpp"
#include "Config.hpp"
#include "Conversion.hpp"
#include "Display.hpp"
#include "PixelProcessor.hpp"
#include "Polygon.hpp"
#include "Rasterizer.hpp"
#include "ShaderImplementation.hpp"
#include "System/Debug.hpp"
#include "System/Math.hpp"

#include "marl/defer.h"
#include "marl/scheduler.h"
#include "marl/waitgroup.h"

#include <algorithm>
#include <cfloat>
#include <iterator>

namespace {

caustic::ClipVertex interpolate(const caustic::ClipVertex &a, const caustic::ClipVertex &b, float t)
{
	caustic::ClipVertex v;

	for(int c = 0; c < 4; c++)
	{
		v.position[c] = caustic::lerp(a.position[c], b.position[c], t);
	}

	for(int c = 0; c < 3; c++)
	{
		v.weights[c] = caustic::lerp(a.weights[c], b.weights[c], t);
	}

	return v;
}

bool isBackFacing(const caustic::float4 &P1, const caustic::float4 &P2, const caustic::float4 &P3)
{
	const float dx31 = P3.x / P3.w - P1.x / P1.w;
	const float dy31 = P3.y / P3.w - P1.y / P1.w;
	const float dx21 = P2.x / P2.w - P1.x / P1.w;
	const float dy21 = P2.y / P2.w - P1.y / P1.w;

	// Counter-clockwise triangles face the viewer.
	return dy31 * dx21 - dx31 * dy21 <= FLT_EPSILON;
}

}  // anonymous namespace

namespace caustic {

Renderer::Renderer(const Configuration &config)
    : boundsChecking(config.boundsChecking)
    , clusterCount(static_cast<int>(getClusterCount(config)))
{
}

Renderer::~Renderer()
{
	dispose();
}

void Renderer::init()
{
	if(viewPort.getArea() == 0)
	{
		viewPort = Rectangle(0, 0, width, height);
	}

	pixels.assign(static_cast<size_t>(width) * height, clearColor);
	depths.assign(static_cast<size_t>(width) * height, DEPTH_CLEAR);
	initialized = true;

	TRACE("Renderer initialized at %dx%d with %d clusters", width, height, clusterCount);
}

void Renderer::dispose()
{
	pixels.clear();
	pixels.shrink_to_fit();
	depths.clear();
	depths.shrink_to_fit();

	textures.clear();
	program = nullptr;
	initialized = false;
}

void Renderer::setDisplay(Display *newDisplay)
{
	display = newDisplay;

	if(display)
	{
		display->setTitle(title);
	}
}

void Renderer::setWindowTitle(const std::string &newTitle)
{
	title = newTitle;

	if(display)
	{
		display->setTitle(title);
	}
}

bool Renderer::isCloseRequested() const
{
	return display && display->isCloseRequested();
}

void Renderer::setWindowSize(int newWidth, int newHeight)
{
	if(newWidth < 0 || newHeight < 0 || newWidth > MAX_FRAMEBUFFER_DIM || newHeight > MAX_FRAMEBUFFER_DIM)
	{
		ABORT("Invalid window size %dx%d", newWidth, newHeight);
	}

	width = newWidth;
	height = newHeight;

	if(initialized)
	{
		pixels.assign(static_cast<size_t>(width) * height, clearColor);
		depths.assign(static_cast<size_t>(width) * height, DEPTH_CLEAR);
	}
}

void Renderer::setCapabilityEnabled(Capability capability, bool enabled)
{
	capabilities.set(static_cast<size_t>(capability), enabled);
}

bool Renderer::isCapabilityEnabled(Capability capability) const
{
	return capabilities.test(static_cast<size_t>(capability));
}

void Renderer::bindTexture(int unit, const std::shared_ptr<const Surface> &texture)
{
	if(unit < 0 || unit >= MAX_TEXTURE_UNITS)
	{
		ABORT("Texture unit %d is not within 0 to %d", unit, MAX_TEXTURE_UNITS - 1);
	}

	textures[unit] = texture;
}

void Renderer::unbindTexture(const Surface *texture)
{
	for(auto it = textures.begin(); it != textures.end();)
	{
		std::shared_ptr<const Surface> bound = it->second.lock();
		it = (!bound || bound.get() == texture) ? textures.erase(it) : std::next(it);
	}
}

std::shared_ptr<const Surface> Renderer::getTexture(int unit) const
{
	auto it = textures.find(unit);
	return (it != textures.end()) ? it->second.lock() : nullptr;
}

void Renderer::clearPixels()
{
	std::fill(pixels.begin(), pixels.end(), clearColor);
	std::fill(depths.begin(), depths.end(), DEPTH_CLEAR);
}

void Renderer::render()
{
	if(display && initialized)
	{
		display->present(pixels.data(), width, height);
	}
}

bool Renderer::checkBounds(int x, int y) const
{
	if(x >= 0 && x < width && y >= 0 && y < height)
	{
		return true;
	}

	if(boundsChecking)
	{
		ABORT("(%d, %d) is not within (0, 0) to (%d, %d)", x, y, width - 1, height - 1);
	}

	return false;
}

bool Renderer::testDepth(int x, int y, int16_t z) const
{
	if(!checkBounds(x, y))
	{
		return false;
	}

	return !isCapabilityEnabled(Capability::DEPTH_TEST) || z <= depths[y * width + x];
}

void Renderer::writePixel(int x, int y, int16_t z, uint32_t argb)
{
	if(!checkBounds(x, y))
	{
		return;
	}

	int index = y * width + x;
	pixels[index] = argb;

	if(isCapabilityEnabled(Capability::DEPTH_TEST) && depthWriting)
	{
		depths[index] = z;
	}
}

uint32_t Renderer::readPixel(int x, int y) const
{
	return checkBounds(x, y) ? pixels[y * width + x] : 0;
}

int16_t Renderer::readDepth(int x, int y) const
{
	return checkBounds(x, y) ? depths[y * width + x] : DEPTH_CLEAR;
}

std::vector<uint8_t> Renderer::readFrame(const Rectangle &rectangle, TextureFormat format) const
{
	if(rectangle.x < 0 || rectangle.y < 0 || rectangle.width < 0 || rectangle.height < 0 ||
	   rectangle.x + rectangle.width > width || rectangle.y + rectangle.height > height)
	{
		ABORT("Frame region (%d, %d, %d, %d) is not within the %dx%d surface",
		      rectangle.x, rectangle.y, rectangle.width, rectangle.height, width, height);
	}

	DataType type = format.getComponentType();
	int count = format.getComponentCount();
	std::vector<uint8_t> frame(static_cast<size_t>(rectangle.getArea()) * format.getBytes());

	size_t index = 0;
	for(int row = rectangle.height - 1; row >= 0; row--)
	{
		for(int column = 0; column < rectangle.width; column++)
		{
			float4 color = unpack(pixels[(rectangle.y + row) * width + rectangle.x + column]);

			for(int channel = 0; channel < 4; channel++)
			{
				int c = format.getComponentIndex(channel);
				if(c >= 0)
				{
					write(frame.data(), type, fromFloat(type, color[channel], true), index + c);
				}
			}

			index += count;
		}
	}

	return frame;
}

float4 Renderer::toWindow(const float4 &position) const
{
	const float invW = 1.0f / position.w;

	// Normalized device coordinates, with y pointing down
	float x = position.x * invW;
	float y = -position.y * invW;
	float z = position.z * invW;

	// Pixel centers lie on integer coordinates, so the view spans half a
	// pixel beyond the first and last centers.
	x = (x + 1.0f) / 2.0f * viewPort.width + viewPort.x - 0.5f;
	y = (y + 1.0f) / 2.0f * viewPort.height + viewPort.y - 0.5f;
	z = clamp01((z + 1.0f) / 2.0f);

	return float4(x, y, z, invW);
}

void Renderer::setBounds(Primitive &primitive) const
{
	primitive.xMin = max(viewPort.x, 0);
	primitive.yMin = max(viewPort.y, 0);
	primitive.xMax = min(viewPort.x + viewPort.width, width) - 1;
	primitive.yMax = min(viewPort.y + viewPort.height, height) - 1;
}

void Renderer::addPoint(const ClipVertex &v, const int *source, int sourceCount, std::vector<Primitive> &primitives) const
{
	if(Clipper::ComputeClipFlags(v.position, isCapabilityEnabled(Capability::DEPTH_CLAMP)) != 0 || v.position.w <= 0.0f)
	{
		return;
	}

	Primitive primitive = {};
	primitive.type = Primitive::POINT;
	primitive.v[0] = toWindow(v.position);
	primitive.weights[0] = v.weights;
	primitive.sourceCount = sourceCount;
	for(int i = 0; i < sourceCount; i++)
	{
		primitive.source[i] = source[i];
	}
	setBounds(primitive);

	primitives.push_back(primitive);
}

void Renderer::addLine(const ClipVertex &v0, const ClipVertex &v1, const int *source, int sourceCount, std::vector<Primitive> &primitives) const
{
	bool depthClamp = isCapabilityEnabled(Capability::DEPTH_CLAMP);
	int flags0 = Clipper::ComputeClipFlags(v0.position, depthClamp);
	int flags1 = Clipper::ComputeClipFlags(v1.position, depthClamp);

	if(flags0 & flags1)
	{
		return;  // Both ends outside the same plane
	}

	float t0 = 0.0f;
	float t1 = 1.0f;
	if((flags0 | flags1) && !Clipper::ClipLine(v0.position, v1.position, flags0 | flags1, t0, t1))
	{
		return;
	}

	ClipVertex V0 = interpolate(v0, v1, t0);
	ClipVertex V1 = interpolate(v0, v1, t1);

	if(V0.position.w <= 0.0f || V1.position.w <= 0.0f)
	{
		return;
	}

	Primitive primitive = {};
	primitive.type = Primitive::LINE;
	primitive.v[0] = toWindow(V0.position);
	primitive.v[1] = toWindow(V1.position);
	primitive.weights[0] = V0.weights;
	primitive.weights[1] = V1.weights;
	primitive.sourceCount = sourceCount;
	for(int i = 0; i < sourceCount; i++)
	{
		primitive.source[i] = source[i];
	}
	setBounds(primitive);

	primitives.push_back(primitive);
}

void Renderer::setupPoints(const std::vector<float4> &positions, std::vector<Primitive> &primitives) const
{
	for(int i = 0; i < static_cast<int>(positions.size()); i++)
	{
		const int source[1] = { i };
		addPoint({ positions[i], float3(1.0f, 0.0f, 0.0f) }, source, 1, primitives);
	}
}

void Renderer::setupLines(const std::vector<float4> &positions, std::vector<Primitive> &primitives) const
{
	for(int i = 0; i + 1 < static_cast<int>(positions.size()); i += 2)
	{
		const int source[2] = { i, i + 1 };
		addLine({ positions[i], float3(1.0f, 0.0f, 0.0f) },
		        { positions[i + 1], float3(0.0f, 1.0f, 0.0f) },
		        source, 2, primitives);
	}
}

void Renderer::setupTriangles(const std::vector<float4> &positions, PolygonMode polygonMode, std::vector<Primitive> &primitives) const
{
	const bool cullFace = isCapabilityEnabled(Capability::CULL_FACE);
	const bool depthClamp = isCapabilityEnabled(Capability::DEPTH_CLAMP);

	for(int i = 0; i + 2 < static_cast<int>(positions.size()); i += 3)
	{
		const float4 &P0 = positions[i];
		const float4 &P1 = positions[i + 1];
		const float4 &P2 = positions[i + 2];

		if(cullFace && isBackFacing(P0, P1, P2))
		{
			continue;
		}

		int flags0 = Clipper::ComputeClipFlags(P0, depthClamp);
		int flags1 = Clipper::ComputeClipFlags(P1, depthClamp);
		int flags2 = Clipper::ComputeClipFlags(P2, depthClamp);

		if(flags0 & flags1 & flags2)
		{
			continue;  // All vertices outside the same plane
		}

		const int source[3] = { i, i + 1, i + 2 };
		Polygon polygon(P0, P1, P2);

		switch(polygonMode)
		{
		case PolygonMode::FILL:
			{
				int clipFlagsOr = flags0 | flags1 | flags2;
				if(clipFlagsOr && !Clipper::Clip(polygon, clipFlagsOr))
				{
					continue;
				}

				float4 window[MAX_CLIPPED_VERTICES];
				bool visible = true;
				for(int k = 0; k < polygon.n; k++)
				{
					visible = visible && polygon.V[k].position.w > 0.0f;
					window[k] = toWindow(polygon.V[k].position);
				}

				if(!visible)
				{
					continue;
				}

				// Triangle fan around the first vertex
				for(int k = 1; k + 1 < polygon.n; k++)
				{
					const int corner[3] = { 0, k, k + 1 };

					Primitive primitive = {};
					primitive.type = Primitive::TRIANGLE;
					for(int c = 0; c < 3; c++)
					{
						primitive.v[c] = window[corner[c]];
						primitive.weights[c] = polygon.V[corner[c]].weights;
						primitive.source[c] = source[c];
					}
					primitive.sourceCount = 3;
					setBounds(primitive);

					primitives.push_back(primitive);
				}
			}
			break;
		case PolygonMode::LINE:
			addLine(polygon.V[0], polygon.V[1], source, 3, primitives);
			addLine(polygon.V[1], polygon.V[2], source, 3, primitives);
			addLine(polygon.V[2], polygon.V[0], source, 3, primitives);
			break;
		case PolygonMode::POINT:
			addPoint(polygon.V[0], source, 3, primitives);
			addPoint(polygon.V[1], source, 3, primitives);
			addPoint(polygon.V[2], source, 3, primitives);
			break;
		default:
			UNSUPPORTED("polygon mode 0x%X", static_cast<uint32_t>(polygonMode));
			return;
		}
	}
}

void Renderer::processPixels(const std::vector<Primitive> &primitives, const std::vector<ShaderBuffer> &vertices, const ShaderImplementation &fragmentShader, int cluster)
{
	PixelProcessor pixelProcessor(*this, fragmentShader, vertices);
	Rasterizer rasterizer(pixelProcessor, cluster, clusterCount);

	// Submission order, so later primitives overwrite earlier ones.
	for(const auto &primitive : primitives)
	{
		rasterizer.rasterize(primitive);
	}
}

void Renderer::draw(DrawingMode mode, PolygonMode polygonMode, std::vector<ShaderBuffer> &vertices, const ShaderImplementation &fragmentShader)
{
	if(!initialized)
	{
		ABORT("Drawing with an uninitialized renderer");
	}

	if(vertices.empty())
	{
		return;
	}

	// The first output slot of the vertex shader is the clip-space position.
	std::vector<float4> positions;
	positions.reserve(vertices.size());
	for(const auto &vertex : vertices)
	{
		positions.emplace_back(bit_cast<float>(vertex.getRaw(0)), bit_cast<float>(vertex.getRaw(1)),
		                       bit_cast<float>(vertex.getRaw(2)), bit_cast<float>(vertex.getRaw(3)));
	}

	std::vector<Primitive> primitives;

	switch(mode)
	{
	case DrawingMode::POINTS:
		setupPoints(positions, primitives);
		break;
	case DrawingMode::LINES:
		setupLines(positions, primitives);
		break;
	case DrawingMode::TRIANGLES:
		setupTriangles(positions, polygonMode, primitives);
		break;
	default:
		UNSUPPORTED("drawing mode 0x%X", static_cast<uint32_t>(mode));
		return;
	}

	if(primitives.empty())
	{
		return;
	}

	if(clusterCount > 1 && marl::Scheduler::get())
	{
		marl::WaitGroup wg(clusterCount);

		for(int cluster = 0; cluster < clusterCount; cluster++)
		{
			marl::schedule([=, &primitives, &vertices, &fragmentShader] {
				defer(wg.done());
				processPixels(primitives, vertices, fragmentShader, cluster);
			});
		}

		wg.wait();
	}
	else
	{
		for(int cluster = 0; cluster < clusterCount; cluster++)
		{
			processPixels(primitives, vertices, fragmentShader, cluster);
		}
	}
}

}  // namespace caustic
