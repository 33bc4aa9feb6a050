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

#ifndef caustic_PixelProcessor_hpp
#define caustic_PixelProcessor_hpp

#include "ShaderBuffer.hpp"
#include "System/Types.hpp"

#include <vector>

namespace caustic {

class Renderer;
class ShaderImplementation;
struct Primitive;

// Shades fragments and writes them to the renderer's buffers. Each cluster
// has its own instance, so records are never shared between threads.
class PixelProcessor
{
public:
	PixelProcessor(Renderer &renderer, const ShaderImplementation &fragmentShader, const std::vector<ShaderBuffer> &vertices);

	// Loads the source vertex outputs of the primitive about to be rasterized.
	void setPrimitive(const Primitive &primitive);

	// Processes the fragment at pixel (x, y). 'weights' are the screen-space
	// barycentric weights relative to the primitive's vertices.
	void processFragment(int x, int y, const float3 &weights);

private:
	Renderer &renderer;
	const ShaderImplementation &fragmentShader;
	const std::vector<ShaderBuffer> &vertices;

	const Primitive *primitive = nullptr;
	std::vector<ShaderBuffer> source;
	ShaderBuffer fragmentIn;
	ShaderBuffer fragmentOut;
};

}  // namespace caustic

#endif  // caustic_PixelProcessor_hpp
