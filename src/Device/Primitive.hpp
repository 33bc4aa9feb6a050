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

#ifndef caustic_Primitive_hpp
#define caustic_Primitive_hpp

#include "System/Types.hpp"

#include <cstdint>

namespace caustic {

// The values match the OpenGL enumerants.
enum class DrawingMode : uint32_t
{
	POINTS = 0x0000,
	LINES = 0x0001,
	LINE_LOOP = 0x0002,
	LINE_STRIP = 0x0003,
	TRIANGLES = 0x0004,
	TRIANGLE_STRIP = 0x0005,
	TRIANGLE_FAN = 0x0006,
};

enum class PolygonMode : uint32_t
{
	POINT = 0x1B00,
	LINE = 0x1B01,
	FILL = 0x1B02,
};

enum class Capability
{
	BLEND,
	CULL_FACE,
	DEPTH_CLAMP,
	DEPTH_TEST,
};

// A point, line or triangle in window coordinates, ready for rasterization.
struct Primitive
{
	enum Type
	{
		POINT = 1,
		LINE = 2,
		TRIANGLE = 3,
	};

	Type type;

	// Window x and y, depth in [0, 1], and 1/w.
	float4 v[3];

	// Weights of each vertex relative to the source vertex outputs. Clipping
	// creates vertices in between the sources.
	float3 weights[3];

	// Indices of the source vertex outputs.
	int source[3];
	int sourceCount;

	// Inclusive pixel bounds the primitive may cover.
	int xMin;
	int xMax;
	int yMin;
	int yMax;
};

}  // namespace caustic

#endif  // caustic_Primitive_hpp
