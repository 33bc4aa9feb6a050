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

#ifndef caustic_Polygon_hpp
#define caustic_Polygon_hpp

#include "Config.hpp"
#include "System/Types.hpp"

namespace caustic {

// A clip-space vertex and its weights relative to the three source vertices.
struct ClipVertex
{
	float4 position;
	float3 weights;
};

// A convex polygon being clipped, starting out as a triangle.
struct Polygon
{
	Polygon(const float4 &P0, const float4 &P1, const float4 &P2)
	{
		V[0] = { P0, float3(1.0f, 0.0f, 0.0f) };
		V[1] = { P1, float3(0.0f, 1.0f, 0.0f) };
		V[2] = { P2, float3(0.0f, 0.0f, 1.0f) };

		n = 3;
	}

	int n;                                 // Number of vertices
	ClipVertex V[MAX_CLIPPED_VERTICES];  // Current vertices
};

}  // namespace caustic

#endif  // caustic_Polygon_hpp
