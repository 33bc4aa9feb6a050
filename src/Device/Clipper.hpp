// Copyright 2016 The SwiftShader Authors. All Rights Reserved.
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

#ifndef caustic_Clipper_hpp
#define caustic_Clipper_hpp

#include "System/Types.hpp"

namespace caustic {

struct Polygon;

// Clipping against the view volume -w <= x, y, z <= w.
struct Clipper
{
	enum ClipFlags
	{
		// Indicates the vertex is outside the respective plane
		CLIP_RIGHT = 1 << 0,
		CLIP_TOP = 1 << 1,
		CLIP_FAR = 1 << 2,
		CLIP_LEFT = 1 << 3,
		CLIP_BOTTOM = 1 << 4,
		CLIP_NEAR = 1 << 5,

		CLIP_FRUSTUM = 0x003F,
		CLIP_SIDES = CLIP_RIGHT | CLIP_TOP | CLIP_LEFT | CLIP_BOTTOM,
	};

	// Planes the vertex is outside of. Depth clamping ignores the near and far planes.
	static int ComputeClipFlags(const float4 &v, bool depthClamp);

	// Sutherland-Hodgman clipping against the planes in 'clipFlagsOr'. Returns
	// false when nothing of the polygon remains.
	static bool Clip(Polygon &polygon, int clipFlagsOr);

	// Clips the segment from P0 to P1. On success t0 and t1 are the parameters
	// of the visible part, with 0 <= t0 <= t1 <= 1.
	static bool ClipLine(const float4 &P0, const float4 &P1, int clipFlagsOr, float &t0, float &t1);
};

}  // namespace caustic

#endif  // caustic_Clipper_hpp
