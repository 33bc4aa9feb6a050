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

#include "Clipper.hpp"

#include "Polygon.hpp"
#include "System/Math.hpp"

namespace {

// Signed distance to a plane, non-negative on the inside.
inline float distance(const caustic::float4 &v, int plane)
{
	switch(plane)
	{
	case caustic::Clipper::CLIP_RIGHT: return v.w - v.x;
	case caustic::Clipper::CLIP_TOP: return v.w - v.y;
	case caustic::Clipper::CLIP_FAR: return v.w - v.z;
	case caustic::Clipper::CLIP_LEFT: return v.w + v.x;
	case caustic::Clipper::CLIP_BOTTOM: return v.w + v.y;
	case caustic::Clipper::CLIP_NEAR: return v.w + v.z;
	}

	return 0.0f;
}

inline void clipEdge(caustic::ClipVertex &Vo, const caustic::ClipVertex &Vi, const caustic::ClipVertex &Vj, float di, float dj)
{
	float D = 1.0f / (dj - di);

	for(int c = 0; c < 4; c++)
	{
		Vo.position[c] = (dj * Vi.position[c] - di * Vj.position[c]) * D;
	}

	for(int c = 0; c < 3; c++)
	{
		Vo.weights[c] = (dj * Vi.weights[c] - di * Vj.weights[c]) * D;
	}
}

void clipPlane(caustic::Polygon &polygon, int plane)
{
	caustic::ClipVertex T[caustic::MAX_CLIPPED_VERTICES];
	const caustic::ClipVertex *V = polygon.V;

	int t = 0;

	for(int i = 0; i < polygon.n; i++)
	{
		int j = i == polygon.n - 1 ? 0 : i + 1;

		float di = distance(V[i].position, plane);
		float dj = distance(V[j].position, plane);

		if(di >= 0)
		{
			T[t++] = V[i];

			if(dj < 0)
			{
				clipEdge(T[t++], V[i], V[j], di, dj);
			}
		}
		else
		{
			if(dj > 0)
			{
				clipEdge(T[t++], V[j], V[i], dj, di);
			}
		}
	}

	for(int i = 0; i < t; i++)
	{
		polygon.V[i] = T[i];
	}

	polygon.n = t;
}

}  // anonymous namespace

namespace caustic {

int Clipper::ComputeClipFlags(const float4 &v, bool depthClamp)
{
	int flags = ((v.x > v.w) ? CLIP_RIGHT : 0) |
	            ((v.y > v.w) ? CLIP_TOP : 0) |
	            ((v.x < -v.w) ? CLIP_LEFT : 0) |
	            ((v.y < -v.w) ? CLIP_BOTTOM : 0);

	if(!depthClamp)
	{
		flags |= ((v.z > v.w) ? CLIP_FAR : 0) |
		         ((v.z < -v.w) ? CLIP_NEAR : 0);
	}

	return flags;
}

bool Clipper::Clip(Polygon &polygon, int clipFlagsOr)
{
	for(int plane = CLIP_RIGHT; plane <= CLIP_NEAR; plane <<= 1)
	{
		if(clipFlagsOr & plane)
		{
			clipPlane(polygon, plane);

			if(polygon.n < 3)
			{
				return false;
			}
		}
	}

	return true;
}

bool Clipper::ClipLine(const float4 &P0, const float4 &P1, int clipFlagsOr, float &t0, float &t1)
{
	t0 = 0.0f;
	t1 = 1.0f;

	for(int plane = CLIP_RIGHT; plane <= CLIP_NEAR; plane <<= 1)
	{
		if(!(clipFlagsOr & plane))
		{
			continue;
		}

		float d0 = distance(P0, plane);
		float d1 = distance(P1, plane);

		if(d0 < 0 && d1 < 0)
		{
			return false;
		}

		if(d0 < 0)
		{
			t0 = max(t0, d0 / (d0 - d1));
		}
		else if(d1 < 0)
		{
			t1 = min(t1, d0 / (d0 - d1));
		}
	}

	return t0 <= t1;
}

}  // namespace caustic
