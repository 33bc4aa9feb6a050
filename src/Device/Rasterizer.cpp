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

#include "Rasterizer.hpp"

#include "Config.hpp"
#include "PixelProcessor.hpp"
#include "Primitive.hpp"
#include "System/Math.hpp"

#include <cmath>

namespace {

// Nearest pixel. A coordinate on the far edge of the bounds, half a pixel
// past the last center, belongs to the last pixel.
int toPixel(float c, int last)
{
	int p = caustic::iround(c);
	return (p == last + 1 && c <= last + 0.5f) ? last : p;
}

}  // anonymous namespace

namespace caustic {

Rasterizer::Rasterizer(PixelProcessor &pixelProcessor, int cluster, int clusterCount)
    : pixelProcessor(pixelProcessor)
    , cluster(cluster)
    , clusterCount(clusterCount)
{
}

bool Rasterizer::ownsRow(int y) const
{
	return (y / BLOCK_SIZE) % clusterCount == cluster;
}

void Rasterizer::rasterize(const Primitive &primitive)
{
	if(primitive.xMin > primitive.xMax || primitive.yMin > primitive.yMax)
	{
		return;
	}

	pixelProcessor.setPrimitive(primitive);

	switch(primitive.type)
	{
	case Primitive::TRIANGLE:
		rasterizeTriangle(primitive);
		break;
	case Primitive::LINE:
		rasterizeLine(primitive);
		break;
	case Primitive::POINT:
		rasterizePoint(primitive);
		break;
	}
}

// Half-space rasterization in 28.4 fixed point. Pixel samples are at integer
// coordinates. A pixel is covered when it is strictly inside all three edges;
// top and left edges are biased by one so that their pixels are included.
// A pixel on an edge shared by two triangles is thus drawn exactly once.
void Rasterizer::rasterizeTriangle(const Primitive &primitive)
{
	int i1 = 0;
	int i2 = 1;
	int i3 = 2;

	int64_t X[3];
	int64_t Y[3];
	for(int i = 0; i < 3; i++)
	{
		X[i] = static_cast<int64_t>(std::lround(SUBPIXEL_SCALE * primitive.v[i].x));
		Y[i] = static_cast<int64_t>(std::lround(SUBPIXEL_SCALE * primitive.v[i].y));
	}

	// The edge functions are positive inside for one winding only.
	int64_t det = (X[1] - X[2]) * (Y[0] - Y[1]) - (Y[1] - Y[2]) * (X[0] - X[1]);
	if(det == 0)
	{
		return;
	}
	else if(det < 0)
	{
		i2 = 2;
		i3 = 1;
		det = -det;
	}

	const int64_t X1 = X[i1], X2 = X[i2], X3 = X[i3];
	const int64_t Y1 = Y[i1], Y2 = Y[i2], Y3 = Y[i3];

	const int64_t DX12 = X1 - X2;
	const int64_t DX23 = X2 - X3;
	const int64_t DX31 = X3 - X1;

	const int64_t DY12 = Y1 - Y2;
	const int64_t DY23 = Y2 - Y3;
	const int64_t DY31 = Y3 - Y1;

	const int64_t FDX12 = DX12 << SUBPIXEL_BITS;
	const int64_t FDX23 = DX23 << SUBPIXEL_BITS;
	const int64_t FDX31 = DX31 << SUBPIXEL_BITS;

	const int64_t FDY12 = DY12 << SUBPIXEL_BITS;
	const int64_t FDY23 = DY23 << SUBPIXEL_BITS;
	const int64_t FDY31 = DY31 << SUBPIXEL_BITS;

	// Bounding rectangle, exclusive of the right and bottom end
	int minx = static_cast<int>((min(X1, X2, X3) + 0xF) >> SUBPIXEL_BITS);
	int maxx = static_cast<int>((max(X1, X2, X3) + 0xF) >> SUBPIXEL_BITS);
	int miny = static_cast<int>((min(Y1, Y2, Y3) + 0xF) >> SUBPIXEL_BITS);
	int maxy = static_cast<int>((max(Y1, Y2, Y3) + 0xF) >> SUBPIXEL_BITS);

	minx = max(minx, primitive.xMin);
	miny = max(miny, primitive.yMin);
	maxx = min(maxx, primitive.xMax + 1);
	maxy = min(maxy, primitive.yMax + 1);

	if(minx >= maxx || miny >= maxy)
	{
		return;
	}

	// Half-edge constants
	int64_t C1 = DY12 * X1 - DX12 * Y1;
	int64_t C2 = DY23 * X2 - DX23 * Y2;
	int64_t C3 = DY31 * X3 - DX31 * Y3;

	// Fill convention
	if(DY12 < 0 || (DY12 == 0 && DX12 > 0)) C1++;
	if(DY23 < 0 || (DY23 == 0 && DX23 > 0)) C2++;
	if(DY31 < 0 || (DY31 == 0 && DX31 > 0)) C3++;

	const double invDet = 1.0 / static_cast<double>(det);
	const int q = BLOCK_SIZE;

	for(int by = miny & ~(q - 1); by < maxy; by += q)
	{
		if(!ownsRow(by))
		{
			continue;
		}

		for(int bx = minx & ~(q - 1); bx < maxx; bx += q)
		{
			// Corners of the block
			int64_t x0 = static_cast<int64_t>(bx) << SUBPIXEL_BITS;
			int64_t x1 = static_cast<int64_t>(bx + q - 1) << SUBPIXEL_BITS;
			int64_t y0 = static_cast<int64_t>(by) << SUBPIXEL_BITS;
			int64_t y1 = static_cast<int64_t>(by + q - 1) << SUBPIXEL_BITS;

			// Skip the block when all corners are outside one edge
			bool a00 = C1 + DX12 * y0 - DY12 * x0 > 0;
			bool a10 = C1 + DX12 * y0 - DY12 * x1 > 0;
			bool a01 = C1 + DX12 * y1 - DY12 * x0 > 0;
			bool a11 = C1 + DX12 * y1 - DY12 * x1 > 0;

			bool b00 = C2 + DX23 * y0 - DY23 * x0 > 0;
			bool b10 = C2 + DX23 * y0 - DY23 * x1 > 0;
			bool b01 = C2 + DX23 * y1 - DY23 * x0 > 0;
			bool b11 = C2 + DX23 * y1 - DY23 * x1 > 0;

			bool c00 = C3 + DX31 * y0 - DY31 * x0 > 0;
			bool c10 = C3 + DX31 * y0 - DY31 * x1 > 0;
			bool c01 = C3 + DX31 * y1 - DY31 * x0 > 0;
			bool c11 = C3 + DX31 * y1 - DY31 * x1 > 0;

			if(!(a00 || a10 || a01 || a11) || !(b00 || b10 || b01 || b11) || !(c00 || c10 || c01 || c11))
			{
				continue;
			}

			int64_t CY1 = C1 + DX12 * y0 - DY12 * x0;
			int64_t CY2 = C2 + DX23 * y0 - DY23 * x0;
			int64_t CY3 = C3 + DX31 * y0 - DY31 * x0;

			for(int y = by; y < by + q; y++)
			{
				int64_t CX1 = CY1;
				int64_t CX2 = CY2;
				int64_t CX3 = CY3;

				for(int x = bx; x < bx + q; x++)
				{
					if(CX1 > 0 && CX2 > 0 && CX3 > 0 &&
					   x >= minx && x < maxx && y >= miny && y < maxy)
					{
						// CX2 is opposite vertex 1, CX3 opposite vertex 2, CX1 opposite vertex 3.
						float r = static_cast<float>(CX2 * invDet);
						float t = static_cast<float>(CX1 * invDet);
						float s = 1.0f - r - t;

						float3 weights(0.0f);
						weights[i1] = r;
						weights[i2] = s;
						weights[i3] = t;

						pixelProcessor.processFragment(x, y, weights);
					}

					CX1 -= FDY12;
					CX2 -= FDY23;
					CX3 -= FDY31;
				}

				CY1 += FDX12;
				CY2 += FDX23;
				CY3 += FDX31;
			}
		}
	}
}

void Rasterizer::rasterizeLine(const Primitive &primitive)
{
	const float4 &P0 = primitive.v[0];
	const float4 &P1 = primitive.v[1];

	float dx = P1.x - P0.x;
	float dy = P1.y - P0.y;

	// Step one pixel at a time along the major axis.
	bool xMajor = std::abs(dx) >= std::abs(dy);
	float start = xMajor ? P0.x : P0.y;
	float delta = xMajor ? dx : dy;

	int from = iround(min(start, start + delta));
	int to = toPixel(max(start, start + delta), xMajor ? primitive.xMax : primitive.yMax);

	for(int i = from; i <= to; i++)
	{
		float t = (delta != 0.0f) ? clamp01((i - start) / delta) : 0.0f;

		int x = xMajor ? i : toPixel(P0.x + t * dx, primitive.xMax);
		int y = xMajor ? toPixel(P0.y + t * dy, primitive.yMax) : i;

		if(x < primitive.xMin || x > primitive.xMax || y < primitive.yMin || y > primitive.yMax || !ownsRow(y))
		{
			continue;
		}

		pixelProcessor.processFragment(x, y, float3(1.0f - t, t, 0.0f));
	}
}

void Rasterizer::rasterizePoint(const Primitive &primitive)
{
	int x = toPixel(primitive.v[0].x, primitive.xMax);
	int y = toPixel(primitive.v[0].y, primitive.yMax);

	if(x < primitive.xMin || x > primitive.xMax || y < primitive.yMin || y > primitive.yMax || !ownsRow(y))
	{
		return;
	}

	pixelProcessor.processFragment(x, y, float3(1.0f, 0.0f, 0.0f));
}

}  // namespace caustic
