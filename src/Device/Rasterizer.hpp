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

#ifndef caustic_Rasterizer_hpp
#define caustic_Rasterizer_hpp

namespace caustic {

class PixelProcessor;
struct Primitive;

// Finds the pixels covered by primitives, restricted to the row bands of one
// cluster. Rows are grouped in bands of BLOCK_SIZE, and band b belongs to
// cluster b % clusterCount.
class Rasterizer
{
public:
	Rasterizer(PixelProcessor &pixelProcessor, int cluster, int clusterCount);

	void rasterize(const Primitive &primitive);

	bool ownsRow(int y) const;

private:
	void rasterizeTriangle(const Primitive &primitive);
	void rasterizeLine(const Primitive &primitive);
	void rasterizePoint(const Primitive &primitive);

	PixelProcessor &pixelProcessor;
	const int cluster;
	const int clusterCount;
};

}  // namespace caustic

#endif  // caustic_Rasterizer_hpp
