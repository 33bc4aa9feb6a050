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

#ifndef caustic_Surface_hpp
#define caustic_Surface_hpp

#include "TextureFormat.hpp"
#include "System/Types.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace caustic {

// Texel storage of a texture, tightly packed in row-major order.
class Surface
{
public:
	Surface() = default;

	// Existing texels are converted to the new format.
	void setFormat(TextureFormat newFormat);
	TextureFormat getFormat() const { return format; }

	// Copies width * height texels of the current format.
	void setImageData(const uint8_t *data, size_t size, int width, int height);
	// Returns the texels converted to 'destination'. Missing color channels
	// read as 0, a missing alpha channel reads as full intensity.
	std::vector<uint8_t> getImageData(TextureFormat destination) const;

	int getWidth() const { return width; }
	int getHeight() const { return height; }
	bool hasData() const { return !data.empty(); }

	// Nearest texel in pixel coordinates.
	float4 texel(int x, int y) const;
	// Nearest texel in normalized [0, 1] coordinates.
	float4 sample(float u, float v) const;

private:
	TextureFormat format;
	std::vector<uint8_t> data;
	int width = 0;
	int height = 0;
};

}  // namespace caustic

#endif  // caustic_Surface_hpp
