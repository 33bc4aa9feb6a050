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

#ifndef caustic_TextureFormat_hpp
#define caustic_TextureFormat_hpp

#include "DataFormat.hpp"

#include <cstdint>

namespace caustic {

// Component layout of a texture. The values match the OpenGL enumerants.
enum class Format : uint32_t
{
	RED = 0x1903,
	RG = 0x8227,
	RGB = 0x1907,
	RGBA = 0x1908,
	DEPTH = 0x1902,
	DEPTH_STENCIL = 0x84F9,
};

// Component layout and per-component storage type of texel data.
enum class InternalFormat : uint32_t
{
	R8 = 0x8229,
	RG8 = 0x822B,
	RGB8 = 0x8051,
	RGBA8 = 0x8058,
	R16 = 0x822A,
	RG16 = 0x822C,
	RGB16 = 0x8054,
	RGBA16 = 0x805B,
	DEPTH_COMPONENT16 = 0x81A5,
	DEPTH_COMPONENT24 = 0x81A6,
	DEPTH_COMPONENT32 = 0x81A7,
	R16F = 0x822D,
	RG16F = 0x822F,
	RGB16F = 0x881B,
	RGBA16F = 0x881A,
	R32F = 0x822E,
	RG32F = 0x8230,
	RGB32F = 0x8815,
	RGBA32F = 0x8814,
};

bool hasRed(Format format);
bool hasGreen(Format format);
bool hasBlue(Format format);
bool hasAlpha(Format format);
bool hasDepth(Format format);
int getComponentCount(Format format);
InternalFormat getDefaultInternalFormat(Format format);

class TextureFormat
{
public:
	TextureFormat(InternalFormat format = InternalFormat::RGBA8);

	operator InternalFormat() const { return format; }
	bool operator==(const TextureFormat &other) const { return format == other.format; }
	bool operator!=(const TextureFormat &other) const { return format != other.format; }

	Format getFormat() const;
	DataType getComponentType() const;
	int getComponentCount() const { return caustic::getComponentCount(getFormat()); }
	int getBytes() const { return getComponentCount() * getByteSize(getComponentType()); }

	bool hasRed() const { return caustic::hasRed(getFormat()); }
	bool hasGreen() const { return caustic::hasGreen(getFormat()); }
	bool hasBlue() const { return caustic::hasBlue(getFormat()); }
	bool hasAlpha() const { return caustic::hasAlpha(getFormat()); }

	// Component index of channel 0 (red) to 3 (alpha) within a texel, or -1 if absent.
	int getComponentIndex(int channel) const;

private:
	InternalFormat format;
};

}  // namespace caustic

#endif  // caustic_TextureFormat_hpp
