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

#include "TextureFormat.hpp"

#include "System/Debug.hpp"

namespace caustic {

bool hasRed(Format format)
{
	return format == Format::RED || format == Format::RG || format == Format::RGB || format == Format::RGBA;
}

bool hasGreen(Format format)
{
	return format == Format::RG || format == Format::RGB || format == Format::RGBA;
}

bool hasBlue(Format format)
{
	return format == Format::RGB || format == Format::RGBA;
}

bool hasAlpha(Format format)
{
	return format == Format::RGBA;
}

bool hasDepth(Format format)
{
	return format == Format::DEPTH || format == Format::DEPTH_STENCIL;
}

int getComponentCount(Format format)
{
	switch(format)
	{
	case Format::RED:
	case Format::DEPTH:
		return 1;
	case Format::RG:
	case Format::DEPTH_STENCIL:
		return 2;
	case Format::RGB:
		return 3;
	case Format::RGBA:
		return 4;
	}

	ABORT("Invalid format 0x%X", static_cast<uint32_t>(format));
}

InternalFormat getDefaultInternalFormat(Format format)
{
	switch(format)
	{
	case Format::RED: return InternalFormat::R8;
	case Format::RG: return InternalFormat::RG8;
	case Format::RGB: return InternalFormat::RGB8;
	case Format::RGBA: return InternalFormat::RGBA8;
	case Format::DEPTH: return InternalFormat::DEPTH_COMPONENT16;
	case Format::DEPTH_STENCIL:
		UNSUPPORTED("DEPTH_STENCIL textures");
		return InternalFormat::DEPTH_COMPONENT24;
	}

	ABORT("Invalid format 0x%X", static_cast<uint32_t>(format));
}

TextureFormat::TextureFormat(InternalFormat format)
    : format(format)
{
}

Format TextureFormat::getFormat() const
{
	switch(format)
	{
	case InternalFormat::R8:
	case InternalFormat::R16:
	case InternalFormat::R16F:
	case InternalFormat::R32F:
		return Format::RED;
	case InternalFormat::RG8:
	case InternalFormat::RG16:
	case InternalFormat::RG16F:
	case InternalFormat::RG32F:
		return Format::RG;
	case InternalFormat::RGB8:
	case InternalFormat::RGB16:
	case InternalFormat::RGB16F:
	case InternalFormat::RGB32F:
		return Format::RGB;
	case InternalFormat::RGBA8:
	case InternalFormat::RGBA16:
	case InternalFormat::RGBA16F:
	case InternalFormat::RGBA32F:
		return Format::RGBA;
	case InternalFormat::DEPTH_COMPONENT16:
	case InternalFormat::DEPTH_COMPONENT24:
	case InternalFormat::DEPTH_COMPONENT32:
		return Format::DEPTH;
	}

	ABORT("Invalid internal format 0x%X", static_cast<uint32_t>(format));
}

DataType TextureFormat::getComponentType() const
{
	switch(format)
	{
	case InternalFormat::R8:
	case InternalFormat::RG8:
	case InternalFormat::RGB8:
	case InternalFormat::RGBA8:
		return DataType::UNSIGNED_BYTE;
	case InternalFormat::R16:
	case InternalFormat::RG16:
	case InternalFormat::RGB16:
	case InternalFormat::RGBA16:
	case InternalFormat::DEPTH_COMPONENT16:
		return DataType::UNSIGNED_SHORT;
	case InternalFormat::DEPTH_COMPONENT24:
	case InternalFormat::DEPTH_COMPONENT32:
		return DataType::UNSIGNED_INT;
	case InternalFormat::R16F:
	case InternalFormat::RG16F:
	case InternalFormat::RGB16F:
	case InternalFormat::RGBA16F:
		return DataType::HALF_FLOAT;
	case InternalFormat::R32F:
	case InternalFormat::RG32F:
	case InternalFormat::RGB32F:
	case InternalFormat::RGBA32F:
		return DataType::FLOAT;
	}

	ABORT("Invalid internal format 0x%X", static_cast<uint32_t>(format));
}

int TextureFormat::getComponentIndex(int channel) const
{
	const bool present[4] = { hasRed(), hasGreen(), hasBlue(), hasAlpha() };

	if(channel < 0 || channel > 3 || !present[channel])
	{
		return -1;
	}

	int index = 0;
	for(int i = 0; i < channel; i++)
	{
		index += present[i] ? 1 : 0;
	}

	return index;
}

}  // namespace caustic
