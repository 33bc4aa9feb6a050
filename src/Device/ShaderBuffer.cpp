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

#include "ShaderBuffer.hpp"

#include "Conversion.hpp"
#include "System/Debug.hpp"
#include "System/Math.hpp"

namespace caustic {

ShaderBuffer::ShaderBuffer(const std::vector<DataFormat> &slotFormats)
{
	size_t size = 0;
	formats.reserve(slotFormats.size());

	for(const auto &format : slotFormats)
	{
		DataType type = format.getType();

		if(format.isInteger())
		{
			// All integer widths share 32-bit INT slots.
			type = DataType::INT;
		}
		else if(type != DataType::FLOAT)
		{
			ABORT("Unsupported shader buffer slot type %s", getName(type));
		}

		formats.emplace_back(type, format.getCount());
		size += format.getCount();
	}

	words.resize(size, 0);
	limit = size;
}

int ShaderBuffer::readIntComponent()
{
	if(slot >= formats.size() || ++consumed > formats[slot].getCount())
	{
		return 0;
	}

	int32_t word = readRaw();
	return (formats[slot].getType() == DataType::INT) ? word : saturateToInt(bit_cast<float>(word));
}

float ShaderBuffer::readFloatComponent()
{
	if(slot >= formats.size() || ++consumed > formats[slot].getCount())
	{
		return 0.0f;
	}

	int32_t word = readRaw();
	return (formats[slot].getType() == DataType::FLOAT) ? bit_cast<float>(word) : static_cast<float>(word);
}

void ShaderBuffer::writeIntComponent(int value)
{
	if(slot >= formats.size() || ++consumed > formats[slot].getCount())
	{
		return;
	}

	writeRaw((formats[slot].getType() == DataType::INT) ? value : bit_cast<int32_t>(static_cast<float>(value)));
}

void ShaderBuffer::writeFloatComponent(float value)
{
	if(slot >= formats.size() || ++consumed > formats[slot].getCount())
	{
		return;
	}

	writeRaw((formats[slot].getType() == DataType::FLOAT) ? bit_cast<int32_t>(value) : saturateToInt(value));
}

void ShaderBuffer::advance()
{
	if(slot >= formats.size())
	{
		return;
	}

	int unconsumed = formats[slot].getCount() - consumed;
	if(unconsumed > 0)
	{
		position(index + unconsumed);
	}

	slot++;
	consumed = 0;
}

int ShaderBuffer::readInt()
{
	int x = readIntComponent();
	advance();
	return x;
}

int2 ShaderBuffer::readVector2i()
{
	int x = readIntComponent();
	int y = readIntComponent();
	advance();
	return int2(x, y);
}

int3 ShaderBuffer::readVector3i()
{
	int x = readIntComponent();
	int y = readIntComponent();
	int z = readIntComponent();
	advance();
	return int3(x, y, z);
}

int4 ShaderBuffer::readVector4i()
{
	int x = readIntComponent();
	int y = readIntComponent();
	int z = readIntComponent();
	int w = readIntComponent();
	advance();
	return int4(x, y, z, w);
}

float ShaderBuffer::readFloat()
{
	float x = readFloatComponent();
	advance();
	return x;
}

float2 ShaderBuffer::readVector2f()
{
	float x = readFloatComponent();
	float y = readFloatComponent();
	advance();
	return float2(x, y);
}

float3 ShaderBuffer::readVector3f()
{
	float x = readFloatComponent();
	float y = readFloatComponent();
	float z = readFloatComponent();
	advance();
	return float3(x, y, z);
}

float4 ShaderBuffer::readVector4f()
{
	float x = readFloatComponent();
	float y = readFloatComponent();
	float z = readFloatComponent();
	float w = readFloatComponent();
	advance();
	return float4(x, y, z, w);
}

void ShaderBuffer::writeInt(int value)
{
	writeIntComponent(value);
	advance();
}

void ShaderBuffer::writeVector2i(const int2 &value)
{
	writeIntComponent(value.x);
	writeIntComponent(value.y);
	advance();
}

void ShaderBuffer::writeVector3i(const int3 &value)
{
	writeIntComponent(value.x);
	writeIntComponent(value.y);
	writeIntComponent(value.z);
	advance();
}

void ShaderBuffer::writeVector4i(const int4 &value)
{
	writeIntComponent(value.x);
	writeIntComponent(value.y);
	writeIntComponent(value.z);
	writeIntComponent(value.w);
	advance();
}

void ShaderBuffer::writeFloat(float value)
{
	writeFloatComponent(value);
	advance();
}

void ShaderBuffer::writeVector2f(const float2 &value)
{
	writeFloatComponent(value.x);
	writeFloatComponent(value.y);
	advance();
}

void ShaderBuffer::writeVector3f(const float3 &value)
{
	writeFloatComponent(value.x);
	writeFloatComponent(value.y);
	writeFloatComponent(value.z);
	advance();
}

void ShaderBuffer::writeVector4f(const float4 &value)
{
	writeFloatComponent(value.x);
	writeFloatComponent(value.y);
	writeFloatComponent(value.z);
	writeFloatComponent(value.w);
	advance();
}

void ShaderBuffer::skip()
{
	advance();
}

int32_t ShaderBuffer::readRaw()
{
	if(index >= limit)
	{
		ABORT("Shader buffer underflow at word %zu (limit %zu)", index, limit);
	}

	return static_cast<int32_t>(words[index++]);
}

void ShaderBuffer::writeRaw(int32_t word)
{
	if(index >= limit)
	{
		ABORT("Shader buffer overflow at word %zu (limit %zu)", index, limit);
	}

	words[index++] = static_cast<uint32_t>(word);
}

void ShaderBuffer::writeRaw(ShaderBuffer &other)
{
	while(other.remaining() > 0)
	{
		writeRaw(other.readRaw());
	}
}

void ShaderBuffer::position(size_t newPosition)
{
	if(newPosition > limit)
	{
		ABORT("Shader buffer position %zu beyond limit %zu", newPosition, limit);
	}

	index = newPosition;
}

void ShaderBuffer::clear()
{
	index = 0;
	limit = words.size();
	slot = 0;
	consumed = 0;
}

void ShaderBuffer::flip()
{
	limit = index;
	index = 0;
	slot = 0;
	consumed = 0;
}

void ShaderBuffer::rewind()
{
	index = 0;
	slot = 0;
	consumed = 0;
}

void lerp(ShaderBuffer &a, ShaderBuffer &b, float t, int startSlot, ShaderBuffer &out)
{
	const auto &formats = out.getFormats();

	for(size_t i = startSlot; i < formats.size(); i++)
	{
		bool isInt = formats[i].getType() == DataType::INT;

		for(int c = 0; c < formats[i].getCount(); c++)
		{
			int32_t wa = a.readRaw();
			int32_t wb = b.readRaw();

			if(isInt)
			{
				// Doubles hold every int32_t, so both ends are exact.
				out.writeRaw(saturateToInt(static_cast<double>(wa) * (1.0 - t) + static_cast<double>(wb) * t));
			}
			else
			{
				out.writeRaw(bit_cast<int32_t>(lerp(bit_cast<float>(wa), bit_cast<float>(wb), t)));
			}
		}
	}
}

void baryLerp(ShaderBuffer &a, ShaderBuffer &b, ShaderBuffer &c, float r, float s, float t, int startSlot, ShaderBuffer &out)
{
	const auto &formats = out.getFormats();

	for(size_t i = startSlot; i < formats.size(); i++)
	{
		bool isInt = formats[i].getType() == DataType::INT;

		for(int n = 0; n < formats[i].getCount(); n++)
		{
			int32_t wa = a.readRaw();
			int32_t wb = b.readRaw();
			int32_t wc = c.readRaw();

			if(isInt)
			{
				out.writeRaw(saturateToInt(static_cast<double>(wa) * r + static_cast<double>(wb) * s + static_cast<double>(wc) * t));
			}
			else
			{
				out.writeRaw(bit_cast<int32_t>(baryLerp(bit_cast<float>(wa), bit_cast<float>(wb), bit_cast<float>(wc), r, s, t)));
			}
		}
	}
}

}  // namespace caustic
