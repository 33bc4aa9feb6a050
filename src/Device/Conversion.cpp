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

#include "Conversion.hpp"

#include "System/Debug.hpp"
#include "System/Half.hpp"
#include "System/Math.hpp"

#include <cmath>
#include <cstring>

namespace {

template<typename T>
T load(const uint8_t *data, size_t index)
{
	T value;
	std::memcpy(&value, data + index * sizeof(T), sizeof(T));
	return value;
}

template<typename T>
void store(uint8_t *data, size_t index, T value)
{
	std::memcpy(data + index * sizeof(T), &value, sizeof(T));
}

int32_t quantize(double value, double low, double high)
{
	if(std::isnan(value))
	{
		return 0;
	}

	int64_t q = std::llround(caustic::clamp(value, low, high));
	return static_cast<int32_t>(static_cast<uint32_t>(q));
}

}  // anonymous namespace

namespace caustic {

int32_t read(const uint8_t *data, DataType type, size_t index)
{
	switch(type)
	{
	case DataType::BYTE:
		return load<int8_t>(data, index);
	case DataType::UNSIGNED_BYTE:
		return load<uint8_t>(data, index);
	case DataType::SHORT:
		return load<int16_t>(data, index);
	case DataType::UNSIGNED_SHORT:
	case DataType::HALF_FLOAT:
		return load<uint16_t>(data, index);
	case DataType::INT:
	case DataType::UNSIGNED_INT:
	case DataType::FLOAT:
		return load<int32_t>(data, index);
	default:
		ABORT("Unsupported data type %s", getName(type));
	}
}

void write(uint8_t *data, DataType type, int32_t value, size_t index)
{
	switch(type)
	{
	case DataType::BYTE:
	case DataType::UNSIGNED_BYTE:
		store(data, index, static_cast<uint8_t>(value));
		break;
	case DataType::SHORT:
	case DataType::UNSIGNED_SHORT:
	case DataType::HALF_FLOAT:
		store(data, index, static_cast<uint16_t>(value));
		break;
	case DataType::INT:
	case DataType::UNSIGNED_INT:
	case DataType::FLOAT:
		store(data, index, value);
		break;
	default:
		ABORT("Unsupported data type %s", getName(type));
	}
}

float toFloat(DataType type, int32_t value, bool normalize)
{
	switch(type)
	{
	case DataType::BYTE:
		{
			float f = static_cast<int8_t>(value);
			return normalize ? (f - INT8_MIN) / BYTE_RANGE : f;
		}
	case DataType::UNSIGNED_BYTE:
		{
			float f = static_cast<float>(value & 0xFF);
			return normalize ? f / BYTE_RANGE : f;
		}
	case DataType::SHORT:
		{
			float f = static_cast<int16_t>(value);
			return normalize ? (f - INT16_MIN) / SHORT_RANGE : f;
		}
	case DataType::UNSIGNED_SHORT:
		{
			float f = static_cast<float>(value & 0xFFFF);
			return normalize ? f / SHORT_RANGE : f;
		}
	case DataType::INT:
		{
			float f = static_cast<float>(value);
			return normalize ? (f - static_cast<float>(INT32_MIN)) / INT_RANGE : f;
		}
	case DataType::UNSIGNED_INT:
		{
			float f = static_cast<float>(static_cast<uint32_t>(value));
			return normalize ? f / INT_RANGE : f;
		}
	case DataType::HALF_FLOAT:
		return half::fromBits(static_cast<uint16_t>(value));
	case DataType::FLOAT:
		return bit_cast<float>(value);
	default:
		ABORT("Unsupported data type %s", getName(type));
	}
}

int32_t fromFloat(DataType type, float value, bool normalize)
{
	double f = normalize ? clamp01(value) : value;

	switch(type)
	{
	case DataType::BYTE:
		return quantize(normalize ? f * BYTE_RANGE + INT8_MIN : f, INT8_MIN, INT8_MAX);
	case DataType::UNSIGNED_BYTE:
		return quantize(normalize ? f * BYTE_RANGE : f, 0, UINT8_MAX);
	case DataType::SHORT:
		return quantize(normalize ? f * SHORT_RANGE + INT16_MIN : f, INT16_MIN, INT16_MAX);
	case DataType::UNSIGNED_SHORT:
		return quantize(normalize ? f * SHORT_RANGE : f, 0, UINT16_MAX);
	case DataType::INT:
		return quantize(normalize ? f * INT_RANGE + INT32_MIN : f, INT32_MIN, INT32_MAX);
	case DataType::UNSIGNED_INT:
		return quantize(normalize ? f * INT_RANGE : f, 0, UINT32_MAX);
	case DataType::HALF_FLOAT:
		return half(value).bits();
	case DataType::FLOAT:
		return bit_cast<int32_t>(value);
	default:
		ABORT("Unsupported data type %s", getName(type));
	}
}

float readAsFloat(const uint8_t *data, DataType type, size_t index)
{
	return toFloat(type, read(data, type, index), true);
}

void copy(const uint8_t *source, DataType sourceType, size_t sourceIndex,
          uint8_t *destination, DataType destinationType, size_t destinationIndex)
{
	int32_t value = read(source, sourceType, sourceIndex);

	if(sourceType != destinationType)
	{
		value = fromFloat(destinationType, toFloat(sourceType, value, true), true);
	}

	write(destination, destinationType, value, destinationIndex);
}

uint32_t pack(float r, float g, float b, float a)
{
	uint32_t ib = saturateToInt(clamp01(b) * BYTE_RANGE) & 0xFF;
	uint32_t ig = saturateToInt(clamp01(g) * BYTE_RANGE) & 0xFF;
	uint32_t ir = saturateToInt(clamp01(r) * BYTE_RANGE) & 0xFF;
	uint32_t ia = saturateToInt(clamp01(a) * BYTE_RANGE) & 0xFF;

	return (ia << 24) | (ir << 16) | (ig << 8) | ib;
}

uint32_t pack(const float4 &color)
{
	return pack(color.x, color.y, color.z, color.w);
}

float4 unpack(uint32_t argb)
{
	return float4(((argb >> 16) & 0xFF) / BYTE_RANGE,
	              ((argb >> 8) & 0xFF) / BYTE_RANGE,
	              (argb & 0xFF) / BYTE_RANGE,
	              ((argb >> 24) & 0xFF) / BYTE_RANGE);
}

int16_t denormalizeToShort(float f)
{
	return static_cast<int16_t>(saturateToInt(clamp01(f) * SHORT_RANGE + INT16_MIN));
}

float baryLerp(float a, float b, float c, float r, float s, float t)
{
	return a * r + b * s + c * t;
}

}  // namespace caustic
