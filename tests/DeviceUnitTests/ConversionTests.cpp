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
#include "Device/Conversion.hpp"
#include "System/Math.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <vector>

using namespace caustic;

TEST(Conversion, ReadSignExtendsSignedTypes)
{
	const uint8_t bytes[] = { 0xFF, 0xFF, 0xFF, 0xFF };

	EXPECT_EQ(read(bytes, DataType::BYTE, 0), -1);
	EXPECT_EQ(read(bytes, DataType::UNSIGNED_BYTE, 0), 255);
	EXPECT_EQ(read(bytes, DataType::SHORT, 0), -1);
	EXPECT_EQ(read(bytes, DataType::UNSIGNED_SHORT, 0), 65535);
	EXPECT_EQ(read(bytes, DataType::INT, 0), -1);
}

TEST(Conversion, ReadAndWriteUseTheComponentIndex)
{
	std::vector<uint8_t> data(8, 0);

	write(data.data(), DataType::SHORT, -2, 1);
	write(data.data(), DataType::SHORT, 300, 2);

	EXPECT_EQ(read(data.data(), DataType::SHORT, 0), 0);
	EXPECT_EQ(read(data.data(), DataType::SHORT, 1), -2);
	EXPECT_EQ(read(data.data(), DataType::SHORT, 2), 300);
	EXPECT_EQ(read(data.data(), DataType::SHORT, 3), 0);
}

TEST(Conversion, NormalizedBounds)
{
	EXPECT_EQ(toFloat(DataType::UNSIGNED_BYTE, 0, true), 0.0f);
	EXPECT_EQ(toFloat(DataType::UNSIGNED_BYTE, 255, true), 1.0f);
	EXPECT_EQ(toFloat(DataType::BYTE, -128, true), 0.0f);
	EXPECT_EQ(toFloat(DataType::BYTE, 127, true), 1.0f);
	EXPECT_EQ(toFloat(DataType::SHORT, INT16_MIN, true), 0.0f);
	EXPECT_EQ(toFloat(DataType::SHORT, INT16_MAX, true), 1.0f);
	EXPECT_EQ(toFloat(DataType::UNSIGNED_SHORT, 65535, true), 1.0f);
}

TEST(Conversion, UnnormalizedValuesKeepTheirMagnitude)
{
	EXPECT_EQ(toFloat(DataType::BYTE, -5, false), -5.0f);
	EXPECT_EQ(toFloat(DataType::UNSIGNED_SHORT, 1000, false), 1000.0f);
	EXPECT_EQ(toFloat(DataType::INT, -123456, false), -123456.0f);

	EXPECT_EQ(fromFloat(DataType::SHORT, -7.4f, false), -7);
	EXPECT_EQ(fromFloat(DataType::UNSIGNED_BYTE, 300.0f, false), 255);
	EXPECT_EQ(fromFloat(DataType::BYTE, -300.0f, false), -128);
}

TEST(Conversion, NormalizedRoundTrip)
{
	for(int v = 0; v <= 255; v++)
	{
		EXPECT_EQ(fromFloat(DataType::UNSIGNED_BYTE, toFloat(DataType::UNSIGNED_BYTE, v, true), true), v);
	}

	for(int v = INT8_MIN; v <= INT8_MAX; v++)
	{
		EXPECT_EQ(fromFloat(DataType::BYTE, toFloat(DataType::BYTE, v, true), true), v);
	}

	for(int v = INT16_MIN; v <= INT16_MAX; v += 97)
	{
		EXPECT_EQ(fromFloat(DataType::SHORT, toFloat(DataType::SHORT, v, true), true), v);
	}

	for(int v = 0; v <= UINT16_MAX; v += 101)
	{
		EXPECT_EQ(fromFloat(DataType::UNSIGNED_SHORT, toFloat(DataType::UNSIGNED_SHORT, v, true), true), v);
	}
}

TEST(Conversion, NormalizedValuesSaturate)
{
	EXPECT_EQ(fromFloat(DataType::UNSIGNED_BYTE, 2.0f, true), 255);
	EXPECT_EQ(fromFloat(DataType::UNSIGNED_BYTE, -1.0f, true), 0);
	EXPECT_EQ(fromFloat(DataType::BYTE, -1.0f, true), -128);
	EXPECT_EQ(fromFloat(DataType::SHORT, 5.0f, true), INT16_MAX);
}

TEST(Conversion, FloatingPointTypesIgnoreNormalization)
{
	EXPECT_EQ(toFloat(DataType::FLOAT, bit_cast<int32_t>(-3.5f), true), -3.5f);
	EXPECT_EQ(fromFloat(DataType::FLOAT, 42.25f, true), bit_cast<int32_t>(42.25f));

	EXPECT_EQ(fromFloat(DataType::HALF_FLOAT, 0.5f, true), 0x3800);
	EXPECT_EQ(toFloat(DataType::HALF_FLOAT, 0x3800, true), 0.5f);
	EXPECT_EQ(toFloat(DataType::HALF_FLOAT, 0xC000, false), -2.0f);
}

TEST(Conversion, ReadAsFloatMatchesToFloat)
{
	const uint8_t bytes[] = { 0x00, 0x80, 0xFF, 0x7F };

	for(size_t i = 0; i < 4; i++)
	{
		EXPECT_EQ(readAsFloat(bytes, DataType::UNSIGNED_BYTE, i), toFloat(DataType::UNSIGNED_BYTE, bytes[i], true));
		EXPECT_EQ(readAsFloat(bytes, DataType::BYTE, i), toFloat(DataType::BYTE, static_cast<int8_t>(bytes[i]), true));
	}
}

TEST(Conversion, CopyConvertsBetweenTypes)
{
	const uint8_t source[] = { 0, 255 };
	float destination[2] = {};

	copy(source, DataType::UNSIGNED_BYTE, 0, reinterpret_cast<uint8_t *>(destination), DataType::FLOAT, 0);
	copy(source, DataType::UNSIGNED_BYTE, 1, reinterpret_cast<uint8_t *>(destination), DataType::FLOAT, 1);

	EXPECT_EQ(destination[0], 0.0f);
	EXPECT_EQ(destination[1], 1.0f);

	const float value = 0.5f;
	uint8_t byte = 0;
	copy(reinterpret_cast<const uint8_t *>(&value), DataType::FLOAT, 0, &byte, DataType::UNSIGNED_BYTE, 0);
	EXPECT_EQ(byte, 128);
}

TEST(Conversion, CopyOfTheSameTypeIsExact)
{
	const int16_t source[] = { -12345 };
	int16_t destination[] = { 0 };

	copy(reinterpret_cast<const uint8_t *>(source), DataType::SHORT, 0,
	     reinterpret_cast<uint8_t *>(destination), DataType::SHORT, 0);

	EXPECT_EQ(destination[0], -12345);
}

TEST(Conversion, PackIsARGB)
{
	EXPECT_EQ(pack(1.0f, 0.0f, 0.0f, 1.0f), 0xFFFF0000u);
	EXPECT_EQ(pack(0.0f, 1.0f, 0.0f, 0.0f), 0x0000FF00u);
	EXPECT_EQ(pack(float4(0.0f, 0.0f, 1.0f, 1.0f)), 0xFF0000FFu);
}

TEST(Conversion, PackClampsAndTruncates)
{
	// 0.5 * 255 = 127.5 truncates to 0x7F.
	EXPECT_EQ(pack(2.0f, -1.0f, 0.5f, 1.0f), 0xFFFF007Fu);
}

TEST(Conversion, UnpackInvertsPack)
{
	for(float c : { 0.0f, 0.2f, 0.5f, 0.75f, 1.0f })
	{
		float4 color = unpack(pack(c, 1.0f - c, c * 0.5f, 1.0f));

		EXPECT_NEAR(color.x, c, 1.0f / 255.0f);
		EXPECT_NEAR(color.y, 1.0f - c, 1.0f / 255.0f);
		EXPECT_NEAR(color.z, c * 0.5f, 1.0f / 255.0f);
		EXPECT_EQ(color.w, 1.0f);
	}
}

TEST(Conversion, DenormalizeToShort)
{
	EXPECT_EQ(denormalizeToShort(0.0f), INT16_MIN);
	EXPECT_EQ(denormalizeToShort(1.0f), INT16_MAX);
	EXPECT_EQ(denormalizeToShort(0.5f), 0);
	EXPECT_EQ(denormalizeToShort(-3.0f), INT16_MIN);
	EXPECT_EQ(denormalizeToShort(3.0f), INT16_MAX);
	EXPECT_LT(denormalizeToShort(0.25f), denormalizeToShort(0.75f));
}

TEST(Conversion, NotANumberConvertsToZero)
{
	const float nan = std::nanf("");

	EXPECT_EQ(pack(nan, 1.0f, nan, 1.0f), 0xFF00FF00u);
	EXPECT_EQ(denormalizeToShort(nan), 0);
	EXPECT_EQ(fromFloat(DataType::UNSIGNED_BYTE, nan, true), 0);
	EXPECT_EQ(fromFloat(DataType::INT, nan, false), 0);
}

TEST(Conversion, BaryLerp)
{
	EXPECT_EQ(baryLerp(1.0f, 2.0f, 3.0f, 1.0f, 0.0f, 0.0f), 1.0f);
	EXPECT_EQ(baryLerp(1.0f, 2.0f, 3.0f, 0.0f, 0.0f, 1.0f), 3.0f);
	EXPECT_FLOAT_EQ(baryLerp(0.0f, 3.0f, 6.0f, 1.0f / 3, 1.0f / 3, 1.0f / 3), 3.0f);
}

TEST(ConversionDeathTest, DoubleIsNotSupported)
{
	const uint8_t bytes[8] = {};

	EXPECT_DEATH(toFloat(DataType::DOUBLE, 0, true), "Unsupported data type DOUBLE");
	EXPECT_DEATH(read(bytes, DataType::DOUBLE, 0), "Unsupported data type DOUBLE");
}
