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

#include "System/Math.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <limits>

using namespace caustic;

TEST(Math, SaturateToIntTruncates)
{
	EXPECT_EQ(saturateToInt(2.75), 2);
	EXPECT_EQ(saturateToInt(-2.75), -2);
	EXPECT_EQ(saturateToInt(0.0), 0);
}

TEST(Math, SaturateToIntKeepsTheLimits)
{
	EXPECT_EQ(saturateToInt(static_cast<double>(INT32_MAX)), INT32_MAX);
	EXPECT_EQ(saturateToInt(static_cast<double>(INT32_MIN)), INT32_MIN);

	// 2^31 is the nearest float to INT32_MAX.
	EXPECT_EQ(saturateToInt(static_cast<float>(INT32_MAX)), INT32_MAX);
	EXPECT_EQ(saturateToInt(1e20), INT32_MAX);
	EXPECT_EQ(saturateToInt(-1e20), INT32_MIN);
	EXPECT_EQ(saturateToInt(std::numeric_limits<double>::infinity()), INT32_MAX);
	EXPECT_EQ(saturateToInt(-std::numeric_limits<double>::infinity()), INT32_MIN);
}

TEST(Math, SaturateToIntOfNotANumber)
{
	EXPECT_EQ(saturateToInt(std::nan("")), 0);
	EXPECT_EQ(saturateToInt(std::nanf("")), 0);
}

TEST(Math, LerpIsExactAtTheEnds)
{
	EXPECT_EQ(lerp(-3.5f, 1e7f, 0.0f), -3.5f);
	EXPECT_EQ(lerp(-3.5f, 1e7f, 1.0f), 1e7f);
	EXPECT_EQ(lerp(0.0f, 8.0f, 0.25f), 2.0f);
}
