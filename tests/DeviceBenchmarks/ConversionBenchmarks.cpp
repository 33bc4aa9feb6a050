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
#include "System/Half.hpp"

#include "benchmark/benchmark.h"

#include <vector>

using namespace caustic;

// Global variable the C++ compiler can't eliminate.
volatile float sink;

static void ReadAsFloat(benchmark::State &state, DataType type)
{
	const size_t count = static_cast<size_t>(state.range());
	std::vector<uint8_t> data(count * getByteSize(type), 0x5A);

	for(auto _ : state)
	{
		float sum = 0.0f;
		for(size_t i = 0; i < count; i++)
		{
			sum += readAsFloat(data.data(), type, i);
		}
		sink = sum;
	}

	state.SetItemsProcessed(state.iterations() * count);
}

BENCHMARK_CAPTURE(ReadAsFloat, UNSIGNED_BYTE, DataType::UNSIGNED_BYTE)->Arg(4096);
BENCHMARK_CAPTURE(ReadAsFloat, SHORT, DataType::SHORT)->Arg(4096);
BENCHMARK_CAPTURE(ReadAsFloat, HALF_FLOAT, DataType::HALF_FLOAT)->Arg(4096);
BENCHMARK_CAPTURE(ReadAsFloat, FLOAT, DataType::FLOAT)->Arg(4096);

static void Copy(benchmark::State &state, DataType sourceType, DataType destinationType)
{
	const size_t count = static_cast<size_t>(state.range());
	std::vector<uint8_t> source(count * getByteSize(sourceType), 0x3C);
	std::vector<uint8_t> destination(count * getByteSize(destinationType));

	for(auto _ : state)
	{
		for(size_t i = 0; i < count; i++)
		{
			copy(source.data(), sourceType, i, destination.data(), destinationType, i);
		}
		benchmark::DoNotOptimize(destination.data());
	}

	state.SetItemsProcessed(state.iterations() * count);
}

BENCHMARK_CAPTURE(Copy, UB_to_UB, DataType::UNSIGNED_BYTE, DataType::UNSIGNED_BYTE)->Arg(4096);
BENCHMARK_CAPTURE(Copy, UB_to_FLOAT, DataType::UNSIGNED_BYTE, DataType::FLOAT)->Arg(4096);
BENCHMARK_CAPTURE(Copy, FLOAT_to_UB, DataType::FLOAT, DataType::UNSIGNED_BYTE)->Arg(4096);
BENCHMARK_CAPTURE(Copy, HALF_to_FLOAT, DataType::HALF_FLOAT, DataType::FLOAT)->Arg(4096);

static void HalfRoundTrip(benchmark::State &state)
{
	float x = 0.0f;

	for(auto _ : state)
	{
		for(int i = 0; i < state.range(); i++)
		{
			x = static_cast<float>(half(x + 0.25f));
		}
		sink = x;
	}
}
BENCHMARK(HalfRoundTrip)->Arg(4096);

static void Pack(benchmark::State &state)
{
	uint32_t argb = 0;

	for(auto _ : state)
	{
		for(int i = 0; i < state.range(); i++)
		{
			float f = static_cast<float>(i & 0xFF) / 255.0f;
			argb ^= pack(f, 1.0f - f, 0.5f, 1.0f);
		}
		benchmark::DoNotOptimize(argb);
	}
}
BENCHMARK(Pack)->Arg(4096);
