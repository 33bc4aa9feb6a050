// Copyright 2016 The SwiftShader Authors. All Rights Reserved.
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

#include "Half.hpp"

#include "Math.hpp"

namespace caustic {

half::half(float fp32)
{
	uint32_t fp32i = bit_cast<uint32_t>(fp32);
	uint32_t sign = (fp32i & 0x80000000) >> 16;
	uint32_t abs = fp32i & 0x7FFFFFFF;

	if(abs > 0x7F800000)  // NaN
	{
		fp16i = static_cast<uint16_t>(sign | 0x7E00);
	}
	else if(abs > 0x477FEFFF)  // Rounds to infinity
	{
		fp16i = static_cast<uint16_t>(sign | 0x7C00);
	}
	else if(abs < 0x38800000)  // Denormal
	{
		uint32_t mantissa = (abs & 0x007FFFFF) | 0x00800000;
		int e = 113 - static_cast<int>(abs >> 23);

		abs = (e < 24) ? (mantissa >> e) : 0;

		fp16i = static_cast<uint16_t>(sign | (abs + 0x00000FFF + ((abs >> 13) & 1)) >> 13);
	}
	else
	{
		fp16i = static_cast<uint16_t>(sign | (abs + 0xC8000000 + 0x00000FFF + ((abs >> 13) & 1)) >> 13);
	}
}

half::operator float() const
{
	uint32_t s = (fp16i >> 15) & 0x00000001;
	int e = (fp16i >> 10) & 0x0000001F;
	uint32_t m = fp16i & 0x000003FF;

	if(e == 0)
	{
		if(m == 0)
		{
			return bit_cast<float>(s << 31);
		}

		// Renormalize.
		while(!(m & 0x00000400))
		{
			m <<= 1;
			e -= 1;
		}

		e += 1;
		m &= ~0x00000400u;
	}
	else if(e == 31)
	{
		return bit_cast<float>((s << 31) | 0x7F800000 | (m << 13));
	}

	e = e + (127 - 15);
	m = m << 13;

	return bit_cast<float>((s << 31) | (static_cast<uint32_t>(e) << 23) | m);
}

half &half::operator=(float f)
{
	*this = half(f);

	return *this;
}

half half::fromBits(uint16_t bits)
{
	half h;
	h.fp16i = bits;
	return h;
}

}  // namespace caustic
