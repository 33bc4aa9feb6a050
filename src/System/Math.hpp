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

#ifndef caustic_Math_hpp
#define caustic_Math_hpp

#include "Types.hpp"

#include <cmath>
#include <cstdint>
#include <cstring>
#include <type_traits>

namespace caustic {

#undef min
#undef max

template<class T>
inline T max(T a, T b)
{
	return a > b ? a : b;
}

template<class T>
inline T min(T a, T b)
{
	return a < b ? a : b;
}

template<class T>
inline T max(T a, T b, T c)
{
	return max(max(a, b), c);
}

template<class T>
inline T min(T a, T b, T c)
{
	return min(min(a, b), c);
}

template<class T>
inline T clamp(T x, T a, T b)
{
	if(x < a) x = a;
	if(x > b) x = b;

	return x;
}

inline float clamp01(float x)
{
	return clamp(x, 0.0f, 1.0f);
}

inline int iround(float x)
{
	return static_cast<int>(std::floor(x + 0.5f));
}

// Truncates toward zero, saturating at the int32_t range. NaN converts to 0.
inline int32_t saturateToInt(double x)
{
	if(std::isnan(x))
	{
		return 0;
	}

	if(x <= static_cast<double>(INT32_MIN))
	{
		return INT32_MIN;
	}

	if(x >= static_cast<double>(INT32_MAX))
	{
		return INT32_MAX;
	}

	return static_cast<int32_t>(x);
}

inline int ifloor(float x)
{
	return static_cast<int>(std::floor(x));
}

inline int ceilInt4(int x)
{
	return (x + 0xF) >> 4;
}

// Reinterprets the bits of a value as another type of the same size.
template<typename To, typename From>
inline To bit_cast(const From &from)
{
	static_assert(sizeof(To) == sizeof(From), "bit_cast requires types of equal size");
	static_assert(std::is_trivially_copyable_v<From> && std::is_trivially_copyable_v<To>, "bit_cast requires trivially copyable types");

	To to;
	std::memcpy(&to, &from, sizeof(To));
	return to;
}

// Exact at both ends: lerp(a, b, 0) == a and lerp(a, b, 1) == b.
inline float lerp(float a, float b, float t)
{
	return a * (1.0f - t) + b * t;
}

template<int N>
inline vec<float, N> operator*(const vec<float, N> &v, float s)
{
	vec<float, N> r;
	for(int i = 0; i < N; i++)
	{
		r[i] = v[i] * s;
	}
	return r;
}

template<int N>
inline vec<float, N> operator+(const vec<float, N> &a, const vec<float, N> &b)
{
	vec<float, N> r;
	for(int i = 0; i < N; i++)
	{
		r[i] = a[i] + b[i];
	}
	return r;
}

template<int N>
inline vec<float, N> operator*(const mat<float, N> &m, const vec<float, N> &v)
{
	vec<float, N> r(0.0f);
	for(int c = 0; c < N; c++)
	{
		r = r + m[c] * v[c];
	}
	return r;
}

template<int N>
inline mat<float, N> operator*(const mat<float, N> &a, const mat<float, N> &b)
{
	mat<float, N> r;
	for(int c = 0; c < N; c++)
	{
		r[c] = a * b[c];
	}
	return r;
}

}  // namespace caustic

#endif  // caustic_Math_hpp
