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

#ifndef caustic_Types_hpp
#define caustic_Types_hpp

#include <cstdint>

namespace caustic {

template<typename T, int N>
struct vec;

template<typename T>
struct alignas(sizeof(T) * 2) vec<T, 2>
{
	vec() = default;

	constexpr explicit vec(T replicate)
	    : x(replicate)
	    , y(replicate)
	{
	}

	constexpr vec(T x, T y)
	    : x(x)
	    , y(y)
	{
	}

	// Require explicit use of replicate constructor.
	vec &operator=(T) = delete;

	T &operator[](int i) { return v[i]; }
	const T &operator[](int i) const { return v[i]; }

	union
	{
		T v[2];

		struct
		{
			T x;
			T y;
		};
	};
};

template<typename T>
struct vec<T, 3>
{
	vec() = default;

	constexpr explicit vec(T replicate)
	    : x(replicate)
	    , y(replicate)
	    , z(replicate)
	{
	}

	constexpr vec(T x, T y, T z)
	    : x(x)
	    , y(y)
	    , z(z)
	{
	}

	vec &operator=(T) = delete;

	T &operator[](int i) { return v[i]; }
	const T &operator[](int i) const { return v[i]; }

	union
	{
		T v[3];

		struct
		{
			T x;
			T y;
			T z;
		};
	};
};

template<typename T>
struct alignas(sizeof(T) * 4) vec<T, 4>
{
	vec() = default;

	constexpr explicit vec(T replicate)
	    : x(replicate)
	    , y(replicate)
	    , z(replicate)
	    , w(replicate)
	{
	}

	constexpr vec(T x, T y, T z, T w)
	    : x(x)
	    , y(y)
	    , z(z)
	    , w(w)
	{
	}

	vec &operator=(T) = delete;

	T &operator[](int i) { return v[i]; }
	const T &operator[](int i) const { return v[i]; }

	union
	{
		T v[4];

		struct
		{
			T x;
			T y;
			T z;
			T w;
		};
	};
};

template<typename T, int N>
bool operator==(const vec<T, N> &a, const vec<T, N> &b)
{
	for(int i = 0; i < N; i++)
	{
		if(a.v[i] != b.v[i])
		{
			return false;
		}
	}

	return true;
}

template<typename T, int N>
bool operator!=(const vec<T, N> &a, const vec<T, N> &b)
{
	return !(a == b);
}

template<typename T>
using vec2 = vec<T, 2>;
template<typename T>
using vec3 = vec<T, 3>;
template<typename T>
using vec4 = vec<T, 4>;

using int2 = vec2<int>;
using int3 = vec3<int>;
using int4 = vec4<int>;
using float2 = vec2<float>;
using float3 = vec3<float>;
using float4 = vec4<float>;

// Square column-major matrix. columns[c][r] is row r of column c.
template<typename T, int N>
struct mat
{
	mat() = default;

	static mat identity()
	{
		mat m{};
		for(int i = 0; i < N; i++)
		{
			m.columns[i][i] = T(1);
		}
		return m;
	}

	vec<T, N> &operator[](int c) { return columns[c]; }
	const vec<T, N> &operator[](int c) const { return columns[c]; }

	vec<T, N> columns[N];
};

template<typename T, int N>
bool operator==(const mat<T, N> &a, const mat<T, N> &b)
{
	for(int i = 0; i < N; i++)
	{
		if(a.columns[i] != b.columns[i])
		{
			return false;
		}
	}

	return true;
}

using float2x2 = mat<float, 2>;
using float3x3 = mat<float, 3>;
using float4x4 = mat<float, 4>;

inline constexpr float4 vector(float x, float y, float z, float w)
{
	return float4{ x, y, z, w };
}

inline constexpr float4 replicate(float f)
{
	return vector(f, f, f, f);
}

}  // namespace caustic

#endif  // caustic_Types_hpp
