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

#ifndef caustic_DataFormat_hpp
#define caustic_DataFormat_hpp

#include "System/Types.hpp"

#include <cstdint>

namespace caustic {

// Primitive component types. The values match the OpenGL enumerants.
enum class DataType : uint32_t
{
	BYTE = 0x1400,
	UNSIGNED_BYTE = 0x1401,
	SHORT = 0x1402,
	UNSIGNED_SHORT = 0x1403,
	INT = 0x1404,
	UNSIGNED_INT = 0x1405,
	HALF_FLOAT = 0x140B,
	FLOAT = 0x1406,
	DOUBLE = 0x140A,
};

int getByteSize(DataType type);
// log2 of the byte size.
int getMultiplyShift(DataType type);
bool isInteger(DataType type);
bool isSigned(DataType type);
const char *getName(DataType type);

// A scalar or vector element: a primitive type and a component count of 1 to 4.
class DataFormat
{
public:
	DataFormat(DataType type, int count);

	DataType getType() const { return type; }
	int getCount() const { return count; }
	int getByteSize() const { return count << getMultiplyShift(type); }
	bool isInteger() const { return caustic::isInteger(type); }

	// Format of a C++ value type, such as int or float3.
	template<typename T>
	static DataFormat of();

	bool operator==(const DataFormat &other) const
	{
		return type == other.type && count == other.count;
	}

	bool operator!=(const DataFormat &other) const
	{
		return !(*this == other);
	}

private:
	DataType type;
	int count;
};

template<typename T>
struct DataFormatOf;

template<>
struct DataFormatOf<int>
{
	static constexpr DataType type = DataType::INT;
	static constexpr int count = 1;
};

template<>
struct DataFormatOf<float>
{
	static constexpr DataType type = DataType::FLOAT;
	static constexpr int count = 1;
};

template<int N>
struct DataFormatOf<vec<int, N>>
{
	static constexpr DataType type = DataType::INT;
	static constexpr int count = N;
};

template<int N>
struct DataFormatOf<vec<float, N>>
{
	static constexpr DataType type = DataType::FLOAT;
	static constexpr int count = N;
};

template<typename T>
DataFormat DataFormat::of()
{
	return DataFormat(DataFormatOf<T>::type, DataFormatOf<T>::count);
}

}  // namespace caustic

#endif  // caustic_DataFormat_hpp
