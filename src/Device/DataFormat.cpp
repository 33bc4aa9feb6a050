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

#include "DataFormat.hpp"

#include "System/Debug.hpp"

namespace caustic {

int getByteSize(DataType type)
{
	return 1 << getMultiplyShift(type);
}

int getMultiplyShift(DataType type)
{
	switch(type)
	{
	case DataType::BYTE:
	case DataType::UNSIGNED_BYTE:
		return 0;
	case DataType::SHORT:
	case DataType::UNSIGNED_SHORT:
	case DataType::HALF_FLOAT:
		return 1;
	case DataType::INT:
	case DataType::UNSIGNED_INT:
	case DataType::FLOAT:
		return 2;
	case DataType::DOUBLE:
		return 3;
	}

	ABORT("Invalid data type 0x%X", static_cast<uint32_t>(type));
}

bool isInteger(DataType type)
{
	switch(type)
	{
	case DataType::BYTE:
	case DataType::UNSIGNED_BYTE:
	case DataType::SHORT:
	case DataType::UNSIGNED_SHORT:
	case DataType::INT:
	case DataType::UNSIGNED_INT:
		return true;
	default:
		return false;
	}
}

bool isSigned(DataType type)
{
	switch(type)
	{
	case DataType::UNSIGNED_BYTE:
	case DataType::UNSIGNED_SHORT:
	case DataType::UNSIGNED_INT:
		return false;
	default:
		return true;
	}
}

const char *getName(DataType type)
{
	switch(type)
	{
	case DataType::BYTE: return "BYTE";
	case DataType::UNSIGNED_BYTE: return "UNSIGNED_BYTE";
	case DataType::SHORT: return "SHORT";
	case DataType::UNSIGNED_SHORT: return "UNSIGNED_SHORT";
	case DataType::INT: return "INT";
	case DataType::UNSIGNED_INT: return "UNSIGNED_INT";
	case DataType::HALF_FLOAT: return "HALF_FLOAT";
	case DataType::FLOAT: return "FLOAT";
	case DataType::DOUBLE: return "DOUBLE";
	}

	return "unknown";
}

DataFormat::DataFormat(DataType type, int count)
    : type(type)
    , count(count)
{
	if(count < 1 || count > 4)
	{
		ABORT("Component count must be between 1 and 4, got %d", count);
	}
}

}  // namespace caustic
