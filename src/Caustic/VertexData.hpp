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

#ifndef caustic_VertexData_hpp
#define caustic_VertexData_hpp

#include "Device/DataFormat.hpp"
#include "System/Debug.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace caustic {

// How attribute components reach the vertex shader.
enum class UploadMode
{
	TO_FLOAT,
	TO_FLOAT_NORMALIZE,
	KEEP_INT,
};

inline bool isNormalized(UploadMode mode)
{
	return mode == UploadMode::TO_FLOAT_NORMALIZE;
}

inline bool isConvertedToFloat(UploadMode mode)
{
	return mode != UploadMode::KEEP_INT;
}

// A named per-vertex attribute of 1 to 4 components, stored as raw bytes.
class VertexAttribute
{
public:
	VertexAttribute(const std::string &name, DataType type, int size, UploadMode uploadMode = UploadMode::TO_FLOAT);

	const std::string &getName() const { return name; }
	DataType getType() const { return type; }
	int getSize() const { return size; }
	UploadMode getUploadMode() const { return uploadMode; }

	const std::vector<uint8_t> &getData() const { return data; }
	void setData(const uint8_t *bytes, size_t count);

	// The element size of T must match the attribute type.
	template<typename T>
	void setData(const std::vector<T> &values)
	{
		if(static_cast<int>(sizeof(T)) != getByteSize(type))
		{
			ABORT("Attribute \"%s\" of type %s cannot hold %d-byte values", name.c_str(), caustic::getName(type), int(sizeof(T)));
		}

		setData(reinterpret_cast<const uint8_t *>(values.data()), values.size() * sizeof(T));
	}

	void clearData() { data.clear(); }

	// Number of complete vertices in the data.
	int getVertexCount() const;

private:
	std::string name;
	DataType type;
	int size;
	UploadMode uploadMode;
	std::vector<uint8_t> data;
};

// Indices and attributes of a mesh. Attributes are keyed by their location.
class VertexData
{
public:
	std::vector<int> &getIndices() { return indices; }
	const std::vector<int> &getIndices() const { return indices; }
	int getIndicesCount() const { return static_cast<int>(indices.size()); }

	// Replaces any attribute at the same location.
	void addAttribute(int location, const VertexAttribute &attribute);

	// Null when absent.
	const VertexAttribute *getAttribute(int location) const;
	const VertexAttribute *getAttribute(const std::string &name) const;
	VertexAttribute *getAttribute(int location);
	VertexAttribute *getAttribute(const std::string &name);

	// -1 when absent.
	int getAttributeLocation(const std::string &name) const;

	bool hasAttribute(int location) const;
	bool hasAttribute(const std::string &name) const;

	void removeAttribute(int location);
	void removeAttribute(const std::string &name);

	int getAttributeCount() const { return static_cast<int>(attributes.size()); }
	std::set<std::string> getAttributeNames() const;
	const std::map<int, VertexAttribute> &getAttributes() const { return attributes; }

	void clear();

private:
	std::vector<int> indices;
	std::map<int, VertexAttribute> attributes;
	std::map<std::string, int> locations;
};

}  // namespace caustic

#endif  // caustic_VertexData_hpp
