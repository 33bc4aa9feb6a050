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

#include "VertexData.hpp"

namespace caustic {

VertexAttribute::VertexAttribute(const std::string &name, DataType type, int size, UploadMode uploadMode)
    : name(name)
    , type(type)
    , size(size)
    , uploadMode(uploadMode)
{
	if(size < 1 || size > 4)
	{
		ABORT("Attribute \"%s\" has %d components, expected 1 to 4", name.c_str(), size);
	}
}

void VertexAttribute::setData(const uint8_t *bytes, size_t count)
{
	data.assign(bytes, bytes + count);
}

int VertexAttribute::getVertexCount() const
{
	return static_cast<int>(data.size() / (size * getByteSize(type)));
}

void VertexData::addAttribute(int location, const VertexAttribute &attribute)
{
	removeAttribute(location);

	attributes.emplace(location, attribute);
	locations[attribute.getName()] = location;
}

const VertexAttribute *VertexData::getAttribute(int location) const
{
	auto it = attributes.find(location);
	return (it != attributes.end()) ? &it->second : nullptr;
}

const VertexAttribute *VertexData::getAttribute(const std::string &name) const
{
	return getAttribute(getAttributeLocation(name));
}

VertexAttribute *VertexData::getAttribute(int location)
{
	auto it = attributes.find(location);
	return (it != attributes.end()) ? &it->second : nullptr;
}

VertexAttribute *VertexData::getAttribute(const std::string &name)
{
	return getAttribute(getAttributeLocation(name));
}

int VertexData::getAttributeLocation(const std::string &name) const
{
	auto it = locations.find(name);
	return (it != locations.end()) ? it->second : -1;
}

bool VertexData::hasAttribute(int location) const
{
	return attributes.count(location) != 0;
}

bool VertexData::hasAttribute(const std::string &name) const
{
	return locations.count(name) != 0;
}

void VertexData::removeAttribute(int location)
{
	auto it = attributes.find(location);
	if(it == attributes.end())
	{
		return;
	}

	locations.erase(it->second.getName());
	attributes.erase(it);
}

void VertexData::removeAttribute(const std::string &name)
{
	int location = getAttributeLocation(name);
	if(location != -1)
	{
		removeAttribute(location);
	}
}

std::set<std::string> VertexData::getAttributeNames() const
{
	std::set<std::string> names;
	for(const auto &location : locations)
	{
		names.insert(location.first);
	}

	return names;
}

void VertexData::clear()
{
	indices.clear();
	attributes.clear();
	locations.clear();
}

}  // namespace caustic
