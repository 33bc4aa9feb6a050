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

#include "SoftwareVertexArray.hpp"

#include "SoftwareProgram.hpp"
#include "Caustic/VertexData.hpp"
#include "Device/Conversion.hpp"
#include "Device/Renderer.hpp"
#include "Device/ShaderBuffer.hpp"
#include "System/Debug.hpp"
#include "System/Math.hpp"

#include <limits>

namespace caustic {

SoftwareVertexArray::SoftwareVertexArray(Renderer &renderer)
    : renderer(renderer)
{
}

void SoftwareVertexArray::destroy()
{
	indices.clear();
	attributes.clear();
	attributeFormats.clear();
	vertexCount = 0;

	VertexArray::destroy();
}

void SoftwareVertexArray::setData(const VertexData &vertexData)
{
	checkCreated();

	indices = vertexData.getIndices();
	attributes.clear();
	attributeFormats.clear();
	vertexCount = std::numeric_limits<int>::max();

	for(const auto &entry : vertexData.getAttributes())
	{
		const VertexAttribute &attribute = entry.second;
		const DataType type = attribute.getType();
		const UploadMode uploadMode = attribute.getUploadMode();
		const uint8_t *data = attribute.getData().data();

		Attribute converted;
		converted.size = attribute.getSize();
		converted.words.resize(static_cast<size_t>(attribute.getVertexCount()) * converted.size);

		if(isConvertedToFloat(uploadMode))
		{
			for(size_t i = 0; i < converted.words.size(); i++)
			{
				float value = toFloat(type, read(data, type, i), isNormalized(uploadMode));
				converted.words[i] = bit_cast<uint32_t>(value);
			}

			attributeFormats.emplace_back(DataType::FLOAT, converted.size);
		}
		else
		{
			if(!isInteger(type))
			{
				ABORT("Attribute \"%s\" of type %s cannot be kept as integers",
				      attribute.getName().c_str(), getName(type));
			}

			for(size_t i = 0; i < converted.words.size(); i++)
			{
				converted.words[i] = static_cast<uint32_t>(read(data, type, i));
			}

			attributeFormats.emplace_back(type, converted.size);
		}

		vertexCount = min(vertexCount, attribute.getVertexCount());
		attributes.push_back(std::move(converted));
	}
}

void SoftwareVertexArray::setIndicesOffset(int offset)
{
	indicesOffset = max(offset, 0);
}

void SoftwareVertexArray::setIndicesCount(int count)
{
	indicesCount = (count < 0) ? -1 : count;
}

void SoftwareVertexArray::draw()
{
	checkCreated();

	SoftwareProgram *program = renderer.getProgram();
	if(!program)
	{
		ABORT("No program in use");
	}

	ShaderImplementation *vertexShader = program->getImplementation(ShaderType::VERTEX);
	ShaderImplementation *fragmentShader = program->getImplementation(ShaderType::FRAGMENT);
	if(!vertexShader || !fragmentShader)
	{
		ABORT("The program in use needs a compiled vertex and fragment shader");
	}

	const int totalCount = static_cast<int>(indices.size());
	const int first = min(indicesOffset, totalCount);
	const int count = (indicesCount < 0) ? totalCount - first : min(indicesCount, totalCount - first);

	if(count <= 0)
	{
		return;
	}

	ShaderBuffer vertexIn(attributeFormats);
	std::vector<ShaderBuffer> vertexOut(count, ShaderBuffer(vertexShader->getOutputFormat()));

	for(int i = 0; i < count; i++)
	{
		const int index = indices[first + i];
		if(index < 0 || index >= vertexCount)
		{
			ABORT("Index %d is outside of the %d vertices of the vertex data", index, vertexCount);
		}

		vertexIn.clear();
		for(const auto &attribute : attributes)
		{
			for(int c = 0; c < attribute.size; c++)
			{
				vertexIn.writeRaw(static_cast<int32_t>(attribute.words[index * attribute.size + c]));
			}
		}
		vertexIn.flip();

		vertexShader->main(vertexIn, vertexOut[i]);
		vertexOut[i].rewind();
	}

	renderer.draw(drawingMode, polygonMode, vertexOut, *fragmentShader);
}

}  // namespace caustic
