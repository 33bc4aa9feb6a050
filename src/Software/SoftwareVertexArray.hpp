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

#ifndef caustic_SoftwareVertexArray_hpp
#define caustic_SoftwareVertexArray_hpp

#include "Caustic/VertexArray.hpp"
#include "Device/DataFormat.hpp"

#include <cstdint>
#include <vector>

namespace caustic {

class Renderer;

class SoftwareVertexArray : public VertexArray
{
public:
	explicit SoftwareVertexArray(Renderer &renderer);

	void destroy() override;

	// Converts each attribute according to its upload mode.
	void setData(const VertexData &vertexData) override;

	void setDrawingMode(DrawingMode mode) override { drawingMode = mode; }
	void setPolygonMode(PolygonMode mode) override { polygonMode = mode; }
	void setIndicesOffset(int offset) override;
	void setIndicesCount(int count) override;

	// Runs the vertex shader once per index, then rasterizes the outputs.
	void draw() override;

	const std::vector<DataFormat> &getAttributeFormats() const { return attributeFormats; }

	GLVersion getGLVersion() const override { return GLVersion::SOFTWARE; }

private:
	struct Attribute
	{
		int size;
		std::vector<uint32_t> words;
	};

	Renderer &renderer;

	std::vector<int> indices;
	std::vector<Attribute> attributes;
	std::vector<DataFormat> attributeFormats;
	int vertexCount = 0;

	DrawingMode drawingMode = DrawingMode::TRIANGLES;
	PolygonMode polygonMode = PolygonMode::FILL;
	int indicesOffset = 0;
	int indicesCount = -1;
};

}  // namespace caustic

#endif  // caustic_SoftwareVertexArray_hpp
