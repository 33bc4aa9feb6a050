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

#ifndef caustic_VertexArray_hpp
#define caustic_VertexArray_hpp

#include "Creatable.hpp"
#include "GLVersioned.hpp"
#include "Device/Primitive.hpp"

namespace caustic {

class VertexData;

class VertexArray : public Creatable, public GLVersioned
{
public:
	// Uploads the indices and attributes. Attributes are ordered by location.
	virtual void setData(const VertexData &vertexData) = 0;

	virtual void setDrawingMode(DrawingMode mode) = 0;
	virtual void setPolygonMode(PolygonMode mode) = 0;

	// Selects the range of indices drawn. A count of -1 draws up to the last
	// index.
	virtual void setIndicesOffset(int offset) = 0;
	virtual void setIndicesCount(int count) = 0;

	// Draws with the program in use.
	virtual void draw() = 0;
};

}  // namespace caustic

#endif  // caustic_VertexArray_hpp
