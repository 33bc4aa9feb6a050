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

#ifndef caustic_Texture_hpp
#define caustic_Texture_hpp

#include "Creatable.hpp"
#include "GLVersioned.hpp"
#include "Device/TextureFormat.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace caustic {

class Texture : public Creatable, public GLVersioned
{
public:
	virtual void bind(int unit) = 0;
	virtual void unbind() = 0;

	// Uses the default internal format of 'format'.
	virtual void setFormat(Format format) = 0;
	virtual void setFormat(InternalFormat internalFormat) = 0;
	virtual Format getFormat() const = 0;
	virtual InternalFormat getInternalFormat() const = 0;

	// 'data' holds the texels row by row in the internal format.
	virtual void setImageData(const uint8_t *data, size_t size, int width, int height) = 0;
	void setImageData(const std::vector<uint8_t> &data, int width, int height)
	{
		setImageData(data.data(), data.size(), width, height);
	}

	virtual std::vector<uint8_t> getImageData(InternalFormat format) const = 0;

	virtual int getWidth() const = 0;
	virtual int getHeight() const = 0;
};

}  // namespace caustic

#endif  // caustic_Texture_hpp
