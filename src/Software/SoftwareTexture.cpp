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

#include "SoftwareTexture.hpp"

#include "Device/Renderer.hpp"

namespace caustic {

SoftwareTexture::SoftwareTexture(Renderer &renderer)
    : renderer(renderer)
{
}

SoftwareTexture::~SoftwareTexture()
{
	if(isCreated())
	{
		destroy();
	}
}

void SoftwareTexture::destroy()
{
	unbind();
	surface = std::make_shared<Surface>();

	Texture::destroy();
}

void SoftwareTexture::bind(int newUnit)
{
	checkCreated();

	renderer.bindTexture(newUnit, surface);
	unit = newUnit;
}

void SoftwareTexture::unbind()
{
	if(unit >= 0)
	{
		renderer.unbindTexture(surface.get());
		unit = -1;
	}
}

void SoftwareTexture::setFormat(Format format)
{
	setFormat(getDefaultInternalFormat(format));
}

void SoftwareTexture::setFormat(InternalFormat internalFormat)
{
	checkCreated();
	surface->setFormat(TextureFormat(internalFormat));
}

Format SoftwareTexture::getFormat() const
{
	return surface->getFormat().getFormat();
}

InternalFormat SoftwareTexture::getInternalFormat() const
{
	return surface->getFormat();
}

void SoftwareTexture::setImageData(const uint8_t *data, size_t size, int width, int height)
{
	checkCreated();
	surface->setImageData(data, size, width, height);
}

std::vector<uint8_t> SoftwareTexture::getImageData(InternalFormat format) const
{
	checkCreated();
	return surface->getImageData(TextureFormat(format));
}

}  // namespace caustic
