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

#ifndef caustic_SoftwareTexture_hpp
#define caustic_SoftwareTexture_hpp

#include "Caustic/Texture.hpp"
#include "Device/Surface.hpp"

#include <cstddef>
#include <memory>

namespace caustic {

class Renderer;

class SoftwareTexture : public Texture
{
public:
	explicit SoftwareTexture(Renderer &renderer);
	~SoftwareTexture() override;

	void destroy() override;

	void bind(int unit) override;
	void unbind() override;

	void setFormat(Format format) override;
	void setFormat(InternalFormat internalFormat) override;
	Format getFormat() const override;
	InternalFormat getInternalFormat() const override;

	using Texture::setImageData;
	void setImageData(const uint8_t *data, size_t size, int width, int height) override;
	std::vector<uint8_t> getImageData(InternalFormat format) const override;

	int getWidth() const override { return surface->getWidth(); }
	int getHeight() const override { return surface->getHeight(); }

	GLVersion getGLVersion() const override { return GLVersion::SOFTWARE; }

private:
	Renderer &renderer;
	// Samplers hold weak references, so they observe the release on destroy().
	std::shared_ptr<Surface> surface = std::make_shared<Surface>();
	int unit = -1;
};

}  // namespace caustic

#endif  // caustic_SoftwareTexture_hpp
