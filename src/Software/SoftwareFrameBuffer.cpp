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

#include "SoftwareFrameBuffer.hpp"

#include "Caustic/Texture.hpp"

namespace caustic {

void SoftwareFrameBuffer::destroy()
{
	attachments.clear();
	FrameBuffer::destroy();
}

void SoftwareFrameBuffer::bind()
{
	checkCreated();
}

void SoftwareFrameBuffer::unbind()
{
	checkCreated();
}

void SoftwareFrameBuffer::attach(AttachmentPoint point, Texture &texture)
{
	checkCreated();
	checkVersion(*this, texture);

	attachments[point] = &texture;
}

void SoftwareFrameBuffer::detach(AttachmentPoint point)
{
	checkCreated();
	attachments.erase(point);
}

Texture *SoftwareFrameBuffer::getAttachment(AttachmentPoint point) const
{
	auto it = attachments.find(point);
	return (it != attachments.end()) ? it->second : nullptr;
}

bool SoftwareFrameBuffer::isComplete() const
{
	// TODO: render into the attached textures instead of the window surface.
	return false;
}

}  // namespace caustic
