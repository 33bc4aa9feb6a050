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

#ifndef caustic_FrameBuffer_hpp
#define caustic_FrameBuffer_hpp

#include "Creatable.hpp"
#include "GLVersioned.hpp"

#include <cstdint>

namespace caustic {

class Texture;

// The values match the OpenGL enumerants.
enum class AttachmentPoint : uint32_t
{
	COLOR0 = 0x8CE0,
	COLOR1 = 0x8CE1,
	COLOR2 = 0x8CE2,
	COLOR3 = 0x8CE3,
	DEPTH = 0x8D00,
	STENCIL = 0x8D20,
	DEPTH_STENCIL = 0x821A,
};

class FrameBuffer : public Creatable, public GLVersioned
{
public:
	virtual void bind() = 0;
	virtual void unbind() = 0;

	// The texture is not owned and must outlive the attachment.
	virtual void attach(AttachmentPoint point, Texture &texture) = 0;
	virtual void detach(AttachmentPoint point) = 0;

	virtual bool isComplete() const = 0;
};

}  // namespace caustic

#endif  // caustic_FrameBuffer_hpp
