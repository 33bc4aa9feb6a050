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

#ifndef caustic_SoftwareFrameBuffer_hpp
#define caustic_SoftwareFrameBuffer_hpp

#include "Caustic/FrameBuffer.hpp"

#include <map>

namespace caustic {

// Keeps track of attachments only. Drawing always targets the window surface.
class SoftwareFrameBuffer : public FrameBuffer
{
public:
	void destroy() override;

	void bind() override;
	void unbind() override;

	void attach(AttachmentPoint point, Texture &texture) override;
	void detach(AttachmentPoint point) override;
	Texture *getAttachment(AttachmentPoint point) const;

	bool isComplete() const override;

	GLVersion getGLVersion() const override { return GLVersion::SOFTWARE; }

private:
	std::map<AttachmentPoint, Texture *> attachments;
};

}  // namespace caustic

#endif  // caustic_SoftwareFrameBuffer_hpp
