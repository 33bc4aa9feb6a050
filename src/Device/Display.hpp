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

#ifndef caustic_Display_hpp
#define caustic_Display_hpp

#include <cstdint>
#include <string>

namespace caustic {

// Platform window the renderer presents its frames to.
class Display
{
public:
	virtual ~Display() = default;

	virtual void setTitle(const std::string &title) = 0;

	// 'pixels' holds width * height ARGB words, top row first.
	virtual void present(const uint32_t *pixels, int width, int height) = 0;

	virtual bool isCloseRequested() const = 0;
};

}  // namespace caustic

#endif  // caustic_Display_hpp
