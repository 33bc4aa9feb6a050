// Copyright 2016 The SwiftShader Authors. All Rights Reserved.
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

#ifndef caustic_Half_hpp
#define caustic_Half_hpp

#include <cstdint>

namespace caustic {

// IEEE 754 binary16 storage.
class half
{
public:
	half() = default;
	explicit half(float f);

	operator float() const;

	half &operator=(float f);

	uint16_t bits() const { return fp16i; }
	static half fromBits(uint16_t bits);

private:
	uint16_t fp16i = 0;
};

}  // namespace caustic

#endif  // caustic_Half_hpp
