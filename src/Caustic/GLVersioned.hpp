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

#ifndef caustic_GLVersioned_hpp
#define caustic_GLVersioned_hpp

namespace caustic {

enum class GLVersion
{
	GL20,
	GL21,
	GL30,
	GL32,
	GLES20,
	GLES30,
	SOFTWARE,
};

int getMajor(GLVersion version);
int getMinor(GLVersion version);
bool isES(GLVersion version);
const char *getName(GLVersion version);

// Implemented by every object tied to a backend. Objects of different
// backends cannot be combined.
class GLVersioned
{
public:
	virtual ~GLVersioned() = default;

	virtual GLVersion getGLVersion() const = 0;
};

// Fatal if the two objects come from different backends.
void checkVersion(const GLVersioned &required, const GLVersioned &object);

}  // namespace caustic

#endif  // caustic_GLVersioned_hpp
