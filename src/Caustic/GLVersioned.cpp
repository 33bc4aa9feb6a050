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

#include "GLVersioned.hpp"

#include "System/Debug.hpp"

namespace caustic {

int getMajor(GLVersion version)
{
	switch(version)
	{
	case GLVersion::GL20:
	case GLVersion::GL21:
	case GLVersion::GLES20:
		return 2;
	case GLVersion::GL30:
	case GLVersion::GL32:
	case GLVersion::GLES30:
		return 3;
	case GLVersion::SOFTWARE:
		return 0;
	}

	UNREACHABLE("GLVersion %d", static_cast<int>(version));
	return 0;
}

int getMinor(GLVersion version)
{
	switch(version)
	{
	case GLVersion::GL21: return 1;
	case GLVersion::GL32: return 2;
	default: return 0;
	}
}

bool isES(GLVersion version)
{
	return version == GLVersion::GLES20 || version == GLVersion::GLES30;
}

const char *getName(GLVersion version)
{
	switch(version)
	{
	case GLVersion::GL20: return "GL20";
	case GLVersion::GL21: return "GL21";
	case GLVersion::GL30: return "GL30";
	case GLVersion::GL32: return "GL32";
	case GLVersion::GLES20: return "GLES20";
	case GLVersion::GLES30: return "GLES30";
	case GLVersion::SOFTWARE: return "SOFTWARE";
	}

	return "UNKNOWN";
}

void checkVersion(const GLVersioned &required, const GLVersioned &object)
{
	if(required.getGLVersion() != object.getGLVersion())
	{
		ABORT("Version mismatch: expected %s, got %s",
		      getName(required.getGLVersion()), getName(object.getGLVersion()));
	}
}

}  // namespace caustic
