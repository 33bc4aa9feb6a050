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

#ifndef caustic_Shader_hpp
#define caustic_Shader_hpp

#include "Creatable.hpp"
#include "GLVersioned.hpp"
#include "Device/ShaderImplementation.hpp"

#include <string>

namespace caustic {

class Shader : public Creatable, public GLVersioned
{
public:
	// Names the shader source. Its meaning depends on the backend.
	virtual void setSource(const std::string &source) = 0;
	virtual void compile() = 0;

	// Only valid once compiled.
	virtual ShaderType getType() const = 0;
};

}  // namespace caustic

#endif  // caustic_Shader_hpp
