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

#ifndef caustic_Program_hpp
#define caustic_Program_hpp

#include "Creatable.hpp"
#include "GLVersioned.hpp"
#include "Device/ShaderImplementation.hpp"

#include <set>
#include <string>
#include <vector>

namespace caustic {

class Shader;

// A vertex and a fragment shader linked together. Attached shaders are not
// owned and must outlive the program.
class Program : public Creatable, public GLVersioned
{
public:
	// Replaces any shader of the same type.
	virtual void attachShader(Shader &shader) = 0;
	virtual void detachShader(Shader &shader) = 0;
	virtual std::vector<Shader *> getShaders() const = 0;

	virtual void link() = 0;
	virtual void use() = 0;

	// Binds the texture at 'unit' to the shaders' sampler of the same unit.
	virtual void bindSampler(int unit) = 0;

	virtual void setUniform(const std::string &name, const UniformValue &value) = 0;
	virtual std::set<std::string> getUniformNames() const = 0;
};

}  // namespace caustic

#endif  // caustic_Program_hpp
