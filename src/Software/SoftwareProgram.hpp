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

#ifndef caustic_SoftwareProgram_hpp
#define caustic_SoftwareProgram_hpp

#include "Caustic/Program.hpp"

#include <map>

namespace caustic {

class Renderer;
class SoftwareShader;

class SoftwareProgram : public Program
{
public:
	explicit SoftwareProgram(Renderer &renderer);
	~SoftwareProgram() override;

	void destroy() override;

	void attachShader(Shader &shader) override;
	void detachShader(Shader &shader) override;
	std::vector<Shader *> getShaders() const override;

	// Requires a vertex and a fragment shader.
	void link() override;
	bool isLinked() const { return linked; }

	// Makes this the renderer's active program.
	void use() override;

	void bindSampler(int unit) override;

	void setUniform(const std::string &name, const UniformValue &value) override;
	std::set<std::string> getUniformNames() const override;

	// Null when no compiled shader of that type is attached.
	ShaderImplementation *getImplementation(ShaderType type) const;

	GLVersion getGLVersion() const override { return GLVersion::SOFTWARE; }

private:
	Renderer &renderer;
	std::map<ShaderType, SoftwareShader *> shaders;
	bool linked = false;
};

}  // namespace caustic

#endif  // caustic_SoftwareProgram_hpp
