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

#ifndef caustic_SoftwareShader_hpp
#define caustic_SoftwareShader_hpp

#include "Caustic/Shader.hpp"

#include <memory>
#include <string>

namespace caustic {

// A shader whose source names an implementation in the ShaderRegistry.
class SoftwareShader : public Shader
{
public:
	~SoftwareShader() override;

	void destroy() override;

	void setSource(const std::string &source) override;
	const std::string &getSource() const { return source; }

	// Instantiates the implementation and discovers its bindings.
	void compile() override;

	ShaderType getType() const override;

	// Null until compiled.
	ShaderImplementation *getImplementation() const { return implementation.get(); }

	GLVersion getGLVersion() const override { return GLVersion::SOFTWARE; }

private:
	std::string source;
	std::unique_ptr<ShaderImplementation> implementation;
};

}  // namespace caustic

#endif  // caustic_SoftwareShader_hpp
