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

#include "SoftwareProgram.hpp"

#include "SoftwareShader.hpp"
#include "Device/Renderer.hpp"
#include "System/Debug.hpp"

namespace caustic {

SoftwareProgram::SoftwareProgram(Renderer &renderer)
    : renderer(renderer)
{
}

SoftwareProgram::~SoftwareProgram()
{
	if(isCreated())
	{
		destroy();
	}
}

void SoftwareProgram::destroy()
{
	if(renderer.getProgram() == this)
	{
		renderer.setProgram(nullptr);
	}

	shaders.clear();
	linked = false;

	Program::destroy();
}

void SoftwareProgram::attachShader(Shader &shader)
{
	checkCreated();
	checkVersion(*this, shader);

	shaders[shader.getType()] = static_cast<SoftwareShader *>(&shader);
	linked = false;
}

void SoftwareProgram::detachShader(Shader &shader)
{
	checkCreated();

	for(auto it = shaders.begin(); it != shaders.end(); ++it)
	{
		if(it->second == &shader)
		{
			shaders.erase(it);
			linked = false;
			return;
		}
	}
}

std::vector<Shader *> SoftwareProgram::getShaders() const
{
	std::vector<Shader *> attached;
	for(const auto &shader : shaders)
	{
		attached.push_back(shader.second);
	}

	return attached;
}

void SoftwareProgram::link()
{
	checkCreated();

	if(!getImplementation(ShaderType::VERTEX) || !getImplementation(ShaderType::FRAGMENT))
	{
		ABORT("Program needs a compiled vertex and fragment shader to link");
	}

	linked = true;
}

void SoftwareProgram::use()
{
	checkCreated();
	renderer.setProgram(this);
}

void SoftwareProgram::bindSampler(int unit)
{
	checkCreated();

	std::shared_ptr<const Surface> texture = renderer.getTexture(unit);
	if(!texture)
	{
		ABORT("No texture bound at unit %d", unit);
	}

	for(const auto &shader : shaders)
	{
		if(ShaderImplementation *implementation = shader.second->getImplementation())
		{
			implementation->bindTexture(unit, texture);
		}
	}
}

void SoftwareProgram::setUniform(const std::string &name, const UniformValue &value)
{
	checkCreated();

	for(const auto &shader : shaders)
	{
		if(ShaderImplementation *implementation = shader.second->getImplementation())
		{
			implementation->setUniform(name, value);
		}
	}
}

std::set<std::string> SoftwareProgram::getUniformNames() const
{
	std::set<std::string> names;

	for(const auto &shader : shaders)
	{
		if(ShaderImplementation *implementation = shader.second->getImplementation())
		{
			std::set<std::string> shaderNames = implementation->getUniformNames();
			names.insert(shaderNames.begin(), shaderNames.end());
		}
	}

	return names;
}

ShaderImplementation *SoftwareProgram::getImplementation(ShaderType type) const
{
	auto it = shaders.find(type);
	return (it != shaders.end()) ? it->second->getImplementation() : nullptr;
}

}  // namespace caustic
