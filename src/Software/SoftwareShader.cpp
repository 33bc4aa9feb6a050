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

#include "SoftwareShader.hpp"

#include "ShaderRegistry.hpp"
#include "System/Debug.hpp"

namespace caustic {

SoftwareShader::~SoftwareShader()
{
	if(isCreated())
	{
		destroy();
	}
}

void SoftwareShader::destroy()
{
	implementation.reset();
	source.clear();

	Shader::destroy();
}

void SoftwareShader::setSource(const std::string &newSource)
{
	checkCreated();
	source = newSource;
}

void SoftwareShader::compile()
{
	checkCreated();

	implementation = ShaderRegistry::instantiate(source);
	if(!implementation)
	{
		ABORT("No shader implementation named \"%s\"", source.c_str());
	}

	implementation->compile();
}

ShaderType SoftwareShader::getType() const
{
	if(!implementation)
	{
		ABORT("Shader \"%s\" has not been compiled", source.c_str());
	}

	return implementation->getType();
}

}  // namespace caustic
