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

#include "ShaderImplementation.hpp"

#include "Sampler.hpp"
#include "System/Debug.hpp"

#include <type_traits>

namespace {

template<typename T>
struct UniformTypeName
{
	static const char *get() { return "unknown"; }
};

#define UNIFORM_TYPE_NAME(T, name)                  \
	template<>                                      \
	struct UniformTypeName<T>                       \
	{                                               \
		static const char *get() { return name; } \
	};

UNIFORM_TYPE_NAME(bool, "bool")
UNIFORM_TYPE_NAME(int, "int")
UNIFORM_TYPE_NAME(float, "float")
UNIFORM_TYPE_NAME(std::vector<float>, "float[]")
UNIFORM_TYPE_NAME(caustic::float2, "float2")
UNIFORM_TYPE_NAME(std::vector<caustic::float2>, "float2[]")
UNIFORM_TYPE_NAME(caustic::float3, "float3")
UNIFORM_TYPE_NAME(std::vector<caustic::float3>, "float3[]")
UNIFORM_TYPE_NAME(caustic::float4, "float4")
UNIFORM_TYPE_NAME(caustic::float2x2, "float2x2")
UNIFORM_TYPE_NAME(caustic::float3x3, "float3x3")
UNIFORM_TYPE_NAME(caustic::float4x4, "float4x4")

#undef UNIFORM_TYPE_NAME

}  // anonymous namespace

namespace caustic {

void Bindings::addUniform(const std::string &name, Uniforms::Field field)
{
	bool isNull = std::visit([](auto *pointer) { return pointer == nullptr; }, field);
	if(isNull)
	{
		ABORT("Uniform \"%s\" is bound to a null field", name.c_str());
	}

	if(!uniforms.emplace(name, field).second)
	{
		ABORT("Uniform \"%s\" is declared twice", name.c_str());
	}
}

void Bindings::sampler(Sampler *sampler)
{
	this->sampler(static_cast<int>(samplers.size()), sampler);
}

void Bindings::sampler(int unit, Sampler *sampler)
{
	if(!sampler)
	{
		ABORT("Sampler for unit %d hasn't been initialized", unit);
	}

	if(!samplers.emplace(unit, sampler).second)
	{
		ABORT("Texture unit %d is declared by more than one sampler", unit);
	}
}

ShaderImplementation::ShaderImplementation(ShaderType type, std::vector<DataFormat> outputFormat)
    : type(type)
    , outputFormat(std::move(outputFormat))
{
	if(this->outputFormat.empty())
	{
		ABORT("Shader implementation declares no output format");
	}

	if(type == ShaderType::VERTEX && this->outputFormat[0] != DataFormat(DataType::FLOAT, 4))
	{
		ABORT("The first output of a vertex shader must be the FLOAT x 4 position, got %s x %d",
		      getName(this->outputFormat[0].getType()), this->outputFormat[0].getCount());
	}
}

void ShaderImplementation::compile()
{
	if(compiled)
	{
		return;
	}

	declareBindings(bindings);
	compiled = true;
}

void ShaderImplementation::setUniform(const std::string &name, const UniformValue &value)
{
	const auto &uniforms = bindings.getUniforms();
	auto it = uniforms.find(name);
	if(it == uniforms.end())
	{
		return;
	}

	std::visit([&](auto *field) {
		using T = std::remove_pointer_t<decltype(field)>;

		const T *typed = std::get_if<T>(&value);
		if(!typed)
		{
			ABORT("Uniform \"%s\" is of type %s", name.c_str(), UniformTypeName<T>::get());
		}

		*field = *typed;
	},
	           it->second);
}

std::set<std::string> ShaderImplementation::getUniformNames() const
{
	std::set<std::string> names;
	for(const auto &uniform : bindings.getUniforms())
	{
		names.insert(uniform.first);
	}
	return names;
}

void ShaderImplementation::bindTexture(int unit, const std::shared_ptr<const Surface> &texture)
{
	const auto &samplers = bindings.getSamplers();
	auto it = samplers.find(unit);
	if(it != samplers.end())
	{
		it->second->setTexture(texture);
	}
}

}  // namespace caustic
