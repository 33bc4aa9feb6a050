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

#ifndef caustic_ShaderImplementation_hpp
#define caustic_ShaderImplementation_hpp

#include "DataFormat.hpp"
#include "ShaderBuffer.hpp"
#include "System/Types.hpp"

#include <map>
#include <memory>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace caustic {

class Sampler;
class Surface;

enum class ShaderType
{
	VERTEX,
	FRAGMENT,
};

template<typename... T>
struct UniformTypes
{
	using Value = std::variant<T...>;
	using Field = std::variant<T *...>;
};

using Uniforms = UniformTypes<bool, int, float, std::vector<float>,
                              float2, std::vector<float2>,
                              float3, std::vector<float3>,
                              float4, float2x2, float3x3, float4x4>;

// A value assignable to a uniform field of the same type.
using UniformValue = Uniforms::Value;

// Uniform and sampler fields a shader exposes, declared by the shader in
// declareBindings().
class Bindings
{
public:
	template<typename T>
	void uniform(const std::string &name, T *field)
	{
		addUniform(name, Uniforms::Field(field));
	}

	// Assigns the next unit in declaration order.
	void sampler(Sampler *sampler);
	void sampler(int unit, Sampler *sampler);

	const std::map<std::string, Uniforms::Field> &getUniforms() const { return uniforms; }
	const std::map<int, Sampler *> &getSamplers() const { return samplers; }

private:
	void addUniform(const std::string &name, Uniforms::Field field);

	std::map<std::string, Uniforms::Field> uniforms;
	std::map<int, Sampler *> samplers;
};

// A vertex or fragment stage executed on the CPU. Subclasses declare their
// output format, register their uniforms and samplers, and implement main().
//
// A vertex stage's first output slot is the clip-space position (FLOAT x 4).
// A fragment stage's input starts with the window position (x, y, z, 1/w)
// followed by the vertex outputs after the position, and its first output
// slot is the RGBA color (FLOAT x 4).
class ShaderImplementation
{
public:
	virtual ~ShaderImplementation() = default;

	// Bindings point into the instance, so it cannot be copied.
	ShaderImplementation(const ShaderImplementation &) = delete;
	ShaderImplementation &operator=(const ShaderImplementation &) = delete;

	ShaderType getType() const { return type; }
	const std::vector<DataFormat> &getOutputFormat() const { return outputFormat; }

	// Discovers the bindings. Runs once; later calls have no effect.
	void compile();
	bool isCompiled() const { return compiled; }

	// Unknown names are ignored, since a uniform may only exist in the other stage.
	void setUniform(const std::string &name, const UniformValue &value);
	std::set<std::string> getUniformNames() const;

	void bindTexture(int unit, const std::shared_ptr<const Surface> &texture);

	// Must be reentrant: fragments of different row bands run concurrently.
	virtual void main(InBuffer &in, OutBuffer &out) const = 0;

protected:
	ShaderImplementation(ShaderType type, std::vector<DataFormat> outputFormat);

	virtual void declareBindings(Bindings &bindings) = 0;

private:
	const ShaderType type;
	const std::vector<DataFormat> outputFormat;

	bool compiled = false;
	Bindings bindings;
};

}  // namespace caustic

#endif  // caustic_ShaderImplementation_hpp
