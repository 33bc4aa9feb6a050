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

#ifndef caustic_ShaderRegistry_hpp
#define caustic_ShaderRegistry_hpp

#include "Device/ShaderImplementation.hpp"

#include <functional>
#include <memory>
#include <string>

namespace caustic {

// Process-wide table of the shader implementations a SoftwareShader can be
// compiled from, keyed by the name given as the shader source.
class ShaderRegistry
{
public:
	using Factory = std::function<std::unique_ptr<ShaderImplementation>()>;

	// Replaces any implementation registered under the same name.
	static void add(const std::string &name, Factory factory);

	template<typename T>
	static void add(const std::string &name)
	{
		add(name, [] { return std::unique_ptr<ShaderImplementation>(new T()); });
	}

	static bool contains(const std::string &name);

	// Null when no implementation is registered under 'name'.
	static std::unique_ptr<ShaderImplementation> instantiate(const std::string &name);
};

}  // namespace caustic

#endif  // caustic_ShaderRegistry_hpp
