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

#include "ShaderRegistry.hpp"

#include <map>
#include <mutex>

namespace {

std::mutex registryMutex;

std::map<std::string, caustic::ShaderRegistry::Factory> &getFactories()
{
	static std::map<std::string, caustic::ShaderRegistry::Factory> factories;
	return factories;
}

}  // anonymous namespace

namespace caustic {

void ShaderRegistry::add(const std::string &name, Factory factory)
{
	std::unique_lock<std::mutex> lock(registryMutex);
	getFactories()[name] = std::move(factory);
}

bool ShaderRegistry::contains(const std::string &name)
{
	std::unique_lock<std::mutex> lock(registryMutex);
	return getFactories().count(name) != 0;
}

std::unique_ptr<ShaderImplementation> ShaderRegistry::instantiate(const std::string &name)
{
	Factory factory;

	{
		std::unique_lock<std::mutex> lock(registryMutex);

		auto it = getFactories().find(name);
		if(it == getFactories().end())
		{
			return nullptr;
		}

		factory = it->second;
	}

	return factory();
}

}  // namespace caustic
