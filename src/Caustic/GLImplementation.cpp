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

#include "GLImplementation.hpp"

#include "Context.hpp"
#include "Software/SoftwareContext.hpp"
#include "System/CausticConfig.hpp"
#include "System/Debug.hpp"

#include <map>
#include <mutex>

namespace {

struct Registry
{
	std::mutex mutex;
	std::map<caustic::GLVersion, caustic::GLImplementation::Factory> factories;
};

Registry &getRegistry()
{
	static Registry registry;
	static std::once_flag once;
	std::call_once(once, [] {
		registry.factories[caustic::GLVersion::SOFTWARE] = [] {
			return std::unique_ptr<caustic::Context>(new caustic::SoftwareContext(caustic::getConfiguration()));
		};
	});

	return registry;
}

}  // anonymous namespace

namespace caustic {

std::unique_ptr<Context> GLImplementation::create(GLVersion version)
{
	Factory factory;

	{
		Registry &registry = getRegistry();
		std::unique_lock<std::mutex> lock(registry.mutex);

		auto it = registry.factories.find(version);
		if(it == registry.factories.end())
		{
			WARN("No implementation registered for %s", getName(version));
			return nullptr;
		}

		factory = it->second;
	}

	return factory();
}

void GLImplementation::registerFactory(GLVersion version, Factory factory)
{
	Registry &registry = getRegistry();
	std::unique_lock<std::mutex> lock(registry.mutex);

	registry.factories[version] = std::move(factory);
}

bool GLImplementation::isAvailable(GLVersion version)
{
	Registry &registry = getRegistry();
	std::unique_lock<std::mutex> lock(registry.mutex);

	return registry.factories.count(version) != 0;
}

std::set<GLVersion> GLImplementation::getAvailableVersions()
{
	Registry &registry = getRegistry();
	std::unique_lock<std::mutex> lock(registry.mutex);

	std::set<GLVersion> versions;
	for(const auto &factory : registry.factories)
	{
		versions.insert(factory.first);
	}

	return versions;
}

}  // namespace caustic
