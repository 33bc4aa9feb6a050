// Copyright 2022 The SwiftShader Authors. All Rights Reserved.
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

#include "CausticConfig.hpp"

#include "Configurator.hpp"
#include "Debug.hpp"
#include "Device/Config.hpp"

#include "marl/scheduler.h"
#include "marl/thread.h"

#include <algorithm>
#include <cctype>
#include <limits>

namespace {

std::string toLowerStr(const std::string &str)
{
	std::string lower = str;
	std::transform(lower.begin(), lower.end(), lower.begin(),
	               [](unsigned char c) { return std::tolower(c); });
	return lower;
}

marl::Thread::Core getCoreFromIndex(uint8_t coreIndex)
{
	marl::Thread::Core core = {};
#if defined(_WIN32)
	// Only one processor group is used when an explicit mask is given.
	core.windows.group = 0;
	core.windows.index = coreIndex;
#else
	core.pthread.index = coreIndex;
#endif
	return core;
}

marl::Thread::Affinity getAffinityFromMask(uint64_t affinityMask)
{
	if(affinityMask == std::numeric_limits<uint64_t>::max())
	{
		return marl::Thread::Affinity::all();
	}

	ASSERT(affinityMask != 0);
	marl::containers::vector<marl::Thread::Core, 32> cores;
	uint8_t coreIndex = 0;
	while(affinityMask)
	{
		if(affinityMask & 1)
		{
			cores.push_back(getCoreFromIndex(coreIndex));
		}
		++coreIndex;
		affinityMask >>= 1;
	}

	return marl::Thread::Affinity(cores, marl::Allocator::Default);
}

std::shared_ptr<marl::Thread::Affinity::Policy> getAffinityPolicy(marl::Thread::Affinity &&affinity, caustic::Configuration::AffinityPolicy affinityPolicy)
{
	switch(affinityPolicy)
	{
	case caustic::Configuration::AffinityPolicy::AnyOf:
		return marl::Thread::Affinity::Policy::anyOf(std::move(affinity));
	case caustic::Configuration::AffinityPolicy::OneOf:
		return marl::Thread::Affinity::Policy::oneOf(std::move(affinity));
	default:
		UNREACHABLE("unknown affinity policy");
	}
	return nullptr;
}

}  // namespace

namespace caustic {

Configuration readConfiguration(const Configurator &ini)
{
	Configuration config{};

	config.threadCount = ini.getInteger<uint32_t>("Processor", "ThreadCount", 0);
	config.affinityMask = ini.getInteger<uint64_t>("Processor", "AffinityMask", 0xFFFFFFFFFFFFFFFFu);
	if(config.affinityMask == 0)
	{
		warn("Affinity mask is empty, using all-cores affinity\n");
		config.affinityMask = 0xFFFFFFFFFFFFFFFFu;
	}

	std::string affinityPolicy = toLowerStr(ini.getValue("Processor", "AffinityPolicy", "any"));
	config.affinityPolicy = (affinityPolicy == "one") ? Configuration::AffinityPolicy::OneOf
	                                                  : Configuration::AffinityPolicy::AnyOf;

	config.clusterCount = ini.getInteger<uint32_t>("Renderer", "ClusterCount", 0);
	if(config.clusterCount > MaxClusterCount)
	{
		warn("ClusterCount %u exceeds the maximum of %d\n", config.clusterCount, MaxClusterCount);
		config.clusterCount = MaxClusterCount;
	}

	config.boundsChecking = ini.getBoolean("Debug", "BoundsChecking", false);

	return config;
}

const Configuration &getConfiguration()
{
	static Configuration config = readConfiguration(Configurator("Caustic.ini"));
	return config;
}

uint32_t getThreadCount(const Configuration &config)
{
	if(config.threadCount != 0)
	{
		return config.threadCount;
	}

	return static_cast<uint32_t>(std::min<size_t>(marl::Thread::numLogicalCPUs(), 16));
}

uint32_t getClusterCount(const Configuration &config)
{
	uint32_t clusterCount = (config.clusterCount == 0) ? getThreadCount(config) : config.clusterCount;

	return std::clamp<uint32_t>(clusterCount, 1, MaxClusterCount);
}

marl::Scheduler::Config getSchedulerConfiguration(const Configuration &config)
{
	auto affinity = getAffinityFromMask(config.affinityMask);
	auto affinityPolicy = getAffinityPolicy(std::move(affinity), config.affinityPolicy);

	marl::Scheduler::Config cfg;
	cfg.setWorkerThreadCount(static_cast<int>(getThreadCount(config)));
	cfg.setWorkerThreadAffinityPolicy(affinityPolicy);
	return cfg;
}

}  // namespace caustic
