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

#ifndef caustic_CausticConfig_hpp
#define caustic_CausticConfig_hpp

#include "marl/scheduler.h"

#include <cstdint>
#include <string>

namespace caustic {

class Configurator;

struct Configuration
{
	enum class AffinityPolicy : int
	{
		// A thread has affinity with any core in the affinity mask.
		AnyOf = 0,
		// A thread has affinity with a single core in the affinity mask.
		OneOf = 1,
	};

	// -------- [Processor] --------
	// Number of threads used by the scheduler. A thread count of 0 is
	// interpreted as min(cpu_cores_available, 16).
	uint32_t threadCount = 0;

	// Core affinity and affinity policy used by the scheduler.
	uint64_t affinityMask = 0xFFFFFFFFFFFFFFFFu;
	AffinityPolicy affinityPolicy = AffinityPolicy::AnyOf;

	// -------- [Renderer] --------
	// Number of row bands rasterized concurrently. 0 matches the thread
	// count, 1 rasterizes everything on the calling thread.
	uint32_t clusterCount = 0;

	// -------- [Debug] --------
	// Out-of-bounds pixel reads and writes abort instead of being ignored.
	bool boundsChecking = false;
};

// Parses the configuration options from an already loaded file.
Configuration readConfiguration(const Configurator &ini);

// Get the configuration as parsed from Caustic.ini in the working directory.
const Configuration &getConfiguration();

// Resolves a thread count of 0 to the number of usable cores.
uint32_t getThreadCount(const Configuration &config);

// Resolves the cluster count, clamped to [1, MaxClusterCount].
uint32_t getClusterCount(const Configuration &config);

// Get the scheduler configuration given a configuration.
marl::Scheduler::Config getSchedulerConfiguration(const Configuration &config);

}  // namespace caustic

#endif  // caustic_CausticConfig_hpp
