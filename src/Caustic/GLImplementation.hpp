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

#ifndef caustic_GLImplementation_hpp
#define caustic_GLImplementation_hpp

#include "GLVersioned.hpp"

#include <functional>
#include <memory>
#include <set>

namespace caustic {

class Context;

// Registry of the backends that can create a Context, keyed by version.
// The software backend is always registered.
class GLImplementation
{
public:
	using Factory = std::function<std::unique_ptr<Context>()>;

	// Returns null, with a warning, when no backend is registered for 'version'.
	static std::unique_ptr<Context> create(GLVersion version);

	// Replaces any factory registered for 'version'.
	static void registerFactory(GLVersion version, Factory factory);

	static bool isAvailable(GLVersion version);
	static std::set<GLVersion> getAvailableVersions();
};

}  // namespace caustic

#endif  // caustic_GLImplementation_hpp
