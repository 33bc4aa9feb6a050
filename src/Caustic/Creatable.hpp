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

#ifndef caustic_Creatable_hpp
#define caustic_Creatable_hpp

namespace caustic {

// An object holding resources between create() and destroy(). Using an
// object outside that window is a fatal error.
class Creatable
{
public:
	virtual ~Creatable() = default;

	virtual void create();
	virtual void destroy();

	bool isCreated() const { return created; }

	void checkCreated() const;
	void checkNotCreated() const;

private:
	bool created = false;
};

}  // namespace caustic

#endif  // caustic_Creatable_hpp
