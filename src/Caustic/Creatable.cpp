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

#include "Creatable.hpp"

#include "System/Debug.hpp"

namespace caustic {

void Creatable::create()
{
	checkNotCreated();
	created = true;
}

void Creatable::destroy()
{
	checkCreated();
	created = false;
}

void Creatable::checkCreated() const
{
	if(!created)
	{
		ABORT("Resource has not been created yet");
	}
}

void Creatable::checkNotCreated() const
{
	if(created)
	{
		ABORT("Resource has been created already");
	}
}

}  // namespace caustic
