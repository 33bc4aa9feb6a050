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

#include "Sampler.hpp"

#include "Surface.hpp"
#include "System/Debug.hpp"

namespace caustic {

std::shared_ptr<const Surface> Sampler::bound() const
{
	std::shared_ptr<const Surface> surface = texture.lock();
	if(!surface)
	{
		ABORT("No texture bound to sampler");
	}

	return surface;
}

float4 Sampler::sample(int x, int y) const
{
	return bound()->texel(x, y);
}

float4 Sampler::sample(float u, float v) const
{
	return bound()->sample(u, v);
}

}  // namespace caustic
