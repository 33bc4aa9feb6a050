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

#ifndef caustic_Sampler_hpp
#define caustic_Sampler_hpp

#include "System/Types.hpp"

#include <memory>
#include <utility>

namespace caustic {

class Surface;

// Shader-visible handle to the texture bound to a unit. The texture is not
// owned; it is rebound each time the program binds its samplers. Sampling
// after the texture was destroyed aborts like sampling an unbound unit.
class Sampler
{
public:
	void setTexture(std::weak_ptr<const Surface> surface) { texture = std::move(surface); }
	std::shared_ptr<const Surface> getTexture() const { return texture.lock(); }

	// Pixel coordinates.
	float4 sample(int x, int y) const;
	float4 sample(const int2 &position) const { return sample(position.x, position.y); }

	// Normalized coordinates in [0, 1].
	float4 sample(float u, float v) const;
	float4 sample(const float2 &position) const { return sample(position.x, position.y); }

private:
	std::shared_ptr<const Surface> bound() const;

	std::weak_ptr<const Surface> texture;
};

}  // namespace caustic

#endif  // caustic_Sampler_hpp
