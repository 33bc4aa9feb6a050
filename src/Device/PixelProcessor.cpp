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

#include "PixelProcessor.hpp"

#include "Conversion.hpp"
#include "Primitive.hpp"
#include "Renderer.hpp"
#include "ShaderImplementation.hpp"
#include "System/Math.hpp"

namespace caustic {

PixelProcessor::PixelProcessor(Renderer &renderer, const ShaderImplementation &fragmentShader, const std::vector<ShaderBuffer> &vertices)
    : renderer(renderer)
    , fragmentShader(fragmentShader)
    , vertices(vertices)
    , source(3, vertices.front())
    , fragmentIn(vertices.front().getFormats())
    , fragmentOut(fragmentShader.getOutputFormat())
{
}

void PixelProcessor::setPrimitive(const Primitive &newPrimitive)
{
	primitive = &newPrimitive;

	// Private copies, so reading them doesn't move the shared cursors.
	for(int i = 0; i < primitive->sourceCount; i++)
	{
		source[i] = vertices[primitive->source[i]];
	}
}

void PixelProcessor::processFragment(int x, int y, const float3 &weights)
{
	const Primitive &p = *primitive;
	const int n = p.type;

	float z = 0.0f;
	float invW = 0.0f;
	for(int i = 0; i < n; i++)
	{
		z += weights[i] * p.v[i].z;
		invW += weights[i] * p.v[i].w;
	}

	// Perspective correction: weigh each vertex by its 1/w.
	float3 corrected(0.0f);
	for(int i = 0; i < n; i++)
	{
		corrected[i] = (invW > 0.0f) ? weights[i] * p.v[i].w / invW : weights[i];
	}

	float3 w(0.0f);
	for(int i = 0; i < n; i++)
	{
		w = w + p.weights[i] * corrected[i];
	}

	fragmentIn.clear();
	fragmentIn.writeRaw(bit_cast<int32_t>(static_cast<float>(x)));
	fragmentIn.writeRaw(bit_cast<int32_t>(static_cast<float>(y)));
	fragmentIn.writeRaw(bit_cast<int32_t>(z));
	fragmentIn.writeRaw(bit_cast<int32_t>(invW));

	// Skip the clip-space positions, the window position replaces them.
	for(int i = 0; i < p.sourceCount; i++)
	{
		source[i].position(4);
	}

	switch(p.sourceCount)
	{
	case 1:
		fragmentIn.writeRaw(source[0]);
		break;
	case 2:
		lerp(source[0], source[1], w[1], 1, fragmentIn);
		break;
	default:
		baryLerp(source[0], source[1], source[2], w[0], w[1], w[2], 1, fragmentIn);
		break;
	}

	fragmentIn.flip();

	fragmentOut.clear();
	fragmentShader.main(fragmentIn, fragmentOut);
	fragmentOut.rewind();

	float4 color = fragmentOut.readVector4f();
	int16_t depth = denormalizeToShort(z);

	if(renderer.testDepth(x, y, depth))
	{
		// TODO: apply the blending functions when Capability::BLEND is enabled.
		renderer.writePixel(x, y, depth, pack(color));
	}
}

}  // namespace caustic
