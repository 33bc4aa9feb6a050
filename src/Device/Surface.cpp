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

#include "Surface.hpp"

#include "Conversion.hpp"
#include "System/Debug.hpp"
#include "System/Math.hpp"

namespace caustic {

void Surface::setFormat(TextureFormat newFormat)
{
	if(newFormat == format)
	{
		return;
	}

	if(!data.empty())
	{
		data = getImageData(newFormat);
	}

	format = newFormat;
}

void Surface::setImageData(const uint8_t *source, size_t size, int newWidth, int newHeight)
{
	if(newWidth < 0 || newHeight < 0)
	{
		ABORT("Invalid image size %dx%d", newWidth, newHeight);
	}

	size_t required = static_cast<size_t>(newWidth) * newHeight * format.getBytes();
	if(size < required)
	{
		ABORT("Image data of %zu bytes is too small for %dx%d texels of %d bytes",
		      size, newWidth, newHeight, format.getBytes());
	}

	data.assign(source, source + required);
	width = newWidth;
	height = newHeight;
}

std::vector<uint8_t> Surface::getImageData(TextureFormat destination) const
{
	size_t texels = static_cast<size_t>(width) * height;
	std::vector<uint8_t> result(texels * destination.getBytes());

	DataType sourceType = format.getComponentType();
	DataType destinationType = destination.getComponentType();
	int sourceCount = format.getComponentCount();
	int destinationCount = destination.getComponentCount();

	// Value written for a color channel the source does not have.
	const int32_t missing[4] = { 0, 0, 0, fromFloat(destinationType, 1.0f, true) };

	for(size_t i = 0; i < texels; i++)
	{
		for(int channel = 0; channel < 4; channel++)
		{
			int d = destination.getComponentIndex(channel);
			if(d < 0)
			{
				continue;
			}

			size_t destinationIndex = i * destinationCount + d;
			int s = format.getComponentIndex(channel);

			if(s < 0)
			{
				write(result.data(), destinationType, missing[channel], destinationIndex);
			}
			else
			{
				copy(data.data(), sourceType, i * sourceCount + s, result.data(), destinationType, destinationIndex);
			}
		}
	}

	return result;
}

float4 Surface::texel(int x, int y) const
{
	if(data.empty())
	{
		ABORT("Sampling a texture with no image data");
	}

	// No wrap modes: coordinates outside the image read the edge texel.
	x = clamp(x, 0, width - 1);
	y = clamp(y, 0, height - 1);

	DataType type = format.getComponentType();
	int count = format.getComponentCount();
	size_t base = (static_cast<size_t>(y) * width + x) * count;
	ASSERT((base + count) * getByteSize(type) <= data.size());

	float4 color(0.0f, 0.0f, 0.0f, 1.0f);
	for(int channel = 0; channel < 4; channel++)
	{
		int c = format.getComponentIndex(channel);
		if(c >= 0)
		{
			color[channel] = readAsFloat(data.data(), type, base + c);
		}
	}

	return color;
}

float4 Surface::sample(float u, float v) const
{
	return texel(saturateToInt(u * (width - 1)), saturateToInt(v * (height - 1)));
}

}  // namespace caustic
