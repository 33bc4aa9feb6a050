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

#include "SoftwareContext.hpp"

#include "SoftwareFrameBuffer.hpp"
#include "SoftwareProgram.hpp"
#include "SoftwareShader.hpp"
#include "SoftwareTexture.hpp"
#include "SoftwareVertexArray.hpp"
#include "Device/Conversion.hpp"
#include "System/Debug.hpp"

namespace caustic {

SoftwareContext::SoftwareContext(const Configuration &config)
    : config(config)
    , renderer(config)
{
}

SoftwareContext::~SoftwareContext()
{
	if(isCreated())
	{
		destroy();
	}
}

void SoftwareContext::create()
{
	Context::create();

	renderer.init();

	if(renderer.getClusterCount() > 1 && !marl::Scheduler::get())
	{
		scheduler = std::make_unique<marl::Scheduler>(getSchedulerConfiguration(config));
		scheduler->bind();
	}
}

void SoftwareContext::destroy()
{
	if(scheduler)
	{
		scheduler->unbind();
		scheduler.reset();
	}

	renderer.dispose();

	Context::destroy();
}

std::unique_ptr<FrameBuffer> SoftwareContext::newFrameBuffer()
{
	return std::unique_ptr<FrameBuffer>(new SoftwareFrameBuffer());
}

std::unique_ptr<Program> SoftwareContext::newProgram()
{
	return std::unique_ptr<Program>(new SoftwareProgram(renderer));
}

std::unique_ptr<Shader> SoftwareContext::newShader()
{
	return std::unique_ptr<Shader>(new SoftwareShader());
}

std::unique_ptr<Texture> SoftwareContext::newTexture()
{
	return std::unique_ptr<Texture>(new SoftwareTexture(renderer));
}

std::unique_ptr<VertexArray> SoftwareContext::newVertexArray()
{
	return std::unique_ptr<VertexArray>(new SoftwareVertexArray(renderer));
}

void SoftwareContext::setWindowTitle(const std::string &title)
{
	renderer.setWindowTitle(title);
}

std::string SoftwareContext::getWindowTitle() const
{
	return renderer.getWindowTitle();
}

void SoftwareContext::setWindowSize(int width, int height)
{
	renderer.setWindowSize(width, height);
}

int SoftwareContext::getWindowWidth() const
{
	return renderer.getWidth();
}

int SoftwareContext::getWindowHeight() const
{
	return renderer.getHeight();
}

bool SoftwareContext::isWindowCloseRequested() const
{
	return renderer.isCloseRequested();
}

void SoftwareContext::updateDisplay()
{
	checkCreated();
	renderer.render();
}

void SoftwareContext::setClearColor(const float4 &color)
{
	renderer.setClearColor(pack(color));
}

void SoftwareContext::clearCurrentBuffer()
{
	checkCreated();
	renderer.clearPixels();
}

void SoftwareContext::enableCapability(Capability capability)
{
	renderer.setCapabilityEnabled(capability, true);
}

void SoftwareContext::disableCapability(Capability capability)
{
	renderer.setCapabilityEnabled(capability, false);
}

bool SoftwareContext::isCapabilityEnabled(Capability capability) const
{
	return renderer.isCapabilityEnabled(capability);
}

void SoftwareContext::setDepthMask(bool enabled)
{
	renderer.setDepthWriting(enabled);
}

void SoftwareContext::setBlendingFunctions(int bufferIndex, BlendFunction source, BlendFunction destination)
{
	// Accepted for compatibility. The renderer does not blend.
	TRACE("Ignoring blending functions 0x%X, 0x%X for buffer %d",
	      static_cast<uint32_t>(source), static_cast<uint32_t>(destination), bufferIndex);
}

void SoftwareContext::setViewPort(const Rectangle &viewPort)
{
	renderer.setViewPort(viewPort);
}

Rectangle SoftwareContext::getViewPort() const
{
	return renderer.getViewPort();
}

std::vector<uint8_t> SoftwareContext::readFrame(const Rectangle &region, InternalFormat format) const
{
	checkCreated();
	return renderer.readFrame(region, TextureFormat(format));
}

void SoftwareContext::setDisplay(Display *display)
{
	renderer.setDisplay(display);
}

}  // namespace caustic
