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
// Draws a shaded triangle off-screen and prints it as text.

#include "Caustic/Context.hpp"
#include "Caustic/GLImplementation.hpp"
#include "Caustic/Program.hpp"
#include "Caustic/Shader.hpp"
#include "Caustic/VertexArray.hpp"
#include "Caustic/VertexData.hpp"
#include "Software/ShaderRegistry.hpp"

#include <cstdio>

namespace {

class TriangleVertexShader : public caustic::ShaderImplementation
{
public:
	TriangleVertexShader()
	    : caustic::ShaderImplementation(caustic::ShaderType::VERTEX, { caustic::DataFormat(caustic::DataType::FLOAT, 4), caustic::DataFormat(caustic::DataType::FLOAT, 4) })
	{
	}

	void main(caustic::InBuffer &in, caustic::OutBuffer &out) const override
	{
		caustic::float2 position = in.readVector2f();
		out.writeVector4f(caustic::float4(position.x, position.y, 0.0f, 1.0f));
		out.writeVector4f(in.readVector4f());
	}

protected:
	void declareBindings(caustic::Bindings &bindings) override {}
};

class TriangleFragmentShader : public caustic::ShaderImplementation
{
public:
	TriangleFragmentShader()
	    : caustic::ShaderImplementation(caustic::ShaderType::FRAGMENT, { caustic::DataFormat(caustic::DataType::FLOAT, 4) })
	{
	}

	void main(caustic::InBuffer &in, caustic::OutBuffer &out) const override
	{
		in.skip();
		out.writeVector4f(in.readVector4f());
	}

protected:
	void declareBindings(caustic::Bindings &bindings) override {}
};

}  // anonymous namespace

int main()
{
	using namespace caustic;

	ShaderRegistry::add<TriangleVertexShader>("triangle.vert");
	ShaderRegistry::add<TriangleFragmentShader>("triangle.frag");

	std::unique_ptr<Context> context = GLImplementation::create(GLVersion::SOFTWARE);
	context->setWindowTitle("Hello Triangle");
	context->setWindowSize(48, 24);
	context->create();

	std::unique_ptr<Shader> vertexShader = context->newShader();
	vertexShader->create();
	vertexShader->setSource("triangle.vert");
	vertexShader->compile();

	std::unique_ptr<Shader> fragmentShader = context->newShader();
	fragmentShader->create();
	fragmentShader->setSource("triangle.frag");
	fragmentShader->compile();

	std::unique_ptr<Program> program = context->newProgram();
	program->create();
	program->attachShader(*vertexShader);
	program->attachShader(*fragmentShader);
	program->link();
	program->use();

	VertexAttribute position("position", DataType::FLOAT, 2);
	position.setData(std::vector<float>{ -0.8f, -0.8f, 0.8f, -0.8f, 0.0f, 0.8f });

	VertexAttribute color("color", DataType::UNSIGNED_BYTE, 4, UploadMode::TO_FLOAT_NORMALIZE);
	color.setData(std::vector<uint8_t>{ 255, 0, 0, 255, 0, 255, 0, 255, 0, 0, 255, 255 });

	VertexData vertexData;
	vertexData.addAttribute(0, position);
	vertexData.addAttribute(1, color);
	vertexData.getIndices() = { 0, 1, 2 };

	std::unique_ptr<VertexArray> vertexArray = context->newVertexArray();
	vertexArray->create();
	vertexArray->setData(vertexData);

	context->setClearColor(float4(0.0f, 0.0f, 0.0f, 1.0f));
	context->clearCurrentBuffer();
	vertexArray->draw();
	context->updateDisplay();

	// The frame starts with the bottom row.
	const int width = context->getWindowWidth();
	const int height = context->getWindowHeight();
	std::vector<uint8_t> frame = context->readFrame(Rectangle(0, 0, width, height), InternalFormat::RGB8);

	for(int y = height - 1; y >= 0; y--)
	{
		for(int x = 0; x < width; x++)
		{
			const uint8_t *rgb = &frame[(y * width + x) * 3];
			char c = '.';
			if(rgb[0] > rgb[1] && rgb[0] > rgb[2]) { c = 'R'; }
			else if(rgb[1] > rgb[2]) { c = 'G'; }
			else if(rgb[2] > 0) { c = 'B'; }
			putchar(c);
		}
		putchar('\n');
	}

	vertexArray->destroy();
	program->destroy();
	fragmentShader->destroy();
	vertexShader->destroy();
	context->destroy();

	return 0;
}
