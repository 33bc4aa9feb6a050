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
#include "TestShaders.hpp"

#include "Caustic/FrameBuffer.hpp"
#include "Caustic/Program.hpp"
#include "Caustic/Shader.hpp"
#include "Caustic/Texture.hpp"
#include "Caustic/VertexArray.hpp"
#include "Caustic/VertexData.hpp"
#include "Device/Config.hpp"
#include "Device/Conversion.hpp"
#include "Device/Display.hpp"
#include "Software/SoftwareContext.hpp"
#include "Software/SoftwareFrameBuffer.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace caustic;
using namespace caustic::test;

using testing::_;

namespace {

class MockDisplay : public Display
{
public:
	MOCK_METHOD(void, setTitle, (const std::string &title), (override));
	MOCK_METHOD(void, present, (const uint32_t *pixels, int width, int height), (override));
	MOCK_METHOD(bool, isCloseRequested, (), (const, override));
};

// A shader of another backend.
class ForeignShader : public Shader
{
public:
	void setSource(const std::string &source) override {}
	void compile() override {}
	ShaderType getType() const override { return ShaderType::VERTEX; }
	GLVersion getGLVersion() const override { return GLVersion::GL20; }
};

const float4 red(1.0f, 0.0f, 0.0f, 1.0f);
const float4 green(0.0f, 1.0f, 0.0f, 1.0f);
const float4 blue(0.0f, 0.0f, 1.0f, 1.0f);

const uint32_t black = 0xFF000000;

Configuration clusters(uint32_t count)
{
	Configuration config;
	config.clusterCount = count;
	return config;
}

VertexData positions(const std::vector<float> &xyz, const std::vector<int> &indices)
{
	VertexAttribute position("position", DataType::FLOAT, 3);
	position.setData(xyz);

	VertexData vertexData;
	vertexData.addAttribute(0, position);
	vertexData.getIndices() = indices;
	return vertexData;
}

// Corners of the view as 0 or 1, kept as integers.
VertexData gridQuad()
{
	VertexAttribute corner("corner", DataType::UNSIGNED_BYTE, 2, UploadMode::KEEP_INT);
	corner.setData(std::vector<uint8_t>{ 0, 0, 1, 0, 0, 1, 1, 1 });

	VertexData vertexData;
	vertexData.addAttribute(0, corner);
	vertexData.getIndices() = { 0, 1, 2, 2, 1, 3 };
	return vertexData;
}

class ContextTest : public testing::Test
{
protected:
	explicit ContextTest(uint32_t clusterCount = 1)
	    : context(clusters(clusterCount))
	{
	}

	void SetUp() override
	{
		registerTestShaders();

		context.setWindowSize(16, 16);
		context.create();
	}

	Shader &newShader(const std::string &source)
	{
		shaders.push_back(context.newShader());

		Shader &shader = *shaders.back();
		shader.create();
		shader.setSource(source);
		shader.compile();
		return shader;
	}

	std::unique_ptr<Program> newProgram(const std::string &vertex, const std::string &fragment)
	{
		std::unique_ptr<Program> program = context.newProgram();
		program->create();
		program->attachShader(newShader(vertex));
		program->attachShader(newShader(fragment));
		program->link();
		program->use();
		return program;
	}

	std::unique_ptr<VertexArray> newVertexArray(const VertexData &vertexData)
	{
		std::unique_ptr<VertexArray> vertexArray = context.newVertexArray();
		vertexArray->create();
		vertexArray->setData(vertexData);
		return vertexArray;
	}

	uint32_t pixel(int x, int y) const
	{
		return context.getRenderer().readPixel(x, y);
	}

	int countPixels(uint32_t argb) const
	{
		int count = 0;
		for(uint32_t p : context.getRenderer().getPixels())
		{
			count += (p == argb) ? 1 : 0;
		}
		return count;
	}

	SoftwareContext context;
	std::vector<std::unique_ptr<Shader>> shaders;
};

using ContextDeathTest = ContextTest;

}  // anonymous namespace

TEST_F(ContextTest, Window)
{
	context.setWindowTitle("Caustic");

	EXPECT_EQ(context.getWindowTitle(), "Caustic");
	EXPECT_EQ(context.getWindowWidth(), 16);
	EXPECT_EQ(context.getWindowHeight(), 16);
	EXPECT_EQ(context.getViewPort(), Rectangle(0, 0, 16, 16));
	EXPECT_FALSE(context.isWindowCloseRequested());
	EXPECT_EQ(context.getGLVersion(), GLVersion::SOFTWARE);
}

TEST_F(ContextTest, UpdateDisplayPresentsTheFrame)
{
	MockDisplay display;

	EXPECT_CALL(display, setTitle(_)).Times(testing::AnyNumber());
	EXPECT_CALL(display, present(_, 16, 16)).Times(2);
	EXPECT_CALL(display, isCloseRequested()).WillOnce(testing::Return(true));

	context.setDisplay(&display);
	context.updateDisplay();
	context.updateDisplay();

	EXPECT_TRUE(context.isWindowCloseRequested());

	context.setDisplay(nullptr);
	context.updateDisplay();
}

TEST_F(ContextTest, ClearUsesTheClearColor)
{
	context.setClearColor(float4(0.0f, 0.0f, 1.0f, 1.0f));
	context.clearCurrentBuffer();

	EXPECT_EQ(context.readFrame(Rectangle(0, 0, 1, 1), InternalFormat::RGBA8), std::vector<uint8_t>({ 0, 0, 255, 255 }));
	EXPECT_EQ(countPixels(pack(blue)), 256);
}

TEST_F(ContextTest, Capabilities)
{
	EXPECT_FALSE(context.isCapabilityEnabled(Capability::DEPTH_TEST));

	context.enableCapability(Capability::DEPTH_TEST);
	context.enableCapability(Capability::BLEND);
	context.setBlendingFunctions(BlendFunction::SRC_ALPHA, BlendFunction::ONE_MINUS_SRC_ALPHA);

	EXPECT_TRUE(context.isCapabilityEnabled(Capability::DEPTH_TEST));
	EXPECT_TRUE(context.isCapabilityEnabled(Capability::BLEND));

	context.disableCapability(Capability::DEPTH_TEST);
	EXPECT_FALSE(context.isCapabilityEnabled(Capability::DEPTH_TEST));

	context.setDepthMask(false);
	EXPECT_FALSE(context.getRenderer().isDepthWriting());
}

TEST_F(ContextTest, ScreenTriangle)
{
	auto program = newProgram("solid.vert", "solid.frag");
	program->setUniform("color", green);

	auto vertexArray = newVertexArray(positions({ -1.0f, -1.0f, 0.5f,
	                                              3.0f, -1.0f, 0.5f,
	                                              -1.0f, 3.0f, 0.5f },
	                                            { 0, 1, 2 }));

	context.enableCapability(Capability::DEPTH_TEST);
	vertexArray->draw();

	std::vector<uint8_t> frame = context.readFrame(Rectangle(0, 0, 16, 16), InternalFormat::RGBA8);
	ASSERT_EQ(frame.size(), 16u * 16u * 4u);

	// Every pixel, including the last row and column.
	for(int row = 0; row < 16; row++)
	{
		for(int column = 0; column < 16; column++)
		{
			const uint8_t *rgba = &frame[(row * 16 + column) * 4];
			EXPECT_THAT(std::vector<uint8_t>(rgba, rgba + 4), testing::ElementsAre(0, 255, 0, 255))
			    << "row " << row << ", column " << column;
		}
	}

	// z = 0.5 lies at 0.75 in the depth range.
	EXPECT_EQ(context.getRenderer().readDepth(7, 7), denormalizeToShort(0.75f));
	EXPECT_EQ(context.getRenderer().readDepth(15, 15), denormalizeToShort(0.75f));
	EXPECT_EQ(countPixels(pack(green)), 16 * 16);
}

TEST_F(ContextTest, VertexColorsAreInterpolated)
{
	auto program = newProgram("color.vert", "color.frag");

	VertexData vertexData = positions({ -1.0f, 1.0f, 0.0f,
	                                    -1.0f, -1.0f, 0.0f,
	                                    1.0f, 1.0f, 0.0f },
	                                  { 0, 1, 2 });

	VertexAttribute color("color", DataType::UNSIGNED_BYTE, 4, UploadMode::TO_FLOAT_NORMALIZE);
	color.setData(std::vector<uint8_t>{ 255, 0, 0, 255, 0, 0, 255, 255, 0, 0, 255, 255 });
	vertexData.addAttribute(1, color);

	auto vertexArray = newVertexArray(vertexData);
	vertexArray->draw();

	float4 corner = unpack(pixel(1, 1));
	EXPECT_GT(corner.x, 0.8f);
	EXPECT_EQ(corner.y, 0.0f);

	float4 middle = unpack(pixel(3, 3));
	EXPECT_GT(middle.x, 0.0f);
	EXPECT_GT(middle.z, 0.0f);
	EXPECT_NEAR(middle.x + middle.z, 1.0f, 2.0f / 255.0f);
}

TEST_F(ContextTest, UniformsReachTheVertexShader)
{
	auto program = newProgram("color.vert", "color.frag");

	VertexData vertexData = positions({ -1.0f, 1.0f, 0.0f,
	                                    -1.0f, -1.0f, 0.0f,
	                                    0.0f, 1.0f, 0.0f },
	                                  { 0, 1, 2 });

	VertexAttribute color("color", DataType::FLOAT, 4);
	color.setData(std::vector<float>{ 0, 1, 0, 1, 0, 1, 0, 1, 0, 1, 0, 1 });
	vertexData.addAttribute(1, color);

	auto vertexArray = newVertexArray(vertexData);
	vertexArray->draw();

	EXPECT_EQ(pixel(1, 1), pack(green));
	EXPECT_EQ(pixel(9, 1), black);

	// Moves the triangle right by half the view.
	float4x4 transform = float4x4::identity();
	transform[3] = float4(1.0f, 0.0f, 0.0f, 1.0f);
	program->setUniform("transform", transform);

	context.clearCurrentBuffer();
	vertexArray->draw();

	EXPECT_EQ(pixel(1, 1), black);
	EXPECT_EQ(pixel(9, 1), pack(green));
}

TEST_F(ContextTest, UniformNamesOfAllStages)
{
	auto program = newProgram("color.vert", "solid.frag");

	EXPECT_THAT(program->getUniformNames(), testing::ElementsAre("color", "transform"));
	EXPECT_EQ(program->getShaders().size(), 2u);

	// Unknown names are ignored.
	program->setUniform("specular", 1.0f);
}

TEST_F(ContextTest, IndexRange)
{
	auto program = newProgram("solid.vert", "solid.frag");
	program->setUniform("color", red);

	// Top left and bottom right triangles.
	auto vertexArray = newVertexArray(positions({ -1.0f, 1.0f, 0.0f, -1.0f, -1.0f, 0.0f, 0.0f, 1.0f, 0.0f,
	                                              1.0f, -1.0f, 0.0f, 1.0f, 1.0f, 0.0f, 0.0f, -1.0f, 0.0f },
	                                            { 0, 1, 2, 3, 4, 5 }));

	vertexArray->setIndicesOffset(3);
	vertexArray->draw();

	EXPECT_EQ(pixel(1, 1), black);
	EXPECT_EQ(pixel(13, 13), pack(red));

	context.clearCurrentBuffer();
	vertexArray->setIndicesOffset(0);
	vertexArray->setIndicesCount(3);
	vertexArray->draw();

	EXPECT_EQ(pixel(1, 1), pack(red));
	EXPECT_EQ(pixel(13, 13), black);

	context.clearCurrentBuffer();
	vertexArray->setIndicesOffset(6);
	vertexArray->setIndicesCount(-1);
	vertexArray->draw();

	EXPECT_EQ(countPixels(black), 256);

	// Negative offsets start at the first index and counts beyond the indices
	// are cut short.
	vertexArray->setIndicesOffset(-2);
	vertexArray->setIndicesCount(100);
	vertexArray->draw();

	EXPECT_EQ(pixel(1, 1), pack(red));
	EXPECT_EQ(pixel(13, 13), pack(red));
}

TEST_F(ContextTest, IntegerAttributes)
{
	auto program = newProgram("grid.vert", "solid.frag");
	program->setUniform("color", blue);

	auto vertexArray = newVertexArray(gridQuad());
	vertexArray->draw();

	EXPECT_EQ(pixel(0, 0), pack(blue));
	EXPECT_EQ(pixel(7, 7), pack(blue));
	EXPECT_EQ(pixel(15, 15), pack(blue));
	EXPECT_EQ(pixel(15, 0), pack(blue));
	EXPECT_EQ(countPixels(pack(blue)), 16 * 16);
}

TEST_F(ContextTest, WireframeAndPoints)
{
	auto program = newProgram("grid.vert", "solid.frag");

	auto vertexArray = newVertexArray(gridQuad());
	vertexArray->setPolygonMode(PolygonMode::LINE);
	vertexArray->draw();

	EXPECT_EQ(pixel(0, 7), 0xFFFFFFFFu);
	EXPECT_EQ(pixel(7, 3), black);

	context.clearCurrentBuffer();
	vertexArray->setPolygonMode(PolygonMode::FILL);
	vertexArray->setDrawingMode(DrawingMode::POINTS);
	vertexArray->draw();

	EXPECT_EQ(countPixels(0xFFFFFFFF), 4);
	EXPECT_EQ(pixel(15, 0), 0xFFFFFFFFu);
}

TEST_F(ContextTest, TexturesAreSampled)
{
	auto program = newProgram("grid.vert", "tiled.frag");

	auto texture = context.newTexture();
	texture->create();
	texture->setFormat(Format::RGBA);
	texture->setImageData(std::vector<uint8_t>{ 255, 0, 0, 255, 0, 255, 0, 255,
	                                            0, 0, 255, 255, 255, 255, 255, 255 },
	                      2, 2);
	texture->bind(0);
	program->bindSampler(0);

	auto vertexArray = newVertexArray(gridQuad());
	vertexArray->draw();

	EXPECT_EQ(pixel(0, 0), pack(red));
	EXPECT_EQ(pixel(12, 3), pack(green));
	EXPECT_EQ(pixel(3, 12), pack(blue));
	EXPECT_EQ(pixel(12, 12), 0xFFFFFFFFu);
}

TEST_F(ContextTest, TextureFormatAndData)
{
	auto texture = context.newTexture();
	texture->create();
	texture->setFormat(Format::RGB);

	EXPECT_EQ(texture->getFormat(), Format::RGB);
	EXPECT_EQ(texture->getInternalFormat(), InternalFormat::RGB8);

	texture->setImageData(std::vector<uint8_t>{ 10, 20, 30, 40, 50, 60 }, 1, 2);

	EXPECT_EQ(texture->getWidth(), 1);
	EXPECT_EQ(texture->getHeight(), 2);
	EXPECT_EQ(texture->getImageData(InternalFormat::RGBA8), std::vector<uint8_t>({ 10, 20, 30, 255, 40, 50, 60, 255 }));
	EXPECT_EQ(texture->getImageData(InternalFormat::RG8), std::vector<uint8_t>({ 10, 20, 40, 50 }));

	// The uploaded texels follow a format change.
	texture->setFormat(InternalFormat::RGBA32F);
	EXPECT_EQ(texture->getFormat(), Format::RGBA);
	EXPECT_EQ(texture->getImageData(InternalFormat::RGBA8), std::vector<uint8_t>({ 10, 20, 30, 255, 40, 50, 60, 255 }));

	texture->setFormat(InternalFormat::R16F);
	EXPECT_EQ(texture->getFormat(), Format::RED);
	EXPECT_EQ(texture->getWidth(), 1);
	EXPECT_EQ(texture->getHeight(), 2);
}

TEST_F(ContextTest, DestroyedTexturesAreUnbound)
{
	auto texture = context.newTexture();
	texture->create();
	texture->bind(3);

	EXPECT_NE(context.getRenderer().getTexture(3), nullptr);

	texture->destroy();

	EXPECT_EQ(context.getRenderer().getTexture(3), nullptr);
	EXPECT_FALSE(texture->isCreated());
}

TEST_F(ContextTest, DestroyedProgramIsNoLongerUsed)
{
	auto program = newProgram("solid.vert", "solid.frag");
	EXPECT_NE(context.getRenderer().getProgram(), nullptr);

	program->destroy();

	EXPECT_EQ(context.getRenderer().getProgram(), nullptr);
}

TEST_F(ContextTest, FrameBufferAttachments)
{
	auto texture = context.newTexture();
	texture->create();

	auto frameBuffer = context.newFrameBuffer();
	frameBuffer->create();
	frameBuffer->attach(AttachmentPoint::COLOR0, *texture);

	auto *software = static_cast<SoftwareFrameBuffer *>(frameBuffer.get());
	EXPECT_EQ(software->getAttachment(AttachmentPoint::COLOR0), texture.get());
	EXPECT_EQ(software->getAttachment(AttachmentPoint::DEPTH), nullptr);
	EXPECT_FALSE(frameBuffer->isComplete());

	frameBuffer->detach(AttachmentPoint::COLOR0);
	EXPECT_EQ(software->getAttachment(AttachmentPoint::COLOR0), nullptr);
}

TEST_F(ContextTest, ShaderType)
{
	Shader &vertex = newShader("solid.vert");
	Shader &fragment = newShader("solid.frag");

	EXPECT_EQ(vertex.getType(), ShaderType::VERTEX);
	EXPECT_EQ(fragment.getType(), ShaderType::FRAGMENT);
}

TEST(Context, ClusteredRenderingMatchesSerial)
{
	registerTestShaders();

	std::vector<std::vector<uint8_t>> frames;

	for(uint32_t clusterCount : { 1u, 4u })
	{
		SoftwareContext context(clusters(clusterCount));
		context.setWindowSize(40, 24);
		context.create();
		context.enableCapability(Capability::DEPTH_TEST);

		auto vertexShader = context.newShader();
		vertexShader->create();
		vertexShader->setSource("color.vert");
		vertexShader->compile();

		auto fragmentShader = context.newShader();
		fragmentShader->create();
		fragmentShader->setSource("color.frag");
		fragmentShader->compile();

		auto program = context.newProgram();
		program->create();
		program->attachShader(*vertexShader);
		program->attachShader(*fragmentShader);
		program->link();
		program->use();

		VertexData vertexData = positions({ -0.9f, -0.9f, 0.2f, 0.9f, -0.7f, -0.3f, -0.2f, 0.95f, 0.1f,
		                                    -1.5f, 0.3f, -0.5f, 0.7f, -1.2f, 0.6f, 0.8f, 0.8f, -0.1f },
		                                  { 0, 1, 2, 3, 4, 5 });
		VertexAttribute color("color", DataType::FLOAT, 4);
		color.setData(std::vector<float>{ 1, 0, 0, 1, 0, 1, 0, 1, 0, 0, 1, 1,
		                                  0, 1, 1, 1, 1, 1, 0, 1, 1, 0, 1, 1 });
		vertexData.addAttribute(1, color);

		auto vertexArray = context.newVertexArray();
		vertexArray->create();
		vertexArray->setData(vertexData);
		vertexArray->draw();

		frames.push_back(context.readFrame(Rectangle(0, 0, 40, 24), InternalFormat::RGBA8));

		vertexArray->destroy();
		program->destroy();
		fragmentShader->destroy();
		vertexShader->destroy();
		context.destroy();
	}

	EXPECT_EQ(frames[0], frames[1]);
}

TEST_F(ContextDeathTest, DrawWithoutProgram)
{
	auto vertexArray = newVertexArray(gridQuad());

	EXPECT_DEATH(vertexArray->draw(), "No program in use");
}

TEST_F(ContextDeathTest, IndexOutsideTheVertexData)
{
	auto program = newProgram("solid.vert", "solid.frag");
	auto vertexArray = newVertexArray(positions({ 0, 0, 0, 1, 0, 0, 0, 1, 0 }, { 0, 1, 5 }));

	EXPECT_DEATH(vertexArray->draw(), "Index 5 is outside of the 3 vertices of the vertex data");
}

TEST_F(ContextDeathTest, LinkNeedsBothStages)
{
	auto program = context.newProgram();
	program->create();
	program->attachShader(newShader("solid.vert"));

	EXPECT_DEATH(program->link(), "Program needs a compiled vertex and fragment shader to link");
}

TEST_F(ContextDeathTest, UnknownShaderSource)
{
	auto shader = context.newShader();
	shader->create();
	shader->setSource("missing.frag");

	EXPECT_DEATH(shader->getType(), "Shader \"missing.frag\" has not been compiled");
	EXPECT_DEATH(shader->compile(), "No shader implementation named \"missing.frag\"");
}

TEST_F(ContextDeathTest, IntegerUploadOfFloats)
{
	VertexAttribute position("position", DataType::FLOAT, 2, UploadMode::KEEP_INT);
	position.setData(std::vector<float>{ 0.0f, 0.0f });

	VertexData vertexData;
	vertexData.addAttribute(0, position);

	auto vertexArray = context.newVertexArray();
	vertexArray->create();

	EXPECT_DEATH(vertexArray->setData(vertexData), "Attribute \"position\" of type FLOAT cannot be kept as integers");
}

TEST_F(ContextDeathTest, UniformTypeMismatch)
{
	auto program = newProgram("solid.vert", "solid.frag");

	EXPECT_DEATH(program->setUniform("color", 1.0f), "Uniform \"color\" is of type float4");
}

TEST_F(ContextDeathTest, SamplerWithoutTexture)
{
	auto program = newProgram("grid.vert", "tiled.frag");

	EXPECT_DEATH(program->bindSampler(2), "No texture bound at unit 2");
}

TEST_F(ContextDeathTest, DrawAfterTheSampledTextureIsDestroyed)
{
	auto program = newProgram("grid.vert", "tiled.frag");

	auto texture = context.newTexture();
	texture->create();
	texture->setFormat(Format::RGBA);
	texture->setImageData(std::vector<uint8_t>{ 255, 0, 0, 255 }, 1, 1);
	texture->bind(0);
	program->bindSampler(0);

	texture->destroy();

	auto vertexArray = newVertexArray(gridQuad());
	EXPECT_DEATH(vertexArray->draw(), "No texture bound to sampler");
}

TEST_F(ContextDeathTest, TextureUnitOutOfRange)
{
	auto texture = context.newTexture();
	texture->create();

	EXPECT_DEATH(texture->bind(MAX_TEXTURE_UNITS), "Texture unit 32 is not within 0 to 31");
}

TEST_F(ContextDeathTest, ShadersOfAnotherBackend)
{
	auto program = context.newProgram();
	program->create();
	ForeignShader shader;

	EXPECT_DEATH(program->attachShader(shader), "Version mismatch: expected SOFTWARE, got GL20");
}

TEST_F(ContextDeathTest, Lifecycle)
{
	auto shader = context.newShader();

	EXPECT_DEATH(shader->setSource("solid.vert"), "Resource has not been created yet");
	EXPECT_DEATH(shader->destroy(), "Resource has not been created yet");

	shader->create();
	EXPECT_DEATH(shader->create(), "Resource has been created already");
	EXPECT_DEATH(context.create(), "Resource has been created already");
}
