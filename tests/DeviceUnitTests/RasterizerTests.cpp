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

#include "Device/PixelProcessor.hpp"
#include "Device/Primitive.hpp"
#include "Device/Rasterizer.hpp"
#include "Device/Renderer.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace caustic;
using namespace caustic::test;

namespace {

Primitive triangle(const float2 &a, const float2 &b, const float2 &c)
{
	Primitive primitive = {};
	primitive.type = Primitive::TRIANGLE;
	primitive.v[0] = float4(a.x, a.y, 0.5f, 1.0f);
	primitive.v[1] = float4(b.x, b.y, 0.5f, 1.0f);
	primitive.v[2] = float4(c.x, c.y, 0.5f, 1.0f);
	primitive.weights[0] = float3(1.0f, 0.0f, 0.0f);
	primitive.weights[1] = float3(0.0f, 1.0f, 0.0f);
	primitive.weights[2] = float3(0.0f, 0.0f, 1.0f);
	primitive.source[0] = 0;
	primitive.source[1] = 1;
	primitive.source[2] = 2;
	primitive.sourceCount = 3;
	primitive.xMin = 0;
	primitive.xMax = 15;
	primitive.yMin = 0;
	primitive.yMax = 15;
	return primitive;
}

Primitive line(const float2 &a, const float2 &b)
{
	Primitive primitive = triangle(a, b, b);
	primitive.type = Primitive::LINE;
	primitive.sourceCount = 2;
	return primitive;
}

Primitive point(const float2 &a)
{
	Primitive primitive = triangle(a, a, a);
	primitive.type = Primitive::POINT;
	primitive.sourceCount = 1;
	return primitive;
}

class RasterizerTest : public testing::Test
{
protected:
	RasterizerTest()
	    : renderer(singleCluster())
	{
		renderer.setWindowSize(16, 16);
		renderer.init();

		vertices.push_back(colorVertex(0.0f, 0.0f, 0.0f, float4(1.0f, 0.0f, 0.0f, 1.0f)));
		vertices.push_back(colorVertex(0.0f, 0.0f, 0.0f, float4(0.0f, 1.0f, 0.0f, 1.0f)));
		vertices.push_back(colorVertex(0.0f, 0.0f, 0.0f, float4(0.0f, 0.0f, 1.0f, 1.0f)));
	}

	static Configuration singleCluster()
	{
		Configuration config;
		config.clusterCount = 1;
		return config;
	}

	// Rasterizes for one cluster and returns the shaded pixels.
	std::map<std::pair<int, int>, int> coverage(const std::vector<Primitive> &primitives, int cluster = 0, int clusterCount = 1)
	{
		CoverageFragmentShader shader;
		PixelProcessor pixelProcessor(renderer, shader, vertices);
		Rasterizer rasterizer(pixelProcessor, cluster, clusterCount);

		for(const auto &primitive : primitives)
		{
			rasterizer.rasterize(primitive);
		}

		return shader.hits;
	}

	Renderer renderer;
	std::vector<ShaderBuffer> vertices;
};

}  // anonymous namespace

TEST_F(RasterizerTest, SharedEdgeIsCoveredOnce)
{
	auto hits = coverage({ triangle(float2(0.0f, 0.0f), float2(8.0f, 0.0f), float2(0.0f, 8.0f)),
	                       triangle(float2(8.0f, 0.0f), float2(8.0f, 8.0f), float2(0.0f, 8.0f)) });

	EXPECT_EQ(hits.size(), 64u);
	for(int y = 0; y < 8; y++)
	{
		for(int x = 0; x < 8; x++)
		{
			EXPECT_EQ(hits[{ x, y }], 1) << "(" << x << ", " << y << ")";
		}
	}
}

TEST_F(RasterizerTest, TopLeftFillRule)
{
	auto hits = coverage({ triangle(float2(0.0f, 0.0f), float2(8.0f, 0.0f), float2(0.0f, 8.0f)) });

	// Pixels on the left and top edges are covered, those on the diagonal are not.
	EXPECT_EQ(hits.size(), 36u);
	EXPECT_EQ(hits.count({ 0, 0 }), 1u);
	EXPECT_EQ(hits.count({ 7, 0 }), 1u);
	EXPECT_EQ(hits.count({ 0, 7 }), 1u);
	EXPECT_EQ(hits.count({ 8, 0 }), 0u);
	EXPECT_EQ(hits.count({ 4, 4 }), 0u);
}

TEST_F(RasterizerTest, BothWindingsAreRasterized)
{
	auto clockwise = coverage({ triangle(float2(1.0f, 1.0f), float2(13.0f, 2.0f), float2(3.0f, 11.0f)) });
	auto counterClockwise = coverage({ triangle(float2(1.0f, 1.0f), float2(3.0f, 11.0f), float2(13.0f, 2.0f)) });

	EXPECT_FALSE(clockwise.empty());
	EXPECT_EQ(clockwise, counterClockwise);
}

TEST_F(RasterizerTest, DegenerateTriangleIsSkipped)
{
	auto hits = coverage({ triangle(float2(1.0f, 1.0f), float2(5.0f, 5.0f), float2(9.0f, 9.0f)) });

	EXPECT_TRUE(hits.empty());
}

TEST_F(RasterizerTest, WeightsInterpolateVertexOutputs)
{
	ColorFragmentShader shader;
	PixelProcessor pixelProcessor(renderer, shader, vertices);
	Rasterizer rasterizer(pixelProcessor, 0, 1);
	rasterizer.rasterize(triangle(float2(0.0f, 0.0f), float2(8.0f, 0.0f), float2(0.0f, 8.0f)));

	EXPECT_EQ(renderer.readPixel(0, 0), 0xFFFF0000u);

	// Half red, a quarter green and a quarter blue.
	EXPECT_EQ(renderer.readPixel(2, 2), 0xFF7F3F3Fu);
}

TEST_F(RasterizerTest, PrimitiveBoundsLimitCoverage)
{
	Primitive primitive = triangle(float2(0.0f, 0.0f), float2(16.0f, 0.0f), float2(0.0f, 16.0f));
	primitive.xMax = 3;
	primitive.yMin = 2;

	auto hits = coverage({ primitive });

	ASSERT_FALSE(hits.empty());
	for(const auto &hit : hits)
	{
		EXPECT_LE(hit.first.first, 3);
		EXPECT_GE(hit.first.second, 2);
	}
}

TEST_F(RasterizerTest, ClustersOwnRowBands)
{
	CoverageFragmentShader shader;
	PixelProcessor pixelProcessor(renderer, shader, vertices);
	Rasterizer first(pixelProcessor, 0, 2);
	Rasterizer second(pixelProcessor, 1, 2);

	EXPECT_TRUE(first.ownsRow(0));
	EXPECT_TRUE(first.ownsRow(7));
	EXPECT_FALSE(first.ownsRow(8));
	EXPECT_TRUE(first.ownsRow(16));
	EXPECT_TRUE(second.ownsRow(15));
	EXPECT_FALSE(second.ownsRow(23));
}

TEST_F(RasterizerTest, ClustersPartitionTheCoverage)
{
	std::vector<Primitive> square = { triangle(float2(0.0f, 0.0f), float2(16.0f, 0.0f), float2(0.0f, 16.0f)),
		                              triangle(float2(16.0f, 0.0f), float2(16.0f, 16.0f), float2(0.0f, 16.0f)) };

	auto all = coverage(square);
	auto top = coverage(square, 0, 2);
	auto bottom = coverage(square, 1, 2);

	EXPECT_EQ(all.size(), 256u);
	EXPECT_EQ(top.size(), 128u);
	EXPECT_EQ(bottom.size(), 128u);

	for(const auto &hit : top)
	{
		EXPECT_LT(hit.first.second, 8);
		EXPECT_EQ(bottom.count(hit.first), 0u);
	}
}

TEST_F(RasterizerTest, HorizontalLine)
{
	auto hits = coverage({ line(float2(1.0f, 2.0f), float2(6.0f, 2.0f)) });

	EXPECT_EQ(hits.size(), 6u);
	for(int x = 1; x <= 6; x++)
	{
		EXPECT_EQ(hits[{ x, 2 }], 1);
	}
}

TEST_F(RasterizerTest, SteepLineStepsAlongY)
{
	auto hits = coverage({ line(float2(3.0f, 10.0f), float2(5.0f, 1.0f)) });

	// One pixel per row.
	EXPECT_EQ(hits.size(), 10u);
	EXPECT_EQ(hits.count({ 3, 10 }), 1u);
	EXPECT_EQ(hits.count({ 5, 1 }), 1u);
}

TEST_F(RasterizerTest, PointRoundsToTheNearestPixel)
{
	auto hits = coverage({ point(float2(3.4f, 5.6f)) });

	EXPECT_EQ(hits.size(), 1u);
	EXPECT_EQ(hits.count({ 3, 6 }), 1u);
}

TEST_F(RasterizerTest, ViewEdgesHalfAPixelOutsideTheCenters)
{
	auto hits = coverage({ triangle(float2(-0.5f, -0.5f), float2(15.5f, -0.5f), float2(-0.5f, 15.5f)),
	                       triangle(float2(15.5f, -0.5f), float2(15.5f, 15.5f), float2(-0.5f, 15.5f)) });

	EXPECT_EQ(hits.size(), 256u);
	for(int y = 0; y < 16; y++)
	{
		for(int x = 0; x < 16; x++)
		{
			EXPECT_EQ(hits[{ x, y }], 1) << "(" << x << ", " << y << ")";
		}
	}
}

TEST_F(RasterizerTest, PointsOnTheFarEdgeBelongToTheLastPixel)
{
	auto hits = coverage({ point(float2(15.5f, 15.5f)), point(float2(-0.5f, -0.5f)), point(float2(16.5f, 3.0f)) });

	EXPECT_EQ(hits.size(), 2u);
	EXPECT_EQ(hits.count({ 15, 15 }), 1u);
	EXPECT_EQ(hits.count({ 0, 0 }), 1u);
}

TEST_F(RasterizerTest, LineAcrossTheWholeRow)
{
	auto hits = coverage({ line(float2(-0.5f, 15.5f), float2(15.5f, 15.5f)) });

	EXPECT_EQ(hits.size(), 16u);
	for(int x = 0; x < 16; x++)
	{
		EXPECT_EQ(hits[{ x, 15 }], 1) << "(" << x << ", 15)";
	}
}
