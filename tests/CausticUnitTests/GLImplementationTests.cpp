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
#include "Caustic/Context.hpp"
#include "Caustic/GLImplementation.hpp"
#include "Software/SoftwareContext.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace caustic;

TEST(GLVersion, Numbers)
{
	EXPECT_EQ(getMajor(GLVersion::GL21), 2);
	EXPECT_EQ(getMinor(GLVersion::GL21), 1);
	EXPECT_EQ(getMajor(GLVersion::GL32), 3);
	EXPECT_EQ(getMinor(GLVersion::GL32), 2);
	EXPECT_EQ(getMajor(GLVersion::GLES30), 3);
	EXPECT_EQ(getMinor(GLVersion::GLES30), 0);

	EXPECT_TRUE(isES(GLVersion::GLES20));
	EXPECT_FALSE(isES(GLVersion::GL30));
	EXPECT_FALSE(isES(GLVersion::SOFTWARE));

	EXPECT_STREQ(getName(GLVersion::GLES20), "GLES20");
	EXPECT_STREQ(getName(GLVersion::SOFTWARE), "SOFTWARE");
}

TEST(GLImplementation, SoftwareIsAvailable)
{
	EXPECT_TRUE(GLImplementation::isAvailable(GLVersion::SOFTWARE));

	std::unique_ptr<Context> context = GLImplementation::create(GLVersion::SOFTWARE);
	ASSERT_NE(context, nullptr);
	EXPECT_EQ(context->getGLVersion(), GLVersion::SOFTWARE);
	EXPECT_FALSE(context->isCreated());
}

TEST(GLImplementation, UnregisteredVersion)
{
	EXPECT_FALSE(GLImplementation::isAvailable(GLVersion::GLES20));
	EXPECT_EQ(GLImplementation::create(GLVersion::GLES20), nullptr);
}

TEST(GLImplementation, RegisterFactory)
{
	int created = 0;
	GLImplementation::registerFactory(GLVersion::GL32, [&created] {
		created++;
		return std::unique_ptr<Context>(new SoftwareContext(Configuration()));
	});

	EXPECT_TRUE(GLImplementation::isAvailable(GLVersion::GL32));
	EXPECT_THAT(GLImplementation::getAvailableVersions(), testing::Contains(GLVersion::GL32));
	EXPECT_THAT(GLImplementation::getAvailableVersions(), testing::Contains(GLVersion::SOFTWARE));

	EXPECT_NE(GLImplementation::create(GLVersion::GL32), nullptr);
	EXPECT_EQ(created, 1);

	// The factory captures a local.
	GLImplementation::registerFactory(GLVersion::GL32, [] {
		return std::unique_ptr<Context>(new SoftwareContext(Configuration()));
	});
}
