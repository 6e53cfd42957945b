//------------------------------------------------------------------------------
// MathTests.cpp
//
// Unit tests for math utilities and Transform
//------------------------------------------------------------------------------

#include <gtest/gtest.h>
#include "Tessera/Math/MathUtils.hpp"
#include "Tessera/Core/Transform.hpp"

using namespace Tessera;

TEST(SanityCheck, FloatComparison)
{
	float a = 0.1f + 0.2f;
	EXPECT_NEAR(a, 0.3f, 0.0001f);  // Float comparison with tolerance
}

// Math Utils Tests
TEST(MathUtilsTest, Clamp)
{
	EXPECT_FLOAT_EQ(Clamp(5.0f, 0.0f, 10.0f), 5.0f);
	EXPECT_FLOAT_EQ(Clamp(-5.0f, 0.0f, 10.0f), 0.0f);
	EXPECT_FLOAT_EQ(Clamp(15.0f, 0.0f, 10.0f), 10.0f);
}

TEST(MathUtilsTest, Lerp)
{
	EXPECT_FLOAT_EQ(Lerp(0.0f, 10.0f, 0.5f), 5.0f);
	EXPECT_FLOAT_EQ(Lerp(0.0f, 10.0f, 0.0f), 0.0f);
	EXPECT_FLOAT_EQ(Lerp(0.0f, 10.0f, 1.0f), 10.0f);
}

TEST(MathUtilsTest, Fract)
{
	EXPECT_FLOAT_EQ(Fract(1.25f), 0.25f);
	EXPECT_FLOAT_EQ(Fract(-0.25f), 0.75f);
	EXPECT_FLOAT_EQ(Fract(3.0f), 0.0f);
}

TEST(MathUtilsTest, AlignUp)
{
	EXPECT_EQ(AlignUp(0, 256), 0u);
	EXPECT_EQ(AlignUp(1, 256), 256u);
	EXPECT_EQ(AlignUp(256, 256), 256u);
	EXPECT_EQ(AlignUp(80, 16), 80u);
	EXPECT_EQ(AlignUp(80, 64), 128u);
	EXPECT_EQ(AlignUp(80, 0), 80u);
}

TEST(MathUtilsTest, IsPowerOfTwo)
{
	EXPECT_TRUE(IsPowerOfTwo(1));
	EXPECT_TRUE(IsPowerOfTwo(256));
	EXPECT_FALSE(IsPowerOfTwo(0));
	EXPECT_FALSE(IsPowerOfTwo(96));
}

// Transform Tests
TEST(TransformTest, DefaultIsIdentity)
{
	Transform t;
	EXPECT_EQ(t.GetMatrix(), glm::mat4(1.0f));
}

TEST(TransformTest, ScaleThenRotateThenTranslate)
{
	Transform t = Transform::Sprite2D(glm::vec2(10.0f, 5.0f), glm::vec2(2.0f, 4.0f), 90.0f);
	glm::vec4 p = t.GetMatrix() * glm::vec4(1.0f, 0.0f, 0.0f, 1.0f);

	// (1,0) -> scaled (2,0) -> rotated (0,2) -> translated (10,7)
	EXPECT_NEAR(p.x, 10.0f, 1e-5f);
	EXPECT_NEAR(p.y, 7.0f, 1e-5f);
	EXPECT_NEAR(p.z, 0.0f, 1e-5f);
}

TEST(TransformTest, SpriteDepthGoesInZ)
{
	Transform t = Transform::Sprite2D(glm::vec2(0.0f), glm::vec2(1.0f), 0.0f, 0.25f);
	glm::vec4 p = t.GetMatrix() * glm::vec4(0.0f, 0.0f, 0.0f, 1.0f);
	EXPECT_FLOAT_EQ(p.z, 0.25f);
}

TEST(TransformTest, DirectionsFollowRotation)
{
	Transform t(glm::vec3(0.0f), glm::vec3(0.0f, 90.0f, 0.0f));

	glm::vec3 forward = t.GetForward();
	EXPECT_NEAR(forward.x, -1.0f, 1e-5f);
	EXPECT_NEAR(forward.z, 0.0f, 1e-5f);

	glm::vec3 up = t.GetUp();
	EXPECT_NEAR(up.y, 1.0f, 1e-5f);
}
