//------------------------------------------------------------------------------
// TextureSamplerTests.cpp
//------------------------------------------------------------------------------

#include <gtest/gtest.h>
#include <array>
#include <cstdint>
#include <limits>
#include "Tessera/Renderer/TextureSampler.hpp"

using namespace Tessera;

namespace
{
	// 2x1: red, green
	ImageData MakeRedGreen()
	{
		ImageData image;
		image.width = 2;
		image.height = 1;
		image.texels = { glm::vec4(1.0f, 0.0f, 0.0f, 1.0f), glm::vec4(0.0f, 1.0f, 0.0f, 1.0f) };
		return image;
	}
}

TEST(ImageDataTest, SolidColorFillsEveryTexel)
{
	ImageData image = CreateSolidColor(3, 2, glm::vec4(0.25f, 0.5f, 0.75f, 1.0f));
	ASSERT_TRUE(image.IsValid());
	EXPECT_EQ(image.texels.size(), 6u);
	EXPECT_EQ(image.At(2, 1), glm::vec4(0.25f, 0.5f, 0.75f, 1.0f));
}

TEST(ImageDataTest, CheckerboardAlternates)
{
	ImageData image = CreateCheckerboard(4, 4, 2);
	EXPECT_EQ(image.At(0, 0), glm::vec4(1.0f));
	EXPECT_EQ(image.At(2, 0), glm::vec4(0.0f, 0.0f, 0.0f, 1.0f));
	EXPECT_EQ(image.At(2, 2), glm::vec4(1.0f));
}

TEST(ImageDataTest, FromRGBA8Normalizes)
{
	const std::array<uint8_t, 8> pixels = { 255, 0, 51, 255, 0, 0, 0, 0 };
	ImageData image = CreateFromRGBA8(2, 1, pixels.data());

	ASSERT_TRUE(image.IsValid());
	EXPECT_FLOAT_EQ(image.At(0, 0).r, 1.0f);
	EXPECT_FLOAT_EQ(image.At(0, 0).b, 0.2f);
	EXPECT_FLOAT_EQ(image.At(1, 0).a, 0.0f);
}

TEST(ImageDataTest, NullPixelsGiveInvalidImage)
{
	EXPECT_FALSE(CreateFromRGBA8(2, 2, nullptr).IsValid());
}

TEST(WrapTexelCoordinateTest, ClampToEdge)
{
	EXPECT_EQ(WrapTexelCoordinate(-3, 4, AddressMode::ClampToEdge), 0);
	EXPECT_EQ(WrapTexelCoordinate(2, 4, AddressMode::ClampToEdge), 2);
	EXPECT_EQ(WrapTexelCoordinate(7, 4, AddressMode::ClampToEdge), 3);
}

TEST(WrapTexelCoordinateTest, Repeat)
{
	EXPECT_EQ(WrapTexelCoordinate(4, 4, AddressMode::Repeat), 0);
	EXPECT_EQ(WrapTexelCoordinate(5, 4, AddressMode::Repeat), 1);
	EXPECT_EQ(WrapTexelCoordinate(-1, 4, AddressMode::Repeat), 3);
}

TEST(WrapTexelCoordinateTest, MirroredRepeat)
{
	EXPECT_EQ(WrapTexelCoordinate(3, 4, AddressMode::MirroredRepeat), 3);
	EXPECT_EQ(WrapTexelCoordinate(4, 4, AddressMode::MirroredRepeat), 3);
	EXPECT_EQ(WrapTexelCoordinate(7, 4, AddressMode::MirroredRepeat), 0);
	EXPECT_EQ(WrapTexelCoordinate(8, 4, AddressMode::MirroredRepeat), 0);
	EXPECT_EQ(WrapTexelCoordinate(-1, 4, AddressMode::MirroredRepeat), 0);
}

TEST(SampleTextureTest, NearestPicksContainingTexel)
{
	ImageData image = MakeRedGreen();
	SamplerDesc sampler;

	EXPECT_EQ(SampleTexture(image, sampler, glm::vec2(0.25f, 0.5f)), glm::vec4(1.0f, 0.0f, 0.0f, 1.0f));
	EXPECT_EQ(SampleTexture(image, sampler, glm::vec2(0.75f, 0.5f)), glm::vec4(0.0f, 1.0f, 0.0f, 1.0f));
}

TEST(SampleTextureTest, ClampHoldsEdgeTexelOutsideRange)
{
	ImageData image = MakeRedGreen();
	SamplerDesc sampler;

	EXPECT_EQ(SampleTexture(image, sampler, glm::vec2(1.5f, 0.5f)), glm::vec4(0.0f, 1.0f, 0.0f, 1.0f));
	EXPECT_EQ(SampleTexture(image, sampler, glm::vec2(-0.5f, 0.5f)), glm::vec4(1.0f, 0.0f, 0.0f, 1.0f));
}

TEST(SampleTextureTest, RepeatWrapsAround)
{
	ImageData image = MakeRedGreen();
	SamplerDesc sampler;
	sampler.addressModeU = AddressMode::Repeat;

	EXPECT_EQ(SampleTexture(image, sampler, glm::vec2(1.25f, 0.5f)), glm::vec4(1.0f, 0.0f, 0.0f, 1.0f));
}

TEST(ReduceTexelCoordinateTest, KeepsTexelAndFraction)
{
	EXPECT_FLOAT_EQ(ReduceTexelCoordinate(5.25f, 4, AddressMode::Repeat), 1.25f);
	EXPECT_FLOAT_EQ(ReduceTexelCoordinate(-0.5f, 4, AddressMode::Repeat), -0.5f);
	EXPECT_FLOAT_EQ(ReduceTexelCoordinate(10.5f, 4, AddressMode::MirroredRepeat), 2.5f);
	EXPECT_FLOAT_EQ(ReduceTexelCoordinate(2.5f, 4, AddressMode::ClampToEdge), 2.5f);
}

TEST(ReduceTexelCoordinateTest, HugeAndNonFiniteValues)
{
	const float nan = std::numeric_limits<float>::quiet_NaN();
	const float inf = std::numeric_limits<float>::infinity();

	EXPECT_FLOAT_EQ(ReduceTexelCoordinate(2e10f, 2, AddressMode::ClampToEdge), 2.0f);
	EXPECT_FLOAT_EQ(ReduceTexelCoordinate(-2e10f, 2, AddressMode::ClampToEdge), -1.0f);
	EXPECT_FLOAT_EQ(ReduceTexelCoordinate(inf, 2, AddressMode::ClampToEdge), 2.0f);
	EXPECT_FLOAT_EQ(ReduceTexelCoordinate(inf, 2, AddressMode::Repeat), 0.0f);
	EXPECT_FLOAT_EQ(ReduceTexelCoordinate(-inf, 2, AddressMode::MirroredRepeat), 0.0f);

	for (AddressMode mode : { AddressMode::ClampToEdge, AddressMode::Repeat, AddressMode::MirroredRepeat })
	{
		EXPECT_FLOAT_EQ(ReduceTexelCoordinate(nan, 2, mode), 0.0f) << ToString(mode);
	}
}

TEST(SampleTextureTest, FarOutOfRangeUVFollowsAddressMode)
{
	const glm::vec4 red(1.0f, 0.0f, 0.0f, 1.0f);
	const glm::vec4 green(0.0f, 1.0f, 0.0f, 1.0f);
	ImageData image = MakeRedGreen();
	SamplerDesc sampler;

	// Far to the right clamps to the right edge, not the left one
	EXPECT_EQ(SampleTexture(image, sampler, glm::vec2(1e10f, 0.0f)), green);
	EXPECT_EQ(SampleTexture(image, sampler, glm::vec2(-1e10f, 0.0f)), red);

	sampler.addressModeU = AddressMode::Repeat;
	EXPECT_EQ(SampleTexture(image, sampler, glm::vec2(1e10f, 0.0f)), red);
	EXPECT_EQ(SampleTexture(image, sampler, glm::vec2(1000000.75f, 0.0f)), green);
	EXPECT_EQ(SampleTexture(image, sampler, glm::vec2(1000001.25f, 0.0f)), red);

	sampler.addressModeU = AddressMode::MirroredRepeat;
	EXPECT_EQ(SampleTexture(image, sampler, glm::vec2(1e10f, 0.0f)), red);
	EXPECT_EQ(SampleTexture(image, sampler, glm::vec2(1000001.25f, 0.0f)), green);
}

TEST(SampleTextureTest, NaNUVSamplesOrigin)
{
	const float nan = std::numeric_limits<float>::quiet_NaN();
	const glm::vec4 red(1.0f, 0.0f, 0.0f, 1.0f);
	ImageData image = MakeRedGreen();

	for (AddressMode mode : { AddressMode::ClampToEdge, AddressMode::Repeat, AddressMode::MirroredRepeat })
	{
		SamplerDesc sampler;
		sampler.addressModeU = mode;
		sampler.addressModeV = mode;
		EXPECT_EQ(SampleTexture(image, sampler, glm::vec2(nan, nan)), red) << ToString(mode);
	}
}

TEST(SampleTextureTest, BilinearHandlesFarOutOfRangeUV)
{
	ImageData image = MakeRedGreen();
	SamplerDesc sampler;
	sampler.minFilter = FilterMode::Linear;
	sampler.magFilter = FilterMode::Linear;

	glm::vec4 right = SampleTexture(image, sampler, glm::vec2(1e10f, 0.5f));
	EXPECT_FLOAT_EQ(right.r, 0.0f);
	EXPECT_FLOAT_EQ(right.g, 1.0f);

	glm::vec4 nanSample = SampleTexture(image, sampler, glm::vec2(std::numeric_limits<float>::quiet_NaN(), 0.5f));
	EXPECT_FLOAT_EQ(nanSample.r, 1.0f);
	EXPECT_FLOAT_EQ(nanSample.g, 0.0f);
	EXPECT_FLOAT_EQ(nanSample.a, 1.0f);
}

TEST(SampleTextureTest, BilinearBlendsBetweenTexelCenters)
{
	ImageData image = MakeRedGreen();
	SamplerDesc sampler;
	sampler.minFilter = FilterMode::Linear;
	sampler.magFilter = FilterMode::Linear;

	// Midway between the two texel centers
	glm::vec4 mid = SampleTexture(image, sampler, glm::vec2(0.5f, 0.5f));
	EXPECT_FLOAT_EQ(mid.r, 0.5f);
	EXPECT_FLOAT_EQ(mid.g, 0.5f);
	EXPECT_FLOAT_EQ(mid.a, 1.0f);

	// At a texel center only that texel contributes
	glm::vec4 left = SampleTexture(image, sampler, glm::vec2(0.25f, 0.5f));
	EXPECT_FLOAT_EQ(left.r, 1.0f);
	EXPECT_FLOAT_EQ(left.g, 0.0f);
}

TEST(SampleTextureTest, InvalidImageIsTransparentBlack)
{
	ImageData empty;
	EXPECT_EQ(SampleTexture(empty, SamplerDesc{}, glm::vec2(0.5f)), glm::vec4(0.0f));
}

TEST(SamplerDescTest, DefaultIsNearestClamp)
{
	SamplerDesc desc;
	EXPECT_EQ(desc.magFilter, FilterMode::Nearest);
	EXPECT_EQ(desc.addressModeU, AddressMode::ClampToEdge);
	EXPECT_STREQ(ToString(desc.addressModeV), "ClampToEdge");
	EXPECT_STREQ(ToString(FilterMode::Linear), "Linear");
}
