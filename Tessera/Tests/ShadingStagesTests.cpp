//------------------------------------------------------------------------------
// ShadingStagesTests.cpp
//
// Checks the vertex and fragment stage rules on the CPU reference stages
//------------------------------------------------------------------------------

#include <gtest/gtest.h>
#include <glm/gtc/matrix_transform.hpp>
#include "Tessera/Renderer/ShadingStages.hpp"

using namespace Tessera;

namespace
{
	Vertex MakeVertex(const glm::vec3& position, const glm::vec2& uv)
	{
		return Vertex{ position, glm::vec3(0.0f, 0.0f, 1.0f), uv };
	}

	StageUniforms MakeUniforms(const glm::vec4& uvWindow, float inset = kDefaultAtlasInset)
	{
		StageUniforms uniforms;
		uniforms.local.uvWindow = uvWindow;
		uniforms.atlasInset = inset;
		return uniforms;
	}
}

// ============================================================================
// Vertex stage
// ============================================================================

TEST(VertexStageTest, LocalIsAppliedBeforeGlobal)
{
	glm::mat4 local = glm::translate(glm::mat4(1.0f), glm::vec3(1.0f, 0.0f, 0.0f));
	glm::mat4 global = glm::scale(glm::mat4(1.0f), glm::vec3(2.0f));

	glm::vec4 clip = TransformToClip(glm::vec3(0.0f), local, global);

	// global * (local * p) = scale(translate(p)) = (2, 0, 0); the other order would give (1, 0, 0)
	EXPECT_FLOAT_EQ(clip.x, 2.0f);
	EXPECT_FLOAT_EQ(clip.y, 0.0f);
	EXPECT_FLOAT_EQ(clip.w, 1.0f);
}

TEST(VertexStageTest, IdentityMatricesPassPositionThrough)
{
	StageUniforms uniforms = MakeUniforms(kFullUVWindow);
	VertexOutput out = RunVertexStage(UVWindowing::None, MakeVertex(glm::vec3(0.5f, -0.25f, 0.75f), glm::vec2(0.0f)), uniforms);

	EXPECT_EQ(out.clipPosition, glm::vec4(0.5f, -0.25f, 0.75f, 1.0f));
}

TEST(VertexStageTest, NoWindowPassesUVUnchanged)
{
	glm::vec2 uv(0.3f, 0.7f);
	EXPECT_EQ(RemapUV(UVWindowing::None, uv, glm::vec4(0.5f, 0.5f, 0.1f, 0.1f), 0.01f), uv);
}

TEST(VertexStageTest, WindowEndpointsMapToWindowCorners)
{
	const glm::vec4 window(0.25f, 0.5f, 0.25f, 0.125f);

	glm::vec2 topLeft = RemapUV(UVWindowing::Window, glm::vec2(0.0f, 0.0f), window, kDefaultAtlasInset);
	EXPECT_FLOAT_EQ(topLeft.x, 0.25f);
	EXPECT_FLOAT_EQ(topLeft.y, 0.5f);

	glm::vec2 bottomRight = RemapUV(UVWindowing::Window, glm::vec2(1.0f, 1.0f), window, kDefaultAtlasInset);
	EXPECT_FLOAT_EQ(bottomRight.x, 0.5f);
	EXPECT_FLOAT_EQ(bottomRight.y, 0.625f);
}

TEST(VertexStageTest, WindowIsLinearInsideTheWindow)
{
	const glm::vec4 window(0.25f, 0.5f, 0.5f, 0.25f);
	glm::vec2 mid = RemapUV(UVWindowing::Window, glm::vec2(0.5f, 0.5f), window, 0.0f);

	EXPECT_FLOAT_EQ(mid.x, 0.5f);
	EXPECT_FLOAT_EQ(mid.y, 0.625f);
}

TEST(VertexStageTest, InsetEndpointsStayInsideTheWindow)
{
	const float e = 0.01f;
	const glm::vec4 window(0.25f, 0.5f, 0.25f, 0.25f);

	glm::vec2 topLeft = RemapUV(UVWindowing::InsetWindow, glm::vec2(0.0f, 0.0f), window, e);
	EXPECT_NEAR(topLeft.x, 0.25f + e, 1e-6f);
	EXPECT_NEAR(topLeft.y, 0.5f + e, 1e-6f);

	// Symmetric margin: the far corner stops e short of the window edge
	glm::vec2 bottomRight = RemapUV(UVWindowing::InsetWindow, glm::vec2(1.0f, 1.0f), window, e);
	EXPECT_NEAR(bottomRight.x, 0.25f + 0.25f - e, 1e-6f);
	EXPECT_NEAR(bottomRight.y, 0.5f + 0.25f - e, 1e-6f);
}

TEST(VertexStageTest, ZeroInsetMatchesPlainWindow)
{
	const glm::vec4 window(0.125f, 0.25f, 0.5f, 0.5f);
	const glm::vec2 uv(0.75f, 0.25f);

	EXPECT_EQ(RemapUV(UVWindowing::InsetWindow, uv, window, 0.0f), RemapUV(UVWindowing::Window, uv, window, 0.0f));
}

TEST(VertexStageTest, DegenerateWindowCollapsesToOrigin)
{
	const glm::vec4 window(0.3f, 0.6f, 0.0f, 0.0f);

	EXPECT_EQ(RemapUV(UVWindowing::Window, glm::vec2(0.0f), window, 0.0f), glm::vec2(0.3f, 0.6f));
	EXPECT_EQ(RemapUV(UVWindowing::Window, glm::vec2(1.0f), window, 0.0f), glm::vec2(0.3f, 0.6f));
}

// ============================================================================
// Fragment stage
// ============================================================================

TEST(FragmentStageTest, CutoutDiscardsBelowThreshold)
{
	FragmentOutput below = ShadeFragment(FragmentShading::TexturedCutout, glm::vec2(0.0f), glm::vec4(1.0f, 1.0f, 1.0f, 0.0009f));
	EXPECT_TRUE(below.discarded);

	FragmentOutput transparent = ShadeFragment(FragmentShading::TexturedCutout, glm::vec2(0.0f), glm::vec4(0.0f));
	EXPECT_TRUE(transparent.discarded);
}

TEST(FragmentStageTest, CutoutKeepsThresholdAndAbove)
{
	FragmentOutput atThreshold = ShadeFragment(FragmentShading::TexturedCutout, glm::vec2(0.0f), glm::vec4(0.2f, 0.4f, 0.6f, kDiscardAlphaThreshold));
	EXPECT_FALSE(atThreshold.discarded);
	EXPECT_EQ(atThreshold.color, glm::vec4(0.2f, 0.4f, 0.6f, kDiscardAlphaThreshold));

	FragmentOutput half = ShadeFragment(FragmentShading::TexturedCutout, glm::vec2(0.0f), glm::vec4(0.5f));
	EXPECT_FALSE(half.discarded);
	EXPECT_EQ(half.color, glm::vec4(0.5f));
}

TEST(FragmentStageTest, TexturedNeverDiscards)
{
	FragmentOutput out = ShadeFragment(FragmentShading::Textured, glm::vec2(0.0f), glm::vec4(0.1f, 0.2f, 0.3f, 0.0f));
	EXPECT_FALSE(out.discarded);
	EXPECT_EQ(out.color, glm::vec4(0.1f, 0.2f, 0.3f, 0.0f));
}

TEST(FragmentStageTest, DebugOutputsUVAndOpaqueAlpha)
{
	FragmentOutput out = ShadeFragment(FragmentShading::UVDebug, glm::vec2(0.25f, 0.75f), glm::vec4(0.9f));
	EXPECT_FALSE(out.discarded);
	EXPECT_EQ(out.color, glm::vec4(0.25f, 0.75f, kDebugBlueChannel, 1.0f));
}

TEST(FragmentStageTest, DebugIsIdempotent)
{
	const glm::vec2 uv(0.125f, 0.875f);
	FragmentOutput first = RunFragmentStage(FragmentShading::UVDebug, uv, StageTexture{});
	FragmentOutput second = RunFragmentStage(FragmentShading::UVDebug, uv, StageTexture{});

	EXPECT_EQ(first.color, second.color);
	EXPECT_EQ(first.discarded, second.discarded);
}

TEST(FragmentStageTest, MissingImageSamplesTransparentBlack)
{
	FragmentOutput textured = RunFragmentStage(FragmentShading::Textured, glm::vec2(0.5f), StageTexture{});
	EXPECT_EQ(textured.color, glm::vec4(0.0f));

	FragmentOutput cutout = RunFragmentStage(FragmentShading::TexturedCutout, glm::vec2(0.5f), StageTexture{});
	EXPECT_TRUE(cutout.discarded);
}

// ============================================================================
// Both stages
// ============================================================================

TEST(ShadingPipelineTest, IdentityFullWindowReturnsSourceTexel)
{
	ImageData white = CreateSolidColor(4, 4, glm::vec4(1.0f));
	StageTexture texture{ &white, SamplerDesc{} };

	// Identity Local and Global, full window
	StageUniforms uniforms = MakeUniforms(kFullUVWindow);
	ASSERT_EQ(uniforms.global.mvp, glm::mat4(1.0f));
	ASSERT_EQ(uniforms.local.transform, glm::mat4(1.0f));

	const glm::vec2 uvs[] = {
		glm::vec2(0.0f, 0.0f), glm::vec2(1.0f, 0.0f),
		glm::vec2(0.0f, 1.0f), glm::vec2(1.0f, 1.0f),
		glm::vec2(0.5f, 0.5f)
	};
	const FragmentShading fragments[] = { FragmentShading::Textured, FragmentShading::TexturedCutout };

	for (FragmentShading fragment : fragments)
	{
		ShadingVariant variant{ UVWindowing::Window, fragment };
		for (const glm::vec2& uv : uvs)
		{
			const glm::vec3 position(uv.x * 2.0f - 1.0f, uv.y * 2.0f - 1.0f, 0.5f);
			VertexOutput vertexOut;
			FragmentOutput out = ShadeVertex(variant, MakeVertex(position, uv), uniforms, texture, &vertexOut);

			EXPECT_EQ(vertexOut.clipPosition, glm::vec4(position, 1.0f));
			EXPECT_EQ(vertexOut.uv, uv);
			EXPECT_FALSE(out.discarded) << GetVariantName(variant);
			EXPECT_EQ(out.color, glm::vec4(1.0f)) << GetVariantName(variant);
		}
	}
}

TEST(ShadingPipelineTest, WhiteTexelThroughCutoutIsKept)
{
	ImageData white = CreateSolidColor(4, 4, glm::vec4(1.0f));
	StageTexture texture{ &white, SamplerDesc{} };

	StageUniforms uniforms = MakeUniforms(glm::vec4(0.0f, 0.0f, 0.5f, 0.5f));
	VertexOutput vertexOut;
	FragmentOutput out = ShadeVertex(ShadingVariant::Atlas(), MakeVertex(glm::vec3(0.0f), glm::vec2(0.5f)), uniforms, texture, &vertexOut);

	EXPECT_FLOAT_EQ(vertexOut.uv.x, 0.25f);
	EXPECT_FLOAT_EQ(vertexOut.uv.y, 0.25f);
	EXPECT_FALSE(out.discarded);
	EXPECT_EQ(out.color, glm::vec4(1.0f));
}

TEST(ShadingPipelineTest, RightHalfWindowSamplesRightHalf)
{
	// Left half opaque red, right half fully transparent
	ImageData image;
	image.width = 2;
	image.height = 1;
	image.texels = { glm::vec4(1.0f, 0.0f, 0.0f, 1.0f), glm::vec4(0.0f) };
	StageTexture texture{ &image, SamplerDesc{} };

	StageUniforms uniforms = MakeUniforms(glm::vec4(0.5f, 0.0f, 0.5f, 1.0f));
	VertexOutput vertexOut;
	FragmentOutput out = ShadeVertex(ShadingVariant::Atlas(), MakeVertex(glm::vec3(0.0f), glm::vec2(0.0f)), uniforms, texture, &vertexOut);

	EXPECT_FLOAT_EQ(vertexOut.uv.x, 0.5f);
	EXPECT_FLOAT_EQ(vertexOut.uv.y, 0.0f);
	EXPECT_TRUE(out.discarded);
}

TEST(ShadingPipelineTest, DebugVariantShowsRemappedUV)
{
	StageUniforms uniforms = MakeUniforms(glm::vec4(0.5f, 0.25f, 0.25f, 0.5f));
	ShadingVariant variant{ UVWindowing::Window, FragmentShading::UVDebug };

	FragmentOutput out = ShadeVertex(variant, MakeVertex(glm::vec3(0.0f), glm::vec2(1.0f, 0.0f)), uniforms, StageTexture{});

	EXPECT_EQ(out.color, glm::vec4(0.75f, 0.25f, kDebugBlueChannel, 1.0f));
}
