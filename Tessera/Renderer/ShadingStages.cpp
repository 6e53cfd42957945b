//------------------------------------------------------------------------------
// ShadingStages.cpp
//
// CPU reference of the sprite vertex and fragment stages
//------------------------------------------------------------------------------

#include "Tessera/Renderer/ShadingStages.hpp"

namespace Tessera
{
	glm::vec4 TransformToClip(const glm::vec3& position, const glm::mat4& localTransform, const glm::mat4& globalMvp)
	{
		glm::vec4 world = localTransform * glm::vec4(position, 1.0f);
		return globalMvp * world;
	}

	glm::vec2 RemapUV(UVWindowing windowing, const glm::vec2& uv, const glm::vec4& uvWindow, float inset)
	{
		const glm::vec2 origin(uvWindow.x, uvWindow.y);
		const glm::vec2 extent(uvWindow.z, uvWindow.w);

		switch (windowing)
		{
		case UVWindowing::Window:
			return origin + extent * uv;
		case UVWindowing::InsetWindow:
			return origin + inset + (extent - 2.0f * inset) * uv;
		case UVWindowing::None:
		default:
			return uv;
		}
	}

	VertexOutput RunVertexStage(UVWindowing windowing, const Vertex& vertex, const StageUniforms& uniforms)
	{
		VertexOutput out;
		out.clipPosition = TransformToClip(vertex.position, uniforms.local.transform, uniforms.global.mvp);
		out.uv = RemapUV(windowing, vertex.uv, uniforms.local.uvWindow, uniforms.atlasInset);
		return out;
	}

	FragmentOutput ShadeFragment(FragmentShading fragment, const glm::vec2& uv, const glm::vec4& sampled)
	{
		FragmentOutput out;

		switch (fragment)
		{
		case FragmentShading::Textured:
			out.color = sampled;
			break;

		case FragmentShading::TexturedCutout:
			if (sampled.a < kDiscardAlphaThreshold)
			{
				out.discarded = true;
				break;
			}
			out.color = sampled;
			break;

		case FragmentShading::UVDebug:
		default:
			out.color = glm::vec4(uv.x, uv.y, kDebugBlueChannel, 1.0f);
			break;
		}

		return out;
	}

	FragmentOutput RunFragmentStage(FragmentShading fragment, const glm::vec2& uv, const StageTexture& texture)
	{
		if (fragment == FragmentShading::UVDebug)
			return ShadeFragment(fragment, uv, glm::vec4(0.0f));

		glm::vec4 sampled = texture.image
			? SampleTexture(*texture.image, texture.sampler, uv)
			: glm::vec4(0.0f);

		return ShadeFragment(fragment, uv, sampled);
	}

	FragmentOutput ShadeVertex(const ShadingVariant& variant, const Vertex& vertex,
		const StageUniforms& uniforms, const StageTexture& texture, VertexOutput* outVertex)
	{
		VertexOutput vertexOut = RunVertexStage(variant.windowing, vertex, uniforms);
		if (outVertex)
			*outVertex = vertexOut;

		return RunFragmentStage(variant.fragment, vertexOut.uv, texture);
	}
}
