//------------------------------------------------------------------------------
// ShadingStages.hpp
//
// CPU reference of the vertex and fragment stages in Shaders/sprite.vert and
// Shaders/sprite.frag. The GPU variants are compiled from the same math; these
// functions are what the tests check the shading rules against.
//------------------------------------------------------------------------------
#pragma once

#include "Tessera/Renderer/ShadingVariant.hpp"
#include "Tessera/Renderer/TextureSampler.hpp"
#include "Tessera/Renderer/UniformBlocks.hpp"
#include "Tessera/Renderer/Vertex.hpp"

#include <glm/glm.hpp>

namespace Tessera
{
	// Everything bound in set 0 for one draw, plus the inset used by InsetWindow
	struct StageUniforms
	{
		GlobalUniforms global;
		WindowedLocalUniforms local;  // uvWindow is ignored when windowing is None
		float atlasInset = kDefaultAtlasInset;
	};

	struct VertexOutput
	{
		glm::vec4 clipPosition = glm::vec4(0.0f);
		glm::vec2 uv = glm::vec2(0.0f);
	};

	struct FragmentOutput
	{
		bool discarded = false;
		glm::vec4 color = glm::vec4(0.0f);  // Undefined when discarded
	};

	// The texture bound in set 1. image may be null for UVDebug.
	struct StageTexture
	{
		const ImageData* image = nullptr;
		SamplerDesc sampler;
	};

	// global * (local * vec4(position, 1)). Local is applied first.
	glm::vec4 TransformToClip(const glm::vec3& position, const glm::mat4& localTransform, const glm::mat4& globalMvp);

	glm::vec2 RemapUV(UVWindowing windowing, const glm::vec2& uv, const glm::vec4& uvWindow, float inset);

	VertexOutput RunVertexStage(UVWindowing windowing, const Vertex& vertex, const StageUniforms& uniforms);

	// Applies the fragment policy to an already sampled texel. UVDebug ignores the sample.
	FragmentOutput ShadeFragment(FragmentShading fragment, const glm::vec2& uv, const glm::vec4& sampled);

	FragmentOutput RunFragmentStage(FragmentShading fragment, const glm::vec2& uv, const StageTexture& texture);

	// Runs both stages for a single vertex, shading the fragment at that vertex's own UV
	FragmentOutput ShadeVertex(const ShadingVariant& variant, const Vertex& vertex,
		const StageUniforms& uniforms, const StageTexture& texture, VertexOutput* outVertex = nullptr);
}
