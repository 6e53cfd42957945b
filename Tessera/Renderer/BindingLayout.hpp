//------------------------------------------------------------------------------
// BindingLayout.hpp
//
// Backend-neutral description of the resources a shading variant binds.
// The Vulkan descriptor manager builds its set layouts from this list, and
// the pipeline manager validates it once before creating each pipeline.
//------------------------------------------------------------------------------
#pragma once

#include "Tessera/Renderer/PipelineInterface.hpp"
#include "Tessera/Renderer/ShadingVariant.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace Tessera
{
	constexpr uint32_t UNIFORM_SET = 0;
	constexpr uint32_t TEXTURE_SET = 1;

	constexpr uint32_t GLOBAL_UNIFORMS_BINDING = 0;
	constexpr uint32_t LOCAL_UNIFORMS_BINDING = 1;
	constexpr uint32_t SAMPLED_IMAGE_BINDING = 0;
	constexpr uint32_t SAMPLER_BINDING = 1;

	enum class BindingKind
	{
		UniformBuffer,
		SampledImage,
		Sampler
	};

	struct BindingSlot
	{
		uint32_t set = 0;
		uint32_t binding = 0;
		BindingKind kind = BindingKind::UniformBuffer;
		uint32_t size = 0;  // Block size in bytes, uniform buffers only
		ShaderStage stages = ShaderStage::Vertex;
	};

	const char* ToString(BindingKind kind);

	// Size of the Local block for a windowing mode (64, or 80 with uvWindow)
	uint32_t GetLocalUniformsSize(UVWindowing windowing);

	std::vector<BindingSlot> BuildBindingLayout(const ShadingVariant& variant);

	// Returns false and fills outError on the first violation found
	bool ValidateBindingLayout(const ShadingVariant& variant, const std::vector<BindingSlot>& slots, std::string& outError);
}
