//------------------------------------------------------------------------------
// ShadingConfig.hpp
//
// Host-facing configuration for the shading core
//------------------------------------------------------------------------------
#pragma once

#include "Tessera/Renderer/PipelineInterface.hpp"
#include "Tessera/Renderer/TextureSampler.hpp"
#include "Tessera/Renderer/UniformBlocks.hpp"

#include <cstdint>
#include <string>

namespace Tessera
{
	struct ShadingConfig
	{
		// Margin per edge for InsetWindow variants, normalized UV units. Must be in [0, 0.5).
		float atlasInset = kDefaultAtlasInset;

		// Sampler bound with every texture
		SamplerDesc sampler;

		uint32_t framesInFlight = 2;
		uint32_t maxDrawsPerFrame = 1024;

		std::string shaderDirectory = "Shaders";

		bool Validate(std::string& outError) const;

		// Pipeline state for all variants, with the default raster state
		ShadingPipelineConfig MakePipelineConfig() const;
	};
}
