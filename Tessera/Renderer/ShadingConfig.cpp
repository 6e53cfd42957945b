//------------------------------------------------------------------------------
// ShadingConfig.cpp
//------------------------------------------------------------------------------

#include "Tessera/Renderer/ShadingConfig.hpp"

#include <cmath>
#include <format>

namespace Tessera
{
	bool ShadingConfig::Validate(std::string& outError) const
	{
		if (!std::isfinite(atlasInset) || atlasInset < 0.0f || atlasInset >= 0.5f)
		{
			outError = std::format("atlasInset must be in [0, 0.5), got {}", atlasInset);
			return false;
		}

		if (framesInFlight == 0)
		{
			outError = "framesInFlight must be at least 1";
			return false;
		}

		if (maxDrawsPerFrame == 0)
		{
			outError = "maxDrawsPerFrame must be at least 1";
			return false;
		}

		if (shaderDirectory.empty())
		{
			outError = "shaderDirectory is empty";
			return false;
		}

		return true;
	}

	ShadingPipelineConfig ShadingConfig::MakePipelineConfig() const
	{
		ShadingPipelineConfig config;
		config.shaderDirectory = shaderDirectory;
		config.atlasInset = atlasInset;
		return config;
	}
}
