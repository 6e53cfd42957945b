//------------------------------------------------------------------------------
// PipelineFactory.cpp
//
// Factory implementation for creating backend-specific pipeline managers
//------------------------------------------------------------------------------

#include "Tessera/Renderer/PipelineInterface.hpp"
#include "Tessera/Renderer/Vulkan/VulkanPipelineAdapter.hpp"

namespace Tessera
{
	// Vulkan is the only backend. The returned adapter still needs Initialize()
	// with the host's device and render pass before pipelines can be created.
	std::unique_ptr<IPipelineManager> CreatePipelineManager()
	{
		return std::make_unique<VulkanPipelineAdapter>();
	}

} // namespace Tessera
