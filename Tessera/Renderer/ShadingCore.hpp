//------------------------------------------------------------------------------
// ShadingCore.hpp
//
// Owns the shading components (memory, uniform ring, descriptors, default
// sampler, pipelines, recorder) for a host that owns device, render pass and
// frame synchronization.
//------------------------------------------------------------------------------
#pragma once

#include "Tessera/Core/Base.hpp"
#include "Tessera/Renderer/Vulkan/VulkanCommon.hpp"
#include "Tessera/Renderer/ShadingConfig.hpp"
#include "Tessera/Renderer/UniformBlocks.hpp"

#include <memory>
#include <cstdint>

namespace Tessera
{
	// Forward declarations
	class VulkanMemoryManager;
	class VulkanUniformRing;
	class VulkanDescriptorManager;
	class VulkanSampler;
	class VulkanPipelineAdapter;
	class ShadingCommandRecorder;
	class IPipelineManager;
	class DrawList;

	class ShadingCore
	{
	public:
		ShadingCore();
		~ShadingCore();

		// Lifecycle
		bool Initialize(const VulkanContext& context, VkRenderPass renderPass, VkExtent2D extent,
			VkDeviceSize minUniformBufferOffsetAlignment, const ShadingConfig& config);
		void Shutdown();

		// frameIndex in [0, framesInFlight); its previous submission must have completed
		bool BeginFrame(uint32_t frameIndex);

		// Records the list into a command buffer inside the host's render pass
		bool Record(VkCommandBuffer commandBuffer, const DrawList& drawList, const GlobalUniforms& global);

		// Rebuilds all pipelines for a new render target size
		bool Resize(VkExtent2D extent);

		// Shader hot reload
		bool ReloadShaders();

		IPipelineManager* GetPipelineManager() const;
		ShadingCommandRecorder* GetRecorder() const { return m_Recorder.get(); }
		VkSampler GetDefaultSampler() const;
		const ShadingConfig& GetConfig() const { return m_Config; }

		bool IsInitialized() const { return m_Initialized; }

	private:
		ShadingConfig m_Config;

		std::unique_ptr<VulkanMemoryManager> m_MemoryManager;
		std::unique_ptr<VulkanUniformRing> m_UniformRing;
		std::unique_ptr<VulkanDescriptorManager> m_DescriptorManager;
		std::unique_ptr<VulkanSampler> m_DefaultSampler;
		std::unique_ptr<VulkanPipelineAdapter> m_PipelineAdapter;
		std::unique_ptr<ShadingCommandRecorder> m_Recorder;

		bool m_Initialized = false;

		bool InitializeResources(const VulkanContext& context, VkDeviceSize minUniformBufferOffsetAlignment);
		bool InitializePipelines(VkDevice device, VkRenderPass renderPass, VkExtent2D extent);

		TESSERA_DISABLE_COPY_AND_MOVE(ShadingCore)
	};

} // namespace Tessera
