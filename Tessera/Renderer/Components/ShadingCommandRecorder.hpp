//------------------------------------------------------------------------------
// ShadingCommandRecorder.hpp
//
// Records a DrawList into a host command buffer inside an active render pass.
// Writes uniform blocks into the ring and binds pipelines and descriptor sets.
//------------------------------------------------------------------------------
#pragma once

#include "Tessera/Renderer/UniformBlocks.hpp"

#include <vulkan/vulkan.h>
#include <cstdint>
#include <optional>

namespace Tessera
{
	// Forward Declarations
	class VulkanPipelineAdapter;
	class VulkanDescriptorManager;
	class VulkanUniformRing;
	class DrawList;
	struct DrawCommand;

	struct RecorderStats
	{
		uint32_t drawsRecorded = 0;
		uint32_t drawsSkipped = 0;
		uint32_t pipelineBinds = 0;
	};

	class ShadingCommandRecorder
	{
	public:
		ShadingCommandRecorder() = default;
		~ShadingCommandRecorder() = default;

		// Lifecycle. defaultSampler is used for draws whose TextureBinding has none.
		bool Initialize(VulkanPipelineAdapter* pipelineManager, VulkanDescriptorManager* descriptorManager,
			VulkanUniformRing* uniformRing, VkSampler defaultSampler);
		void Cleanup();

		// Releases the ring region and texture sets of frameIndex
		bool BeginFrame(uint32_t frameIndex);

		// Writes the Global block once, then records every command. Returns false
		// if any draw had to be skipped.
		bool ExecuteDrawList(VkCommandBuffer commandBuffer, const DrawList& drawList, const GlobalUniforms& global);

		const RecorderStats& GetStats() const { return m_Stats; }

	private:
		VulkanPipelineAdapter* m_PipelineManager = nullptr;
		VulkanDescriptorManager* m_DescriptorManager = nullptr;
		VulkanUniformRing* m_UniformRing = nullptr;
		VkSampler m_DefaultSampler = VK_NULL_HANDLE;

		// Track current state to minimize redundant binds
		VkPipeline m_CurrentPipeline = VK_NULL_HANDLE;
		RecorderStats m_Stats;

		bool ExecuteDrawCommand(VkCommandBuffer commandBuffer, const DrawCommand& cmd, uint32_t globalOffset);
		std::optional<uint32_t> WriteLocalUniforms(const DrawCommand& cmd);

		// Prevent copying
		ShadingCommandRecorder(const ShadingCommandRecorder&) = delete;
		ShadingCommandRecorder& operator=(const ShadingCommandRecorder&) = delete;
	};

} // namespace Tessera
