//------------------------------------------------------------------------------
// ShadingCommandRecorder.cpp
//------------------------------------------------------------------------------

#include "Tessera/Renderer/Components/ShadingCommandRecorder.hpp"
#include "Tessera/Renderer/Vulkan/VulkanPipelineAdapter.hpp"
#include "Tessera/Renderer/Vulkan/VulkanDescriptorManager.hpp"
#include "Tessera/Renderer/Vulkan/VulkanUniformRing.hpp"
#include "Tessera/Renderer/BindingLayout.hpp"
#include "Tessera/Renderer/DrawCommandSystem.hpp"
#include "Tessera/Core/Logger/Logger.hpp"

#include <array>

namespace Tessera
{
	bool ShadingCommandRecorder::Initialize(VulkanPipelineAdapter* pipelineManager, VulkanDescriptorManager* descriptorManager,
		VulkanUniformRing* uniformRing, VkSampler defaultSampler)
	{
		if (!pipelineManager || !descriptorManager || !uniformRing || defaultSampler == VK_NULL_HANDLE)
		{
			LOG_ERROR("ShadingCommandRecorder needs a pipeline manager, descriptor manager, uniform ring and sampler");
			return false;
		}

		m_PipelineManager = pipelineManager;
		m_DescriptorManager = descriptorManager;
		m_UniformRing = uniformRing;
		m_DefaultSampler = defaultSampler;

		LOG_INFO("Shading command recorder initialized");
		return true;
	}

	void ShadingCommandRecorder::Cleanup()
	{
		m_PipelineManager = nullptr;
		m_DescriptorManager = nullptr;
		m_UniformRing = nullptr;
		m_DefaultSampler = VK_NULL_HANDLE;
		m_CurrentPipeline = VK_NULL_HANDLE;
	}

	bool ShadingCommandRecorder::BeginFrame(uint32_t frameIndex)
	{
		if (!m_UniformRing || !m_DescriptorManager)
		{
			LOG_ERROR("Shading command recorder not initialized");
			return false;
		}

		m_Stats = {};
		return m_UniformRing->BeginFrame(frameIndex) && m_DescriptorManager->BeginFrame(frameIndex);
	}

	bool ShadingCommandRecorder::ExecuteDrawList(VkCommandBuffer commandBuffer, const DrawList& drawList, const GlobalUniforms& global)
	{
		if (commandBuffer == VK_NULL_HANDLE || !m_PipelineManager)
		{
			LOG_ERROR("No command buffer or pipeline manager provided");
			return false;
		}

		if (drawList.IsEmpty())
			return true;

		std::optional<uint32_t> globalOffset = m_UniformRing->Write(global);
		if (!globalOffset)
		{
			LOG_ERROR("Could not write the Global uniform block");
			return false;
		}

		// Pipeline state is unknown at the start of each list
		m_CurrentPipeline = VK_NULL_HANDLE;

		bool allRecorded = true;
		for (const auto& cmd : drawList.GetCommands())
		{
			if (ExecuteDrawCommand(commandBuffer, cmd, *globalOffset))
			{
				++m_Stats.drawsRecorded;
			}
			else
			{
				++m_Stats.drawsSkipped;
				allRecorded = false;
			}
		}

		if (!m_UniformRing->FlushFrame())
		{
			LOG_ERROR("Failed to flush uniform ring");
			return false;
		}

		return allRecorded;
	}

	std::optional<uint32_t> ShadingCommandRecorder::WriteLocalUniforms(const DrawCommand& cmd)
	{
		if (UsesUVWindow(cmd.variant))
		{
			return m_UniformRing->Write(cmd.GetLocalUniforms());
		}

		LocalUniforms local;
		local.transform = cmd.transform;
		return m_UniformRing->Write(local);
	}

	bool ShadingCommandRecorder::ExecuteDrawCommand(VkCommandBuffer commandBuffer, const DrawCommand& cmd, uint32_t globalOffset)
	{
		VulkanPipelineManager* vulkanManager = m_PipelineManager->GetVulkanManager();
		VkPipeline pipeline = vulkanManager->GetPipeline(cmd.variant);
		VkPipelineLayout layout = vulkanManager->GetPipelineLayout(cmd.variant);

		if (pipeline == VK_NULL_HANDLE)
		{
			LOG_ERROR("Skipping draw: no pipeline for {}", GetVariantName(cmd.variant));
			return false;
		}

		// Resolve set 1 before touching the command buffer so a failure skips the whole draw
		VkDescriptorSet textureSet = VK_NULL_HANDLE;
		if (UsesTexture(cmd.variant))
		{
			VkSampler sampler = cmd.texture.sampler != VK_NULL_HANDLE ? cmd.texture.sampler : m_DefaultSampler;
			textureSet = m_DescriptorManager->AcquireTextureSet(cmd.texture.imageView, sampler);
			if (textureSet == VK_NULL_HANDLE)
			{
				LOG_ERROR("Skipping {} draw: no texture descriptor set", GetVariantName(cmd.variant));
				return false;
			}
		}

		std::optional<uint32_t> localOffset = WriteLocalUniforms(cmd);
		if (!localOffset)
		{
			LOG_ERROR("Skipping {} draw: uniform ring is full", GetVariantName(cmd.variant));
			return false;
		}

		if (pipeline != m_CurrentPipeline)
		{
			if (!m_PipelineManager->BindPipeline(commandBuffer, cmd.variant))
			{
				LOG_ERROR("Skipping draw: failed to bind {}", GetVariantName(cmd.variant));
				return false;
			}
			m_CurrentPipeline = pipeline;
			++m_Stats.pipelineBinds;
		}

		// Set 0: dynamic offsets in binding order (Global, Local)
		VkDescriptorSet uniformSet = m_DescriptorManager->GetUniformSet(cmd.variant.windowing);
		std::array<uint32_t, 2> dynamicOffsets = { globalOffset, *localOffset };
		vkCmdBindDescriptorSets(
			commandBuffer,
			VK_PIPELINE_BIND_POINT_GRAPHICS,
			layout,
			UNIFORM_SET,
			1,
			&uniformSet,
			static_cast<uint32_t>(dynamicOffsets.size()),
			dynamicOffsets.data()
		);

		if (textureSet != VK_NULL_HANDLE)
		{
			vkCmdBindDescriptorSets(
				commandBuffer,
				VK_PIPELINE_BIND_POINT_GRAPHICS,
				layout,
				TEXTURE_SET,
				1,
				&textureSet,
				0,
				nullptr
			);
		}

		// Bind vertex buffer
		VkBuffer vertexBuffers[] = { cmd.mesh.vertexBuffer };
		VkDeviceSize offsets[] = { 0 };
		vkCmdBindVertexBuffers(commandBuffer, 0, 1, vertexBuffers, offsets);

		// Draw
		if (cmd.mesh.IsIndexed())
		{
			vkCmdBindIndexBuffer(commandBuffer, cmd.mesh.indexBuffer, 0, VK_INDEX_TYPE_UINT32);
			vkCmdDrawIndexed(commandBuffer, cmd.mesh.indexCount, cmd.instanceCount, 0, 0, cmd.firstInstance);
		}
		else
		{
			vkCmdDraw(commandBuffer, cmd.mesh.vertexCount, cmd.instanceCount, 0, cmd.firstInstance);
		}

		return true;
	}
}
