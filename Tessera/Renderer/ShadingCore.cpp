//------------------------------------------------------------------------------
// ShadingCore.cpp
//------------------------------------------------------------------------------

#include "Tessera/Renderer/ShadingCore.hpp"
#include "Tessera/Renderer/Vulkan/VulkanMemoryManager.hpp"
#include "Tessera/Renderer/Vulkan/VulkanUniformRing.hpp"
#include "Tessera/Renderer/Vulkan/VulkanDescriptorManager.hpp"
#include "Tessera/Renderer/Vulkan/VulkanSampler.hpp"
#include "Tessera/Renderer/Vulkan/VulkanPipelineAdapter.hpp"
#include "Tessera/Renderer/Components/ShadingCommandRecorder.hpp"
#include "Tessera/Renderer/DrawCommandSystem.hpp"
#include "Tessera/Core/Logger/Logger.hpp"

#include <string>

namespace Tessera
{
	ShadingCore::ShadingCore() = default;

	ShadingCore::~ShadingCore()
	{
		if (m_Initialized)
		{
			Shutdown();
		}
	}

	bool ShadingCore::Initialize(const VulkanContext& context, VkRenderPass renderPass, VkExtent2D extent,
		VkDeviceSize minUniformBufferOffsetAlignment, const ShadingConfig& config)
	{
		if (m_Initialized)
		{
			LOG_WARN("Shading core is already initialized");
			return true;
		}

		LOG_INFO("=== Initializing Shading Core ===");
		LOG_INFO("Tessera {}.{}.{}", TESSERA_VERSION_MAJOR, TESSERA_VERSION_MINOR, TESSERA_VERSION_PATCH);

		std::string error;
		if (!config.Validate(error))
		{
			LOG_ERROR("Invalid shading config: {}", error);
			return false;
		}

		if (!context.IsValid() || renderPass == VK_NULL_HANDLE)
		{
			LOG_ERROR("Shading core needs a valid Vulkan context and render pass");
			return false;
		}

		m_Config = config;

		if (!InitializeResources(context, minUniformBufferOffsetAlignment))
		{
			LOG_ERROR("Failed to initialize shading resources");
			Shutdown();
			return false;
		}

		if (!InitializePipelines(context.device, renderPass, extent))
		{
			LOG_ERROR("Failed to initialize pipelines");
			Shutdown();
			return false;
		}

		m_Recorder = std::make_unique<ShadingCommandRecorder>();
		if (!m_Recorder->Initialize(m_PipelineAdapter.get(), m_DescriptorManager.get(),
			m_UniformRing.get(), m_DefaultSampler->GetSampler()))
		{
			LOG_ERROR("Failed to initialize command recorder");
			Shutdown();
			return false;
		}

		m_Initialized = true;
		m_MemoryManager->LogMemoryStats();

		LOG_INFO("=== Shading Core Initialization Complete ===");
		return true;
	}

	bool ShadingCore::InitializeResources(const VulkanContext& context, VkDeviceSize minUniformBufferOffsetAlignment)
	{
		m_MemoryManager = std::make_unique<VulkanMemoryManager>();
		if (!m_MemoryManager->Initialize(context))
		{
			LOG_ERROR("Failed to initialize memory manager");
			return false;
		}

		m_UniformRing = std::make_unique<VulkanUniformRing>();
		if (!m_UniformRing->Initialize(m_MemoryManager.get(), m_Config.framesInFlight,
			m_Config.maxDrawsPerFrame, minUniformBufferOffsetAlignment))
		{
			LOG_ERROR("Failed to create uniform ring");
			return false;
		}

		// At most one texture set per draw
		m_DescriptorManager = std::make_unique<VulkanDescriptorManager>();
		if (!m_DescriptorManager->Initialize(context.device, m_Config.framesInFlight, m_Config.maxDrawsPerFrame))
		{
			LOG_ERROR("Failed to initialize descriptor manager");
			return false;
		}

		if (!m_DescriptorManager->UpdateUniformSets(m_UniformRing->GetBuffer()))
		{
			LOG_ERROR("Failed to point uniform sets at the uniform ring");
			return false;
		}

		m_DefaultSampler = std::make_unique<VulkanSampler>();
		if (!m_DefaultSampler->Create(context.device, m_Config.sampler))
		{
			LOG_ERROR("Failed to create default sampler");
			return false;
		}

		return true;
	}

	bool ShadingCore::InitializePipelines(VkDevice device, VkRenderPass renderPass, VkExtent2D extent)
	{
		m_PipelineAdapter = std::make_unique<VulkanPipelineAdapter>();
		if (!m_PipelineAdapter->Initialize(device, renderPass, extent, m_DescriptorManager.get()))
		{
			LOG_ERROR("Failed to initialize pipeline adapter");
			return false;
		}

		if (!m_PipelineAdapter->CreateAllPipelines(m_Config.MakePipelineConfig()))
		{
			LOG_ERROR("Failed to create shading pipelines");
			return false;
		}

		LOG_INFO("Created {} shading pipelines", SHADING_VARIANT_COUNT);
		return true;
	}

	void ShadingCore::Shutdown()
	{
		LOG_INFO("=== Shutting down Shading Core ===");

		// Reverse order of initialization
		if (m_Recorder)
		{
			m_Recorder->Cleanup();
			m_Recorder.reset();
		}

		m_PipelineAdapter.reset();
		m_DefaultSampler.reset();

		if (m_DescriptorManager)
		{
			m_DescriptorManager->Cleanup();
			m_DescriptorManager.reset();
		}

		if (m_UniformRing)
		{
			m_UniformRing->Shutdown();
			m_UniformRing.reset();
		}

		if (m_MemoryManager)
		{
			m_MemoryManager->Shutdown();
			m_MemoryManager.reset();
		}

		m_Initialized = false;
	}

	bool ShadingCore::BeginFrame(uint32_t frameIndex)
	{
		if (!m_Initialized)
		{
			LOG_ERROR("Shading core is not initialized");
			return false;
		}

		if (frameIndex >= m_Config.framesInFlight)
		{
			LOG_ERROR("Frame index {} out of range ({} frames in flight)", frameIndex, m_Config.framesInFlight);
			return false;
		}

		return m_Recorder->BeginFrame(frameIndex);
	}

	bool ShadingCore::Record(VkCommandBuffer commandBuffer, const DrawList& drawList, const GlobalUniforms& global)
	{
		if (!m_Initialized)
		{
			LOG_ERROR("Shading core is not initialized");
			return false;
		}

		return m_Recorder->ExecuteDrawList(commandBuffer, drawList, global);
	}

	bool ShadingCore::Resize(VkExtent2D extent)
	{
		if (!m_Initialized)
			return false;

		if (extent.width == 0 || extent.height == 0)
		{
			LOG_WARN("Ignoring resize to {}x{}", extent.width, extent.height);
			return false;
		}

		LOG_INFO("Rebuilding pipelines for {}x{}", extent.width, extent.height);
		m_PipelineAdapter->GetVulkanManager()->SetExtent(extent);
		return m_PipelineAdapter->ReloadAllPipelines();
	}

	bool ShadingCore::ReloadShaders()
	{
		if (!m_Initialized)
			return false;

		LOG_INFO("Reloading shaders...");
		bool success = m_PipelineAdapter->ReloadAllPipelines();
		if (!success)
		{
			LOG_ERROR("Some shaders failed to reload");
		}
		return success;
	}

	IPipelineManager* ShadingCore::GetPipelineManager() const
	{
		return m_PipelineAdapter.get();
	}

	VkSampler ShadingCore::GetDefaultSampler() const
	{
		return m_DefaultSampler ? m_DefaultSampler->GetSampler() : VK_NULL_HANDLE;
	}
}
