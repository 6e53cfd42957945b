#include "Tessera/Renderer/Vulkan/VulkanPipeline.hpp"
#include "Tessera/Renderer/Vulkan/VulkanCommon.hpp"
#include "Tessera/Renderer/BindingLayout.hpp"
#include "Tessera/Renderer/Vertex.hpp"
#include "Tessera/Core/FileUtils.hpp"
#include "Tessera/Core/Logger/Logger.hpp"

#include <exception>

namespace Tessera
{
	bool VulkanPipelineManager::Initialize(VkDevice device, VkRenderPass defaultRenderPass, VkExtent2D extent)
	{
		if (device == VK_NULL_HANDLE || defaultRenderPass == VK_NULL_HANDLE)
		{
			LOG_ERROR("VulkanPipelineManager needs a device and a render pass");
			return false;
		}

		m_Device = device;
		m_DefaultRenderPass = defaultRenderPass;
		m_Extent = extent;

		LOG_INFO("VulkanPipelineManager initialized ({}x{})", extent.width, extent.height);
		return true;
	}

	bool VulkanPipelineManager::CreatePipeline(const ShadingVariant& variant, const VulkanPipelineConfig& config)
	{
		const size_t index = GetVariantIndex(variant);
		if (index >= m_Pipelines.size())
		{
			LOG_ERROR("Invalid shading variant");
			return false;
		}

		const std::string name = GetVariantName(variant);

		// Binding contract is checked once, before any Vulkan object exists
		std::string layoutError;
		if (!ValidateBindingLayout(variant, BuildBindingLayout(variant), layoutError))
		{
			LOG_ERROR("Binding layout for {} is invalid: {}", name, layoutError);
			return false;
		}

		const size_t expectedSets = UsesTexture(variant) ? 2 : 1;
		if (config.descriptorSetLayouts.size() != expectedSets)
		{
			LOG_ERROR("{} pipeline needs {} descriptor set layouts, got {}", name, expectedSets, config.descriptorSetLayouts.size());
			return false;
		}

		// Destroy existing pipeline if it exists
		if (m_Pipelines[index].isValid)
		{
			DestroyPipeline(m_Pipelines[index]);
		}

		// Store config for hot reload
		m_Pipelines[index].config = config;

		bool success = CreateGraphicsPipeline(variant, config, m_Pipelines[index]);
		if (success)
		{
			m_Pipelines[index].isValid = true;
			LOG_INFO("Created {} pipeline", name);
		}
		else
		{
			DestroyPipeline(m_Pipelines[index]);
			LOG_ERROR("Failed to create {} pipeline", name);
		}

		return success;
	}

	bool VulkanPipelineManager::CreateGraphicsPipeline(const ShadingVariant& variant, const VulkanPipelineConfig& config, Pipeline& pipeline)
	{
		// Load shaders
		std::vector<uint32_t> vertShaderCode;
		std::vector<uint32_t> fragShaderCode;
		try
		{
			vertShaderCode = FileUtils::ReadSpirV(config.vertexShaderPath);
			fragShaderCode = FileUtils::ReadSpirV(config.fragmentShaderPath);
		}
		catch (const std::exception& e)
		{
			LOG_ERROR("Failed to load shaders for {}: {}", GetVariantName(variant), e.what());
			return false;
		}

		VkShaderModule vertShaderModule = CreateShaderModule(vertShaderCode);
		VkShaderModule fragShaderModule = CreateShaderModule(fragShaderCode);
		if (vertShaderModule == VK_NULL_HANDLE || fragShaderModule == VK_NULL_HANDLE)
		{
			if (vertShaderModule != VK_NULL_HANDLE) vkDestroyShaderModule(m_Device, vertShaderModule, nullptr);
			if (fragShaderModule != VK_NULL_HANDLE) vkDestroyShaderModule(m_Device, fragShaderModule, nullptr);
			return false;
		}

		// Specialization: inset for the vertex stage, discard threshold for the fragment stage.
		// Stages that do not declare the constant ignore the entry.
		VkSpecializationMapEntry insetEntry{};
		insetEntry.constantID = SPEC_CONSTANT_ATLAS_INSET;
		insetEntry.offset = 0;
		insetEntry.size = sizeof(float);

		VkSpecializationInfo vertSpecialization{};
		vertSpecialization.mapEntryCount = 1;
		vertSpecialization.pMapEntries = &insetEntry;
		vertSpecialization.dataSize = sizeof(float);
		vertSpecialization.pData = &config.atlasInset;

		VkSpecializationMapEntry thresholdEntry{};
		thresholdEntry.constantID = SPEC_CONSTANT_DISCARD_THRESHOLD;
		thresholdEntry.offset = 0;
		thresholdEntry.size = sizeof(float);

		VkSpecializationInfo fragSpecialization{};
		fragSpecialization.mapEntryCount = 1;
		fragSpecialization.pMapEntries = &thresholdEntry;
		fragSpecialization.dataSize = sizeof(float);
		fragSpecialization.pData = &config.discardAlphaThreshold;

		// Shader stages
		std::array<VkPipelineShaderStageCreateInfo, 2> shaderStages{};

		shaderStages[0].sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
		shaderStages[0].stage = VK_SHADER_STAGE_VERTEX_BIT;
		shaderStages[0].module = vertShaderModule;
		shaderStages[0].pName = "main";
		shaderStages[0].pSpecializationInfo = &vertSpecialization;

		shaderStages[1].sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
		shaderStages[1].stage = VK_SHADER_STAGE_FRAGMENT_BIT;
		shaderStages[1].module = fragShaderModule;
		shaderStages[1].pName = "main";
		shaderStages[1].pSpecializationInfo = &fragSpecialization;

		// Vertex input: position, normal, uv from one interleaved buffer
		VkVertexInputBindingDescription bindingDescription = Vertex::GetBindingDescription();
		auto attributeDescriptions = Vertex::GetAttributeDescriptions();

		VkPipelineVertexInputStateCreateInfo vertexInputInfo{};
		vertexInputInfo.sType = VK_STRUCTURE_TYPE_PIPELINE_VERTEX_INPUT_STATE_CREATE_INFO;
		vertexInputInfo.vertexBindingDescriptionCount = 1;
		vertexInputInfo.pVertexBindingDescriptions = &bindingDescription;
		vertexInputInfo.vertexAttributeDescriptionCount = static_cast<uint32_t>(attributeDescriptions.size());
		vertexInputInfo.pVertexAttributeDescriptions = attributeDescriptions.data();

		// Input assembly
		VkPipelineInputAssemblyStateCreateInfo inputAssembly{};
		inputAssembly.sType = VK_STRUCTURE_TYPE_PIPELINE_INPUT_ASSEMBLY_STATE_CREATE_INFO;
		inputAssembly.topology = VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST;
		inputAssembly.primitiveRestartEnable = VK_FALSE;

		// Viewport state
		VkViewport viewport{};
		viewport.x = 0.0f;
		viewport.y = 0.0f;
		viewport.width = static_cast<float>(m_Extent.width);
		viewport.height = static_cast<float>(m_Extent.height);
		viewport.minDepth = 0.0f;
		viewport.maxDepth = 1.0f;

		VkRect2D scissor{};
		scissor.offset = { 0, 0 };
		scissor.extent = m_Extent;

		VkPipelineViewportStateCreateInfo viewportState{};
		viewportState.sType = VK_STRUCTURE_TYPE_PIPELINE_VIEWPORT_STATE_CREATE_INFO;
		viewportState.viewportCount = 1;
		viewportState.pViewports = &viewport;
		viewportState.scissorCount = 1;
		viewportState.pScissors = &scissor;

		// Rasterizer
		VkPipelineRasterizationStateCreateInfo rasterizer{};
		rasterizer.sType = VK_STRUCTURE_TYPE_PIPELINE_RASTERIZATION_STATE_CREATE_INFO;
		rasterizer.depthClampEnable = VK_FALSE;
		rasterizer.rasterizerDiscardEnable = VK_FALSE;
		rasterizer.polygonMode = config.polygonMode;
		rasterizer.lineWidth = 1.0f;
		rasterizer.cullMode = config.cullMode;
		rasterizer.frontFace = config.frontFace;
		rasterizer.depthBiasEnable = VK_FALSE;

		// Multisampling
		VkPipelineMultisampleStateCreateInfo multisampling{};
		multisampling.sType = VK_STRUCTURE_TYPE_PIPELINE_MULTISAMPLE_STATE_CREATE_INFO;
		multisampling.sampleShadingEnable = VK_FALSE;
		multisampling.rasterizationSamples = VK_SAMPLE_COUNT_1_BIT;

		// Depth stencil
		VkPipelineDepthStencilStateCreateInfo depthStencil{};
		depthStencil.sType = VK_STRUCTURE_TYPE_PIPELINE_DEPTH_STENCIL_STATE_CREATE_INFO;
		depthStencil.depthTestEnable = config.depthTestEnable;
		depthStencil.depthWriteEnable = config.depthWriteEnable;
		depthStencil.depthCompareOp = config.depthCompareOp;
		depthStencil.depthBoundsTestEnable = VK_FALSE;
		depthStencil.stencilTestEnable = VK_FALSE;

		// Color blending
		VkPipelineColorBlendAttachmentState colorBlendAttachment{};
		colorBlendAttachment.colorWriteMask = VK_COLOR_COMPONENT_R_BIT | VK_COLOR_COMPONENT_G_BIT |
			VK_COLOR_COMPONENT_B_BIT | VK_COLOR_COMPONENT_A_BIT;

		colorBlendAttachment.blendEnable = config.blendEnable;
		if (config.blendEnable)
		{
			colorBlendAttachment.srcColorBlendFactor = config.srcColorBlendFactor;
			colorBlendAttachment.dstColorBlendFactor = config.dstColorBlendFactor;
			colorBlendAttachment.colorBlendOp = VK_BLEND_OP_ADD;
			colorBlendAttachment.srcAlphaBlendFactor = config.srcAlphaBlendFactor;
			colorBlendAttachment.dstAlphaBlendFactor = config.dstAlphaBlendFactor;
			colorBlendAttachment.alphaBlendOp = VK_BLEND_OP_ADD;
		}

		VkPipelineColorBlendStateCreateInfo colorBlending{};
		colorBlending.sType = VK_STRUCTURE_TYPE_PIPELINE_COLOR_BLEND_STATE_CREATE_INFO;
		colorBlending.logicOpEnable = VK_FALSE;
		colorBlending.attachmentCount = 1;
		colorBlending.pAttachments = &colorBlendAttachment;

		// Pipeline layout
		VkPipelineLayoutCreateInfo pipelineLayoutInfo{};
		pipelineLayoutInfo.sType = VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO;
		pipelineLayoutInfo.setLayoutCount = static_cast<uint32_t>(config.descriptorSetLayouts.size());
		pipelineLayoutInfo.pSetLayouts = config.descriptorSetLayouts.data();
		pipelineLayoutInfo.pushConstantRangeCount = 0;
		pipelineLayoutInfo.pPushConstantRanges = nullptr;

		VkResult result = vkCreatePipelineLayout(m_Device, &pipelineLayoutInfo, nullptr, &pipeline.layout);
		if (result != VK_SUCCESS)
		{
			LOG_ERROR("Failed to create pipeline layout: {}", VulkanUtils::VkResultToString(result));
			pipeline.layout = VK_NULL_HANDLE;
			vkDestroyShaderModule(m_Device, vertShaderModule, nullptr);
			vkDestroyShaderModule(m_Device, fragShaderModule, nullptr);
			return false;
		}

		// Create the graphics pipeline
		VkGraphicsPipelineCreateInfo pipelineInfo{};
		pipelineInfo.sType = VK_STRUCTURE_TYPE_GRAPHICS_PIPELINE_CREATE_INFO;
		pipelineInfo.stageCount = static_cast<uint32_t>(shaderStages.size());
		pipelineInfo.pStages = shaderStages.data();
		pipelineInfo.pVertexInputState = &vertexInputInfo;
		pipelineInfo.pInputAssemblyState = &inputAssembly;
		pipelineInfo.pViewportState = &viewportState;
		pipelineInfo.pRasterizationState = &rasterizer;
		pipelineInfo.pMultisampleState = &multisampling;
		pipelineInfo.pDepthStencilState = &depthStencil;
		pipelineInfo.pColorBlendState = &colorBlending;
		pipelineInfo.layout = pipeline.layout;
		pipelineInfo.renderPass = config.renderPass ? config.renderPass : m_DefaultRenderPass;
		pipelineInfo.subpass = 0;

		result = vkCreateGraphicsPipelines(m_Device, VK_NULL_HANDLE, 1, &pipelineInfo, nullptr, &pipeline.pipeline);

		// Cleanup shader modules
		vkDestroyShaderModule(m_Device, vertShaderModule, nullptr);
		vkDestroyShaderModule(m_Device, fragShaderModule, nullptr);

		if (result != VK_SUCCESS)
		{
			LOG_ERROR("vkCreateGraphicsPipelines failed: {}", VulkanUtils::VkResultToString(result));
			pipeline.pipeline = VK_NULL_HANDLE;
			return false;
		}

		return true;
	}

	bool VulkanPipelineManager::BindPipeline(VkCommandBuffer cmd, const ShadingVariant& variant)
	{
		if (!IsValid(variant))
		{
			LOG_ERROR("Attempting to bind invalid pipeline: {}", GetVariantName(variant));
			return false;
		}

		vkCmdBindPipeline(cmd, VK_PIPELINE_BIND_POINT_GRAPHICS, m_Pipelines[GetVariantIndex(variant)].pipeline);
		return true;
	}

	void VulkanPipelineManager::Cleanup()
	{
		if (m_Device == VK_NULL_HANDLE)
			return;

		for (auto& pipeline : m_Pipelines)
		{
			DestroyPipeline(pipeline);
		}
		m_Device = VK_NULL_HANDLE;
		m_DefaultRenderPass = VK_NULL_HANDLE;
		LOG_INFO("VulkanPipelineManager cleaned up");
	}

	VkShaderModule VulkanPipelineManager::CreateShaderModule(const std::vector<uint32_t>& code)
	{
		VkShaderModuleCreateInfo createInfo{};
		createInfo.sType = VK_STRUCTURE_TYPE_SHADER_MODULE_CREATE_INFO;
		createInfo.codeSize = code.size() * sizeof(uint32_t);
		createInfo.pCode = code.data();

		VkShaderModule shaderModule = VK_NULL_HANDLE;
		VkResult result = vkCreateShaderModule(m_Device, &createInfo, nullptr, &shaderModule);
		if (result != VK_SUCCESS)
		{
			LOG_ERROR("Failed to create shader module: {}", VulkanUtils::VkResultToString(result));
			return VK_NULL_HANDLE;
		}

		return shaderModule;
	}

	bool VulkanPipelineManager::ReloadPipeline(const ShadingVariant& variant)
	{
		if (!IsValid(variant))
		{
			LOG_ERROR("Attempting to reload invalid pipeline: {}", GetVariantName(variant));
			return false;
		}

		LOG_INFO("Reloading {} pipeline", GetVariantName(variant));

		// Copy first: CreatePipeline overwrites the stored config
		VulkanPipelineConfig config = m_Pipelines[GetVariantIndex(variant)].config;
		return CreatePipeline(variant, config);
	}

	bool VulkanPipelineManager::ReloadAllPipelines()
	{
		bool success = true;
		for (size_t i = 0; i < m_Pipelines.size(); ++i)
		{
			if (m_Pipelines[i].isValid)
			{
				success &= ReloadPipeline(ShadingVariant::FromIndex(i));
			}
		}
		return success;
	}

	void VulkanPipelineManager::DestroyPipeline(const ShadingVariant& variant)
	{
		const size_t index = GetVariantIndex(variant);
		if (index < m_Pipelines.size())
		{
			DestroyPipeline(m_Pipelines[index]);
		}
	}

	void VulkanPipelineManager::DestroyPipeline(Pipeline& pipeline)
	{
		if (pipeline.pipeline != VK_NULL_HANDLE)
		{
			vkDestroyPipeline(m_Device, pipeline.pipeline, nullptr);
			pipeline.pipeline = VK_NULL_HANDLE;
		}
		if (pipeline.layout != VK_NULL_HANDLE)
		{
			vkDestroyPipelineLayout(m_Device, pipeline.layout, nullptr);
			pipeline.layout = VK_NULL_HANDLE;
		}
		pipeline.isValid = false;
	}

	bool VulkanPipelineManager::IsValid(const ShadingVariant& variant) const
	{
		const size_t index = GetVariantIndex(variant);
		return index < m_Pipelines.size() && m_Pipelines[index].isValid;
	}

	VkPipeline VulkanPipelineManager::GetPipeline(const ShadingVariant& variant) const
	{
		return IsValid(variant) ? m_Pipelines[GetVariantIndex(variant)].pipeline : VK_NULL_HANDLE;
	}

	VkPipelineLayout VulkanPipelineManager::GetPipelineLayout(const ShadingVariant& variant) const
	{
		return IsValid(variant) ? m_Pipelines[GetVariantIndex(variant)].layout : VK_NULL_HANDLE;
	}
}
