//------------------------------------------------------------------------------
// VulkanPipelineAdapter.hpp
//
// Vulkan implementation of the generic pipeline interface
// This adapts between generic types and Vulkan-specific types
//------------------------------------------------------------------------------

#pragma once

#include "Tessera/Renderer/PipelineInterface.hpp"
#include "Tessera/Renderer/TextureSampler.hpp"
#include "Tessera/Renderer/Vulkan/VulkanPipeline.hpp"
#include "Tessera/Renderer/Vulkan/VulkanDescriptorManager.hpp"
#include "Tessera/Core/FileUtils.hpp"
#include "Tessera/Core/Logger/Logger.hpp"

#include <vulkan/vulkan.h>
#include <array>
#include <memory>

namespace Tessera
{
	// Convert generic enums to Vulkan enums
	class VulkanEnumConverter
	{
	public:
		static VkPolygonMode ToVkPolygonMode(PolygonMode mode)
		{
			switch (mode)
			{
			case PolygonMode::Fill:  return VK_POLYGON_MODE_FILL;
			case PolygonMode::Line:  return VK_POLYGON_MODE_LINE;
			case PolygonMode::Point: return VK_POLYGON_MODE_POINT;
			default: return VK_POLYGON_MODE_FILL;
			}
		}

		static VkCullModeFlags ToVkCullMode(CullMode mode)
		{
			switch (mode)
			{
			case CullMode::None:         return VK_CULL_MODE_NONE;
			case CullMode::Front:        return VK_CULL_MODE_FRONT_BIT;
			case CullMode::Back:         return VK_CULL_MODE_BACK_BIT;
			case CullMode::FrontAndBack: return VK_CULL_MODE_FRONT_AND_BACK;
			default: return VK_CULL_MODE_NONE;
			}
		}

		static VkFrontFace ToVkFrontFace(FrontFace face)
		{
			switch (face)
			{
			case FrontFace::Clockwise:        return VK_FRONT_FACE_CLOCKWISE;
			case FrontFace::CounterClockwise: return VK_FRONT_FACE_COUNTER_CLOCKWISE;
			default: return VK_FRONT_FACE_COUNTER_CLOCKWISE;
			}
		}

		static VkCompareOp ToVkCompareOp(CompareOp op)
		{
			switch (op)
			{
			case CompareOp::Never:          return VK_COMPARE_OP_NEVER;
			case CompareOp::Less:           return VK_COMPARE_OP_LESS;
			case CompareOp::Equal:          return VK_COMPARE_OP_EQUAL;
			case CompareOp::LessOrEqual:    return VK_COMPARE_OP_LESS_OR_EQUAL;
			case CompareOp::Greater:        return VK_COMPARE_OP_GREATER;
			case CompareOp::NotEqual:       return VK_COMPARE_OP_NOT_EQUAL;
			case CompareOp::GreaterOrEqual: return VK_COMPARE_OP_GREATER_OR_EQUAL;
			case CompareOp::Always:         return VK_COMPARE_OP_ALWAYS;
			default: return VK_COMPARE_OP_LESS_OR_EQUAL;
			}
		}

		static VkBlendFactor ToVkBlendFactor(BlendFactor factor)
		{
			switch (factor)
			{
			case BlendFactor::Zero:             return VK_BLEND_FACTOR_ZERO;
			case BlendFactor::One:              return VK_BLEND_FACTOR_ONE;
			case BlendFactor::SrcColor:         return VK_BLEND_FACTOR_SRC_COLOR;
			case BlendFactor::OneMinusSrcColor: return VK_BLEND_FACTOR_ONE_MINUS_SRC_COLOR;
			case BlendFactor::DstColor:         return VK_BLEND_FACTOR_DST_COLOR;
			case BlendFactor::OneMinusDstColor: return VK_BLEND_FACTOR_ONE_MINUS_DST_COLOR;
			case BlendFactor::SrcAlpha:         return VK_BLEND_FACTOR_SRC_ALPHA;
			case BlendFactor::OneMinusSrcAlpha: return VK_BLEND_FACTOR_ONE_MINUS_SRC_ALPHA;
			case BlendFactor::DstAlpha:         return VK_BLEND_FACTOR_DST_ALPHA;
			case BlendFactor::OneMinusDstAlpha: return VK_BLEND_FACTOR_ONE_MINUS_DST_ALPHA;
			default: return VK_BLEND_FACTOR_ONE;
			}
		}

		static VkShaderStageFlags ToVkShaderStages(ShaderStage stages)
		{
			VkShaderStageFlags vkStages = 0;

			if (static_cast<int>(stages) & static_cast<int>(ShaderStage::Vertex))
				vkStages |= VK_SHADER_STAGE_VERTEX_BIT;
			if (static_cast<int>(stages) & static_cast<int>(ShaderStage::Fragment))
				vkStages |= VK_SHADER_STAGE_FRAGMENT_BIT;

			return vkStages;
		}

		static VkFilter ToVkFilter(FilterMode mode)
		{
			switch (mode)
			{
			case FilterMode::Linear:  return VK_FILTER_LINEAR;
			case FilterMode::Nearest:
			default: return VK_FILTER_NEAREST;
			}
		}

		static VkSamplerAddressMode ToVkAddressMode(AddressMode mode)
		{
			switch (mode)
			{
			case AddressMode::Repeat:         return VK_SAMPLER_ADDRESS_MODE_REPEAT;
			case AddressMode::MirroredRepeat: return VK_SAMPLER_ADDRESS_MODE_MIRRORED_REPEAT;
			case AddressMode::ClampToEdge:
			default: return VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE;
			}
		}
	};

	// Vulkan pipeline wrapper
	class VulkanPipeline : public IPipeline
	{
	public:
		VulkanPipeline(const ShadingVariant& variant, VkPipeline pipeline, VkPipelineLayout layout)
			: m_Variant(variant), m_Pipeline(pipeline), m_Layout(layout) {}

		bool IsValid() const override { return m_Pipeline != VK_NULL_HANDLE; }
		ShadingVariant GetVariant() const override { return m_Variant; }

		VkPipeline GetVkPipeline() const { return m_Pipeline; }
		VkPipelineLayout GetVkLayout() const { return m_Layout; }

	private:
		ShadingVariant m_Variant;
		VkPipeline m_Pipeline;
		VkPipelineLayout m_Layout;
	};

	// Adaptor class that implements the interface using VulkanPipelineManager
	class VulkanPipelineAdapter : public IPipelineManager
	{
	public:
		VulkanPipelineAdapter() = default;
		~VulkanPipelineAdapter() override = default;

		bool Initialize(VkDevice device, VkRenderPass renderPass, VkExtent2D extent, VulkanDescriptorManager* descriptorManager)
		{
			if (!descriptorManager)
			{
				LOG_ERROR("VulkanPipelineAdapter needs a descriptor manager");
				return false;
			}

			m_VulkanManager = std::make_unique<VulkanPipelineManager>();
			m_DescriptorManager = descriptorManager;

			return m_VulkanManager->Initialize(device, renderPass, extent);
		}

		bool CreatePipeline(const ShadingVariant& variant, const ShadingPipelineConfig& config) override
		{
			if (!m_VulkanManager || !m_DescriptorManager)
			{
				LOG_ERROR("Pipeline adapter not initialized");
				return false;
			}

			// Convert generic config to vulkan config
			VulkanPipelineConfig vkConfig;
			vkConfig.vertexShaderPath = FileUtils::JoinPath(config.shaderDirectory, GetVertexShaderFile(variant.windowing));
			vkConfig.fragmentShaderPath = FileUtils::JoinPath(config.shaderDirectory, GetFragmentShaderFile(variant.fragment));

			// Convert enums
			vkConfig.polygonMode = VulkanEnumConverter::ToVkPolygonMode(config.polygonMode);
			vkConfig.cullMode = VulkanEnumConverter::ToVkCullMode(config.cullMode);
			vkConfig.frontFace = VulkanEnumConverter::ToVkFrontFace(config.frontFace);
			vkConfig.depthTestEnable = config.depthTestEnable;
			vkConfig.depthWriteEnable = config.depthWriteEnable;
			vkConfig.depthCompareOp = VulkanEnumConverter::ToVkCompareOp(config.depthCompareOp);
			vkConfig.blendEnable = config.blendEnable;
			vkConfig.srcColorBlendFactor = VulkanEnumConverter::ToVkBlendFactor(config.srcColorBlendFactor);
			vkConfig.dstColorBlendFactor = VulkanEnumConverter::ToVkBlendFactor(config.dstColorBlendFactor);
			vkConfig.srcAlphaBlendFactor = VulkanEnumConverter::ToVkBlendFactor(config.srcAlphaBlendFactor);
			vkConfig.dstAlphaBlendFactor = VulkanEnumConverter::ToVkBlendFactor(config.dstAlphaBlendFactor);

			vkConfig.atlasInset = config.atlasInset;
			vkConfig.discardAlphaThreshold = kDiscardAlphaThreshold;

			vkConfig.descriptorSetLayouts.push_back(m_DescriptorManager->GetUniformSetLayout());
			if (UsesTexture(variant))
			{
				vkConfig.descriptorSetLayouts.push_back(m_DescriptorManager->GetTextureSetLayout());
			}

			const size_t index = GetVariantIndex(variant);
			bool success = m_VulkanManager->CreatePipeline(variant, vkConfig);
			if (success)
			{
				m_Pipelines[index] = std::make_unique<VulkanPipeline>(variant,
					m_VulkanManager->GetPipeline(variant), m_VulkanManager->GetPipelineLayout(variant));
			}
			else
			{
				m_Pipelines[index].reset();
			}

			return success;
		}

		bool CreateAllPipelines(const ShadingPipelineConfig& config) override
		{
			bool success = true;
			for (size_t i = 0; i < SHADING_VARIANT_COUNT; ++i)
			{
				success &= CreatePipeline(ShadingVariant::FromIndex(i), config);
			}
			return success;
		}

		bool DestroyPipeline(const ShadingVariant& variant) override
		{
			if (m_VulkanManager)
			{
				m_VulkanManager->DestroyPipeline(variant);
			}
			m_Pipelines[GetVariantIndex(variant)].reset();
			return true;
		}

		IPipeline* GetPipeline(const ShadingVariant& variant) override
		{
			return m_Pipelines[GetVariantIndex(variant)].get();
		}

		bool ReloadPipeline(const ShadingVariant& variant) override
		{
			if (!m_VulkanManager || !m_VulkanManager->ReloadPipeline(variant))
				return false;

			RefreshWrapper(variant);
			return true;
		}

		bool ReloadAllPipelines() override
		{
			if (!m_VulkanManager)
				return false;

			bool success = m_VulkanManager->ReloadAllPipelines();
			for (size_t i = 0; i < SHADING_VARIANT_COUNT; ++i)
			{
				RefreshWrapper(ShadingVariant::FromIndex(i));
			}
			return success;
		}

		// Vulkan-specific methods for internal use
		bool BindPipeline(VkCommandBuffer cmd, const ShadingVariant& variant)
		{
			return m_VulkanManager && m_VulkanManager->BindPipeline(cmd, variant);
		}

		VulkanPipelineManager* GetVulkanManager() { return m_VulkanManager.get(); }

	private:
		// Vulkan handles change on reload
		void RefreshWrapper(const ShadingVariant& variant)
		{
			const size_t index = GetVariantIndex(variant);
			if (m_VulkanManager->IsValid(variant))
			{
				m_Pipelines[index] = std::make_unique<VulkanPipeline>(variant,
					m_VulkanManager->GetPipeline(variant), m_VulkanManager->GetPipelineLayout(variant));
			}
			else
			{
				m_Pipelines[index].reset();
			}
		}

		VulkanDescriptorManager* m_DescriptorManager = nullptr;

		std::unique_ptr<VulkanPipelineManager> m_VulkanManager;
		std::array<std::unique_ptr<VulkanPipeline>, SHADING_VARIANT_COUNT> m_Pipelines;
	};

} // namespace Tessera
