//------------------------------------------------------------------------------
// VulkanPipeline.hpp
//
// Creates one Vulkan graphics pipeline per shading variant from a single
// parameterized construction path.
//------------------------------------------------------------------------------

#pragma once

#include "Tessera/Renderer/ShadingVariant.hpp"

#include <vulkan/vulkan.h>
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace Tessera
{
	// Specialization constant ids shared with Shaders/sprite.vert and sprite.frag
	constexpr uint32_t SPEC_CONSTANT_ATLAS_INSET = 0;
	constexpr uint32_t SPEC_CONSTANT_DISCARD_THRESHOLD = 1;

	// Vulkan-specific pipeline configuration
	// This is internal to the Vulkan backend
	struct VulkanPipelineConfig
	{
		std::string vertexShaderPath;
		std::string fragmentShaderPath;

		// Render state
		VkPolygonMode polygonMode = VK_POLYGON_MODE_FILL;
		VkCullModeFlags cullMode = VK_CULL_MODE_NONE;
		VkFrontFace frontFace = VK_FRONT_FACE_COUNTER_CLOCKWISE;

		bool depthTestEnable = true;
		bool depthWriteEnable = true;
		VkCompareOp depthCompareOp = VK_COMPARE_OP_LESS_OR_EQUAL;

		// Blending
		bool blendEnable = true;
		VkBlendFactor srcColorBlendFactor = VK_BLEND_FACTOR_ONE;
		VkBlendFactor dstColorBlendFactor = VK_BLEND_FACTOR_ONE_MINUS_SRC_ALPHA;
		VkBlendFactor srcAlphaBlendFactor = VK_BLEND_FACTOR_ONE;
		VkBlendFactor dstAlphaBlendFactor = VK_BLEND_FACTOR_ONE_MINUS_SRC_ALPHA;

		// Specialization constants
		float atlasInset = 0.0f;
		float discardAlphaThreshold = 0.0f;

		// Set 0 always, set 1 for textured variants
		std::vector<VkDescriptorSetLayout> descriptorSetLayouts;

		// Optional: render pass override (if different from default)
		VkRenderPass renderPass = VK_NULL_HANDLE;
	};

	class VulkanPipelineManager
	{
	public:
		VulkanPipelineManager() = default;
		~VulkanPipelineManager() { Cleanup(); }

		// Initialize with device and default render pass
		bool Initialize(VkDevice device, VkRenderPass defaultRenderPass, VkExtent2D extent);

		// Create (or replace) the pipeline of a variant
		bool CreatePipeline(const ShadingVariant& variant, const VulkanPipelineConfig& config);
		void DestroyPipeline(const ShadingVariant& variant);

		VkPipeline GetPipeline(const ShadingVariant& variant) const;
		VkPipelineLayout GetPipelineLayout(const ShadingVariant& variant) const;
		bool IsValid(const ShadingVariant& variant) const;

		// Bind pipeline to commandbuffer
		bool BindPipeline(VkCommandBuffer cmd, const ShadingVariant& variant);

		// Hot reload specific pipeline
		bool ReloadPipeline(const ShadingVariant& variant);

		// Rebuild everything, e.g. after the render target was resized
		bool ReloadAllPipelines();
		void SetExtent(VkExtent2D extent) { m_Extent = extent; }

		void Cleanup();

	private:
		struct Pipeline
		{
			VkPipeline pipeline = VK_NULL_HANDLE;
			VkPipelineLayout layout = VK_NULL_HANDLE;
			VulkanPipelineConfig config; // Store config for hot reload
			bool isValid = false;
		};

		// Helper functions
		VkShaderModule CreateShaderModule(const std::vector<uint32_t>& code);
		bool CreateGraphicsPipeline(const ShadingVariant& variant, const VulkanPipelineConfig& config, Pipeline& outPipeline);
		void DestroyPipeline(Pipeline& pipeline);

		// Device references
		VkDevice m_Device = VK_NULL_HANDLE;
		VkRenderPass m_DefaultRenderPass = VK_NULL_HANDLE;
		VkExtent2D m_Extent = {};

		std::array<Pipeline, SHADING_VARIANT_COUNT> m_Pipelines;
	};
}
