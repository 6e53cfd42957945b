//------------------------------------------------------------------------------
// PipelineManagerTests.cpp
//
// Pipeline manager behavior that does not need a Vulkan device
//------------------------------------------------------------------------------

#include <gtest/gtest.h>
#include "Tessera/Renderer/PipelineInterface.hpp"
#include "Tessera/Renderer/Vulkan/VulkanPipelineAdapter.hpp"
#include "Tessera/Core/Logger/Logger.hpp"

namespace Tessera
{
	class PipelineManagerTest : public ::testing::Test
	{
	protected:
		void SetUp() override
		{
			Logger::Get().ClearSinks();
			m_Manager = CreatePipelineManager();
		}

		std::unique_ptr<IPipelineManager> m_Manager;
	};

	TEST_F(PipelineManagerTest, FactoryReturnsEmptyManager)
	{
		ASSERT_NE(m_Manager, nullptr);
		for (size_t i = 0; i < SHADING_VARIANT_COUNT; ++i)
		{
			EXPECT_EQ(m_Manager->GetPipeline(ShadingVariant::FromIndex(i)), nullptr);
		}
	}

	TEST_F(PipelineManagerTest, CreateFailsBeforeInitialize)
	{
		ShadingPipelineConfig config;
		config.shaderDirectory = "Shaders";

		EXPECT_FALSE(m_Manager->CreatePipeline(ShadingVariant::Atlas(), config));
		EXPECT_FALSE(m_Manager->CreateAllPipelines(config));
		EXPECT_EQ(m_Manager->GetPipeline(ShadingVariant::Atlas()), nullptr);
	}

	TEST_F(PipelineManagerTest, ReloadFailsBeforeInitialize)
	{
		EXPECT_FALSE(m_Manager->ReloadPipeline(ShadingVariant::Debug()));
		EXPECT_FALSE(m_Manager->ReloadAllPipelines());
		EXPECT_TRUE(m_Manager->DestroyPipeline(ShadingVariant::Debug()));
	}

	TEST_F(PipelineManagerTest, InitializeNeedsDescriptorManager)
	{
		VulkanPipelineAdapter adapter;
		EXPECT_FALSE(adapter.Initialize(VK_NULL_HANDLE, VK_NULL_HANDLE, VkExtent2D{ 800, 600 }, nullptr));
	}

	TEST(VulkanEnumConverterTest, RasterStateDefaults)
	{
		ShadingPipelineConfig config;
		EXPECT_EQ(VulkanEnumConverter::ToVkCullMode(config.cullMode), static_cast<VkCullModeFlags>(VK_CULL_MODE_NONE));
		EXPECT_EQ(VulkanEnumConverter::ToVkFrontFace(config.frontFace), VK_FRONT_FACE_COUNTER_CLOCKWISE);
		EXPECT_EQ(VulkanEnumConverter::ToVkCompareOp(config.depthCompareOp), VK_COMPARE_OP_LESS_OR_EQUAL);
		EXPECT_EQ(VulkanEnumConverter::ToVkBlendFactor(config.dstColorBlendFactor), VK_BLEND_FACTOR_ONE_MINUS_SRC_ALPHA);
	}

	TEST(VulkanEnumConverterTest, SamplerAndStages)
	{
		EXPECT_EQ(VulkanEnumConverter::ToVkFilter(FilterMode::Nearest), VK_FILTER_NEAREST);
		EXPECT_EQ(VulkanEnumConverter::ToVkAddressMode(AddressMode::MirroredRepeat), VK_SAMPLER_ADDRESS_MODE_MIRRORED_REPEAT);
		EXPECT_EQ(VulkanEnumConverter::ToVkShaderStages(ShaderStage::VertexFragment),
			static_cast<VkShaderStageFlags>(VK_SHADER_STAGE_VERTEX_BIT | VK_SHADER_STAGE_FRAGMENT_BIT));
	}
}
