#include "Tessera/Renderer/Vulkan/VulkanSampler.hpp"
#include "Tessera/Renderer/Vulkan/VulkanPipelineAdapter.hpp"
#include "Tessera/Core/Logger/Logger.hpp"

namespace Tessera
{
	bool VulkanSampler::Create(VkDevice device, const SamplerDesc& desc)
	{
		Destroy();

		VkSamplerCreateInfo samplerInfo{};
		samplerInfo.sType = VK_STRUCTURE_TYPE_SAMPLER_CREATE_INFO;
		samplerInfo.magFilter = VulkanEnumConverter::ToVkFilter(desc.magFilter);
		samplerInfo.minFilter = VulkanEnumConverter::ToVkFilter(desc.minFilter);
		samplerInfo.addressModeU = VulkanEnumConverter::ToVkAddressMode(desc.addressModeU);
		samplerInfo.addressModeV = VulkanEnumConverter::ToVkAddressMode(desc.addressModeV);
		samplerInfo.addressModeW = VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE;
		samplerInfo.anisotropyEnable = VK_FALSE;
		samplerInfo.maxAnisotropy = 1.0f;
		samplerInfo.borderColor = VK_BORDER_COLOR_INT_OPAQUE_BLACK;
		samplerInfo.unnormalizedCoordinates = VK_FALSE;
		samplerInfo.compareEnable = VK_FALSE;
		samplerInfo.compareOp = VK_COMPARE_OP_ALWAYS;
		samplerInfo.mipmapMode = VK_SAMPLER_MIPMAP_MODE_NEAREST;
		samplerInfo.mipLodBias = 0.0f;
		samplerInfo.minLod = 0.0f;
		samplerInfo.maxLod = 0.0f;

		VkResult result = vkCreateSampler(device, &samplerInfo, nullptr, &m_Sampler);
		if (result != VK_SUCCESS)
		{
			LOG_ERROR("Failed to create sampler: {}", VulkanUtils::VkResultToString(result));
			m_Sampler = VK_NULL_HANDLE;
			return false;
		}

		m_Device = device;
		m_Desc = desc;

		LOG_DEBUG("Created sampler: mag={}, min={}, u={}, v={}",
			ToString(desc.magFilter), ToString(desc.minFilter),
			ToString(desc.addressModeU), ToString(desc.addressModeV));
		return true;
	}

	void VulkanSampler::Destroy()
	{
		if (m_Sampler != VK_NULL_HANDLE && m_Device != VK_NULL_HANDLE)
		{
			vkDestroySampler(m_Device, m_Sampler, nullptr);
		}
		m_Sampler = VK_NULL_HANDLE;
		m_Device = VK_NULL_HANDLE;
	}
}
