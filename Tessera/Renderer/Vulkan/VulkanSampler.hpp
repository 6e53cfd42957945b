//------------------------------------------------------------------------------
// VulkanSampler.hpp
//
// VkSampler built from a SamplerDesc. Edge handling for out-of-range UVs is
// decided here, not in the shading stages.
//------------------------------------------------------------------------------
#pragma once

#include "Tessera/Renderer/TextureSampler.hpp"

#include <vulkan/vulkan.h>

namespace Tessera
{
	class VulkanSampler
	{
	public:
		VulkanSampler() = default;
		~VulkanSampler() { Destroy(); }

		bool Create(VkDevice device, const SamplerDesc& desc);
		void Destroy();

		VkSampler GetSampler() const { return m_Sampler; }
		const SamplerDesc& GetDesc() const { return m_Desc; }

	private:
		VkDevice m_Device = VK_NULL_HANDLE;
		VkSampler m_Sampler = VK_NULL_HANDLE;
		SamplerDesc m_Desc;

		VulkanSampler(const VulkanSampler&) = delete;
		VulkanSampler& operator=(const VulkanSampler&) = delete;
	};
}
