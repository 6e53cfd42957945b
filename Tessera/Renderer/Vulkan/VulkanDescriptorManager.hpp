// Tessera/Renderer/Vulkan/VulkanDescriptorManager.hpp
#pragma once

#include "Tessera/Renderer/BindingLayout.hpp"
#include "Tessera/Renderer/ShadingVariant.hpp"

#include <vulkan/vulkan.h>
#include <array>
#include <cstdint>
#include <map>
#include <utility>
#include <vector>

namespace Tessera
{
	// Owns the two set layouts shared by all variants:
	//   set 0: Global + Local uniform blocks, both UNIFORM_BUFFER_DYNAMIC into the uniform ring
	//   set 1: sampled image + sampler (textured variants only)
	// Texture sets come from a per-frame pool that is reset when the frame begins.
	class VulkanDescriptorManager
	{
	public:
		VulkanDescriptorManager() = default;
		~VulkanDescriptorManager();

		bool Initialize(VkDevice device, uint32_t framesInFlight, uint32_t maxTextureSetsPerFrame);
		void Cleanup();

		// Builds a layout from the slots of one set. Uniform buffers become dynamic.
		VkDescriptorSetLayout CreateSetLayout(const std::vector<BindingSlot>& slots, uint32_t set);

		VkDescriptorSetLayout GetUniformSetLayout() const { return m_UniformSetLayout; }
		VkDescriptorSetLayout GetTextureSetLayout() const { return m_TextureSetLayout; }

		// Points both uniform sets at the ring buffer. Ranges are the block sizes;
		// the per-draw position comes from dynamic offsets.
		bool UpdateUniformSets(VkBuffer uniformRing);

		// Set 0 whose Local range matches the windowing mode (64 or 80 bytes)
		VkDescriptorSet GetUniformSet(UVWindowing windowing) const;

		// Releases the texture sets of this frame; the frame must no longer be in flight
		bool BeginFrame(uint32_t frameIndex);

		// Set 1 for an image view and sampler, reused within the frame
		VkDescriptorSet AcquireTextureSet(VkImageView imageView, VkSampler sampler);

	private:
		static constexpr uint32_t UNIFORM_SET_COUNT = 2;  // Plain and windowed Local block

		VkDevice m_Device = VK_NULL_HANDLE;

		// Layouts
		VkDescriptorSetLayout m_UniformSetLayout = VK_NULL_HANDLE;
		VkDescriptorSetLayout m_TextureSetLayout = VK_NULL_HANDLE;

		VkDescriptorPool m_UniformPool = VK_NULL_HANDLE;
		std::array<VkDescriptorSet, UNIFORM_SET_COUNT> m_UniformSets{};

		std::vector<VkDescriptorPool> m_FrameTexturePools;
		uint32_t m_CurrentFrame = 0;
		std::map<std::pair<VkImageView, VkSampler>, VkDescriptorSet> m_FrameTextureSets;

		VulkanDescriptorManager(const VulkanDescriptorManager&) = delete;
		VulkanDescriptorManager& operator=(const VulkanDescriptorManager&) = delete;
	};
}
