// Tessera/Renderer/Vulkan/VulkanDescriptorManager.cpp
#include "Tessera/Renderer/Vulkan/VulkanDescriptorManager.hpp"
#include "Tessera/Renderer/Vulkan/VulkanPipelineAdapter.hpp"
#include "Tessera/Renderer/UniformBlocks.hpp"
#include "Tessera/Core/Logger/Logger.hpp"

namespace Tessera
{
	namespace
	{
		VkDescriptorType ToVkDescriptorType(BindingKind kind)
		{
			switch (kind)
			{
			case BindingKind::SampledImage:  return VK_DESCRIPTOR_TYPE_SAMPLED_IMAGE;
			case BindingKind::Sampler:       return VK_DESCRIPTOR_TYPE_SAMPLER;
			case BindingKind::UniformBuffer:
			default: return VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER_DYNAMIC;
			}
		}

		size_t UniformSetIndex(UVWindowing windowing)
		{
			return windowing == UVWindowing::None ? 0 : 1;
		}
	}

	VulkanDescriptorManager::~VulkanDescriptorManager()
	{
		Cleanup();
	}

	bool VulkanDescriptorManager::Initialize(VkDevice device, uint32_t framesInFlight, uint32_t maxTextureSetsPerFrame)
	{
		LOG_INFO("Initializing VulkanDescriptorManager");

		if (device == VK_NULL_HANDLE || framesInFlight == 0 || maxTextureSetsPerFrame == 0)
		{
			LOG_ERROR("Invalid descriptor manager parameters");
			return false;
		}

		m_Device = device;

		// Layouts come from the same slot lists the pipelines are validated against
		m_UniformSetLayout = CreateSetLayout(BuildBindingLayout(ShadingVariant::Debug()), UNIFORM_SET);
		m_TextureSetLayout = CreateSetLayout(BuildBindingLayout(ShadingVariant::Textured()), TEXTURE_SET);
		if (m_UniformSetLayout == VK_NULL_HANDLE || m_TextureSetLayout == VK_NULL_HANDLE)
		{
			LOG_ERROR("Failed to create descriptor set layouts");
			Cleanup();
			return false;
		}

		// Uniform pool: two sets, two dynamic uniform buffers each
		VkDescriptorPoolSize uniformPoolSize{};
		uniformPoolSize.type = VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER_DYNAMIC;
		uniformPoolSize.descriptorCount = UNIFORM_SET_COUNT * 2;

		VkDescriptorPoolCreateInfo poolInfo{};
		poolInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO;
		poolInfo.poolSizeCount = 1;
		poolInfo.pPoolSizes = &uniformPoolSize;
		poolInfo.maxSets = UNIFORM_SET_COUNT;

		if (!VulkanUtils::CheckVkResult(vkCreateDescriptorPool(m_Device, &poolInfo, nullptr, &m_UniformPool), "vkCreateDescriptorPool(uniform)"))
		{
			Cleanup();
			return false;
		}

		std::array<VkDescriptorSetLayout, UNIFORM_SET_COUNT> layouts;
		layouts.fill(m_UniformSetLayout);

		VkDescriptorSetAllocateInfo allocInfo{};
		allocInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_ALLOCATE_INFO;
		allocInfo.descriptorPool = m_UniformPool;
		allocInfo.descriptorSetCount = UNIFORM_SET_COUNT;
		allocInfo.pSetLayouts = layouts.data();

		if (!VulkanUtils::CheckVkResult(vkAllocateDescriptorSets(m_Device, &allocInfo, m_UniformSets.data()), "vkAllocateDescriptorSets(uniform)"))
		{
			Cleanup();
			return false;
		}

		// Texture pools, one per frame in flight
		std::array<VkDescriptorPoolSize, 2> texturePoolSizes{};
		texturePoolSizes[0].type = VK_DESCRIPTOR_TYPE_SAMPLED_IMAGE;
		texturePoolSizes[0].descriptorCount = maxTextureSetsPerFrame;
		texturePoolSizes[1].type = VK_DESCRIPTOR_TYPE_SAMPLER;
		texturePoolSizes[1].descriptorCount = maxTextureSetsPerFrame;

		VkDescriptorPoolCreateInfo texturePoolInfo{};
		texturePoolInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO;
		texturePoolInfo.poolSizeCount = static_cast<uint32_t>(texturePoolSizes.size());
		texturePoolInfo.pPoolSizes = texturePoolSizes.data();
		texturePoolInfo.maxSets = maxTextureSetsPerFrame;

		m_FrameTexturePools.assign(framesInFlight, VK_NULL_HANDLE);
		for (uint32_t i = 0; i < framesInFlight; ++i)
		{
			if (!VulkanUtils::CheckVkResult(vkCreateDescriptorPool(m_Device, &texturePoolInfo, nullptr, &m_FrameTexturePools[i]), "vkCreateDescriptorPool(texture)"))
			{
				LOG_ERROR("Failed to create texture descriptor pool for frame {}", i);
				Cleanup();
				return false;
			}
		}

		m_CurrentFrame = 0;
		LOG_INFO("VulkanDescriptorManager initialized ({} frames, {} texture sets per frame)", framesInFlight, maxTextureSetsPerFrame);
		return true;
	}

	void VulkanDescriptorManager::Cleanup()
	{
		if (m_Device == VK_NULL_HANDLE) return;

		for (VkDescriptorPool& pool : m_FrameTexturePools)
		{
			if (pool != VK_NULL_HANDLE)
				vkDestroyDescriptorPool(m_Device, pool, nullptr);
		}
		m_FrameTexturePools.clear();
		m_FrameTextureSets.clear();

		if (m_UniformPool != VK_NULL_HANDLE)
		{
			vkDestroyDescriptorPool(m_Device, m_UniformPool, nullptr);
			m_UniformPool = VK_NULL_HANDLE;
		}
		m_UniformSets.fill(VK_NULL_HANDLE);

		if (m_TextureSetLayout != VK_NULL_HANDLE)
		{
			vkDestroyDescriptorSetLayout(m_Device, m_TextureSetLayout, nullptr);
			m_TextureSetLayout = VK_NULL_HANDLE;
		}

		if (m_UniformSetLayout != VK_NULL_HANDLE)
		{
			vkDestroyDescriptorSetLayout(m_Device, m_UniformSetLayout, nullptr);
			m_UniformSetLayout = VK_NULL_HANDLE;
		}

		m_Device = VK_NULL_HANDLE;
	}

	VkDescriptorSetLayout VulkanDescriptorManager::CreateSetLayout(const std::vector<BindingSlot>& slots, uint32_t set)
	{
		std::vector<VkDescriptorSetLayoutBinding> bindings;
		for (const BindingSlot& slot : slots)
		{
			if (slot.set != set)
				continue;

			VkDescriptorSetLayoutBinding binding{};
			binding.binding = slot.binding;
			binding.descriptorCount = 1;
			binding.descriptorType = ToVkDescriptorType(slot.kind);
			binding.pImmutableSamplers = nullptr;
			binding.stageFlags = VulkanEnumConverter::ToVkShaderStages(slot.stages);
			bindings.push_back(binding);
		}

		VkDescriptorSetLayoutCreateInfo layoutInfo{};
		layoutInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO;
		layoutInfo.bindingCount = static_cast<uint32_t>(bindings.size());
		layoutInfo.pBindings = bindings.data();

		VkDescriptorSetLayout layout = VK_NULL_HANDLE;
		if (!VulkanUtils::CheckVkResult(vkCreateDescriptorSetLayout(m_Device, &layoutInfo, nullptr, &layout), "vkCreateDescriptorSetLayout"))
		{
			return VK_NULL_HANDLE;
		}

		return layout;
	}

	bool VulkanDescriptorManager::UpdateUniformSets(VkBuffer uniformRing)
	{
		if (uniformRing == VK_NULL_HANDLE || m_UniformSets[0] == VK_NULL_HANDLE)
		{
			LOG_ERROR("Cannot update uniform sets without a ring buffer");
			return false;
		}

		const std::array<UVWindowing, UNIFORM_SET_COUNT> modes = { UVWindowing::None, UVWindowing::Window };

		for (UVWindowing windowing : modes)
		{
			VkDescriptorSet set = m_UniformSets[UniformSetIndex(windowing)];

			VkDescriptorBufferInfo globalInfo{};
			globalInfo.buffer = uniformRing;
			globalInfo.offset = 0;
			globalInfo.range = GLOBAL_UNIFORMS_SIZE;

			VkDescriptorBufferInfo localInfo{};
			localInfo.buffer = uniformRing;
			localInfo.offset = 0;
			localInfo.range = GetLocalUniformsSize(windowing);

			std::array<VkWriteDescriptorSet, 2> writes{};
			writes[0].sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
			writes[0].dstSet = set;
			writes[0].dstBinding = GLOBAL_UNIFORMS_BINDING;
			writes[0].descriptorType = VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER_DYNAMIC;
			writes[0].descriptorCount = 1;
			writes[0].pBufferInfo = &globalInfo;

			writes[1].sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
			writes[1].dstSet = set;
			writes[1].dstBinding = LOCAL_UNIFORMS_BINDING;
			writes[1].descriptorType = VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER_DYNAMIC;
			writes[1].descriptorCount = 1;
			writes[1].pBufferInfo = &localInfo;

			vkUpdateDescriptorSets(m_Device, static_cast<uint32_t>(writes.size()), writes.data(), 0, nullptr);
		}

		return true;
	}

	VkDescriptorSet VulkanDescriptorManager::GetUniformSet(UVWindowing windowing) const
	{
		return m_UniformSets[UniformSetIndex(windowing)];
	}

	bool VulkanDescriptorManager::BeginFrame(uint32_t frameIndex)
	{
		if (frameIndex >= m_FrameTexturePools.size())
		{
			LOG_ERROR("Invalid frame index {} for descriptor manager", frameIndex);
			return false;
		}

		m_CurrentFrame = frameIndex;
		m_FrameTextureSets.clear();
		return VulkanUtils::CheckVkResult(vkResetDescriptorPool(m_Device, m_FrameTexturePools[frameIndex], 0), "vkResetDescriptorPool");
	}

	VkDescriptorSet VulkanDescriptorManager::AcquireTextureSet(VkImageView imageView, VkSampler sampler)
	{
		if (imageView == VK_NULL_HANDLE || sampler == VK_NULL_HANDLE)
		{
			LOG_ERROR("Texture set needs both an image view and a sampler");
			return VK_NULL_HANDLE;
		}

		auto key = std::make_pair(imageView, sampler);
		auto it = m_FrameTextureSets.find(key);
		if (it != m_FrameTextureSets.end())
			return it->second;

		VkDescriptorSetAllocateInfo allocInfo{};
		allocInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_ALLOCATE_INFO;
		allocInfo.descriptorPool = m_FrameTexturePools[m_CurrentFrame];
		allocInfo.descriptorSetCount = 1;
		allocInfo.pSetLayouts = &m_TextureSetLayout;

		VkDescriptorSet set = VK_NULL_HANDLE;
		if (!VulkanUtils::CheckVkResult(vkAllocateDescriptorSets(m_Device, &allocInfo, &set), "vkAllocateDescriptorSets(texture)"))
		{
			return VK_NULL_HANDLE;
		}

		VkDescriptorImageInfo imageInfo{};
		imageInfo.imageLayout = VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL;
		imageInfo.imageView = imageView;

		VkDescriptorImageInfo samplerInfo{};
		samplerInfo.sampler = sampler;

		std::array<VkWriteDescriptorSet, 2> writes{};
		writes[0].sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
		writes[0].dstSet = set;
		writes[0].dstBinding = SAMPLED_IMAGE_BINDING;
		writes[0].descriptorType = VK_DESCRIPTOR_TYPE_SAMPLED_IMAGE;
		writes[0].descriptorCount = 1;
		writes[0].pImageInfo = &imageInfo;

		writes[1].sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
		writes[1].dstSet = set;
		writes[1].dstBinding = SAMPLER_BINDING;
		writes[1].descriptorType = VK_DESCRIPTOR_TYPE_SAMPLER;
		writes[1].descriptorCount = 1;
		writes[1].pImageInfo = &samplerInfo;

		vkUpdateDescriptorSets(m_Device, static_cast<uint32_t>(writes.size()), writes.data(), 0, nullptr);

		m_FrameTextureSets.emplace(key, set);
		return set;
	}
}
