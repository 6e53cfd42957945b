//------------------------------------------------------------------------------
// VulkanMemoryManager.hpp
//
// Buffer allocation through Vulkan Memory Allocator (VMA)
//------------------------------------------------------------------------------

#pragma once

#include "Tessera/Renderer/Vulkan/VulkanCommon.hpp"

// VMA Configuration
#define VMA_STATIC_VULKAN_FUNCTIONS 0
#define VMA_DYNAMIC_VULKAN_FUNCTIONS 1

#include <vk_mem_alloc.h>

#include <memory>
#include <vector>

namespace Tessera
{
	class VulkanMemoryManager
	{
	public:
		VulkanMemoryManager() = default;
		~VulkanMemoryManager();

		bool Initialize(const VulkanContext& context);
		void Shutdown();

		struct BufferCreateInfo
		{
			VkDeviceSize size = 0;
			VkBufferUsageFlags usage = 0;
			VmaMemoryUsage memoryUsage = VMA_MEMORY_USAGE_AUTO;
			bool mappable = false; // Host-visible and persistently mapped
		};

		struct BufferAllocation
		{
			VkBuffer buffer = VK_NULL_HANDLE;
			VmaAllocation allocation = VK_NULL_HANDLE;
			VmaAllocationInfo allocationInfo = {};
			void* mappedData = nullptr;  // Only valid if persistently mapped
		};

		// The manager keeps ownership; the pointer stays valid until DestroyBuffer or Shutdown
		BufferAllocation* CreateBuffer(const BufferCreateInfo& createInfo);
		void DestroyBuffer(BufferAllocation* allocation);

		// Required after CPU writes when the memory is not host-coherent
		bool FlushMemory(VmaAllocation allocation, VkDeviceSize offset = 0, VkDeviceSize size = VK_WHOLE_SIZE);

		struct MemoryStats
		{
			size_t totalAllocatedBytes = 0;
			size_t totalUsedBytes = 0;
			size_t allocationCount = 0;
		};

		MemoryStats GetMemoryStats() const;
		void LogMemoryStats() const;

		VmaAllocator GetAllocator() const { return m_Allocator; }
		bool IsInitialized() const { return m_Allocator != VK_NULL_HANDLE; }

	private:
		VmaAllocator m_Allocator = VK_NULL_HANDLE;

		// Track allocations for cleanup
		std::vector<std::unique_ptr<BufferAllocation>> m_BufferAllocations;

		VulkanMemoryManager(const VulkanMemoryManager&) = delete;
		VulkanMemoryManager& operator=(const VulkanMemoryManager&) = delete;
	};
}
