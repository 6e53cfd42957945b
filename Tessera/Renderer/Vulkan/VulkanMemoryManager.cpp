//------------------------------------------------------------------------------
// VulkanMemoryManager.cpp
//
// VMA implementation unit
//------------------------------------------------------------------------------

#define VMA_IMPLEMENTATION

#include "Tessera/Renderer/Vulkan/VulkanMemoryManager.hpp"
#include "Tessera/Core/Logger/Logger.hpp"

#include <algorithm>

namespace Tessera
{
	VulkanMemoryManager::~VulkanMemoryManager()
	{
		Shutdown();
	}

	bool VulkanMemoryManager::Initialize(const VulkanContext& context)
	{
		if (!context.IsValid())
		{
			LOG_ERROR("VulkanMemoryManager needs an instance, physical device and device");
			return false;
		}

		VmaVulkanFunctions vulkanFunctions = {};
		vulkanFunctions.vkGetInstanceProcAddr = &vkGetInstanceProcAddr;
		vulkanFunctions.vkGetDeviceProcAddr = &vkGetDeviceProcAddr;

		VmaAllocatorCreateInfo allocatorInfo = {};
		allocatorInfo.vulkanApiVersion = context.apiVersion;
		allocatorInfo.physicalDevice = context.physicalDevice;
		allocatorInfo.device = context.device;
		allocatorInfo.instance = context.instance;
		allocatorInfo.pVulkanFunctions = &vulkanFunctions;

		VkResult result = vmaCreateAllocator(&allocatorInfo, &m_Allocator);
		if (result != VK_SUCCESS)
		{
			LOG_ERROR("Failed to create VMA allocator: {}", VulkanUtils::VkResultToString(result));
			m_Allocator = VK_NULL_HANDLE;
			return false;
		}

		LOG_INFO("VMA initialized");
		return true;
	}

	void VulkanMemoryManager::Shutdown()
	{
		if (m_Allocator == VK_NULL_HANDLE)
			return;

		if (!m_BufferAllocations.empty())
		{
			LOG_WARN("Destroying {} remaining buffer allocations", m_BufferAllocations.size());
			for (auto& allocation : m_BufferAllocations)
			{
				vmaDestroyBuffer(m_Allocator, allocation->buffer, allocation->allocation);
			}
			m_BufferAllocations.clear();
		}

		vmaDestroyAllocator(m_Allocator);
		m_Allocator = VK_NULL_HANDLE;

		LOG_INFO("VMA shutdown complete");
	}

	VulkanMemoryManager::BufferAllocation* VulkanMemoryManager::CreateBuffer(const BufferCreateInfo& createInfo)
	{
		if (m_Allocator == VK_NULL_HANDLE || createInfo.size == 0)
		{
			LOG_ERROR("Cannot create buffer: allocator not initialized or size is zero");
			return nullptr;
		}

		auto allocation = std::make_unique<BufferAllocation>();

		VkBufferCreateInfo bufferInfo = {};
		bufferInfo.sType = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO;
		bufferInfo.size = createInfo.size;
		bufferInfo.usage = createInfo.usage;
		bufferInfo.sharingMode = VK_SHARING_MODE_EXCLUSIVE;

		VmaAllocationCreateInfo allocInfo = {};
		allocInfo.usage = createInfo.memoryUsage;

		if (createInfo.mappable)
		{
			allocInfo.flags |= VMA_ALLOCATION_CREATE_HOST_ACCESS_SEQUENTIAL_WRITE_BIT;
			allocInfo.flags |= VMA_ALLOCATION_CREATE_MAPPED_BIT;  // Keep persistently mapped
		}

		VkResult result = vmaCreateBuffer(
			m_Allocator,
			&bufferInfo,
			&allocInfo,
			&allocation->buffer,
			&allocation->allocation,
			&allocation->allocationInfo
		);

		if (result != VK_SUCCESS)
		{
			LOG_ERROR("Failed to create buffer through VMA: {}", VulkanUtils::VkResultToString(result));
			return nullptr;
		}

		if (createInfo.mappable)
		{
			allocation->mappedData = allocation->allocationInfo.pMappedData;
		}

		BufferAllocation* rawPtr = allocation.get();
		m_BufferAllocations.push_back(std::move(allocation));

		LOG_TRACE("Created buffer: size={} bytes, usage=0x{:X}", createInfo.size, createInfo.usage);
		return rawPtr;
	}

	void VulkanMemoryManager::DestroyBuffer(BufferAllocation* allocation)
	{
		if (!allocation)
			return;

		auto it = std::find_if(m_BufferAllocations.begin(), m_BufferAllocations.end(),
			[allocation](const std::unique_ptr<BufferAllocation>& ptr) {
				return ptr.get() == allocation;
			});

		if (it != m_BufferAllocations.end())
		{
			vmaDestroyBuffer(m_Allocator, (*it)->buffer, (*it)->allocation);
			m_BufferAllocations.erase(it);
			LOG_TRACE("Destroyed buffer allocation");
		}
	}

	bool VulkanMemoryManager::FlushMemory(VmaAllocation allocation, VkDeviceSize offset, VkDeviceSize size)
	{
		return VulkanUtils::CheckVkResult(vmaFlushAllocation(m_Allocator, allocation, offset, size), "vmaFlushAllocation");
	}

	VulkanMemoryManager::MemoryStats VulkanMemoryManager::GetMemoryStats() const
	{
		MemoryStats stats;
		if (m_Allocator == VK_NULL_HANDLE)
			return stats;

		VmaTotalStatistics vmaStats = {};
		vmaCalculateStatistics(m_Allocator, &vmaStats);

		stats.totalAllocatedBytes = vmaStats.total.statistics.blockBytes;
		stats.totalUsedBytes = vmaStats.total.statistics.allocationBytes;
		stats.allocationCount = vmaStats.total.statistics.allocationCount;
		return stats;
	}

	void VulkanMemoryManager::LogMemoryStats() const
	{
		auto stats = GetMemoryStats();

		LOG_INFO("VMA: {} allocations, {:.2f} KB used of {:.2f} KB, {} tracked buffers",
			stats.allocationCount,
			stats.totalUsedBytes / 1024.0,
			stats.totalAllocatedBytes / 1024.0,
			m_BufferAllocations.size());
	}
}
