//------------------------------------------------------------------------------
// VulkanUniformRing.cpp
//
// Persistently mapped uniform buffer split into per-frame regions
//------------------------------------------------------------------------------

#include "Tessera/Renderer/Vulkan/VulkanUniformRing.hpp"
#include "Tessera/Core/Logger/Logger.hpp"

#include <cstring>
#include <limits>

namespace Tessera
{
	bool VulkanUniformRing::Initialize(VulkanMemoryManager* memoryManager, uint32_t framesInFlight,
		uint32_t maxDrawsPerFrame, VkDeviceSize minUniformBufferOffsetAlignment)
	{
		if (!memoryManager || !memoryManager->IsInitialized())
		{
			LOG_ERROR("Uniform ring needs an initialized memory manager");
			return false;
		}

		const uint64_t frameCapacity = UniformRingAllocator::ComputeFrameCapacity(maxDrawsPerFrame, minUniformBufferOffsetAlignment);
		if (!m_Allocator.Initialize(framesInFlight, frameCapacity, minUniformBufferOffsetAlignment))
			return false;

		if (m_Allocator.GetTotalSize() > std::numeric_limits<uint32_t>::max())
		{
			LOG_ERROR("Uniform ring of {} bytes exceeds the dynamic offset range", m_Allocator.GetTotalSize());
			return false;
		}

		m_MemoryManager = memoryManager;

		VulkanMemoryManager::BufferCreateInfo createInfo;
		createInfo.size = m_Allocator.GetTotalSize();
		createInfo.usage = VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT;
		createInfo.mappable = true;

		m_Buffer = m_MemoryManager->CreateBuffer(createInfo);
		if (!m_Buffer || !m_Buffer->mappedData)
		{
			LOG_ERROR("Failed to create mapped uniform ring buffer");
			Shutdown();
			return false;
		}

		LOG_INFO("Uniform ring: {} frames x {} bytes (alignment {})",
			framesInFlight, m_Allocator.GetFrameCapacity(), m_Allocator.GetAlignment());
		return true;
	}

	void VulkanUniformRing::Shutdown()
	{
		if (m_MemoryManager && m_Buffer)
		{
			m_MemoryManager->DestroyBuffer(m_Buffer);
		}
		m_Buffer = nullptr;
		m_MemoryManager = nullptr;
	}

	bool VulkanUniformRing::BeginFrame(uint32_t frameIndex)
	{
		return m_Allocator.BeginFrame(frameIndex);
	}

	std::optional<uint32_t> VulkanUniformRing::Write(const void* data, VkDeviceSize size)
	{
		if (!m_Buffer || !data)
			return std::nullopt;

		std::optional<uint64_t> offset = m_Allocator.Allocate(size);
		if (!offset)
		{
			LOG_ERROR("Uniform ring frame {} is full ({} bytes)", m_Allocator.GetCurrentFrame(), m_Allocator.GetFrameCapacity());
			return std::nullopt;
		}

		std::memcpy(static_cast<uint8_t*>(m_Buffer->mappedData) + *offset, data, static_cast<size_t>(size));
		return static_cast<uint32_t>(*offset);
	}

	bool VulkanUniformRing::FlushFrame()
	{
		if (!m_Buffer)
			return false;

		const uint32_t frame = m_Allocator.GetCurrentFrame();
		return m_MemoryManager->FlushMemory(m_Buffer->allocation,
			m_Allocator.GetFrameBaseOffset(frame), m_Allocator.GetFrameCapacity());
	}
}
