//------------------------------------------------------------------------------
// VulkanUniformRing.hpp
//
// One persistently mapped uniform buffer split into a region per frame in
// flight. Global and Local blocks are written here and bound as dynamic
// uniform buffers, so descriptors never change while a frame is in flight.
//------------------------------------------------------------------------------

#pragma once

#include "Tessera/Renderer/Vulkan/VulkanMemoryManager.hpp"
#include "Tessera/Renderer/UniformRingAllocator.hpp"

#include <cstdint>
#include <optional>

namespace Tessera
{
	class VulkanUniformRing
	{
	public:
		VulkanUniformRing() = default;
		~VulkanUniformRing() { Shutdown(); }

		bool Initialize(VulkanMemoryManager* memoryManager, uint32_t framesInFlight,
			uint32_t maxDrawsPerFrame, VkDeviceSize minUniformBufferOffsetAlignment);
		void Shutdown();

		// The host must have waited for the fence of the frame that last used this region
		bool BeginFrame(uint32_t frameIndex);

		// Copies a block into the current frame region and returns its dynamic offset
		std::optional<uint32_t> Write(const void* data, VkDeviceSize size);

		template<typename T>
		std::optional<uint32_t> Write(const T& block)
		{
			return Write(&block, sizeof(T));
		}

		// Makes this frame's writes visible to the device
		bool FlushFrame();

		VkBuffer GetBuffer() const { return m_Buffer ? m_Buffer->buffer : VK_NULL_HANDLE; }
		const UniformRingAllocator& GetAllocator() const { return m_Allocator; }

	private:
		VulkanMemoryManager* m_MemoryManager = nullptr;
		VulkanMemoryManager::BufferAllocation* m_Buffer = nullptr;
		UniformRingAllocator m_Allocator;

		VulkanUniformRing(const VulkanUniformRing&) = delete;
		VulkanUniformRing& operator=(const VulkanUniformRing&) = delete;
	};
}
