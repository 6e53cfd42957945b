//------------------------------------------------------------------------------
// UniformRingAllocator.hpp
//
// Offset bookkeeping for the per-frame uniform ring. One fixed region per frame
// in flight; allocations inside a region are bump allocated at the device's
// minUniformBufferOffsetAlignment and released all at once by BeginFrame().
//------------------------------------------------------------------------------
#pragma once

#include <cstdint>
#include <optional>

namespace Tessera
{
	class UniformRingAllocator
	{
	public:
		UniformRingAllocator() = default;

		// Region size needed for one Global block plus maxDraws Local blocks
		static uint64_t ComputeFrameCapacity(uint32_t maxDraws, uint64_t minAlignment);

		// minAlignment must be 0 or a power of two
		bool Initialize(uint32_t framesInFlight, uint64_t frameCapacity, uint64_t minAlignment);

		// Starts writing into the region of frameIndex, discarding what it held
		bool BeginFrame(uint32_t frameIndex);

		// Offset from the start of the whole ring, or nullopt when the frame region is full
		std::optional<uint64_t> Allocate(uint64_t size);

		uint64_t GetTotalSize() const { return m_FrameCapacity * m_FramesInFlight; }
		uint64_t GetFrameCapacity() const { return m_FrameCapacity; }
		uint64_t GetFrameBaseOffset(uint32_t frameIndex) const { return m_FrameCapacity * frameIndex; }
		uint64_t GetUsedBytes() const { return m_Head; }
		uint64_t GetAlignment() const { return m_Alignment; }
		uint32_t GetFramesInFlight() const { return m_FramesInFlight; }
		uint32_t GetCurrentFrame() const { return m_CurrentFrame; }

	private:
		uint32_t m_FramesInFlight = 0;
		uint64_t m_FrameCapacity = 0;
		uint64_t m_Alignment = 1;

		uint32_t m_CurrentFrame = 0;
		uint64_t m_Head = 0;  // Bytes used in the current frame region
	};
}
