//------------------------------------------------------------------------------
// UniformRingAllocator.cpp
//------------------------------------------------------------------------------

#include "Tessera/Renderer/UniformRingAllocator.hpp"
#include "Tessera/Renderer/UniformBlocks.hpp"
#include "Tessera/Math/MathUtils.hpp"
#include "Tessera/Core/Logger/Logger.hpp"

namespace Tessera
{
	uint64_t UniformRingAllocator::ComputeFrameCapacity(uint32_t maxDraws, uint64_t minAlignment)
	{
		const uint64_t alignment = minAlignment > UNIFORM_BLOCK_ALIGNMENT ? minAlignment : UNIFORM_BLOCK_ALIGNMENT;
		const uint64_t globalStride = AlignUp(GLOBAL_UNIFORMS_SIZE, alignment);
		const uint64_t localStride = AlignUp(WINDOWED_LOCAL_UNIFORMS_SIZE, alignment);
		return globalStride + localStride * maxDraws;
	}

	bool UniformRingAllocator::Initialize(uint32_t framesInFlight, uint64_t frameCapacity, uint64_t minAlignment)
	{
		if (framesInFlight == 0 || frameCapacity == 0)
		{
			LOG_ERROR("Uniform ring needs at least one frame and a non-zero capacity");
			return false;
		}

		if (minAlignment != 0 && !IsPowerOfTwo(minAlignment))
		{
			LOG_ERROR("Uniform ring alignment {} is not a power of two", minAlignment);
			return false;
		}

		m_Alignment = minAlignment > UNIFORM_BLOCK_ALIGNMENT ? minAlignment : UNIFORM_BLOCK_ALIGNMENT;
		m_FramesInFlight = framesInFlight;

		// Every frame region starts on an aligned offset
		m_FrameCapacity = AlignUp(frameCapacity, m_Alignment);
		m_CurrentFrame = 0;
		m_Head = 0;
		return true;
	}

	bool UniformRingAllocator::BeginFrame(uint32_t frameIndex)
	{
		if (frameIndex >= m_FramesInFlight)
		{
			LOG_ERROR("Invalid frame index {} (frames in flight: {})", frameIndex, m_FramesInFlight);
			return false;
		}

		m_CurrentFrame = frameIndex;
		m_Head = 0;
		return true;
	}

	std::optional<uint64_t> UniformRingAllocator::Allocate(uint64_t size)
	{
		if (m_FramesInFlight == 0 || size == 0)
			return std::nullopt;

		const uint64_t offset = AlignUp(m_Head, m_Alignment);
		if (offset + size > m_FrameCapacity)
			return std::nullopt;

		m_Head = offset + size;
		return GetFrameBaseOffset(m_CurrentFrame) + offset;
	}
}
