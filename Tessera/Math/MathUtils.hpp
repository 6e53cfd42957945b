//------------------------------------------------------------------------------
// MathUtils.hpp
//
// Common math utility functions
//------------------------------------------------------------------------------
#pragma once

#include <cmath>
#include <cstdint>

namespace Tessera
{
	//clamping
	template <typename T>
	inline T Clamp(T value, T min, T max)
	{
		return value < min ? min : (value > max ? max : value);
	}

	// Lerp function
	template <typename T>
	inline T Lerp(T a, T b, float t)
	{
		return a + (b - a) * t;
	}

	// Fractional part, always in [0, 1) (GLSL fract)
	inline float Fract(float x)
	{
		return x - std::floor(x);
	}

	// Rounds value up to the next multiple of alignment (alignment must be a power of two, 0 = no-op)
	inline uint64_t AlignUp(uint64_t value, uint64_t alignment)
	{
		if (alignment == 0)
			return value;
		return (value + alignment - 1) & ~(alignment - 1);
	}

	inline bool IsPowerOfTwo(uint64_t value)
	{
		return value != 0 && (value & (value - 1)) == 0;
	}
}
