//------------------------------------------------------------------------------
// Base.hpp
//
// Common includes and definitions for Tessera
//------------------------------------------------------------------------------
#pragma once

#include "Tessera/Core/Platform.hpp"

// Standard includes
#include <cstdint>
#include <cstddef>

// Library version
#define TESSERA_VERSION_MAJOR 0
#define TESSERA_VERSION_MINOR 3
#define TESSERA_VERSION_PATCH 0

namespace Tessera
{
	// Type aliases
	using uint8 = std::uint8_t;
	using uint16 = std::uint16_t;
	using uint32 = std::uint32_t;
	using uint64 = std::uint64_t;

	using int32 = std::int32_t;
	using int64 = std::int64_t;
}

// Utility macros
#define TESSERA_DISABLE_COPY(ClassName) \
        ClassName(const ClassName&) = delete; \
        ClassName& operator=(const ClassName&) = delete;

#define TESSERA_DISABLE_MOVE(ClassName) \
        ClassName(ClassName&&) = delete; \
        ClassName& operator=(ClassName&&) = delete;

#define TESSERA_DISABLE_COPY_AND_MOVE(ClassName) \
        TESSERA_DISABLE_COPY(ClassName) \
        TESSERA_DISABLE_MOVE(ClassName)
