//------------------------------------------------------------------------------
// Platform.hpp
//
// Platform detection and configuration
//------------------------------------------------------------------------------
#pragma once

// Platform detection (CMake may already have defined one of these)
#if !defined(TESSERA_PLATFORM_WINDOWS) && !defined(TESSERA_PLATFORM_LINUX) && !defined(TESSERA_PLATFORM_MACOS)
#ifdef _WIN32
#ifdef _WIN64
#define TESSERA_PLATFORM_WINDOWS
#else
#error "x86 builds are not supported!"
#endif
#elif defined(__APPLE__) || defined(__MACH__)
#include <TargetConditionals.h>
#if TARGET_OS_MAC == 1 && TARGET_OS_IPHONE == 0
#define TESSERA_PLATFORM_MACOS
#else
#error "Only macOS is supported on Apple platforms!"
#endif
#elif defined(__linux__)
#define TESSERA_PLATFORM_LINUX
#else
#error "Unknown platform!"
#endif
#endif

// Platform-specific includes
#ifdef TESSERA_PLATFORM_WINDOWS
#ifndef NOMINMAX
#define NOMINMAX  // Prevent Windows.h from defining min/max macros
#endif
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#endif

// Debugbreak macro
#ifdef TESSERA_DEBUG
#ifdef TESSERA_PLATFORM_WINDOWS
#define TESSERA_DEBUGBREAK() __debugbreak()
#elif defined(TESSERA_PLATFORM_LINUX)
#include <signal.h>
#define TESSERA_DEBUGBREAK() raise(SIGTRAP)
#else
#define TESSERA_DEBUGBREAK()
#endif
#else
#define TESSERA_DEBUGBREAK()
#endif
