//------------------------------------------------------------------------------
// UniformBlocks.hpp
//
// CPU mirrors of the uniform blocks declared in Shaders/sprite.vert.
// Layouts are std140 and must stay bit-exact with the GLSL side.
//------------------------------------------------------------------------------

#pragma once

#include <glm/glm.hpp>
#include <cstddef>

namespace Tessera
{
	// Fragments whose sampled alpha is below this are discarded by cutout variants.
	// Exact value, never rounded to zero.
	constexpr float kDiscardAlphaThreshold = 0.001f;

	// Default anti-bleeding margin for inset atlas windows, in normalized UV units per edge
	constexpr float kDefaultAtlasInset = 0.01f;

	// Blue channel written by the UV debug fragment stage
	constexpr float kDebugBlueChannel = 0.0f;

	// Window covering the whole texture: (x, y, width, height)
	inline const glm::vec4 kFullUVWindow = glm::vec4(0.0f, 0.0f, 1.0f, 1.0f);

	// Set 0, binding 0. Combined view-projection, updated once per frame/camera change.
	struct GlobalUniforms
	{
		glm::mat4 mvp = glm::mat4(1.0f);  // 64 bytes, column-major
	};

	// Set 0, binding 1 for variants without a UV window
	struct LocalUniforms
	{
		glm::mat4 transform = glm::mat4(1.0f);  // 64 bytes
	};

	// Set 0, binding 1 for windowed variants
	struct WindowedLocalUniforms
	{
		glm::mat4 transform = glm::mat4(1.0f);  // 64 bytes
		glm::vec4 uvWindow = kFullUVWindow;     // 16 bytes: (x, y, width, height)
	};

	constexpr size_t GLOBAL_UNIFORMS_SIZE = 64;
	constexpr size_t LOCAL_UNIFORMS_SIZE = 64;
	constexpr size_t WINDOWED_LOCAL_UNIFORMS_SIZE = 80;
	constexpr size_t UNIFORM_BLOCK_ALIGNMENT = 16;

	static_assert(sizeof(GlobalUniforms) == GLOBAL_UNIFORMS_SIZE, "GlobalUniforms must be 64 bytes");
	static_assert(sizeof(LocalUniforms) == LOCAL_UNIFORMS_SIZE, "LocalUniforms must be 64 bytes");
	static_assert(sizeof(WindowedLocalUniforms) == WINDOWED_LOCAL_UNIFORMS_SIZE, "WindowedLocalUniforms must be 80 bytes");
	static_assert(offsetof(WindowedLocalUniforms, uvWindow) == 64, "uvWindow follows the transform directly");
	static_assert(sizeof(GlobalUniforms) % UNIFORM_BLOCK_ALIGNMENT == 0, "std140 blocks are 16-byte multiples");
	static_assert(sizeof(WindowedLocalUniforms) % UNIFORM_BLOCK_ALIGNMENT == 0, "std140 blocks are 16-byte multiples");
}
