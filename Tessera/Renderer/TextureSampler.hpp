//------------------------------------------------------------------------------
// TextureSampler.hpp
//
// Sampler description shared by the Vulkan backend and the CPU reference
// sampler used by ShadingStages. The CPU sampler follows the Vulkan texel
// addressing rules so both sides agree on edge handling.
//------------------------------------------------------------------------------
#pragma once

#include <glm/glm.hpp>
#include <cstdint>
#include <vector>

namespace Tessera
{
	enum class FilterMode
	{
		Nearest,
		Linear
	};

	// Edge policy for UVs outside [0, 1]. Owned by the sampler, not by the shading core.
	enum class AddressMode
	{
		ClampToEdge,
		Repeat,
		MirroredRepeat
	};

	struct SamplerDesc
	{
		// Defaults match a pixel-art atlas: no filtering across texels, clamp at the edges
		FilterMode minFilter = FilterMode::Nearest;
		FilterMode magFilter = FilterMode::Nearest;
		AddressMode addressModeU = AddressMode::ClampToEdge;
		AddressMode addressModeV = AddressMode::ClampToEdge;

		bool operator==(const SamplerDesc& other) const = default;
	};

	const char* ToString(FilterMode mode);
	const char* ToString(AddressMode mode);

	// RGBA float texels, row-major, row 0 at v = 0
	struct ImageData
	{
		uint32_t width = 0;
		uint32_t height = 0;
		std::vector<glm::vec4> texels;

		bool IsValid() const { return width > 0 && height > 0 && texels.size() == size_t(width) * height; }
		const glm::vec4& At(uint32_t x, uint32_t y) const { return texels[size_t(y) * width + x]; }
		glm::vec4& At(uint32_t x, uint32_t y) { return texels[size_t(y) * width + x]; }
	};

	// Create solid color image
	ImageData CreateSolidColor(uint32_t width, uint32_t height, const glm::vec4& color);

	// Create checkerboard pattern (useful for debugging UVs)
	ImageData CreateCheckerboard(uint32_t width, uint32_t height, uint32_t checkSize,
		const glm::vec4& colorA = glm::vec4(1.0f), const glm::vec4& colorB = glm::vec4(0.0f, 0.0f, 0.0f, 1.0f));

	// Converts 8-bit RGBA pixels (as handed over by an image loader) to float texels
	ImageData CreateFromRGBA8(uint32_t width, uint32_t height, const uint8_t* pixels);

	// Maps an integer texel coordinate into [0, size) according to the address mode
	int32_t WrapTexelCoordinate(int32_t coord, int32_t size, AddressMode mode);

	// Brings a float texel coordinate into a range that casts to int32_t safely while
	// keeping its wrapped texel and fraction. NaN and, for the repeating modes, infinity become 0.
	float ReduceTexelCoordinate(float coord, int32_t size, AddressMode mode);

	// Samples at a normalized UV. There are no mip levels on the CPU side, so the
	// magnification filter is used. An invalid image samples as transparent black.
	glm::vec4 SampleTexture(const ImageData& image, const SamplerDesc& sampler, const glm::vec2& uv);
}
