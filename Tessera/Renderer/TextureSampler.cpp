//------------------------------------------------------------------------------
// TextureSampler.cpp
//
// CPU reference sampling (Vulkan texel coordinate rules)
//------------------------------------------------------------------------------

#include "Tessera/Renderer/TextureSampler.hpp"
#include "Tessera/Math/MathUtils.hpp"

#include <cmath>

namespace Tessera
{
	const char* ToString(FilterMode mode)
	{
		switch (mode)
		{
		case FilterMode::Nearest: return "Nearest";
		case FilterMode::Linear:  return "Linear";
		default: return "Unknown";
		}
	}

	const char* ToString(AddressMode mode)
	{
		switch (mode)
		{
		case AddressMode::ClampToEdge:    return "ClampToEdge";
		case AddressMode::Repeat:         return "Repeat";
		case AddressMode::MirroredRepeat: return "MirroredRepeat";
		default: return "Unknown";
		}
	}

	ImageData CreateSolidColor(uint32_t width, uint32_t height, const glm::vec4& color)
	{
		ImageData data;
		data.width = width;
		data.height = height;
		data.texels.assign(size_t(width) * height, color);
		return data;
	}

	ImageData CreateCheckerboard(uint32_t width, uint32_t height, uint32_t checkSize,
		const glm::vec4& colorA, const glm::vec4& colorB)
	{
		ImageData data;
		data.width = width;
		data.height = height;
		data.texels.resize(size_t(width) * height);

		if (checkSize == 0)
			checkSize = 1;

		for (uint32_t y = 0; y < height; ++y)
		{
			for (uint32_t x = 0; x < width; ++x)
			{
				bool isA = ((x / checkSize) + (y / checkSize)) % 2 == 0;
				data.At(x, y) = isA ? colorA : colorB;
			}
		}

		return data;
	}

	ImageData CreateFromRGBA8(uint32_t width, uint32_t height, const uint8_t* pixels)
	{
		ImageData data;
		if (!pixels)
			return data;

		data.width = width;
		data.height = height;
		data.texels.resize(size_t(width) * height);

		for (size_t i = 0; i < data.texels.size(); ++i)
		{
			const uint8_t* p = pixels + i * 4;
			data.texels[i] = glm::vec4(p[0], p[1], p[2], p[3]) / 255.0f;
		}

		return data;
	}

	int32_t WrapTexelCoordinate(int32_t coord, int32_t size, AddressMode mode)
	{
		switch (mode)
		{
		case AddressMode::Repeat:
		{
			int32_t wrapped = coord % size;
			return wrapped < 0 ? wrapped + size : wrapped;
		}
		case AddressMode::MirroredRepeat:
		{
			int32_t period = size * 2;
			int32_t t = coord % period;
			if (t < 0)
				t += period;
			return t < size ? t : (period - 1 - t);
		}
		case AddressMode::ClampToEdge:
		default:
			return Clamp(coord, 0, size - 1);
		}
	}

	float ReduceTexelCoordinate(float coord, int32_t size, AddressMode mode)
	{
		if (std::isnan(coord))
			return 0.0f;

		switch (mode)
		{
		case AddressMode::Repeat:
			if (!std::isfinite(coord))
				return 0.0f;
			return std::fmod(coord, static_cast<float>(size));
		case AddressMode::MirroredRepeat:
			if (!std::isfinite(coord))
				return 0.0f;
			return std::fmod(coord, static_cast<float>(size) * 2.0f);
		case AddressMode::ClampToEdge:
		default:
			// One texel of slack on each side keeps both bilinear neighbours on the edge
			return Clamp(coord, -1.0f, static_cast<float>(size));
		}
	}

	glm::vec4 SampleTexture(const ImageData& image, const SamplerDesc& sampler, const glm::vec2& uv)
	{
		if (!image.IsValid())
			return glm::vec4(0.0f);

		const int32_t width = static_cast<int32_t>(image.width);
		const int32_t height = static_cast<int32_t>(image.height);

		const float u = uv.x * static_cast<float>(width);
		const float v = uv.y * static_cast<float>(height);
		const AddressMode modeU = sampler.addressModeU;
		const AddressMode modeV = sampler.addressModeV;

		auto fetch = [&](int32_t i, int32_t j) -> const glm::vec4&
		{
			int32_t x = WrapTexelCoordinate(i, width, sampler.addressModeU);
			int32_t y = WrapTexelCoordinate(j, height, sampler.addressModeV);
			return image.At(static_cast<uint32_t>(x), static_cast<uint32_t>(y));
		};

		if (sampler.magFilter == FilterMode::Nearest)
		{
			const float un = ReduceTexelCoordinate(u, width, modeU);
			const float vn = ReduceTexelCoordinate(v, height, modeV);
			return fetch(static_cast<int32_t>(std::floor(un)), static_cast<int32_t>(std::floor(vn)));
		}

		// Bilinear: texel centers sit at half-integer coordinates
		const float uc = ReduceTexelCoordinate(u - 0.5f, width, modeU);
		const float vc = ReduceTexelCoordinate(v - 0.5f, height, modeV);
		const int32_t i0 = static_cast<int32_t>(std::floor(uc));
		const int32_t j0 = static_cast<int32_t>(std::floor(vc));
		const float alpha = Fract(uc);
		const float beta = Fract(vc);

		glm::vec4 top = Lerp(fetch(i0, j0), fetch(i0 + 1, j0), alpha);
		glm::vec4 bottom = Lerp(fetch(i0, j0 + 1), fetch(i0 + 1, j0 + 1), alpha);
		return Lerp(top, bottom, beta);
	}
}
