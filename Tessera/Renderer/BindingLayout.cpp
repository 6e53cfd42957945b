#include "Tessera/Renderer/BindingLayout.hpp"
#include "Tessera/Renderer/UniformBlocks.hpp"

#include <algorithm>
#include <format>

namespace Tessera
{
	namespace
	{
		const BindingSlot* FindSlot(const std::vector<BindingSlot>& slots, uint32_t set, uint32_t binding)
		{
			auto it = std::find_if(slots.begin(), slots.end(),
				[=](const BindingSlot& slot) { return slot.set == set && slot.binding == binding; });
			return it != slots.end() ? &*it : nullptr;
		}

		bool HasStage(ShaderStage stages, ShaderStage stage)
		{
			return static_cast<int>(stages & stage) != 0;
		}
	}

	const char* ToString(BindingKind kind)
	{
		switch (kind)
		{
		case BindingKind::UniformBuffer: return "UniformBuffer";
		case BindingKind::SampledImage:  return "SampledImage";
		case BindingKind::Sampler:       return "Sampler";
		default: return "Unknown";
		}
	}

	uint32_t GetLocalUniformsSize(UVWindowing windowing)
	{
		return windowing == UVWindowing::None
			? static_cast<uint32_t>(LOCAL_UNIFORMS_SIZE)
			: static_cast<uint32_t>(WINDOWED_LOCAL_UNIFORMS_SIZE);
	}

	std::vector<BindingSlot> BuildBindingLayout(const ShadingVariant& variant)
	{
		std::vector<BindingSlot> slots;

		slots.push_back({ UNIFORM_SET, GLOBAL_UNIFORMS_BINDING, BindingKind::UniformBuffer,
			static_cast<uint32_t>(GLOBAL_UNIFORMS_SIZE), ShaderStage::Vertex });
		slots.push_back({ UNIFORM_SET, LOCAL_UNIFORMS_BINDING, BindingKind::UniformBuffer,
			GetLocalUniformsSize(variant.windowing), ShaderStage::Vertex });

		if (UsesTexture(variant))
		{
			slots.push_back({ TEXTURE_SET, SAMPLED_IMAGE_BINDING, BindingKind::SampledImage, 0, ShaderStage::Fragment });
			slots.push_back({ TEXTURE_SET, SAMPLER_BINDING, BindingKind::Sampler, 0, ShaderStage::Fragment });
		}

		return slots;
	}

	bool ValidateBindingLayout(const ShadingVariant& variant, const std::vector<BindingSlot>& slots, std::string& outError)
	{
		for (size_t i = 0; i < slots.size(); ++i)
		{
			for (size_t j = i + 1; j < slots.size(); ++j)
			{
				if (slots[i].set == slots[j].set && slots[i].binding == slots[j].binding)
				{
					outError = std::format("Set {} binding {} is declared twice", slots[i].set, slots[i].binding);
					return false;
				}
			}

			const BindingSlot& slot = slots[i];
			if (slot.kind == BindingKind::UniformBuffer && slot.size % UNIFORM_BLOCK_ALIGNMENT != 0)
			{
				outError = std::format("Uniform block at set {} binding {} is {} bytes, not a multiple of {}",
					slot.set, slot.binding, slot.size, UNIFORM_BLOCK_ALIGNMENT);
				return false;
			}
		}

		const BindingSlot* global = FindSlot(slots, UNIFORM_SET, GLOBAL_UNIFORMS_BINDING);
		if (!global || global->kind != BindingKind::UniformBuffer || global->size != GLOBAL_UNIFORMS_SIZE)
		{
			outError = std::format("Global block must be a {}-byte uniform buffer at set {} binding {}",
				GLOBAL_UNIFORMS_SIZE, UNIFORM_SET, GLOBAL_UNIFORMS_BINDING);
			return false;
		}

		const uint32_t expectedLocalSize = GetLocalUniformsSize(variant.windowing);
		const BindingSlot* local = FindSlot(slots, UNIFORM_SET, LOCAL_UNIFORMS_BINDING);
		if (!local || local->kind != BindingKind::UniformBuffer || local->size != expectedLocalSize)
		{
			outError = std::format("Local block for {} must be a {}-byte uniform buffer at set {} binding {}",
				GetVariantName(variant), expectedLocalSize, UNIFORM_SET, LOCAL_UNIFORMS_BINDING);
			return false;
		}

		if (!HasStage(global->stages, ShaderStage::Vertex) || !HasStage(local->stages, ShaderStage::Vertex))
		{
			outError = "Uniform blocks must be visible to the vertex stage";
			return false;
		}

		const BindingSlot* image = FindSlot(slots, TEXTURE_SET, SAMPLED_IMAGE_BINDING);
		const BindingSlot* sampler = FindSlot(slots, TEXTURE_SET, SAMPLER_BINDING);

		if (UsesTexture(variant))
		{
			if (!image || image->kind != BindingKind::SampledImage || !HasStage(image->stages, ShaderStage::Fragment))
			{
				outError = std::format("{} needs a fragment-visible sampled image at set {} binding {}",
					GetVariantName(variant), TEXTURE_SET, SAMPLED_IMAGE_BINDING);
				return false;
			}

			if (!sampler || sampler->kind != BindingKind::Sampler || !HasStage(sampler->stages, ShaderStage::Fragment))
			{
				outError = std::format("{} needs a fragment-visible sampler at set {} binding {}",
					GetVariantName(variant), TEXTURE_SET, SAMPLER_BINDING);
				return false;
			}
		}
		else
		{
			bool hasTextureSet = std::any_of(slots.begin(), slots.end(),
				[](const BindingSlot& slot) { return slot.set == TEXTURE_SET; });
			if (hasTextureSet)
			{
				outError = std::format("{} samples no texture but declares set {}", GetVariantName(variant), TEXTURE_SET);
				return false;
			}
		}

		return true;
	}
}
