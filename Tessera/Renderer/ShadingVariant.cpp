//------------------------------------------------------------------------------
// ShadingVariant.cpp
//------------------------------------------------------------------------------

#include "Tessera/Renderer/ShadingVariant.hpp"

namespace Tessera
{
	ShadingVariant ShadingVariant::FromIndex(size_t index)
	{
		if (index >= SHADING_VARIANT_COUNT)
			return Debug();

		ShadingVariant variant;
		variant.windowing = static_cast<UVWindowing>(index / FRAGMENT_SHADING_COUNT);
		variant.fragment = static_cast<FragmentShading>(index % FRAGMENT_SHADING_COUNT);
		return variant;
	}

	const char* ToString(UVWindowing windowing)
	{
		switch (windowing)
		{
		case UVWindowing::None:        return "NoWindow";
		case UVWindowing::Window:      return "Window";
		case UVWindowing::InsetWindow: return "InsetWindow";
		default: return "Unknown";
		}
	}

	const char* ToString(FragmentShading fragment)
	{
		switch (fragment)
		{
		case FragmentShading::UVDebug:        return "UVDebug";
		case FragmentShading::Textured:       return "Textured";
		case FragmentShading::TexturedCutout: return "TexturedCutout";
		default: return "Unknown";
		}
	}

	std::string GetVariantName(const ShadingVariant& variant)
	{
		return std::string(ToString(variant.windowing)) + "+" + ToString(variant.fragment);
	}

	const char* GetVertexShaderFile(UVWindowing windowing)
	{
		switch (windowing)
		{
		case UVWindowing::Window:      return "sprite_window.vert.spv";
		case UVWindowing::InsetWindow: return "sprite_inset.vert.spv";
		case UVWindowing::None:
		default: return "sprite_plain.vert.spv";
		}
	}

	const char* GetFragmentShaderFile(FragmentShading fragment)
	{
		switch (fragment)
		{
		case FragmentShading::Textured:       return "sprite_textured.frag.spv";
		case FragmentShading::TexturedCutout: return "sprite_cutout.frag.spv";
		case FragmentShading::UVDebug:
		default: return "sprite_uvdebug.frag.spv";
		}
	}

	ShadingVariant SelectShadingVariant(const DrawIntent& intent)
	{
		ShadingVariant variant;

		if (intent.debugUV || !intent.hasTexture)
		{
			variant.fragment = FragmentShading::UVDebug;
		}
		else
		{
			variant.fragment = intent.alphaCutout ? FragmentShading::TexturedCutout : FragmentShading::Textured;
		}

		if (intent.usesAtlasWindow)
		{
			variant.windowing = intent.insetAtlasWindow ? UVWindowing::InsetWindow : UVWindowing::Window;
		}
		else
		{
			variant.windowing = UVWindowing::None;
		}

		return variant;
	}
}
