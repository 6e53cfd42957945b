//------------------------------------------------------------------------------
// ShadingVariant.hpp
//
// The closed set of vertex/fragment stage pairs the shading core can run.
// Each variant is compiled into its own pipeline object; nothing branches on
// the variant inside a shader.
//------------------------------------------------------------------------------
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace Tessera
{
	// How the vertex stage maps the mesh UV into the bound texture
	enum class UVWindowing : uint8_t
	{
		None,         // uv passes through unchanged, Local block has no uvWindow
		Window,       // window.xy + window.zw * uv
		InsetWindow,  // window.xy + inset + (window.zw - 2 * inset) * uv

		Count
	};

	// What the fragment stage outputs
	enum class FragmentShading : uint8_t
	{
		UVDebug,         // (uv.x, uv.y, kDebugBlueChannel, 1), no texture bound
		Textured,        // texture sample, never discards
		TexturedCutout,  // texture sample, discards when alpha < kDiscardAlphaThreshold

		Count
	};

	constexpr size_t UV_WINDOWING_COUNT = static_cast<size_t>(UVWindowing::Count);
	constexpr size_t FRAGMENT_SHADING_COUNT = static_cast<size_t>(FragmentShading::Count);
	constexpr size_t SHADING_VARIANT_COUNT = UV_WINDOWING_COUNT * FRAGMENT_SHADING_COUNT;

	struct ShadingVariant
	{
		UVWindowing windowing = UVWindowing::None;
		FragmentShading fragment = FragmentShading::UVDebug;

		bool operator==(const ShadingVariant& other) const = default;

		// Named presets for the common draws
		static constexpr ShadingVariant Debug() { return { UVWindowing::None, FragmentShading::UVDebug }; }
		static constexpr ShadingVariant Textured() { return { UVWindowing::None, FragmentShading::Textured }; }
		static constexpr ShadingVariant Atlas() { return { UVWindowing::Window, FragmentShading::TexturedCutout }; }
		static constexpr ShadingVariant AtlasInset() { return { UVWindowing::InsetWindow, FragmentShading::TexturedCutout }; }

		// Inverse of GetVariantIndex. Out-of-range indices return Debug().
		static ShadingVariant FromIndex(size_t index);
	};

	// Dense index in [0, SHADING_VARIANT_COUNT), used to key pipeline tables
	constexpr size_t GetVariantIndex(const ShadingVariant& variant)
	{
		return static_cast<size_t>(variant.windowing) * FRAGMENT_SHADING_COUNT
			+ static_cast<size_t>(variant.fragment);
	}

	constexpr bool UsesTexture(const ShadingVariant& variant)
	{
		return variant.fragment != FragmentShading::UVDebug;
	}

	constexpr bool UsesUVWindow(const ShadingVariant& variant)
	{
		return variant.windowing != UVWindowing::None;
	}

	constexpr bool UsesDiscard(const ShadingVariant& variant)
	{
		return variant.fragment == FragmentShading::TexturedCutout;
	}

	const char* ToString(UVWindowing windowing);
	const char* ToString(FragmentShading fragment);

	// e.g. "Window+TexturedCutout"
	std::string GetVariantName(const ShadingVariant& variant);

	// Compiled SPIR-V file names produced by the build for each stage
	const char* GetVertexShaderFile(UVWindowing windowing);
	const char* GetFragmentShaderFile(FragmentShading fragment);

	// What the host knows about a draw before picking a pipeline
	struct DrawIntent
	{
		bool hasTexture = false;
		bool usesAtlasWindow = false;
		bool insetAtlasWindow = false;  // Only meaningful with usesAtlasWindow
		bool alphaCutout = false;
		bool debugUV = false;           // Force the UV visualization, ignoring the texture
	};

	// Picks the variant for one draw. A draw without a texture always gets the
	// UV debug fragment stage.
	ShadingVariant SelectShadingVariant(const DrawIntent& intent);
}
