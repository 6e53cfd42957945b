//------------------------------------------------------------------------------
// PipelineInterface.hpp
//
// Generic pipeline interface that hides backend-specific details.
// Pipelines are keyed by ShadingVariant; one pipeline object per variant.
//------------------------------------------------------------------------------
#pragma once

#include "Tessera/Renderer/ShadingVariant.hpp"
#include "Tessera/Renderer/UniformBlocks.hpp"

#include <string>
#include <memory>

namespace Tessera
{
	enum class PolygonMode
	{
		Fill,
		Line,
		Point
	};

	enum class CullMode
	{
		None,
		Front,
		Back,
		FrontAndBack
	};

	enum class FrontFace
	{
		Clockwise,
		CounterClockwise
	};

	enum class CompareOp
	{
		Never,
		Less,
		Equal,
		LessOrEqual,
		Greater,
		NotEqual,
		GreaterOrEqual,
		Always
	};

	enum class BlendFactor
	{
		Zero,
		One,
		SrcColor,
		OneMinusSrcColor,
		DstColor,
		OneMinusDstColor,
		SrcAlpha,
		OneMinusSrcAlpha,
		DstAlpha,
		OneMinusDstAlpha
	};

	enum class ShaderStage
	{
		Vertex = 0x01,
		Fragment = 0x02,

		// Common combinations
		VertexFragment = Vertex | Fragment
	};

	// Use bitwise operations for ShaderStage
	inline ShaderStage operator|(ShaderStage a, ShaderStage b)
	{
		return static_cast<ShaderStage>(static_cast<int>(a) | static_cast<int>(b));
	}

	inline ShaderStage operator&(ShaderStage a, ShaderStage b)
	{
		return static_cast<ShaderStage>(static_cast<int>(a) & static_cast<int>(b));
	}

	// Raster state shared by every shading variant
	struct ShadingPipelineConfig
	{
		// Directory holding the compiled sprite_*.spv files
		std::string shaderDirectory;

		// Baked into InsetWindow vertex stages as a specialization constant
		float atlasInset = kDefaultAtlasInset;

		// Rasterization state. Sprites are double sided.
		PolygonMode polygonMode = PolygonMode::Fill;
		CullMode cullMode = CullMode::None;
		FrontFace frontFace = FrontFace::CounterClockwise;

		// Depth testing
		bool depthTestEnable = true;
		bool depthWriteEnable = true;
		CompareOp depthCompareOp = CompareOp::LessOrEqual;

		// Blending, premultiplied alpha
		bool blendEnable = true;
		BlendFactor srcColorBlendFactor = BlendFactor::One;
		BlendFactor dstColorBlendFactor = BlendFactor::OneMinusSrcAlpha;
		BlendFactor srcAlphaBlendFactor = BlendFactor::One;
		BlendFactor dstAlphaBlendFactor = BlendFactor::OneMinusSrcAlpha;
	};

	// Forward declaration - actual implementation is backend-specific
	class IPipeline
	{
	public:
		virtual ~IPipeline() = default;
		virtual bool IsValid() const = 0;
		virtual ShadingVariant GetVariant() const = 0;
	};

	// Pipeline manager interface
	class IPipelineManager
	{
	public:
		virtual ~IPipelineManager() = default;

		// Pipeline management
		virtual bool CreatePipeline(const ShadingVariant& variant, const ShadingPipelineConfig& config) = 0;
		virtual bool CreateAllPipelines(const ShadingPipelineConfig& config) = 0;
		virtual bool DestroyPipeline(const ShadingVariant& variant) = 0;
		virtual IPipeline* GetPipeline(const ShadingVariant& variant) = 0;

		// Hot reload
		virtual bool ReloadPipeline(const ShadingVariant& variant) = 0;
		virtual bool ReloadAllPipelines() = 0;
	};

	// Factory function - implemented by the backend
	std::unique_ptr<IPipelineManager> CreatePipelineManager();
}
