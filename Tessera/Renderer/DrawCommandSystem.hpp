//------------------------------------------------------------------------------
// DrawCommandSystem.hpp
//
// Draw submission from the host. Each command names its shading variant and
// carries the per-draw Local data; ShadingCommandRecorder turns a DrawList
// into Vulkan commands.
//------------------------------------------------------------------------------
#pragma once

#include "Tessera/Renderer/ShadingVariant.hpp"
#include "Tessera/Renderer/UniformBlocks.hpp"

#include <vulkan/vulkan.h>
#include <glm/glm.hpp>
#include <cstdint>
#include <vector>

namespace Tessera
{
	// ============================================================================
	// Draw Command Types
	// ============================================================================

	// Geometry owned by the host. Vertices are Tessera::Vertex, indices uint32.
	struct MeshRef
	{
		VkBuffer vertexBuffer = VK_NULL_HANDLE;
		VkBuffer indexBuffer = VK_NULL_HANDLE;
		uint32_t indexCount = 0;
		uint32_t vertexCount = 0;  // For non-indexed draws

		bool IsIndexed() const { return indexBuffer != VK_NULL_HANDLE && indexCount > 0; }
		bool IsDrawable() const { return vertexBuffer != VK_NULL_HANDLE && (IsIndexed() || vertexCount > 0); }
	};

	// Texture bound in set 1. A null sampler means the shading core's default sampler.
	struct TextureBinding
	{
		VkImageView imageView = VK_NULL_HANDLE;  // SHADER_READ_ONLY_OPTIMAL, 4-channel float-sampled
		VkSampler sampler = VK_NULL_HANDLE;

		bool IsValid() const { return imageView != VK_NULL_HANDLE; }
	};

	struct DrawCommand
	{
		ShadingVariant variant = ShadingVariant::Debug();
		MeshRef mesh;

		// Local uniform block. uvWindow is only uploaded for windowed variants.
		glm::mat4 transform = glm::mat4(1.0f);
		glm::vec4 uvWindow = kFullUVWindow;

		TextureBinding texture;

		uint32_t instanceCount = 1;
		uint32_t firstInstance = 0;

		WindowedLocalUniforms GetLocalUniforms() const { return { transform, uvWindow }; }
	};

	// ============================================================================
	// Draw List - Accumulates draw commands for a frame
	// ============================================================================

	class DrawList
	{
	public:
		DrawList() = default;

		// Rejects (and logs) commands that could not be drawn: no geometry, or a
		// textured variant without a texture.
		bool AddCommand(const DrawCommand& cmd);

		// UV visualization, no texture
		bool DrawUVDebug(const MeshRef& mesh, const glm::mat4& transform);

		// Whole texture
		bool DrawTextured(const MeshRef& mesh, const glm::mat4& transform,
			const TextureBinding& texture, bool alphaCutout = false);

		// Atlas sub-rectangle with alpha cutout
		bool DrawSprite(const MeshRef& mesh, const glm::mat4& transform,
			const TextureBinding& texture, const glm::vec4& uvWindow, bool inset = false);

		// Clear the list
		void Clear() { m_Commands.clear(); }

		const std::vector<DrawCommand>& GetCommands() const { return m_Commands; }
		size_t Size() const { return m_Commands.size(); }
		bool IsEmpty() const { return m_Commands.empty(); }

		// Groups commands by variant to minimize pipeline switches. Submission order
		// within a variant is kept.
		void SortByVariant();

	private:
		std::vector<DrawCommand> m_Commands;
	};
}
