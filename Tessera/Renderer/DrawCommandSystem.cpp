//------------------------------------------------------------------------------
// DrawCommandSystem.cpp
//
// Draw list validation and ordering
//------------------------------------------------------------------------------

#include "Tessera/Renderer/DrawCommandSystem.hpp"
#include "Tessera/Core/Logger/Logger.hpp"

#include <algorithm>

namespace Tessera
{
	bool DrawList::AddCommand(const DrawCommand& cmd)
	{
		if (!cmd.mesh.IsDrawable())
		{
			LOG_ERROR("Rejected {} draw: no vertex buffer or nothing to draw", GetVariantName(cmd.variant));
			return false;
		}

		if (UsesTexture(cmd.variant) && !cmd.texture.IsValid())
		{
			LOG_ERROR("Rejected {} draw: variant samples a texture but none is bound", GetVariantName(cmd.variant));
			return false;
		}

		if (cmd.instanceCount == 0)
		{
			LOG_WARN("Skipping {} draw with zero instances", GetVariantName(cmd.variant));
			return false;
		}

		m_Commands.push_back(cmd);
		return true;
	}

	bool DrawList::DrawUVDebug(const MeshRef& mesh, const glm::mat4& transform)
	{
		DrawCommand cmd;
		cmd.variant = ShadingVariant::Debug();
		cmd.mesh = mesh;
		cmd.transform = transform;
		return AddCommand(cmd);
	}

	bool DrawList::DrawTextured(const MeshRef& mesh, const glm::mat4& transform,
		const TextureBinding& texture, bool alphaCutout)
	{
		if (!texture.IsValid())
		{
			LOG_ERROR("Rejected textured draw: no texture bound");
			return false;
		}

		DrawIntent intent;
		intent.hasTexture = true;
		intent.alphaCutout = alphaCutout;

		DrawCommand cmd;
		cmd.variant = SelectShadingVariant(intent);
		cmd.mesh = mesh;
		cmd.transform = transform;
		cmd.texture = texture;
		return AddCommand(cmd);
	}

	bool DrawList::DrawSprite(const MeshRef& mesh, const glm::mat4& transform,
		const TextureBinding& texture, const glm::vec4& uvWindow, bool inset)
	{
		if (!texture.IsValid())
		{
			LOG_ERROR("Rejected sprite draw: no texture bound");
			return false;
		}

		DrawIntent intent;
		intent.hasTexture = true;
		intent.usesAtlasWindow = true;
		intent.insetAtlasWindow = inset;
		intent.alphaCutout = true;

		DrawCommand cmd;
		cmd.variant = SelectShadingVariant(intent);
		cmd.mesh = mesh;
		cmd.transform = transform;
		cmd.uvWindow = uvWindow;
		cmd.texture = texture;
		return AddCommand(cmd);
	}

	void DrawList::SortByVariant()
	{
		std::stable_sort(m_Commands.begin(), m_Commands.end(),
			[](const DrawCommand& a, const DrawCommand& b) {
				return GetVariantIndex(a.variant) < GetVariantIndex(b.variant);
			});
	}
}
