//------------------------------------------------------------------------------
// TextureAtlas.cpp
//
// Sprite frames and the (image, tag) registry
//------------------------------------------------------------------------------

#include "Tessera/Renderer/TextureAtlas.hpp"
#include "Tessera/Core/Logger/Logger.hpp"

namespace Tessera
{
	glm::vec4 MakeUVWindowFromPixels(const PixelRect& rect, uint32_t atlasWidth, uint32_t atlasHeight)
	{
		if (atlasWidth == 0 || atlasHeight == 0)
			return glm::vec4(0.0f, 0.0f, 1.0f, 1.0f);

		const double w = static_cast<double>(atlasWidth);
		const double h = static_cast<double>(atlasHeight);

		return glm::vec4(
			static_cast<float>(rect.x / w),
			static_cast<float>(rect.y / h),
			static_cast<float>(rect.width / w),
			static_cast<float>(rect.height / h));
	}

	glm::vec4 Sprite::GetUVWindow(uint32_t frame) const
	{
		const uint32_t frameCount = frames > 0 ? frames : 1;
		const float left = uvTopLeft.x + uvSize.x * static_cast<float>(frame % frameCount);
		return glm::vec4(left, uvTopLeft.y, uvSize.x, uvSize.y);
	}

	SpriteId TextureAtlas::AddSprite(const Sprite& sprite, const std::string& image, const std::optional<std::string>& tag)
	{
		Sprite stored = sprite;
		if (stored.frames == 0)
		{
			LOG_WARN("Sprite '{}' registered with zero frames, using one", image);
			stored.frames = 1;
		}

		const uint32_t index = static_cast<uint32_t>(m_Sprites.size());
		m_Sprites.push_back(stored);
		m_Identifiers[SpriteKey(image, tag)] = index;

		LOG_DEBUG("Added sprite {} for '{}' tag '{}' ({} frames)", index, image, tag.value_or(""), stored.frames);
		return SpriteId{ index };
	}

	SpriteId TextureAtlas::AddSpriteStrip(TextureId texture, const std::string& image, const std::optional<std::string>& tag,
		uint32_t atlasWidth, uint32_t atlasHeight, const PixelRect& firstFrame, uint32_t frameCount)
	{
		const glm::vec4 window = MakeUVWindowFromPixels(firstFrame, atlasWidth, atlasHeight);

		Sprite sprite;
		sprite.texture = texture;
		sprite.uvTopLeft = glm::vec2(window.x, window.y);
		sprite.uvSize = glm::vec2(window.z, window.w);
		sprite.frames = frameCount;

		return AddSprite(sprite, image, tag);
	}

	std::optional<SpriteId> TextureAtlas::GetSpriteId(const std::string& image, const std::optional<std::string>& tag) const
	{
		auto it = m_Identifiers.find(SpriteKey(image, tag));
		if (it == m_Identifiers.end())
			return std::nullopt;
		return SpriteId{ it->second };
	}

	const Sprite* TextureAtlas::GetSprite(SpriteId id) const
	{
		if (id.index >= m_Sprites.size())
			return nullptr;
		return &m_Sprites[id.index];
	}

	void TextureAtlas::Clear()
	{
		m_Identifiers.clear();
		m_Sprites.clear();
	}
}
