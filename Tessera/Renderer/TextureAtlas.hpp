//------------------------------------------------------------------------------
// TextureAtlas.hpp
//
// Sprites packed into a shared texture. Each sprite is a row of equally sized
// animation frames; GetUVWindow() yields the uvWindow for the windowed shading
// variants.
//------------------------------------------------------------------------------
#pragma once

#include <glm/glm.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Tessera
{
	// Host-side handle of the texture a sprite lives in
	using TextureId = uint32_t;

	struct PixelRect
	{
		uint32_t x = 0;
		uint32_t y = 0;
		uint32_t width = 0;
		uint32_t height = 0;
	};

	// Normalized window (x, y, width, height) for a pixel rectangle of an atlas.
	// A zero-sized atlas yields the full window.
	glm::vec4 MakeUVWindowFromPixels(const PixelRect& rect, uint32_t atlasWidth, uint32_t atlasHeight);

	struct Sprite
	{
		TextureId texture = 0;
		glm::vec2 uvTopLeft = glm::vec2(0.0f);
		glm::vec2 uvSize = glm::vec2(1.0f);
		uint32_t frames = 1;

		// Window of the given animation frame. Frames wrap around.
		glm::vec4 GetUVWindow(uint32_t frame) const;
	};

	struct SpriteId
	{
		uint32_t index = 0;

		bool operator==(const SpriteId& other) const = default;
	};

	class TextureAtlas
	{
	public:
		TextureAtlas() = default;

		// Registers a sprite under (image, tag). Re-registering a key points it at the new sprite.
		SpriteId AddSprite(const Sprite& sprite, const std::string& image, const std::optional<std::string>& tag = std::nullopt);

		// Registers a horizontal strip of frameCount frames starting at firstFrame
		SpriteId AddSpriteStrip(TextureId texture, const std::string& image, const std::optional<std::string>& tag,
			uint32_t atlasWidth, uint32_t atlasHeight, const PixelRect& firstFrame, uint32_t frameCount);

		std::optional<SpriteId> GetSpriteId(const std::string& image, const std::optional<std::string>& tag = std::nullopt) const;

		// nullptr for an id this atlas did not hand out
		const Sprite* GetSprite(SpriteId id) const;

		size_t GetSpriteCount() const { return m_Sprites.size(); }
		void Clear();

	private:
		using SpriteKey = std::pair<std::string, std::optional<std::string>>;

		std::map<SpriteKey, uint32_t> m_Identifiers;
		std::vector<Sprite> m_Sprites;
	};
}
