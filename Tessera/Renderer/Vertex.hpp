// Vertex.hpp
#pragma once

#include <vulkan/vulkan.h>
#include <glm/glm.hpp>
#include <array>
#include <cstddef>

namespace Tessera
{
	// Per-vertex input. The normal is carried through but no stage reads it.
	struct Vertex
	{
		glm::vec3 position;
		glm::vec3 normal;
		glm::vec2 uv;

		static constexpr uint32_t BINDING = 0;
		static constexpr uint32_t LOCATION_POSITION = 0;
		static constexpr uint32_t LOCATION_NORMAL = 1;
		static constexpr uint32_t LOCATION_UV = 2;

		// Tell Vulkan how to read this vertex data from a buffer
		static VkVertexInputBindingDescription GetBindingDescription()
		{
			VkVertexInputBindingDescription bindingDesc{};
			bindingDesc.binding = BINDING;
			bindingDesc.stride = sizeof(Vertex);
			bindingDesc.inputRate = VK_VERTEX_INPUT_RATE_VERTEX; // Move to next data entry after each vertex

			return bindingDesc;
		}

		// Tell Vulkan how to extract vertex attributes (position, normal, uv)
		static std::array<VkVertexInputAttributeDescription, 3> GetAttributeDescriptions()
		{
			std::array<VkVertexInputAttributeDescription, 3> attributeDesc{};

			// Position attribute
			attributeDesc[0].binding = BINDING;
			attributeDesc[0].location = LOCATION_POSITION;  // layout(location = 0)
			attributeDesc[0].format = VK_FORMAT_R32G32B32_SFLOAT;  // vec3
			attributeDesc[0].offset = offsetof(Vertex, position);

			// Normal attribute
			attributeDesc[1].binding = BINDING;
			attributeDesc[1].location = LOCATION_NORMAL;  // layout(location = 1)
			attributeDesc[1].format = VK_FORMAT_R32G32B32_SFLOAT;  // vec3
			attributeDesc[1].offset = offsetof(Vertex, normal);

			// UV attribute
			attributeDesc[2].binding = BINDING;
			attributeDesc[2].location = LOCATION_UV;  // layout(location = 2)
			attributeDesc[2].format = VK_FORMAT_R32G32_SFLOAT;  // vec2
			attributeDesc[2].offset = offsetof(Vertex, uv);

			return attributeDesc;
		}
	};

	static_assert(sizeof(Vertex) == 32, "Vertex must be tightly packed: 3 + 3 + 2 floats");
	static_assert(offsetof(Vertex, normal) == 12, "Vertex::normal offset");
	static_assert(offsetof(Vertex, uv) == 24, "Vertex::uv offset");
}
