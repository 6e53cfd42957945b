#include "Tessera/Renderer/Vulkan/VulkanCommon.hpp"
#include "Tessera/Core/Logger/Logger.hpp"

namespace Tessera
{
	namespace VulkanUtils
	{
		bool CheckVkResult(VkResult result, const char* operation)
		{
			if (result != VK_SUCCESS)
			{
				LOG_ERROR("{} failed: {}", operation, VkResultToString(result));
				return false;
			}
			return true;
		}
	}
}
