//------------------------------------------------------------------------------
// ShadingCoreTests.cpp
//
// Facade behavior that does not need a Vulkan device
//------------------------------------------------------------------------------

#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>
#include "Tessera/Renderer/ShadingCore.hpp"
#include "Tessera/Renderer/DrawCommandSystem.hpp"
#include "Tessera/Core/Logger/Logger.hpp"

namespace Tessera
{
	namespace
	{
		class CaptureSink : public ILogSink
		{
		public:
			void Write(LogLevel level, const std::string& message) override
			{
				m_Levels.push_back(level);
				m_Messages.push_back(message);
			}

			int Count(const std::string& text) const
			{
				int count = 0;
				for (const std::string& message : m_Messages)
				{
					if (message.find(text) != std::string::npos)
						count++;
				}
				return count;
			}

			std::vector<LogLevel> m_Levels;
			std::vector<std::string> m_Messages;
		};
	}

	class ShadingCoreTest : public ::testing::Test
	{
	protected:
		void SetUp() override
		{
			Logger::Get().ClearSinks();
			m_Sink = std::make_shared<CaptureSink>();
			Logger::Get().AddSink(m_Sink);
			Logger::Get().SetLogLevel(LogLevel::Trace);
		}

		void TearDown() override
		{
			Logger::Get().ClearSinks();
		}

		std::shared_ptr<CaptureSink> m_Sink;
	};

	TEST_F(ShadingCoreTest, RejectsInvalidConfigBeforeTouchingVulkan)
	{
		ShadingCore core;
		ShadingConfig config;
		config.framesInFlight = 0;

		EXPECT_FALSE(core.Initialize(VulkanContext{}, VK_NULL_HANDLE, VkExtent2D{ 800, 600 }, 256, config));
		EXPECT_FALSE(core.IsInitialized());
		EXPECT_EQ(core.GetPipelineManager(), nullptr);
		EXPECT_EQ(core.GetDefaultSampler(), VK_NULL_HANDLE);
		EXPECT_EQ(m_Sink->Count("Invalid shading config"), 1);
	}

	TEST_F(ShadingCoreTest, RejectsMissingDevice)
	{
		ShadingCore core;
		EXPECT_FALSE(core.Initialize(VulkanContext{}, VK_NULL_HANDLE, VkExtent2D{ 800, 600 }, 256, ShadingConfig{}));
		EXPECT_FALSE(core.IsInitialized());
		EXPECT_EQ(m_Sink->Count("valid Vulkan context"), 1);
	}

	TEST_F(ShadingCoreTest, InitBannerOnlyForRealAttempts)
	{
		ShadingCore core;
		ShadingConfig config;
		config.maxDrawsPerFrame = 0;

		// Each rejected call is a fresh attempt and announces itself once
		EXPECT_FALSE(core.Initialize(VulkanContext{}, VK_NULL_HANDLE, VkExtent2D{ 800, 600 }, 256, config));
		EXPECT_FALSE(core.Initialize(VulkanContext{}, VK_NULL_HANDLE, VkExtent2D{ 800, 600 }, 256, config));

		EXPECT_EQ(m_Sink->Count("=== Initializing Shading Core ==="), 2);
		EXPECT_EQ(m_Sink->Count("already initialized"), 0);
		EXPECT_EQ(m_Sink->Count("Initialization Complete"), 0);
	}

	TEST_F(ShadingCoreTest, FrameCallsFailWhenUninitialized)
	{
		ShadingCore core;
		DrawList drawList;

		EXPECT_FALSE(core.BeginFrame(0));
		EXPECT_FALSE(core.Record(VK_NULL_HANDLE, drawList, GlobalUniforms{}));
		EXPECT_FALSE(core.Resize(VkExtent2D{ 1024, 768 }));
		EXPECT_FALSE(core.ReloadShaders());
		EXPECT_EQ(core.GetRecorder(), nullptr);
	}
}
