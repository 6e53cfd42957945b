//------------------------------------------------------------------------------
// DrawListTests.cpp
//
// Draw submission checks. Handles are never dereferenced, so made-up values
// stand in for real Vulkan objects.
//------------------------------------------------------------------------------

#include <gtest/gtest.h>
#include <cstring>
#include "Tessera/Renderer/DrawCommandSystem.hpp"
#include "Tessera/Core/Logger/Logger.hpp"

namespace Tessera
{
	namespace
	{
		template<typename T>
		T FakeHandle(uint64_t value)
		{
			static_assert(sizeof(T) <= sizeof(uint64_t));
			T handle{};
			std::memcpy(&handle, &value, sizeof(T));
			return handle;
		}

		MeshRef MakeQuadMesh()
		{
			MeshRef mesh;
			mesh.vertexBuffer = FakeHandle<VkBuffer>(0x10);
			mesh.indexBuffer = FakeHandle<VkBuffer>(0x20);
			mesh.indexCount = 6;
			mesh.vertexCount = 4;
			return mesh;
		}

		TextureBinding MakeTexture()
		{
			TextureBinding texture;
			texture.imageView = FakeHandle<VkImageView>(0x30);
			return texture;
		}
	}

	class DrawListTest : public ::testing::Test
	{
	protected:
		void SetUp() override
		{
			// Rejections log errors; keep test output quiet
			Logger::Get().ClearSinks();
		}

		DrawList m_List;
	};

	TEST_F(DrawListTest, UVDebugNeedsNoTexture)
	{
		EXPECT_TRUE(m_List.DrawUVDebug(MakeQuadMesh(), glm::mat4(1.0f)));
		ASSERT_EQ(m_List.Size(), 1u);
		EXPECT_EQ(m_List.GetCommands()[0].variant, ShadingVariant::Debug());
	}

	TEST_F(DrawListTest, TexturedDefaultsToFullWindow)
	{
		EXPECT_TRUE(m_List.DrawTextured(MakeQuadMesh(), glm::mat4(1.0f), MakeTexture()));
		const DrawCommand& cmd = m_List.GetCommands()[0];

		EXPECT_EQ(cmd.variant, ShadingVariant::Textured());
		EXPECT_EQ(cmd.uvWindow, kFullUVWindow);
	}

	TEST_F(DrawListTest, TexturedWithCutout)
	{
		EXPECT_TRUE(m_List.DrawTextured(MakeQuadMesh(), glm::mat4(1.0f), MakeTexture(), true));
		EXPECT_EQ(m_List.GetCommands()[0].variant.fragment, FragmentShading::TexturedCutout);
	}

	TEST_F(DrawListTest, SpriteCarriesWindowIntoLocalBlock)
	{
		const glm::vec4 window(0.5f, 0.0f, 0.5f, 1.0f);
		const glm::mat4 transform = glm::mat4(2.0f);

		EXPECT_TRUE(m_List.DrawSprite(MakeQuadMesh(), transform, MakeTexture(), window, true));
		const DrawCommand& cmd = m_List.GetCommands()[0];

		EXPECT_EQ(cmd.variant, ShadingVariant::AtlasInset());
		WindowedLocalUniforms local = cmd.GetLocalUniforms();
		EXPECT_EQ(local.uvWindow, window);
		EXPECT_EQ(local.transform, transform);
	}

	TEST_F(DrawListTest, RejectsTexturedVariantWithoutTexture)
	{
		EXPECT_FALSE(m_List.DrawTextured(MakeQuadMesh(), glm::mat4(1.0f), TextureBinding{}));
		EXPECT_FALSE(m_List.DrawSprite(MakeQuadMesh(), glm::mat4(1.0f), TextureBinding{}, kFullUVWindow));

		DrawCommand cmd;
		cmd.variant = ShadingVariant::Atlas();
		cmd.mesh = MakeQuadMesh();
		EXPECT_FALSE(m_List.AddCommand(cmd));

		EXPECT_TRUE(m_List.IsEmpty());
	}

	TEST_F(DrawListTest, RejectsMeshWithoutGeometry)
	{
		EXPECT_FALSE(m_List.DrawUVDebug(MeshRef{}, glm::mat4(1.0f)));

		MeshRef noCounts;
		noCounts.vertexBuffer = FakeHandle<VkBuffer>(0x10);
		EXPECT_FALSE(m_List.DrawUVDebug(noCounts, glm::mat4(1.0f)));

		EXPECT_TRUE(m_List.IsEmpty());
	}

	TEST_F(DrawListTest, NonIndexedMeshIsDrawable)
	{
		MeshRef mesh;
		mesh.vertexBuffer = FakeHandle<VkBuffer>(0x10);
		mesh.vertexCount = 3;

		EXPECT_FALSE(mesh.IsIndexed());
		EXPECT_TRUE(m_List.DrawUVDebug(mesh, glm::mat4(1.0f)));
	}

	TEST_F(DrawListTest, RejectsZeroInstances)
	{
		DrawCommand cmd;
		cmd.mesh = MakeQuadMesh();
		cmd.instanceCount = 0;
		EXPECT_FALSE(m_List.AddCommand(cmd));
	}

	TEST_F(DrawListTest, SortGroupsByVariantAndKeepsOrder)
	{
		const glm::mat4 first = glm::mat4(1.0f);
		const glm::mat4 second = glm::mat4(3.0f);

		ASSERT_TRUE(m_List.DrawSprite(MakeQuadMesh(), first, MakeTexture(), kFullUVWindow));
		ASSERT_TRUE(m_List.DrawUVDebug(MakeQuadMesh(), first));
		ASSERT_TRUE(m_List.DrawSprite(MakeQuadMesh(), second, MakeTexture(), kFullUVWindow));

		m_List.SortByVariant();
		const auto& cmds = m_List.GetCommands();

		EXPECT_EQ(cmds[0].variant, ShadingVariant::Debug());
		EXPECT_EQ(cmds[1].variant, ShadingVariant::Atlas());
		EXPECT_EQ(cmds[1].transform, first);
		EXPECT_EQ(cmds[2].transform, second);
	}

	TEST_F(DrawListTest, ClearEmptiesTheList)
	{
		ASSERT_TRUE(m_List.DrawUVDebug(MakeQuadMesh(), glm::mat4(1.0f)));
		m_List.Clear();
		EXPECT_TRUE(m_List.IsEmpty());
	}
}
