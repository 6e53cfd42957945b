//------------------------------------------------------------------------------
// Camera.hpp
//
// Produces the view-projection written into the Global uniform block
//------------------------------------------------------------------------------
#pragma once

#include "Tessera/Core/Transform.hpp"
#include "Tessera/Renderer/UniformBlocks.hpp"

#include <glm/glm.hpp>

namespace Tessera
{
	enum class ProjectionType
	{
		Perspective,
		Orthographic
	};

	struct ProjectionDesc
	{
		ProjectionType type = ProjectionType::Perspective;

		// Perspective
		float fovDegrees = 90.0f;
		float aspect = 1.0f;

		// Orthographic half extents around the camera
		float halfWidth = 1.0f;
		float halfHeight = 1.0f;

		float nearPlane = 0.01f;
		float farPlane = 100.0f;
	};

	class Camera
	{
	public:
		Camera() = default;
		explicit Camera(const ProjectionDesc& projection) : m_Projection(projection) {}

		void SetPerspective(float fovDegrees, float aspect, float nearPlane, float farPlane);
		void SetOrthographic(float halfWidth, float halfHeight, float nearPlane, float farPlane);

		// Any edit through here drops the cached projection matrix
		ProjectionDesc& EditProjection() { m_ProjectionDirty = true; return m_Projection; }
		const ProjectionDesc& GetProjection() const { return m_Projection; }

		Transform& GetTransform() { return m_Transform; }
		const Transform& GetTransform() const { return m_Transform; }
		void SetTransform(const Transform& transform) { m_Transform = transform; }

		// Right handed, depth 0..1, Y flipped for Vulkan clip space
		const glm::mat4& GetProjectionMatrix() const;
		glm::mat4 GetViewMatrix() const;

		// projection * inverse(camera transform)
		glm::mat4 GetViewProjectionMatrix() const;

		GlobalUniforms MakeGlobalUniforms() const;

	private:
		Transform m_Transform;
		ProjectionDesc m_Projection;

		mutable glm::mat4 m_ProjectionMatrix = glm::mat4(1.0f);
		mutable bool m_ProjectionDirty = true;
	};

} // namespace Tessera
