//------------------------------------------------------------------------------
// Camera.cpp
//------------------------------------------------------------------------------

#include "Tessera/Renderer/Camera.hpp"

#include <glm/gtc/matrix_transform.hpp>

namespace Tessera
{
	void Camera::SetPerspective(float fovDegrees, float aspect, float nearPlane, float farPlane)
	{
		ProjectionDesc& projection = EditProjection();
		projection.type = ProjectionType::Perspective;
		projection.fovDegrees = fovDegrees;
		projection.aspect = aspect;
		projection.nearPlane = nearPlane;
		projection.farPlane = farPlane;
	}

	void Camera::SetOrthographic(float halfWidth, float halfHeight, float nearPlane, float farPlane)
	{
		ProjectionDesc& projection = EditProjection();
		projection.type = ProjectionType::Orthographic;
		projection.halfWidth = halfWidth;
		projection.halfHeight = halfHeight;
		projection.nearPlane = nearPlane;
		projection.farPlane = farPlane;
	}

	const glm::mat4& Camera::GetProjectionMatrix() const
	{
		if (m_ProjectionDirty)
		{
			const ProjectionDesc& p = m_Projection;
			if (p.type == ProjectionType::Orthographic)
			{
				m_ProjectionMatrix = glm::orthoRH_ZO(-p.halfWidth, p.halfWidth, -p.halfHeight, p.halfHeight,
					p.nearPlane, p.farPlane);
			}
			else
			{
				m_ProjectionMatrix = glm::perspectiveRH_ZO(glm::radians(p.fovDegrees), p.aspect, p.nearPlane, p.farPlane);
			}

			m_ProjectionMatrix[1][1] *= -1.0f;  // Vulkan Y-flip
			m_ProjectionDirty = false;
		}
		return m_ProjectionMatrix;
	}

	glm::mat4 Camera::GetViewMatrix() const
	{
		return glm::inverse(m_Transform.GetMatrix());
	}

	glm::mat4 Camera::GetViewProjectionMatrix() const
	{
		return GetProjectionMatrix() * GetViewMatrix();
	}

	GlobalUniforms Camera::MakeGlobalUniforms() const
	{
		GlobalUniforms uniforms;
		uniforms.mvp = GetViewProjectionMatrix();
		return uniforms;
	}

} // namespace Tessera
