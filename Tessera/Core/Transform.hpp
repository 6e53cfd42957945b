//------------------------------------------------------------------------------
// Transform.hpp
//
// Position, rotation and scale producing a T * R * S matrix
//------------------------------------------------------------------------------
#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/quaternion.hpp>

namespace Tessera
{
	// Placement of a drawable or camera. GetMatrix() feeds the Local uniform
	// block, or the Camera's view after inversion.
	class Transform
	{
	public:
		glm::vec3 position = glm::vec3(0.0f);
		glm::quat rotation = glm::quat(1.0f, 0.0f, 0.0f, 0.0f); // Identity quaternion
		glm::vec3 scale = glm::vec3(1.0f);

		Transform() = default;

		explicit Transform(const glm::vec3& pos) : position(pos) {}
		Transform(const glm::vec3& pos, const glm::vec3& eulerDegrees)
			: position(pos)
		{
			SetEulerAngles(eulerDegrees);
		}

		// Sprite placement in the XY plane: size scales the unit quad, depth goes in Z
		static Transform Sprite2D(const glm::vec2& pos, const glm::vec2& size, float rotationDegrees = 0.0f, float depth = 0.0f)
		{
			Transform t(glm::vec3(pos, depth));
			t.scale = glm::vec3(size, 1.0f);
			t.rotation = glm::angleAxis(glm::radians(rotationDegrees), glm::vec3(0.0f, 0.0f, 1.0f));
			return t;
		}

		// T * R * S: scale first, then rotate, then translate
		glm::mat4 GetMatrix() const
		{
			glm::mat4 t = glm::translate(glm::mat4(1.0f), position);
			glm::mat4 r = glm::mat4_cast(rotation);
			glm::mat4 s = glm::scale(glm::mat4(1.0f), scale);
			return t * r * s;
		}

		// Set rotation from euler angles (degrees, pitch/yaw/roll)
		void SetEulerAngles(const glm::vec3& eulerDegrees)
		{
			rotation = glm::quat(glm::radians(eulerDegrees));
		}

		glm::vec3 GetForward() const { return rotation * glm::vec3(0, 0, -1); } // -Z is forward
		glm::vec3 GetUp() const { return rotation * glm::vec3(0, 1, 0); }
	};
}
