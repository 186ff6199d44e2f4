// SPDX-License-Identifier: MIT

#pragma once

#include <glm/mat4x4.hpp>
#include <glm/vec3.hpp>

// Camera state handed over by the scene owner once per frame: projection, clip range and the
// camera-to-world transform.
class ViewCamera {
public:
	enum class Projection {
		Perspective,
		Orthographic
	};

	ViewCamera();

	void setPerspective(float fovYDegrees, float aspect, float nearPlane, float farPlane);
	void setOrthographic(float halfWidth, float halfHeight, float nearPlane, float farPlane);

	void setPosition(const glm::vec3& position);
	void lookAt(const glm::vec3& target, const glm::vec3& up = glm::vec3(0.0f, 1.0f, 0.0f));

	[[nodiscard]] const glm::mat4& getProjectionMatrix() const;
	[[nodiscard]] const glm::mat4& getWorldMatrix() const;
	[[nodiscard]] glm::vec3 getPosition() const;
	[[nodiscard]] float getNear() const;
	[[nodiscard]] float getFar() const;

	// False until a projection with a usable clip range has been set.
	[[nodiscard]] bool isValid() const;

private:
	void updateProjection();

	Projection m_projectionType { Projection::Perspective };
	glm::mat4 m_projection { 1.0f };
	glm::mat4 m_world { 1.0f };

	float m_fovYDegrees { 60.0f };
	float m_aspect { 16.0f / 9.0f };
	float m_halfWidth { 1.0f };
	float m_halfHeight { 1.0f };
	float m_near { 1.0f };
	float m_far { 1000.0f };
};
