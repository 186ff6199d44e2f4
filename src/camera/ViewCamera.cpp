// SPDX-License-Identifier: MIT

#include "camera/ViewCamera.h"

#include <glm/common.hpp>
#include <glm/geometric.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/matrix.hpp>
#include <glm/trigonometric.hpp>

#include <cmath>

ViewCamera::ViewCamera()
{
	updateProjection();
}

void ViewCamera::setPerspective(float fovYDegrees, float aspect, float nearPlane, float farPlane)
{
	m_projectionType = Projection::Perspective;
	m_fovYDegrees = fovYDegrees;
	m_aspect = aspect;
	m_near = nearPlane;
	m_far = farPlane;
	updateProjection();
}

void ViewCamera::setOrthographic(float halfWidth, float halfHeight, float nearPlane, float farPlane)
{
	m_projectionType = Projection::Orthographic;
	m_halfWidth = halfWidth;
	m_halfHeight = halfHeight;
	m_near = nearPlane;
	m_far = farPlane;
	updateProjection();
}

void ViewCamera::setPosition(const glm::vec3& position)
{
	m_world[3] = glm::vec4(position, 1.0f);
}

void ViewCamera::lookAt(const glm::vec3& target, const glm::vec3& up)
{
	const glm::vec3 position = getPosition();
	m_world = glm::inverse(glm::lookAt(position, target, up));
}

const glm::mat4& ViewCamera::getProjectionMatrix() const
{
	return m_projection;
}

const glm::mat4& ViewCamera::getWorldMatrix() const
{
	return m_world;
}

glm::vec3 ViewCamera::getPosition() const
{
	return glm::vec3(m_world[3]);
}

float ViewCamera::getNear() const
{
	return m_near;
}

float ViewCamera::getFar() const
{
	return m_far;
}

bool ViewCamera::isValid() const
{
	if (!std::isfinite(m_near) || !std::isfinite(m_far))
		return false;
	if (m_near <= 0.0f || m_far <= m_near)
		return false;
	if (m_projectionType == Projection::Perspective)
		return m_aspect > 0.0f && m_fovYDegrees > 0.0f && m_fovYDegrees < 180.0f;
	return m_halfWidth > 0.0f && m_halfHeight > 0.0f;
}

void ViewCamera::updateProjection()
{
	if (!isValid())
		return;

	if (m_projectionType == Projection::Perspective)
		m_projection = glm::perspective(glm::radians(m_fovYDegrees), m_aspect, m_near, m_far);
	else
		m_projection = glm::ortho(-m_halfWidth, m_halfWidth, -m_halfHeight, m_halfHeight, m_near, m_far);
}
