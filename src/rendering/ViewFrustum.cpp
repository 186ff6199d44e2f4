// SPDX-License-Identifier: MIT
#include "rendering/ViewFrustum.h"

#include <glm/common.hpp>
#include <glm/geometric.hpp>
#include <glm/matrix.hpp>
#include <glm/vec4.hpp>

#include <algorithm>
#include <cmath>
#include <limits>

namespace {

constexpr float kDeterminantEpsilon = 1e-12f;

// NDC corners in the same order as FrustumCorners; near at z = -1, far at z = +1.
constexpr std::array<glm::vec3, FrustumCorners::kRingSize> kClipRing = {
    glm::vec3(1.0f, 1.0f, 0.0f),
    glm::vec3(1.0f, -1.0f, 0.0f),
    glm::vec3(-1.0f, -1.0f, 0.0f),
    glm::vec3(-1.0f, 1.0f, 0.0f)
};

[[nodiscard]] glm::vec3 unproject(const glm::mat4& inverseProjection, const glm::vec3& clip)
{
    const glm::vec4 point = inverseProjection * glm::vec4(clip, 1.0f);
    return glm::vec3(point) / point.w;
}

[[nodiscard]] glm::vec3 transformPoint(const glm::mat4& transform, const glm::vec3& point)
{
    const glm::vec4 result = transform * glm::vec4(point, 1.0f);
    return glm::vec3(result) / result.w;
}

} // namespace

ViewFrustum::ViewFrustum(const FrustumCorners& corners)
    : m_corners(corners)
{
}

bool ViewFrustum::isOrthographic(const glm::mat4& projection)
{
    // Perspective matrices carry -1 in the w row of the z column.
    return projection[2][3] == 0.0f;
}

bool ViewFrustum::setFromProjection(const glm::mat4& projection, float maxFar)
{
    const float determinant = glm::determinant(projection);
    if (!std::isfinite(determinant) || std::abs(determinant) < kDeterminantEpsilon)
        return false;

    const bool orthographic = isOrthographic(projection);
    const glm::mat4 inverseProjection = glm::inverse(projection);

    for (std::size_t i = 0; i < kClipRing.size(); ++i) {
        glm::vec3 nearClip = kClipRing[i];
        nearClip.z = -1.0f;
        glm::vec3 farClip = kClipRing[i];
        farClip.z = 1.0f;

        m_corners.nearRing[i] = unproject(inverseProjection, nearClip);
        glm::vec3 farVertex = unproject(inverseProjection, farClip);

        const float absZ = std::abs(farVertex.z);
        const float factor = absZ > 0.0f ? std::min(maxFar / absZ, 1.0f) : 1.0f;
        if (orthographic)
            farVertex.z *= factor;
        else
            farVertex *= factor;
        m_corners.farRing[i] = farVertex;
    }
    return true;
}

void ViewFrustum::split(const std::vector<float>& fractions, std::vector<ViewFrustum>& cascades) const
{
    cascades.resize(fractions.size());

    const auto& sourceNear = m_corners.nearRing;
    const auto& sourceFar = m_corners.farRing;

    for (std::size_t i = 0; i < fractions.size(); ++i) {
        FrustumCorners& target = cascades[i].m_corners;

        if (i == 0) {
            target.nearRing = sourceNear;
        } else {
            const float previous = fractions[i - 1];
            for (std::size_t k = 0; k < FrustumCorners::kRingSize; ++k)
                target.nearRing[k] = glm::mix(sourceNear[k], sourceFar[k], previous);
        }

        if (i == fractions.size() - 1) {
            target.farRing = sourceFar;
        } else {
            const float current = fractions[i];
            for (std::size_t k = 0; k < FrustumCorners::kRingSize; ++k)
                target.farRing[k] = glm::mix(sourceNear[k], sourceFar[k], current);
        }
    }
}

void ViewFrustum::toSpace(const glm::mat4& transform, ViewFrustum& target) const
{
    for (std::size_t k = 0; k < FrustumCorners::kRingSize; ++k) {
        target.m_corners.nearRing[k] = transformPoint(transform, m_corners.nearRing[k]);
        target.m_corners.farRing[k] = transformPoint(transform, m_corners.farRing[k]);
    }
}

FrustumBounds ViewFrustum::bounds() const
{
    FrustumBounds box;
    box.min = glm::vec3(std::numeric_limits<float>::max());
    box.max = glm::vec3(std::numeric_limits<float>::lowest());
    for (std::size_t k = 0; k < FrustumCorners::kRingSize; ++k) {
        box.min = glm::min(box.min, glm::min(m_corners.nearRing[k], m_corners.farRing[k]));
        box.max = glm::max(box.max, glm::max(m_corners.nearRing[k], m_corners.farRing[k]));
    }
    return box;
}
