// SPDX-License-Identifier: MIT
#pragma once

#include <glm/mat4x4.hpp>
#include <glm/vec3.hpp>

#include <array>
#include <vector>

//  3 --- 0   corner order for both rings
//  |     |
//  2 --- 1
struct FrustumCorners {
    static constexpr int kRingSize = 4;

    enum Corner {
        TopRight = 0,
        BottomRight = 1,
        BottomLeft = 2,
        TopLeft = 3
    };

    std::array<glm::vec3, kRingSize> nearRing {};
    std::array<glm::vec3, kRingSize> farRing {};
};

struct FrustumBounds {
    glm::vec3 min { 0.0f };
    glm::vec3 max { 0.0f };

    [[nodiscard]] glm::vec3 center() const { return (min + max) * 0.5f; }
};

class ViewFrustum {
public:
    ViewFrustum() = default;
    explicit ViewFrustum(const FrustumCorners& corners);

    // Rebuilds the view-space corners from a projection matrix, pulling the far ring in to maxFar.
    // Returns false and leaves the corners untouched if the projection cannot be inverted.
    bool setFromProjection(const glm::mat4& projection, float maxFar);

    // Slices this frustum at the given fractions of its depth, one cascade per fraction.
    void split(const std::vector<float>& fractions, std::vector<ViewFrustum>& cascades) const;

    void toSpace(const glm::mat4& transform, ViewFrustum& target) const;

    [[nodiscard]] FrustumBounds bounds() const;

    [[nodiscard]] const FrustumCorners& corners() const { return m_corners; }
    [[nodiscard]] const glm::vec3& nearCorner(int index) const { return m_corners.nearRing[static_cast<std::size_t>(index)]; }
    [[nodiscard]] const glm::vec3& farCorner(int index) const { return m_corners.farRing[static_cast<std::size_t>(index)]; }

    [[nodiscard]] static bool isOrthographic(const glm::mat4& projection);

private:
    FrustumCorners m_corners {};
};
