// SPDX-License-Identifier: MIT
#pragma once

#include "rendering/ShadowMapAllocator.h"

#include <cstdint>
#include <unordered_map>

// Hands out texture names without a GPU context, charging each map against a texel budget.
// Used by offline tools; a budget of 0 means unlimited.
class HeadlessShadowMapAllocator : public ShadowMapAllocator {
public:
    static constexpr int kMinResolution = 32;
    static constexpr int kMaxResolution = 16384;

    explicit HeadlessShadowMapAllocator(std::uint64_t texelBudget = 0);

    [[nodiscard]] ShadowMapHandle allocate(int resolution) override;
    void release(const ShadowMapHandle& handle) override;

    [[nodiscard]] std::size_t liveCount() const { return m_live.size(); }
    [[nodiscard]] std::uint64_t texelsInUse() const { return m_texelsInUse; }
    [[nodiscard]] std::uint64_t texelBudget() const { return m_texelBudget; }
    [[nodiscard]] std::uint64_t allocationCount() const { return m_allocationCount; }
    [[nodiscard]] std::uint64_t releaseCount() const { return m_releaseCount; }
    [[nodiscard]] std::uint64_t invalidReleaseCount() const { return m_invalidReleaseCount; }
    [[nodiscard]] bool isLive(GLuint texture) const { return m_live.find(texture) != m_live.end(); }

private:
    std::uint64_t m_texelBudget { 0 };
    std::uint64_t m_texelsInUse { 0 };
    std::uint64_t m_allocationCount { 0 };
    std::uint64_t m_releaseCount { 0 };
    std::uint64_t m_invalidReleaseCount { 0 };
    GLuint m_nextTexture { 1 };
    std::unordered_map<GLuint, int> m_live;
};
