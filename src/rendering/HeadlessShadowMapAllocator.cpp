// SPDX-License-Identifier: MIT
#include "rendering/HeadlessShadowMapAllocator.h"

#include <fmt/format.h>

#include <iostream>

HeadlessShadowMapAllocator::HeadlessShadowMapAllocator(std::uint64_t texelBudget)
    : m_texelBudget(texelBudget)
{
}

ShadowMapHandle HeadlessShadowMapAllocator::allocate(int resolution)
{
    if (resolution < kMinResolution || resolution > kMaxResolution)
        throw ShadowMapAllocationError(fmt::format("Unsupported shadow map resolution {}", resolution));

    const std::uint64_t texels = static_cast<std::uint64_t>(resolution) * static_cast<std::uint64_t>(resolution);
    if (m_texelBudget != 0 && m_texelsInUse + texels > m_texelBudget) {
        throw ShadowMapAllocationError(fmt::format("Shadow map budget exhausted: {}x{} requested, {} of {} texels in use",
            resolution, resolution, m_texelsInUse, m_texelBudget));
    }

    ShadowMapHandle handle;
    handle.texture = m_nextTexture++;
    handle.resolution = resolution;
    m_live.emplace(handle.texture, resolution);
    m_texelsInUse += texels;
    ++m_allocationCount;
    return handle;
}

void HeadlessShadowMapAllocator::release(const ShadowMapHandle& handle)
{
    auto it = m_live.find(handle.texture);
    if (it == m_live.end()) {
        ++m_invalidReleaseCount;
        std::cerr << fmt::format("[ShadowMaps] Release of unknown shadow map {}\n", handle.texture);
        return;
    }

    const auto resolution = static_cast<std::uint64_t>(it->second);
    m_texelsInUse -= resolution * resolution;
    m_live.erase(it);
    ++m_releaseCount;
}
