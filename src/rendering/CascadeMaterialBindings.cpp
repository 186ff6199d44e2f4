// SPDX-License-Identifier: MIT
#include "rendering/CascadeMaterialBindings.h"

#include <fmt/format.h>

#include <algorithm>

const CascadeMaterialBindings::MaterialParams& CascadeMaterialBindings::setupMaterial(MaterialId id)
{
    auto [it, inserted] = m_materials.try_emplace(id);
    if (inserted)
        apply(it->second);
    return it->second;
}

bool CascadeMaterialBindings::releaseMaterial(MaterialId id)
{
    return m_materials.erase(id) > 0;
}

void CascadeMaterialBindings::clear()
{
    m_materials.clear();
    m_state = FrameState {};
}

void CascadeMaterialBindings::update(const FrameState& state)
{
    m_state = state;
    for (auto& entry : m_materials)
        apply(entry.second);
}

const CascadeMaterialBindings::MaterialParams* CascadeMaterialBindings::find(MaterialId id) const
{
    auto it = m_materials.find(id);
    return it == m_materials.end() ? nullptr : &it->second;
}

bool CascadeMaterialBindings::consumeRecompile(MaterialId id)
{
    auto it = m_materials.find(id);
    if (it == m_materials.end())
        return false;
    const bool recompile = it->second.needsRecompile;
    it->second.needsRecompile = false;
    return recompile;
}

std::string CascadeMaterialBindings::buildPreamble(int cascadeCount, bool fade)
{
    std::string preamble = fmt::format("#define USE_CSM 1\n#define CSM_CASCADES {}\n", cascadeCount);
    if (fade)
        preamble += "#define CSM_FADE\n";
    return preamble;
}

CascadeUniformBlock CascadeMaterialBindings::buildBlock(const FrameState& state)
{
    CascadeUniformBlock block;
    const std::size_t count = std::min(state.intervals.size(), static_cast<std::size_t>(kMaxShadowCascades));
    for (std::size_t i = 0; i < count; ++i) {
        const float texel = i < state.texelSizes.size() ? state.texelSizes[i] : 0.0f;
        block.cascadeIntervals[i] = glm::vec4(state.intervals[i], texel, 0.0f);
        if (i < state.viewProjections.size())
            block.cascadeViewProj[i] = state.viewProjections[i];
    }
    block.cascadeParams = glm::vec4(state.cameraNear, state.shadowFar, state.shadowOpacity, static_cast<float>(count));
    block.lightDirection = glm::vec4(state.lightDirection, 0.0f);
    return block;
}

void CascadeMaterialBindings::apply(MaterialParams& params) const
{
    const int cascadeCount = static_cast<int>(std::min(m_state.intervals.size(), static_cast<std::size_t>(kMaxShadowCascades)));
    if (params.preamble.empty() || params.cascadeCount != cascadeCount || params.fade != m_state.fade) {
        params.cascadeCount = cascadeCount;
        params.fade = m_state.fade;
        params.preamble = buildPreamble(cascadeCount, m_state.fade);
        params.needsRecompile = true;
    }
    params.block = buildBlock(m_state);
}
