// SPDX-License-Identifier: MIT
#include "rendering/CascadeFragmentSelector.h"

namespace CascadeFragmentSelector {

std::vector<glm::vec2> depthIntervals(const std::vector<float>& splits)
{
    std::vector<glm::vec2> intervals;
    intervals.reserve(splits.size());
    float previous = 0.0f;
    for (float split : splits) {
        intervals.emplace_back(previous, split);
        previous = split;
    }
    return intervals;
}

float linearDepth(float viewDepth, float cameraNear, float shadowFar)
{
    const float range = shadowFar - cameraNear;
    if (range <= 0.0f)
        return 0.0f;
    return (viewDepth - cameraNear) / range;
}

int selectCascade(float linearDepth, const std::vector<float>& splits)
{
    if (splits.empty())
        return 0;

    const int last = static_cast<int>(splits.size()) - 1;
    for (int i = 0; i < last; ++i) {
        if (linearDepth < splits[static_cast<std::size_t>(i)])
            return i;
    }
    return last;
}

int selectCascadeForViewDepth(float viewDepth, float cameraNear, float shadowFar, const std::vector<float>& splits)
{
    return selectCascade(linearDepth(viewDepth, cameraNear, shadowFar), splits);
}

} // namespace CascadeFragmentSelector
