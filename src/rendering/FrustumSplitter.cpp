// SPDX-License-Identifier: MIT
#include "rendering/FrustumSplitter.h"

#include <fmt/format.h>

#include <glm/common.hpp>

#include <cmath>
#include <iostream>
#include <utility>

FrustumSplitter::FrustumSplitter(Settings settings)
    : m_settings(std::move(settings))
{
}

void FrustumSplitter::setSettings(Settings settings)
{
    m_settings = std::move(settings);
}

std::optional<std::vector<float>> FrustumSplitter::split(int cascades, float nearPlane, float farPlane) const
{
    if (cascades < 1 || nearPlane <= 0.0f || farPlane <= nearPlane)
        return std::nullopt;

    switch (m_settings.scheme) {
    case SplitScheme::Uniform:
        return uniformSplit(cascades, nearPlane, farPlane);
    case SplitScheme::Logarithmic:
        return logarithmicSplit(cascades, nearPlane, farPlane);
    case SplitScheme::Practical:
        return practicalSplit(cascades, nearPlane, farPlane, m_settings.lambda);
    case SplitScheme::Custom:
        break;
    }

    if (!m_settings.customCallback) {
        std::cerr << "[CSM] Custom split scheme callback not defined.\n";
        return std::nullopt;
    }

    std::vector<float> fractions = m_settings.customCallback(cascades, nearPlane, farPlane);
    if (!isValidSplit(fractions, cascades)) {
        std::cerr << fmt::format("[CSM] Custom split callback returned {} values for {} cascades; expected increasing fractions ending in 1.\n",
            fractions.size(), cascades);
        return std::nullopt;
    }
    return fractions;
}

std::vector<float> FrustumSplitter::uniformSplit(int cascades, float nearPlane, float farPlane)
{
    std::vector<float> fractions;
    fractions.reserve(static_cast<std::size_t>(cascades));

    const float step = (farPlane - nearPlane) / static_cast<float>(cascades);
    const float invFar = 1.0f / farPlane;
    for (int i = 1; i < cascades; ++i)
        fractions.push_back((nearPlane + step * static_cast<float>(i)) * invFar);

    fractions.push_back(1.0f);
    return fractions;
}

std::vector<float> FrustumSplitter::logarithmicSplit(int cascades, float nearPlane, float farPlane)
{
    std::vector<float> fractions;
    fractions.reserve(static_cast<std::size_t>(cascades));

    const float logBase = farPlane / nearPlane;
    const float invFar = 1.0f / farPlane;
    for (int i = 1; i < cascades; ++i)
        fractions.push_back(nearPlane * std::pow(logBase, static_cast<float>(i) / static_cast<float>(cascades)) * invFar);

    fractions.push_back(1.0f);
    return fractions;
}

std::vector<float> FrustumSplitter::practicalSplit(int cascades, float nearPlane, float farPlane, float lambda)
{
    const std::vector<float> uniform = uniformSplit(cascades, nearPlane, farPlane);
    const std::vector<float> logarithmic = logarithmicSplit(cascades, nearPlane, farPlane);
    const float weight = glm::clamp(lambda, 0.0f, 1.0f);

    std::vector<float> fractions;
    fractions.reserve(static_cast<std::size_t>(cascades));
    for (int i = 1; i < cascades; ++i) {
        const auto index = static_cast<std::size_t>(i - 1);
        fractions.push_back(glm::mix(uniform[index], logarithmic[index], weight));
    }

    fractions.push_back(1.0f);
    return fractions;
}

bool FrustumSplitter::isValidSplit(const std::vector<float>& fractions, int cascades)
{
    if (cascades < 1 || fractions.size() != static_cast<std::size_t>(cascades))
        return false;
    if (fractions.back() != 1.0f)
        return false;

    float previous = 0.0f;
    for (float value : fractions) {
        if (!(value > previous) || value > 1.0f)
            return false;
        previous = value;
    }
    return true;
}

const char* toString(SplitScheme scheme)
{
    switch (scheme) {
    case SplitScheme::Uniform:
        return "uniform";
    case SplitScheme::Logarithmic:
        return "logarithmic";
    case SplitScheme::Practical:
        return "practical";
    case SplitScheme::Custom:
        return "custom";
    }
    return "unknown";
}

std::optional<SplitScheme> splitSchemeFromString(const std::string& name)
{
    if (name == "uniform")
        return SplitScheme::Uniform;
    if (name == "logarithmic")
        return SplitScheme::Logarithmic;
    if (name == "practical")
        return SplitScheme::Practical;
    if (name == "custom")
        return SplitScheme::Custom;
    return std::nullopt;
}
