// SPDX-License-Identifier: MIT
#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

enum class SplitScheme {
    Uniform,
    Logarithmic,
    Practical,
    Custom
};

// Produces cascade boundaries as fractions of the far distance. Every result is strictly
// increasing, lies in (0, 1] and ends with exactly 1.
class FrustumSplitter {
public:
    static constexpr float kDefaultLambda = 0.5f;

    using CustomSplitCallback = std::function<std::vector<float>(int cascades, float nearPlane, float farPlane)>;

    struct Settings {
        SplitScheme scheme { SplitScheme::Practical };
        float lambda { kDefaultLambda };
        CustomSplitCallback customCallback;
    };

    FrustumSplitter() = default;
    explicit FrustumSplitter(Settings settings);

    void setSettings(Settings settings);
    [[nodiscard]] const Settings& settings() const { return m_settings; }

    // Empty when the inputs are degenerate or a custom scheme has no usable callback.
    [[nodiscard]] std::optional<std::vector<float>> split(int cascades, float nearPlane, float farPlane) const;

    [[nodiscard]] static std::vector<float> uniformSplit(int cascades, float nearPlane, float farPlane);
    [[nodiscard]] static std::vector<float> logarithmicSplit(int cascades, float nearPlane, float farPlane);
    [[nodiscard]] static std::vector<float> practicalSplit(int cascades, float nearPlane, float farPlane, float lambda);

    [[nodiscard]] static bool isValidSplit(const std::vector<float>& fractions, int cascades);

private:
    Settings m_settings {};
};

[[nodiscard]] const char* toString(SplitScheme scheme);
[[nodiscard]] std::optional<SplitScheme> splitSchemeFromString(const std::string& name);
