// SPDX-License-Identifier: MIT
#pragma once

#include "util/TimeOfDay.h"

#include <glm/vec3.hpp>

class SunPositionCalculator {
public:
    static constexpr float kDefaultSunriseHour = 6.0f;
    static constexpr float kDefaultSunsetHour = 20.0f;
    static constexpr float kDefaultNightAngleOffset = 0.2f;
    static constexpr float kMinVerticalComponent = 0.1f;
    static constexpr float kMaxWobble = 0.001f;

    struct Settings {
        float sunriseHour { kDefaultSunriseHour };
        float sunsetHour { kDefaultSunsetHour };
        // Radians below the horizon the sun is pinned to outside daylight.
        float nightAngleOffset { kDefaultNightAngleOffset };
    };

    SunPositionCalculator() = default;
    explicit SunPositionCalculator(const Settings& settings);

    void setSettings(const Settings& settings);
    [[nodiscard]] const Settings& settings() const { return m_settings; }

    // 0 at sunrise, pi at sunset. Night is pinned just below the horizon on either side.
    [[nodiscard]] float sunAngle(double fractionalHours) const;
    [[nodiscard]] float sunAngle(const TimeOfDay& time) const;

    [[nodiscard]] glm::vec3 lightDirection(const TimeOfDay& time, float wobble = 0.0f) const;
    [[nodiscard]] static glm::vec3 lightDirectionFromAngle(float sunAngle, float wobble = 0.0f);

    // Small slow oscillation added to the sun angle, bounded by kMaxWobble.
    [[nodiscard]] static float wobbleForElapsed(double elapsedSeconds);

    [[nodiscard]] static float shadowOpacity(const TimeOfDay& time);

private:
    Settings m_settings {};
};
