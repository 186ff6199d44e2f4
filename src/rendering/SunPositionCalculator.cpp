// SPDX-License-Identifier: MIT
#include "rendering/SunPositionCalculator.h"

#include <fmt/format.h>

#include <glm/common.hpp>
#include <glm/geometric.hpp>
#include <glm/gtc/constants.hpp>

#include <cmath>
#include <stdexcept>

SunPositionCalculator::SunPositionCalculator(const Settings& settings)
{
    setSettings(settings);
}

void SunPositionCalculator::setSettings(const Settings& settings)
{
    if (settings.sunriseHour < 0.0f || settings.sunsetHour > 24.0f)
        throw std::invalid_argument(fmt::format("Sun hours out of range: sunrise={} sunset={}", settings.sunriseHour, settings.sunsetHour));
    if (settings.sunsetHour <= settings.sunriseHour)
        throw std::invalid_argument(fmt::format("Sunset ({}) must come after sunrise ({})", settings.sunsetHour, settings.sunriseHour));
    m_settings = settings;
}

float SunPositionCalculator::sunAngle(double fractionalHours) const
{
    const double sunrise = m_settings.sunriseHour;
    const double sunset = m_settings.sunsetHour;

    if (fractionalHours >= sunrise && fractionalHours <= sunset)
        return static_cast<float>((fractionalHours - sunrise) / (sunset - sunrise) * glm::pi<double>());
    if (fractionalHours < sunrise)
        return -m_settings.nightAngleOffset;
    return glm::pi<float>() + m_settings.nightAngleOffset;
}

float SunPositionCalculator::sunAngle(const TimeOfDay& time) const
{
    return sunAngle(time.fractionalHours());
}

glm::vec3 SunPositionCalculator::lightDirection(const TimeOfDay& time, float wobble) const
{
    return lightDirectionFromAngle(sunAngle(time), wobble);
}

glm::vec3 SunPositionCalculator::lightDirectionFromAngle(float sunAngle, float wobble)
{
    const float angle = sunAngle + glm::clamp(wobble, -kMaxWobble, kMaxWobble);
    // The clamped vertical term keeps the light off the horizon so look-at stays well defined.
    return glm::normalize(glm::vec3(-std::cos(angle), -std::max(kMinVerticalComponent, std::sin(angle)), 0.5f));
}

float SunPositionCalculator::wobbleForElapsed(double elapsedSeconds)
{
    return static_cast<float>(std::sin(elapsedSeconds * 0.1)) * kMaxWobble;
}

float SunPositionCalculator::shadowOpacity(const TimeOfDay& time)
{
    if (time.hour < 6 || time.hour > 20)
        return 0.8f;
    if (time.hour < 8 || time.hour > 18)
        return 0.7f;
    return 0.6f;
}
