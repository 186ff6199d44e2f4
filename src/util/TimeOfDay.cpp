// SPDX-License-Identifier: MIT
#include "util/TimeOfDay.h"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace {

[[nodiscard]] std::optional<int> parseDigits(std::string_view text)
{
    if (text.empty() || text.size() > 2)
        return std::nullopt;
    int value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c)))
            return std::nullopt;
        value = value * 10 + (c - '0');
    }
    return value;
}

} // namespace

TimeOfDay TimeOfDay::fromHoursMinutes(int hour, int minute)
{
    if (hour < 0 || hour > 23 || minute < 0 || minute > 59)
        throw std::invalid_argument(fmt::format("Invalid time of day {}:{:02}", hour, minute));
    return TimeOfDay { hour, minute };
}

TimeOfDay TimeOfDay::fromTm(const std::tm& localTime)
{
    return TimeOfDay { std::clamp(localTime.tm_hour, 0, 23), std::clamp(localTime.tm_min, 0, 59) };
}

std::optional<TimeOfDay> TimeOfDay::parse(std::string_view text)
{
    const std::size_t colon = text.find(':');
    if (colon == std::string_view::npos)
        return std::nullopt;

    const std::string_view minutePart = text.substr(colon + 1);
    if (minutePart.size() != 2)
        return std::nullopt;

    const std::optional<int> hour = parseDigits(text.substr(0, colon));
    const std::optional<int> minute = parseDigits(minutePart);
    if (!hour || !minute || *hour > 23 || *minute > 59)
        return std::nullopt;

    return TimeOfDay { *hour, *minute };
}

double TimeOfDay::fractionalHours() const
{
    return static_cast<double>(hour) + static_cast<double>(minute) / 60.0;
}

std::string TimeOfDay::toString() const
{
    return fmt::format("{:02}:{:02}", hour, minute);
}
