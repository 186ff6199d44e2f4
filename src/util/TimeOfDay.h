// SPDX-License-Identifier: MIT
#pragma once

#include <ctime>
#include <optional>
#include <string>
#include <string_view>

// Wall-clock time of day with minute precision.
struct TimeOfDay {
    int hour { 12 };
    int minute { 0 };

    [[nodiscard]] static TimeOfDay fromHoursMinutes(int hour, int minute);
    [[nodiscard]] static TimeOfDay fromTm(const std::tm& localTime);
    // Accepts "H:MM" or "HH:MM" in 24h format.
    [[nodiscard]] static std::optional<TimeOfDay> parse(std::string_view text);

    [[nodiscard]] double fractionalHours() const;
    [[nodiscard]] std::string toString() const;

    bool operator==(const TimeOfDay& other) const { return hour == other.hour && minute == other.minute; }
    bool operator!=(const TimeOfDay& other) const { return !(*this == other); }
};
