#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace hs::util {

using Timestamp = std::chrono::sys_seconds;
using Date = std::chrono::sys_days;

inline Date dateOf(const Timestamp ts) { return std::chrono::floor<std::chrono::days>(ts); }

inline Timestamp startOf(const Date d) { return Timestamp{d.time_since_epoch()}; }

inline std::string formatTimestamp(const Timestamp ts) {
    const std::time_t t = std::chrono::system_clock::to_time_t(ts);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ"); // ISO 8601 UTC
    return oss.str();
}

inline std::string formatDate(const Date d) {
    const std::chrono::year_month_day ymd{d};
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << static_cast<int>(ymd.year()) << '-'
        << std::setw(2) << static_cast<unsigned>(ymd.month()) << '-'
        << std::setw(2) << static_cast<unsigned>(ymd.day());
    return oss.str();
}

// Accepts "YYYY-MM-DD", "YYYY-MM-DDTHH:MM:SS[.fff][Z]" and "YYYY-MM-DD HH:MM:SS".
inline std::optional<Timestamp> parseTimestamp(const std::string_view text) {
    if (text.size() < 10) return std::nullopt;

    std::tm tm{};
    std::istringstream ss(std::string(text.substr(0, 10)));
    ss >> std::get_time(&tm, "%Y-%m-%d");
    if (ss.fail()) return std::nullopt;

    if (text.size() >= 19 && (text[10] == 'T' || text[10] == ' ')) {
        std::istringstream tss(std::string(text.substr(11, 8)));
        tss >> std::get_time(&tm, "%H:%M:%S");
        if (tss.fail()) return std::nullopt;
    }

    return std::chrono::time_point_cast<std::chrono::seconds>(
        std::chrono::system_clock::from_time_t(timegm(&tm)));
}

inline std::optional<Date> parseDate(const std::string_view text) {
    const auto ts = parseTimestamp(text);
    if (!ts) return std::nullopt;
    return dateOf(*ts);
}

// 1 = Monday ... 7 = Sunday
inline unsigned int isoWeekday(const Date d) { return std::chrono::weekday{d}.iso_encoding(); }

struct Clock {
    virtual ~Clock() = default;

    [[nodiscard]] virtual Timestamp now() const = 0;

    // Local calendar date; records are keyed by the user's local dates.
    [[nodiscard]] virtual Date today() const { return dateOf(now()); }

    [[nodiscard]] virtual unsigned int localHour(Timestamp ts) const = 0;
};

struct SystemClock final : Clock {
    [[nodiscard]] Timestamp now() const override {
        return std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
    }

    [[nodiscard]] Date today() const override {
        const std::time_t t = std::chrono::system_clock::to_time_t(now());
        std::tm tm{};
        localtime_r(&t, &tm);
        return std::chrono::year_month_day{std::chrono::year{tm.tm_year + 1900},
                                           std::chrono::month{static_cast<unsigned>(tm.tm_mon + 1)},
                                           std::chrono::day{static_cast<unsigned>(tm.tm_mday)}};
    }

    [[nodiscard]] unsigned int localHour(const Timestamp ts) const override {
        const std::time_t t = std::chrono::system_clock::to_time_t(ts);
        std::tm tm{};
        localtime_r(&t, &tm);
        return static_cast<unsigned int>(tm.tm_hour);
    }
};

} // namespace hs::util
