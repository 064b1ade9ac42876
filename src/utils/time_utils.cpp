#include "utils/time_utils.h"
#include "logger.h"
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <stdexcept>

namespace pem {
namespace utils {

namespace {

bool allDigits(const std::string& text, size_t pos, size_t count) {
    if (pos + count > text.size()) {
        return false;
    }
    for (size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return false;
        }
    }
    return true;
}

int field(const std::string& text, size_t pos, size_t count) {
    return std::stoi(text.substr(pos, count));
}

std::tm toLocal(Timestamp tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm local{};
    localtime_r(&t, &local);
    return local;
}

std::string format(Timestamp tp, const char* pattern) {
    std::tm local = toLocal(tp);
    char buffer[64];
    size_t written = std::strftime(buffer, sizeof(buffer), pattern, &local);
    return std::string(buffer, written);
}

} // namespace

std::string applyTimezone(const std::string& name) {
    std::string zone = name;
    if (!zone.empty() && zone.front() == ':') {
        zone.erase(0, 1);
    }

    bool usable = false;
    if (zone.empty() || zone == "UTC") {
        zone = "UTC";
        usable = true;
    } else if (zone.find("..") == std::string::npos &&
               std::filesystem::exists(std::filesystem::path("/usr/share/zoneinfo") / zone)) {
        usable = true;
    } else {
        // POSIX rule strings such as "CET-1CEST" carry an explicit offset
        for (char c : zone) {
            if (std::isdigit(static_cast<unsigned char>(c))) {
                usable = true;
                break;
            }
        }
    }

    if (!usable) {
        LOG_WARN("Time", "Unknown timezone '" + name + "', falling back to UTC");
        zone = "UTC";
    }

    setenv("TZ", zone.c_str(), 1);
    tzset();
    return zone;
}

std::string formatTimestamp(Timestamp tp) {
    return format(tp, "%Y-%m-%d %H:%M:%S%z");
}

std::string formatCompactTimestamp(Timestamp tp) {
    return format(tp, "%Y%m%dT%H%M%S%z");
}

std::optional<Timestamp> parseCompactTimestamp(const std::string& text) {
    // YYYYMMDDTHHMMSS followed by Z or +HHMM / -HHMM
    if (text.size() != 16 && text.size() != 20) {
        return std::nullopt;
    }
    if (!allDigits(text, 0, 8) || text[8] != 'T' || !allDigits(text, 9, 6)) {
        return std::nullopt;
    }

    long offsetSeconds = 0;
    if (text.size() == 16) {
        if (text[15] != 'Z') {
            return std::nullopt;
        }
    } else {
        char sign = text[15];
        if ((sign != '+' && sign != '-') || !allDigits(text, 16, 4)) {
            return std::nullopt;
        }
        int hours = field(text, 16, 2);
        int minutes = field(text, 18, 2);
        if (hours > 23 || minutes > 59) {
            return std::nullopt;
        }
        offsetSeconds = (hours * 60L + minutes) * 60L;
        if (sign == '-') {
            offsetSeconds = -offsetSeconds;
        }
    }

    std::tm fields{};
    fields.tm_year = field(text, 0, 4) - 1900;
    fields.tm_mon = field(text, 4, 2) - 1;
    fields.tm_mday = field(text, 6, 2);
    fields.tm_hour = field(text, 9, 2);
    fields.tm_min = field(text, 11, 2);
    fields.tm_sec = field(text, 13, 2);

    if (fields.tm_mon < 0 || fields.tm_mon > 11 || fields.tm_mday < 1 || fields.tm_mday > 31 ||
        fields.tm_hour > 23 || fields.tm_min > 59 || fields.tm_sec > 60) {
        return std::nullopt;
    }

    std::time_t utc = timegm(&fields);
    if (utc == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }

    return std::chrono::system_clock::from_time_t(utc - offsetSeconds);
}

std::chrono::system_clock::duration minutesToDuration(double minutes) {
    if (!std::isfinite(minutes) || minutes < 0 || minutes > kMaxWindowMinutes) {
        throw std::out_of_range("minutes out of range: " + std::to_string(minutes));
    }
    return std::chrono::duration_cast<std::chrono::system_clock::duration>(
        std::chrono::duration<double, std::ratio<60>>(minutes));
}

double secondsBetween(Timestamp from, Timestamp to) {
    return std::chrono::duration<double>(to - from).count();
}

} // namespace utils
} // namespace pem
