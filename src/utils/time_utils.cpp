#include "../include/utils/time_utils.hpp"

#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace nudger {
namespace timeutil {

namespace {

bool isDigitAt(const std::string& s, std::size_t i) {
    return i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]));
}

bool matchesDatestampAt(const std::string& s, std::size_t i) {
    if (i + 10 > s.size()) return false;
    for (std::size_t k = 0; k < 10; ++k) {
        if (k == 4 || k == 7) {
            if (s[i + k] != '-') return false;
        } else if (!isDigitAt(s, i + k)) {
            return false;
        }
    }
    return true;
}

int twoDigits(const std::string& s, std::size_t i) {
    return (s[i] - '0') * 10 + (s[i + 1] - '0');
}

} // namespace

double unixNow() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::microseconds>(now).count() / 1e6;
}

Clock systemClock() {
    return []() { return unixNow(); };
}

std::string formatDate(double t) {
    std::time_t secs = static_cast<std::time_t>(std::floor(t));
    std::tm tm{};
    localtime_r(&secs, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d");
    return oss.str();
}

std::string logicalDate(double t) {
    return formatDate(t - kDayBoundaryHour * 3600.0);
}

bool sameLogicalDay(double a, double b) {
    return logicalDate(a) == logicalDate(b);
}

std::string formatPosted(double t, bool high_precision) {
    std::ostringstream oss;
    if (high_precision) {
        oss << std::fixed << std::setprecision(7) << t;
    } else {
        oss << static_cast<long long>(std::floor(t));
    }
    return oss.str();
}

std::size_t findDatestamp(const std::string& text, std::size_t from) {
    for (std::size_t i = from; i + 10 <= text.size(); ++i) {
        if (matchesDatestampAt(text, i)) return i;
    }
    return std::string::npos;
}

std::size_t findLastDatestamp(const std::string& text) {
    if (text.size() < 10) return std::string::npos;
    for (std::size_t i = text.size() - 10 + 1; i-- > 0;) {
        if (matchesDatestampAt(text, i)) return i;
    }
    return std::string::npos;
}

std::optional<double> parseDatestamp(const std::string& text) {
    std::size_t pos = findDatestamp(text);
    if (pos == std::string::npos) return std::nullopt;

    std::tm tm{};
    tm.tm_year = std::atoi(text.substr(pos, 4).c_str()) - 1900;
    tm.tm_mon = twoDigits(text, pos + 5) - 1;
    tm.tm_mday = twoDigits(text, pos + 8);
    if (tm.tm_mon < 0 || tm.tm_mon > 11 || tm.tm_mday < 1 || tm.tm_mday > 31) {
        return std::nullopt;
    }

    std::size_t t = pos + 10;
    if (t + 6 <= text.size() && (text[t] == ' ' || text[t] == 'T') &&
        isDigitAt(text, t + 1) && isDigitAt(text, t + 2) && text[t + 3] == ':' &&
        isDigitAt(text, t + 4) && isDigitAt(text, t + 5)) {
        tm.tm_hour = twoDigits(text, t + 1);
        tm.tm_min = twoDigits(text, t + 4);
        if (t + 9 <= text.size() && text[t + 6] == ':' &&
            isDigitAt(text, t + 7) && isDigitAt(text, t + 8)) {
            tm.tm_sec = twoDigits(text, t + 7);
        }
    }
    tm.tm_isdst = -1;
    std::time_t result = std::mktime(&tm);
    if (result == static_cast<std::time_t>(-1)) return std::nullopt;
    return static_cast<double>(result);
}

std::optional<double> parseNumber(const std::string& text) {
    if (text.empty()) return std::nullopt;
    const char* begin = text.c_str();
    char* end = nullptr;
    double value = std::strtod(begin, &end);
    if (end == begin || *end != '\0' || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

} // namespace timeutil
} // namespace nudger
