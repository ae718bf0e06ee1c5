#ifndef NUDGER_TIME_UTILS_HPP
#define NUDGER_TIME_UTILS_HPP

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace nudger {

// Wall-clock source in unix seconds. Injected everywhere "now" matters.
using Clock = std::function<double()>;

namespace timeutil {

// A day starts at 05:00 local time, not at midnight.
constexpr int kDayBoundaryHour = 5;

double unixNow();
Clock systemClock();

// Local YYYY-MM-DD of the instant t.
std::string formatDate(double t);

// Local YYYY-MM-DD of the logical day containing t (05:00 boundary).
std::string logicalDate(double t);

bool sameLogicalDay(double a, double b);

// Field 0 of an EventLog record.
std::string formatPosted(double t, bool high_precision);

// Locates the first (or last) YYYY-MM-DD substring; returns npos when absent.
std::size_t findDatestamp(const std::string& text, std::size_t from = 0);
std::size_t findLastDatestamp(const std::string& text);

// "YYYY-MM-DD", optionally followed by " HH:MM" or " HH:MM:SS" (also 'T').
// Interpreted in local time.
std::optional<double> parseDatestamp(const std::string& text);

std::optional<double> parseNumber(const std::string& text);

} // namespace timeutil
} // namespace nudger

#endif // NUDGER_TIME_UTILS_HPP
