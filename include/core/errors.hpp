#ifndef NUDGER_ERRORS_HPP
#define NUDGER_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace nudger {

// Unregistered item, duplicate registration, invalid configuration value.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

// Variable log rows without exactly (posted, name, value).
class CorruptLogError : public ConfigurationError {
public:
    explicit CorruptLogError(const std::string& what) : ConfigurationError(what) {}
};

class EventLogError : public std::runtime_error {
public:
    explicit EventLogError(const std::string& what) : std::runtime_error(what) {}
};

// Raised when scheduling decisions are requested before MemoryStore recovery.
class StateNotRecoveredError : public std::logic_error {
public:
    explicit StateNotRecoveredError(const std::string& what) : std::logic_error(what) {}
};

} // namespace nudger

#endif // NUDGER_ERRORS_HPP
