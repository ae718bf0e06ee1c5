#ifndef NUDGER_LOGGER_HPP
#define NUDGER_LOGGER_HPP

#include <string>
#include <fstream>
#include <mutex>
#include <iostream>

namespace nudger {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

class Logger {
public:
    static Logger& getInstance();
    
    void log(LogLevel level, const std::string& message);
    void debug(const std::string& message);
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);
    
    void setLogFile(const std::string& filename);
    void setMinLevel(LogLevel level);
    void setConsoleEnabled(bool enabled);

    // Accepts "debug", "info", "warning"/"warn", "error" (case-insensitive).
    static bool parseLevel(const std::string& text, LogLevel& level);
    
private:
    Logger() = default;
    ~Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    
    std::mutex mutex_;
    std::ofstream log_file_;
    bool file_logging_enabled_ = false;
    bool console_enabled_ = true;
    LogLevel min_level_ = LogLevel::INFO;
    
    std::string levelToString(LogLevel level);
    std::string getCurrentTime();
};

} // namespace nudger

#endif // NUDGER_LOGGER_HPP
