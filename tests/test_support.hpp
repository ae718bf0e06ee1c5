#ifndef NUDGER_TEST_SUPPORT_HPP
#define NUDGER_TEST_SUPPORT_HPP

#include <ctime>
#include <deque>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "scheduling/scheduler.hpp"
#include "utils/logger.hpp"
#include "utils/time_utils.hpp"

namespace testsupport {

inline void quietLogger() {
    nudger::Logger::getInstance().setConsoleEnabled(false);
    nudger::Logger::getInstance().setMinLevel(nudger::LogLevel::ERROR);
}

// Unix time of a local wall-clock moment.
inline double localTime(int year, int month, int day, int hour, int minute = 0, int second = 0) {
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    tm.tm_isdst = -1;
    return static_cast<double>(std::mktime(&tm));
}

class FakeClock {
public:
    explicit FakeClock(double start) : now_(start) {}

    nudger::Clock clock() {
        return [this]() { return now_; };
    }

    double now() const { return now_; }
    void set(double t) { now_ = t; }
    void advance(double seconds) { now_ += seconds; }

private:
    double now_;
};

// Answers confirm() from a script; an exhausted script answers "no".
class ScriptedPrompter : public nudger::Prompter {
public:
    bool confirm(const std::string& question) override {
        questions.push_back(question);
        if (answers.empty()) return false;
        bool answer = answers.front();
        answers.pop_front();
        return answer;
    }

    std::deque<bool> answers;
    std::vector<std::string> questions;
};

inline std::string readFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

inline void writeFile(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

} // namespace testsupport

#endif // NUDGER_TEST_SUPPORT_HPP
