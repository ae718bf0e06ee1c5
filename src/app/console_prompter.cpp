#include "../include/app/console_prompter.hpp"

#include <algorithm>
#include <cctype>

namespace nudger {

namespace {

std::string trim(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

} // namespace

ConsolePrompter::ConsolePrompter(std::istream& in, std::ostream& out) : in_(in), out_(out) {
}

bool ConsolePrompter::confirm(const std::string& question) {
    while (true) {
        out_ << question << " [y/n] " << std::flush;
        std::string line;
        if (!std::getline(in_, line)) return false;
        line = trim(line);
        if (line == "y" || line == "yes") return true;
        if (line == "n" || line == "no") return false;
    }
}

RunResult ConsolePrompter::ask(const std::string& question, std::string& answer) {
    out_ << question << " " << std::flush;
    std::string line;
    if (!std::getline(in_, line)) {
        out_ << "\n";
        return RunResult::Cancelled;
    }
    line = trim(line);
    if (line == kSkipInput) return RunResult::Skipped;
    if (line == kCancelInput) return RunResult::Cancelled;
    answer = line;
    return RunResult::Success;
}

} // namespace nudger
