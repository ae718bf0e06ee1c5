#ifndef NUDGER_CONSOLE_PROMPTER_HPP
#define NUDGER_CONSOLE_PROMPTER_HPP

#include <iostream>
#include <string>
#include "../scheduling/scheduler.hpp"

namespace nudger {

// Line-based prompts on a terminal. "skip" skips the item, "cancel" or
// end of input cancels it.
class ConsolePrompter : public Prompter {
public:
    static constexpr const char* kSkipInput = "skip";
    static constexpr const char* kCancelInput = "cancel";

    ConsolePrompter(std::istream& in = std::cin, std::ostream& out = std::cout);

    bool confirm(const std::string& question) override;

    // Success with the answer in `answer`, or Skipped / Cancelled.
    RunResult ask(const std::string& question, std::string& answer);

private:
    std::istream& in_;
    std::ostream& out_;
};

} // namespace nudger

#endif // NUDGER_CONSOLE_PROMPTER_HPP
