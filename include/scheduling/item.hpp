#ifndef NUDGER_ITEM_HPP
#define NUDGER_ITEM_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace nudger {

enum class ExecutionKind {
    Query,      // prompt/answer, completes when the body returns
    Excursion   // opens auxiliary resources, completes when they are all closed
};

struct Item {
    std::string fn;
    double min_hours_wait = 3;
    std::optional<int> max_calls_per_day;
    std::optional<int> max_entries_per_day;
    std::optional<int> max_successes_per_day;
    bool lookup_posted_time = false;
    std::string dataset;            // empty: no user-visible dataset
    ExecutionKind kind = ExecutionKind::Query;

    // Used by the CLI's built-in bodies.
    std::string prompt;
    std::vector<std::string> command;

    bool hasDataset() const { return !dataset.empty(); }

    // Entries and successes caps are aliases; entries wins when both are set.
    std::optional<int> dailyCap() const {
        return max_entries_per_day ? max_entries_per_day : max_successes_per_day;
    }
};

struct ItemState {
    std::optional<double> last_called;
    int dismissals = 0;
    int calls_today = 0;
    std::string calls_day;          // logical date calls_today refers to
};

const char* executionKindName(ExecutionKind kind);
bool parseExecutionKind(const std::string& text, ExecutionKind& kind);

} // namespace nudger

#endif // NUDGER_ITEM_HPP
