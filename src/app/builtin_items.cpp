#include "../include/app/builtin_items.hpp"
#include "../include/storage/event_log.hpp"
#include "../include/utils/logger.hpp"
#include "../include/utils/process.hpp"

#include <cmath>
#include <ctime>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace nudger {

namespace {

std::string localTimestamp(double t) {
    std::time_t secs = static_cast<std::time_t>(std::floor(t));
    std::tm tm{};
    localtime_r(&secs, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

} // namespace

void registerBuiltinBodies(Scheduler& scheduler, const ItemRegistry& registry,
                           ConsolePrompter& prompter, Clock clock) {
    for (const auto& fn : registry.ids()) {
        const Item& item = registry.require(fn);

        if (item.kind == ExecutionKind::Query) {
            scheduler.setQueryBody(fn, [&prompter, clock](const Item& it) {
                std::string answer;
                const std::string question = it.prompt.empty() ? it.fn + "?" : it.prompt;
                RunResult result = prompter.ask(question, answer);
                if (result != RunResult::Success || !it.hasDataset()) {
                    return result;
                }
                const double now = clock();
                if (!EventLog::appendAt(it.dataset, {localTimestamp(now), answer}, now)) {
                    Logger::getInstance().warning("Builtin: answer for " + it.fn + " not recorded");
                    return RunResult::Skipped;
                }
                return RunResult::Success;
            });
            continue;
        }

        scheduler.setExcursionBody(fn, [](const Item& it, Excursion& excursion) {
            if (!Process::isExecutable(it.command.front())) {
                throw std::runtime_error("command not found: " + it.command.front());
            }
            pid_t pid = Process::spawn(it.command);
            if (pid < 0) {
                throw std::runtime_error("cannot start " + it.command.front());
            }
            excursion.addResource(std::make_shared<ProcessResource>(pid));
            return RunResult::Success;
        });
    }
}

} // namespace nudger
