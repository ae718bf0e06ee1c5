#include "../include/presence/idle_probe.hpp"
#include "../include/utils/logger.hpp"
#include "../include/utils/process.hpp"

#include <stdexcept>
#include <utility>

namespace nudger {

CommandIdleProbe::CommandIdleProbe(std::vector<std::string> command, double units_per_second,
                                   int timeout_ms)
    : command_(std::move(command)), units_per_second_(units_per_second), timeout_ms_(timeout_ms) {
    if (command_.empty()) {
        throw std::invalid_argument("CommandIdleProbe: empty command");
    }
    if (units_per_second_ <= 0) {
        units_per_second_ = 1;
    }
}

double CommandIdleProbe::currentIdleSeconds() {
    Process::Result result = Process::run(command_, timeout_ms_);
    if (!result.started || result.timed_out || result.exit_code != 0) {
        throw std::runtime_error(command_[0] + " failed (exit " +
                                 std::to_string(result.exit_code) + ")");
    }
    std::string text = result.out;
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r' || text.back() == ' ')) {
        text.pop_back();
    }
    auto value = timeutil::parseNumber(text);
    if (!value) {
        throw std::runtime_error(command_[0] + " printed '" + text + "'");
    }
    return *value / units_per_second_;
}

std::string CommandIdleProbe::name() const {
    return "command:" + command_[0];
}

InternalIdleProbe::InternalIdleProbe(Clock clock) : clock_(std::move(clock)), last_activity_(clock_()) {
}

void InternalIdleProbe::notifyActivity() {
    std::lock_guard<std::mutex> lock(mutex_);
    last_activity_ = clock_();
}

double InternalIdleProbe::currentIdleSeconds() {
    std::lock_guard<std::mutex> lock(mutex_);
    double idle = clock_() - last_activity_;
    return idle < 0 ? 0 : idle;
}

std::shared_ptr<IdleProbe> selectIdleProbe(const IdleProbeOptions& options, Clock clock) {
    if (!options.command.empty()) {
        if (Process::isExecutable(options.command[0])) {
            Logger::getInstance().info("Idle probe: using " + options.command[0]);
            return std::make_shared<CommandIdleProbe>(options.command, options.command_units_per_second);
        }
        Logger::getInstance().warning("Idle probe: " + options.command[0] + " not found");
    }
    if (options.allow_internal) {
        Logger::getInstance().info("Idle probe: using internal activity measure");
        return std::make_shared<InternalIdleProbe>(std::move(clock));
    }
    Logger::getInstance().warning("Idle probe: none available, idle detection disabled");
    return nullptr;
}

} // namespace nudger
