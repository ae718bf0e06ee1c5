#ifndef NUDGER_IDLE_PROBE_HPP
#define NUDGER_IDLE_PROBE_HPP

#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "../utils/time_utils.hpp"

namespace nudger {

// Platform capability: seconds since the user last touched an input device.
class IdleProbe {
public:
    virtual ~IdleProbe() = default;
    virtual double currentIdleSeconds() = 0;
    virtual std::string name() const = 0;
};

// Runs an external query (e.g. xprintidle) that prints the idle time.
class CommandIdleProbe : public IdleProbe {
public:
    // `units_per_second` converts the printed number to seconds (1000 for ms).
    CommandIdleProbe(std::vector<std::string> command, double units_per_second, int timeout_ms = 2000);

    double currentIdleSeconds() override;
    std::string name() const override;

private:
    std::vector<std::string> command_;
    double units_per_second_;
    int timeout_ms_;
};

// Idle measure fed by the host application on every user interaction.
class InternalIdleProbe : public IdleProbe {
public:
    explicit InternalIdleProbe(Clock clock);

    void notifyActivity();
    double currentIdleSeconds() override;
    std::string name() const override { return "internal"; }

private:
    Clock clock_;
    std::mutex mutex_;
    double last_activity_;
};

struct IdleProbeOptions {
    std::vector<std::string> command;       // empty: no command probe
    double command_units_per_second = 1000;
    bool allow_internal = false;
};

// Command probe if its program is available, else the internal probe if
// opted in, else nullptr (idle detection disabled).
std::shared_ptr<IdleProbe> selectIdleProbe(const IdleProbeOptions& options, Clock clock);

} // namespace nudger

#endif // NUDGER_IDLE_PROBE_HPP
