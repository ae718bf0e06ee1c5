#ifndef NUDGER_IDLE_MONITOR_HPP
#define NUDGER_IDLE_MONITOR_HPP

#include <memory>
#include <optional>
#include <boost/asio.hpp>
#include "../core/hook_list.hpp"
#include "../utils/time_utils.hpp"
#include "idle_probe.hpp"

namespace nudger {

enum class PresenceState {
    Present,
    Idle
};

struct IdleEpisode {
    double began = 0;
    double ended = 0;
    double length = 0;
    bool long_idle = false;
};

struct IdleMonitorConfig {
    double short_idle_threshold = 600;
    double long_idle_threshold = 5400;
    double present_poll_interval = 111;
    double idle_poll_interval = 2;
    // Subtract the short threshold from the measured length (clamped at 0).
    bool subtract_threshold = false;
};

/**
 * PRESENT/IDLE state machine.
 *
 * tick() performs one poll and returns the delay until the next one;
 * start() drives tick() from a steady_timer on the given io_context.
 * Return hooks fire exactly once per idle episode.
 */
class IdleMonitor {
public:
    IdleMonitor(boost::asio::io_context& ioc,
                std::shared_ptr<IdleProbe> probe,
                IdleMonitorConfig config,
                Clock clock);
    ~IdleMonitor();

    IdleMonitor(const IdleMonitor&) = delete;
    IdleMonitor& operator=(const IdleMonitor&) = delete;

    // False when no probe is available.
    bool start();
    void stop();
    bool isRunning() const { return running_; }

    double tick();

    // Continues from the last-known-online time of a previous run. A gap
    // longer than the short threshold becomes an idle episode that ends on
    // the next tick with the user present.
    void resumeFrom(double last_online);

    PresenceState state() const { return state_; }
    // Idle, and the episode so far already counts as long idle.
    bool inLongIdle() const;
    double lastOnline() const { return last_online_; }
    double idleBeginning() const { return idle_beginning_; }
    double lengthOfLastIdle() const { return length_of_last_idle_; }
    const IdleMonitorConfig& config() const { return config_; }

    HookList<>& presentHooks() { return present_hooks_; }
    HookList<>& idleHooks() { return idle_hooks_; }
    HookList<const IdleEpisode&>& returnHooks() { return return_hooks_; }

private:
    double episodeLength(double now) const;
    double probeIdleSeconds();
    void enterIdle(double began);
    void schedule(double seconds);

    boost::asio::steady_timer timer_;
    std::shared_ptr<IdleProbe> probe_;
    IdleMonitorConfig config_;
    Clock clock_;
    bool running_ = false;

    PresenceState state_ = PresenceState::Present;
    std::optional<double> last_poll_;
    double last_online_;
    double idle_beginning_;
    double length_of_last_idle_ = 0;

    HookList<> present_hooks_;
    HookList<> idle_hooks_;
    HookList<const IdleEpisode&> return_hooks_;
};

const char* presenceStateName(PresenceState state);

} // namespace nudger

#endif // NUDGER_IDLE_MONITOR_HPP
