#ifndef NUDGER_ENGINE_HPP
#define NUDGER_ENGINE_HPP

#include <functional>
#include <memory>
#include <optional>
#include <utility>
#include <boost/asio.hpp>
#include "../core/hook_list.hpp"
#include "../presence/idle_monitor.hpp"
#include "../scheduling/item_registry.hpp"
#include "../scheduling/pending_policy.hpp"
#include "../scheduling/scheduler.hpp"
#include "../storage/memory_store.hpp"
#include "config.hpp"
#include "instance_lock.hpp"

namespace nudger {

/**
 * Wires registry, policy, scheduler, idle monitor and memory store on one
 * io_context. initialize() must run before any scheduling.
 */
class Engine {
public:
    // A null probe means "select one from the configuration".
    Engine(AppConfig config, Prompter& prompter,
           std::shared_ptr<IdleProbe> probe = nullptr,
           Clock clock = timeutil::systemClock());
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // Registers items and recovers persisted state.
    void initialize();

    // Takes the PID marker and, unless `monitor` is false, starts idle
    // monitoring. False if another instance is active. State is only
    // saved by an activated engine.
    bool activate(bool monitor = true);

    // Runs the io_context until stop() (or SIGINT/SIGTERM).
    void run();

    // Saves state, stops timers and releases the PID marker.
    void stop();

    bool startSession(bool force_all);
    bool resume();

    // Session at daemon start. Skipped while a recovered idle episode is
    // already long: the return from it starts the session instead.
    bool startupSession();

    // Foreground session: runs until the queue is empty or the run halts.
    void runSessionToCompletion(bool force_all);
    void resumeToCompletion();

    // Polled while a foreground session waits; true cancels the current item.
    void setInterruptCheck(std::function<bool()> check) { interrupt_check_ = std::move(check); }

    std::size_t saveState();

    const AppConfig& config() const { return config_; }
    ItemRegistry& registry() { return registry_; }
    const PendingPolicy& policy() const { return policy_; }
    Scheduler& scheduler() { return scheduler_; }
    IdleMonitor& monitor() { return monitor_; }
    MemoryStore& memory() { return memory_; }
    boost::asio::io_context& ioContext() { return ioc_; }

    HookList<>& afterInitHooks() { return after_init_hooks_; }

private:
    void installHooks();
    void trackVariables();
    void onPresentTick();
    void onReturnFromIdle(const IdleEpisode& episode);
    void drainUntilHalted();

    AppConfig config_;
    Clock clock_;
    boost::asio::io_context ioc_;
    ItemRegistry registry_;
    PendingPolicy policy_;
    Scheduler scheduler_;
    IdleMonitor monitor_;
    MemoryStore memory_;
    InstanceLock lock_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_;
    HookList<> after_init_hooks_;
    std::function<bool()> interrupt_check_;
    bool initialized_ = false;
    double last_snapshot_ = 0;
};

} // namespace nudger

#endif // NUDGER_ENGINE_HPP
