#ifndef NUDGER_SCHEDULER_HPP
#define NUDGER_SCHEDULER_HPP

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <boost/asio.hpp>
#include "../core/hook_list.hpp"
#include "../utils/time_utils.hpp"
#include "excursion.hpp"
#include "item_registry.hpp"
#include "pending_policy.hpp"

namespace nudger {

// What an item body reports back to the scheduler.
enum class RunResult {
    Success,
    Cancelled,  // user cancelled: counts as a dismissal, halts the run
    Skipped,    // user skipped: next item, or cancel when it was the last one
    TimedOut    // excursion watchdog expired: dropped from this pass
};

enum class SchedulerPhase {
    IdleNoQueue,
    Queued,
    RunningItem
};

const char* runResultName(RunResult result);
const char* schedulerPhaseName(SchedulerPhase phase);

struct SchedulerState {
    std::deque<std::string> queue;
    std::string current_fn;
    double as_of = 0;
    SchedulerPhase phase = SchedulerPhase::IdleNoQueue;
    bool running = false;
};

struct SchedulerConfig {
    double excursion_watchdog = 300;
    double excursion_poll_interval = 1;
};

// UI boundary for yes/no questions (e.g. "disable this item?").
class Prompter {
public:
    virtual ~Prompter() = default;
    virtual bool confirm(const std::string& question) = 0;
};

using QueryBody = std::function<RunResult(const Item&)>;
// Returns Success once the excursion's resources are open.
using ExcursionBody = std::function<RunResult(const Item&, Excursion&)>;

/**
 * Owns the session queue and runs items one at a time.
 *
 * Queries run synchronously inside runQueue(). An excursion suspends the
 * run until its resources close, its watchdog fires, or it is cancelled;
 * the run then continues from the io_context.
 */
class Scheduler {
public:
    Scheduler(boost::asio::io_context& ioc,
              ItemRegistry& registry,
              const PendingPolicy& policy,
              Prompter& prompter,
              SchedulerConfig config,
              Clock clock);
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    // Throw ConfigurationError for unregistered items or a kind mismatch.
    void setQueryBody(const std::string& fn, QueryBody body);
    void setExcursionBody(const std::string& fn, ExcursionBody body);

    // Throws std::logic_error while a run is active.
    std::size_t buildQueue(bool force_all = false);

    // buildQueue + runQueue. False (and nothing built) while a run is active.
    bool startSession(bool force_all = false);

    // Runs (or resumes) the existing queue. False if already running.
    bool runQueue();

    // Puts one registered item at the front of the queue and runs it.
    // Throws ConfigurationError if fn is not registered.
    bool runSingle(const std::string& fn);

    // Stops the run; the current item stays queued for a later resume.
    void abort();

    // Cancels the excursion in flight, if any.
    bool cancelCurrent();

    bool isRunning() const { return state_.running; }
    bool excursionInFlight() const { return static_cast<bool>(excursion_); }
    const SchedulerState& state() const { return state_; }

    HookList<>& sessionFinishedHooks() { return session_finished_hooks_; }
    HookList<const std::string&, RunResult>& itemFinishedHooks() { return item_finished_hooks_; }

private:
    void runLoop();
    bool hasBody(const Item& item) const;
    bool passesDismissalCheck(const Item& item);
    bool runQuery(const Item& item);
    bool startExcursion(const Item& item);
    void checkExcursion(std::uint64_t generation);
    void completeExcursion(RunResult result);
    void disarmExcursion();
    bool settle(const std::string& fn, RunResult result);
    void dropFromPass(const std::string& fn, const std::string& reason);
    void removeFromQueue(const std::string& fn);
    void halt();
    void finishSession();

    ItemRegistry& registry_;
    const PendingPolicy& policy_;
    Prompter& prompter_;
    SchedulerConfig config_;
    Clock clock_;

    SchedulerState state_;
    std::map<std::string, QueryBody> query_bodies_;
    std::map<std::string, ExcursionBody> excursion_bodies_;

    std::shared_ptr<Excursion> excursion_;
    std::uint64_t excursion_generation_ = 0;
    boost::asio::steady_timer watchdog_timer_;
    boost::asio::steady_timer poll_timer_;

    HookList<> session_finished_hooks_;
    HookList<const std::string&, RunResult> item_finished_hooks_;
};

} // namespace nudger

#endif // NUDGER_SCHEDULER_HPP
