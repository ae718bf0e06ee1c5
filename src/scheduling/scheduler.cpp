#include "../include/scheduling/scheduler.hpp"
#include "../include/core/errors.hpp"
#include "../include/utils/logger.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <stdexcept>
#include <utility>

namespace nudger {

namespace {

std::chrono::milliseconds toMillis(double seconds) {
    return std::chrono::milliseconds(static_cast<long long>(seconds * 1000));
}

} // namespace

const char* runResultName(RunResult result) {
    switch (result) {
        case RunResult::Success: return "success";
        case RunResult::Cancelled: return "cancelled";
        case RunResult::Skipped: return "skipped";
        case RunResult::TimedOut: return "timed out";
    }
    return "unknown";
}

const char* schedulerPhaseName(SchedulerPhase phase) {
    switch (phase) {
        case SchedulerPhase::IdleNoQueue: return "idle";
        case SchedulerPhase::Queued: return "queued";
        case SchedulerPhase::RunningItem: return "running";
    }
    return "unknown";
}

Scheduler::Scheduler(boost::asio::io_context& ioc,
                     ItemRegistry& registry,
                     const PendingPolicy& policy,
                     Prompter& prompter,
                     SchedulerConfig config,
                     Clock clock)
    : registry_(registry),
      policy_(policy),
      prompter_(prompter),
      config_(config),
      clock_(std::move(clock)),
      watchdog_timer_(ioc),
      poll_timer_(ioc),
      session_finished_hooks_("session finished hooks"),
      item_finished_hooks_("item finished hooks") {
}

Scheduler::~Scheduler() {
    disarmExcursion();
}

void Scheduler::setQueryBody(const std::string& fn, QueryBody body) {
    const Item& item = registry_.require(fn);
    if (item.kind != ExecutionKind::Query) {
        throw ConfigurationError(fn + " is not a query item");
    }
    query_bodies_[fn] = std::move(body);
}

void Scheduler::setExcursionBody(const std::string& fn, ExcursionBody body) {
    const Item& item = registry_.require(fn);
    if (item.kind != ExecutionKind::Excursion) {
        throw ConfigurationError(fn + " is not an excursion item");
    }
    excursion_bodies_[fn] = std::move(body);
}

std::size_t Scheduler::buildQueue(bool force_all) {
    if (state_.running) {
        throw std::logic_error("buildQueue while a run is active");
    }
    const double now = clock_();
    state_.as_of = now;
    state_.queue.clear();
    state_.current_fn.clear();

    for (const auto& fn : registry_.enabledIds()) {
        if (force_all) {
            state_.queue.push_back(fn);
            continue;
        }
        try {
            PendingVerdict verdict = policy_.evaluate(registry_.require(fn), now);
            if (verdict == PendingVerdict::Pending) {
                state_.queue.push_back(fn);
            } else {
                Logger::getInstance().debug("Scheduler: " + fn + " not pending (" +
                                            pendingVerdictName(verdict) + ")");
            }
        } catch (const StateNotRecoveredError&) {
            throw;
        } catch (const std::exception& e) {
            Logger::getInstance().warning("Scheduler: pending check for " + fn + " failed: " + e.what());
        }
    }

    state_.phase = state_.queue.empty() ? SchedulerPhase::IdleNoQueue : SchedulerPhase::Queued;
    Logger::getInstance().info("Scheduler: queued " + std::to_string(state_.queue.size()) +
                               " item(s)" + (force_all ? " (forced)" : ""));
    return state_.queue.size();
}

bool Scheduler::startSession(bool force_all) {
    if (state_.running) {
        Logger::getInstance().warning("Scheduler: a run is already active, new session refused");
        return false;
    }
    buildQueue(force_all);
    return runQueue();
}

bool Scheduler::runQueue() {
    if (state_.running) {
        Logger::getInstance().warning("Scheduler: run already active");
        return false;
    }
    state_.running = true;
    try {
        runLoop();
    } catch (...) {
        disarmExcursion();
        halt();
        throw;
    }
    return true;
}

bool Scheduler::runSingle(const std::string& fn) {
    registry_.require(fn);
    if (state_.running) {
        Logger::getInstance().warning("Scheduler: a run is already active, " + fn + " not started");
        return false;
    }
    removeFromQueue(fn);
    state_.queue.push_front(fn);
    return runQueue();
}

void Scheduler::abort() {
    if (!state_.running) return;
    Logger::getInstance().info("Scheduler: run aborted" +
                               (state_.current_fn.empty() ? std::string() : " during " + state_.current_fn));
    disarmExcursion();
    halt();
}

bool Scheduler::cancelCurrent() {
    if (!excursion_) return false;
    excursion_->cancel();
    checkExcursion(excursion_->generation());
    return true;
}

void Scheduler::runLoop() {
    while (state_.running) {
        if (state_.queue.empty()) {
            finishSession();
            return;
        }

        const std::string fn = state_.queue.front();
        state_.current_fn = fn;
        state_.phase = SchedulerPhase::RunningItem;

        const Item* item = registry_.byId(fn);
        if (!item) {
            dropFromPass(fn, "not registered");
            continue;
        }
        if (registry_.isDisabled(fn)) {
            dropFromPass(fn, "disabled");
            continue;
        }
        if (!hasBody(*item)) {
            dropFromPass(fn, "no body registered");
            continue;
        }
        if (!passesDismissalCheck(*item)) {
            removeFromQueue(fn);
            continue;
        }

        registry_.recordCall(fn, clock_());
        Logger::getInstance().info("Scheduler: running " + fn);

        bool keep_going = item->kind == ExecutionKind::Query ? runQuery(*item) : startExcursion(*item);
        if (!keep_going) return;
    }
}

bool Scheduler::passesDismissalCheck(const Item& item) {
    const int dismissals = registry_.state(item.fn).dismissals;
    if (dismissals < ItemRegistry::kDismissalsBeforeDisablePrompt) return true;

    const std::string question = "You've dismissed " + item.fn + " " + std::to_string(dismissals) +
                                 " times in a row. Disable it?";
    if (prompter_.confirm(question)) {
        registry_.disable(item.fn);
        return false;
    }
    registry_.resetDismissals(item.fn);
    return true;
}

bool Scheduler::hasBody(const Item& item) const {
    return item.kind == ExecutionKind::Query ? query_bodies_.count(item.fn) > 0
                                             : excursion_bodies_.count(item.fn) > 0;
}

bool Scheduler::runQuery(const Item& item) {
    RunResult result;
    try {
        result = query_bodies_.at(item.fn)(item);
    } catch (const std::exception& e) {
        dropFromPass(item.fn, std::string("body failed: ") + e.what());
        return true;
    }
    return settle(item.fn, result);
}

bool Scheduler::startExcursion(const Item& item) {
    auto excursion = std::make_shared<Excursion>(item.fn, ++excursion_generation_);
    RunResult result;
    try {
        result = excursion_bodies_.at(item.fn)(item, *excursion);
    } catch (const std::exception& e) {
        dropFromPass(item.fn, std::string("body failed: ") + e.what());
        return true;
    }

    if (result != RunResult::Success) return settle(item.fn, result);
    if (excursion->cancelled()) return settle(item.fn, RunResult::Cancelled);
    if (excursion->allClosed()) return settle(item.fn, RunResult::Success);

    excursion_ = excursion;
    const std::uint64_t generation = excursion->generation();
    Logger::getInstance().info("Scheduler: excursion " + item.fn + " waiting on " +
                               std::to_string(excursion->resourceCount()) + " resource(s)");

    watchdog_timer_.expires_after(toMillis(config_.excursion_watchdog));
    watchdog_timer_.async_wait([this, generation](const boost::system::error_code& ec) {
        if (ec || !excursion_ || excursion_->generation() != generation) return;
        Logger::getInstance().warning("Scheduler: excursion " + excursion_->fn() + " timed out");
        completeExcursion(RunResult::TimedOut);
    });

    poll_timer_.expires_after(toMillis(config_.excursion_poll_interval));
    poll_timer_.async_wait([this, generation](const boost::system::error_code& ec) {
        if (ec) return;
        checkExcursion(generation);
    });
    return false;
}

void Scheduler::checkExcursion(std::uint64_t generation) {
    if (!excursion_ || excursion_->generation() != generation) return;

    if (excursion_->cancelled()) {
        completeExcursion(RunResult::Cancelled);
        return;
    }
    if (excursion_->allClosed()) {
        completeExcursion(RunResult::Success);
        return;
    }
    poll_timer_.expires_after(toMillis(config_.excursion_poll_interval));
    poll_timer_.async_wait([this, generation](const boost::system::error_code& ec) {
        if (ec) return;
        checkExcursion(generation);
    });
}

void Scheduler::completeExcursion(RunResult result) {
    if (!excursion_) return;
    const std::string fn = excursion_->fn();
    disarmExcursion();
    try {
        if (settle(fn, result) && state_.running) {
            runLoop();
        }
    } catch (...) {
        disarmExcursion();
        halt();
        throw;
    }
}

void Scheduler::disarmExcursion() {
    if (excursion_) {
        excursion_->release();
    }
    excursion_.reset();
    watchdog_timer_.cancel();
    poll_timer_.cancel();
}

bool Scheduler::settle(const std::string& fn, RunResult result) {
    const double now = clock_();
    Logger::getInstance().info("Scheduler: " + fn + " " + runResultName(result));

    switch (result) {
        case RunResult::Success:
            removeFromQueue(fn);
            registry_.resetDismissals(fn);
            if (!registry_.recordSuccess(fn, now)) {
                Logger::getInstance().warning("Scheduler: could not record success of " + fn);
            }
            item_finished_hooks_.run(fn, result);
            return true;

        case RunResult::Cancelled:
            registry_.incrementDismissals(fn);
            removeFromQueue(fn);
            state_.queue.push_front(fn);
            item_finished_hooks_.run(fn, result);
            halt();
            return false;

        case RunResult::Skipped:
            if (state_.queue.size() > 1) {
                removeFromQueue(fn);
                item_finished_hooks_.run(fn, result);
                return true;
            }
            Logger::getInstance().info("Scheduler: skipped the last queued item, cancelling the run");
            return settle(fn, RunResult::Cancelled);

        case RunResult::TimedOut:
            removeFromQueue(fn);
            item_finished_hooks_.run(fn, result);
            return true;
    }
    return true;
}

void Scheduler::dropFromPass(const std::string& fn, const std::string& reason) {
    Logger::getInstance().warning("Scheduler: dropping " + fn + " from this pass: " + reason);
    removeFromQueue(fn);
}

void Scheduler::removeFromQueue(const std::string& fn) {
    auto& queue = state_.queue;
    queue.erase(std::remove(queue.begin(), queue.end(), fn), queue.end());
}

void Scheduler::halt() {
    state_.running = false;
    state_.current_fn.clear();
    state_.phase = state_.queue.empty() ? SchedulerPhase::IdleNoQueue : SchedulerPhase::Queued;
}

void Scheduler::finishSession() {
    state_.running = false;
    state_.current_fn.clear();
    state_.phase = SchedulerPhase::IdleNoQueue;
    Logger::getInstance().info("Scheduler: queue empty");
    session_finished_hooks_.run();
}

} // namespace nudger
