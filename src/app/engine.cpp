#include "../include/app/engine.hpp"
#include "../include/core/errors.hpp"
#include "../include/storage/event_log.hpp"
#include "../include/utils/logger.hpp"

#include <csignal>
#include <exception>
#include <utility>

namespace nudger {

namespace {

const char* const kVarLastOnline = "idle.last_online";
const char* const kVarItemState = "items.state";
const char* const kVarDisabled = "items.disabled";

} // namespace

Engine::Engine(AppConfig config, Prompter& prompter, std::shared_ptr<IdleProbe> probe, Clock clock)
    : config_(std::move(config)),
      clock_(std::move(clock)),
      registry_(config_.state_dir),
      policy_(registry_),
      scheduler_(ioc_, registry_, policy_, prompter, config_.scheduler, clock_),
      monitor_(ioc_, probe ? probe : selectIdleProbe(config_.probe, clock_), config_.idle, clock_),
      memory_(config_.variableLogPath(), clock_),
      lock_(config_.pidFilePath()),
      after_init_hooks_("after-init hooks") {
    installHooks();
    trackVariables();
}

Engine::~Engine() {
    stop();
}

void Engine::initialize() {
    if (initialized_) return;
    for (Item item : config_.items) {
        if (item.hasDataset()) {
            item.dataset = config_.resolvePath(item.dataset);
        }
        registry_.registerItem(std::move(item));
    }

    memory_.recover();
    registry_.markRestored();
    initialized_ = true;
    Logger::getInstance().info("Engine: " + std::to_string(registry_.ids().size()) + " item(s), " +
                               std::to_string(registry_.enabledIds().size()) + " enabled");
    after_init_hooks_.run();
}

bool Engine::activate(bool monitor) {
    if (!initialized_) {
        throw StateNotRecoveredError("Engine::activate before initialize");
    }
    if (!lock_.acquire()) {
        Logger::getInstance().warning("Engine: not activating a second scheduling engine");
        return false;
    }
    if (monitor) {
        monitor_.start();
    }
    return true;
}

void Engine::run() {
    work_.emplace(boost::asio::make_work_guard(ioc_));
    boost::asio::signal_set signals(ioc_, SIGINT, SIGTERM);
    signals.async_wait([this](const boost::system::error_code& ec, int signal_number) {
        if (ec) return;
        Logger::getInstance().info("Engine: signal " + std::to_string(signal_number) + ", shutting down");
        stop();
    });
    ioc_.run();
}

void Engine::stop() {
    if (initialized_ && lock_.held()) {
        scheduler_.abort();
        try {
            saveState();
        } catch (const std::exception& e) {
            Logger::getInstance().error(std::string("Engine: saving state failed: ") + e.what());
        }
    }
    monitor_.stop();
    lock_.release();
    work_.reset();
    ioc_.stop();
}

bool Engine::startSession(bool force_all) {
    if (!initialized_) {
        throw StateNotRecoveredError("Engine::startSession before initialize");
    }
    return scheduler_.startSession(force_all);
}

bool Engine::resume() {
    if (!initialized_) {
        throw StateNotRecoveredError("Engine::resume before initialize");
    }
    if (scheduler_.state().queue.empty()) {
        Logger::getInstance().info("Engine: nothing to resume");
        return false;
    }
    return scheduler_.runQueue();
}

bool Engine::startupSession() {
    if (monitor_.inLongIdle()) {
        Logger::getInstance().info("Engine: resumed a long idle episode, session starts on return");
        return false;
    }
    return startSession(false);
}

void Engine::runSessionToCompletion(bool force_all) {
    if (!startSession(force_all)) return;
    drainUntilHalted();
}

void Engine::resumeToCompletion() {
    if (!resume()) return;
    drainUntilHalted();
}

std::size_t Engine::saveState() {
    last_snapshot_ = clock_();
    return memory_.snapshot();
}

void Engine::installHooks() {
    monitor_.presentHooks().add("save-state", [this]() { onPresentTick(); });
    monitor_.returnHooks().add("log-idle", [this](const IdleEpisode& episode) {
        EventLog::appendAt(config_.idleLogPath(),
                           {timeutil::formatPosted(episode.began, false),
                            timeutil::formatPosted(episode.length, false)},
                           episode.ended);
    });
    monitor_.returnHooks().add("schedule-after-long-idle", [this](const IdleEpisode& episode) {
        onReturnFromIdle(episode);
    });
    scheduler_.sessionFinishedHooks().add("save-state", [this]() { saveState(); });
}

void Engine::trackVariables() {
    memory_.trackTimestamp(kVarLastOnline,
        [this]() { return monitor_.lastOnline(); },
        [this](double last_online) { monitor_.resumeFrom(last_online); });
    memory_.track(kVarItemState,
        [this]() { return registry_.serializeState(); },
        [this](const std::string& value) { registry_.restoreState(value); });
    memory_.track(kVarDisabled,
        [this]() { return registry_.serializeDisabled(); },
        [this](const std::string& value) { registry_.restoreDisabled(value); });
}

void Engine::onPresentTick() {
    if (config_.snapshot_interval > 0 && clock_() - last_snapshot_ < config_.snapshot_interval) {
        return;
    }
    saveState();
}

void Engine::onReturnFromIdle(const IdleEpisode& episode) {
    if (!episode.long_idle) return;
    if (scheduler_.isRunning()) {
        Logger::getInstance().info("Engine: run in progress, not starting a new session");
        return;
    }
    scheduler_.startSession(false);
}

void Engine::drainUntilHalted() {
    while (scheduler_.isRunning()) {
        if (interrupt_check_ && interrupt_check_()) {
            Logger::getInstance().info("Engine: interrupted, cancelling " + scheduler_.state().current_fn);
            if (!scheduler_.cancelCurrent()) scheduler_.abort();
            break;
        }
        if (ioc_.stopped()) ioc_.restart();
        if (ioc_.run_one() == 0) break;
    }
}

} // namespace nudger
