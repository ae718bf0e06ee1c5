#include "../include/presence/idle_monitor.hpp"
#include "../include/utils/logger.hpp"

#include <chrono>
#include <cmath>
#include <exception>
#include <utility>

namespace nudger {

const char* presenceStateName(PresenceState state) {
    return state == PresenceState::Present ? "present" : "idle";
}

IdleMonitor::IdleMonitor(boost::asio::io_context& ioc,
                         std::shared_ptr<IdleProbe> probe,
                         IdleMonitorConfig config,
                         Clock clock)
    : timer_(ioc),
      probe_(std::move(probe)),
      config_(config),
      clock_(std::move(clock)),
      last_online_(clock_()),
      idle_beginning_(last_online_),
      present_hooks_("present hooks"),
      idle_hooks_("idle hooks"),
      return_hooks_("return-from-idle hooks") {
}

IdleMonitor::~IdleMonitor() {
    stop();
}

bool IdleMonitor::start() {
    if (!probe_) {
        Logger::getInstance().warning("IdleMonitor: no idle probe, not starting");
        return false;
    }
    if (running_) return true;
    running_ = true;
    Logger::getInstance().info("IdleMonitor: started with probe " + probe_->name());
    schedule(0);
    return true;
}

void IdleMonitor::stop() {
    if (!running_) return;
    running_ = false;
    timer_.cancel();
    Logger::getInstance().info("IdleMonitor: stopped");
}

double IdleMonitor::tick() {
    const double now = clock_();

    if (state_ == PresenceState::Present) {
        // A gap this long means the process itself was suspended.
        if (last_poll_ && now - *last_poll_ > config_.short_idle_threshold) {
            const double began = *last_poll_;
            last_poll_ = now;
            Logger::getInstance().info("IdleMonitor: " +
                                       std::to_string(static_cast<long long>(now - began)) +
                                       "s since last poll, treating as idle");
            enterIdle(began);
            return config_.idle_poll_interval;
        }
        last_poll_ = now;

        if (probeIdleSeconds() > config_.short_idle_threshold) {
            enterIdle(now);
            return config_.idle_poll_interval;
        }

        last_online_ = now;
        idle_beginning_ = now;
        present_hooks_.run();
        return config_.present_poll_interval;
    }

    last_poll_ = now;
    if (probeIdleSeconds() >= config_.short_idle_threshold) {
        return config_.idle_poll_interval;
    }

    const double length = episodeLength(now);

    IdleEpisode episode;
    episode.began = idle_beginning_;
    episode.ended = now;
    episode.length = length;
    episode.long_idle = length >= config_.long_idle_threshold;

    length_of_last_idle_ = length;
    idle_beginning_ = now;
    last_online_ = now;
    state_ = PresenceState::Present;

    Logger::getInstance().info("IdleMonitor: user returned after " +
                               std::to_string(static_cast<long long>(length)) + "s" +
                               (episode.long_idle ? " (long idle)" : ""));
    return_hooks_.run(episode);
    return config_.present_poll_interval;
}

void IdleMonitor::resumeFrom(double last_online) {
    const double now = clock_();
    if (last_online <= 0 || last_online > now) return;
    last_online_ = last_online;
    if (now - last_online > config_.short_idle_threshold && state_ == PresenceState::Present) {
        Logger::getInstance().info("IdleMonitor: offline since previous run, resuming idle episode");
        enterIdle(last_online);
        last_poll_ = now;
    }
}

bool IdleMonitor::inLongIdle() const {
    return state_ == PresenceState::Idle && episodeLength(clock_()) >= config_.long_idle_threshold;
}

double IdleMonitor::episodeLength(double now) const {
    double length = now - idle_beginning_;
    if (config_.subtract_threshold) {
        length -= config_.short_idle_threshold;
    }
    return length < 0 ? 0 : length;
}

double IdleMonitor::probeIdleSeconds() {
    if (!probe_) return 0;
    try {
        double idle = probe_->currentIdleSeconds();
        return (std::isfinite(idle) && idle > 0) ? idle : 0;
    } catch (const std::exception& e) {
        Logger::getInstance().warning(std::string("IdleMonitor: probe failed: ") + e.what());
        return 0;
    }
}

void IdleMonitor::enterIdle(double began) {
    state_ = PresenceState::Idle;
    idle_beginning_ = began;
    Logger::getInstance().debug("IdleMonitor: idle");
    idle_hooks_.run();
}

void IdleMonitor::schedule(double seconds) {
    if (!running_) return;
    auto delay = std::chrono::milliseconds(static_cast<long long>(seconds * 1000));
    timer_.expires_after(delay);
    timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec || !running_) return;
        schedule(tick());
    });
}

} // namespace nudger
