#ifndef NUDGER_CONFIG_HPP
#define NUDGER_CONFIG_HPP

#include <string>
#include <vector>
#include "../presence/idle_monitor.hpp"
#include "../presence/idle_probe.hpp"
#include "../scheduling/item.hpp"
#include "../scheduling/scheduler.hpp"
#include "../utils/logger.hpp"

namespace nudger {

/**
 * Engine configuration.
 *
 * Read from a JSON file, then overridden by NUDGER_STATE_DIR,
 * NUDGER_LOG_FILE, NUDGER_LOG_LEVEL and NUDGER_IDLE_COMMAND.
 */
struct AppConfig {
    std::string state_dir;
    std::string log_file;
    LogLevel log_level = LogLevel::INFO;

    IdleMonitorConfig idle;
    IdleProbeOptions probe;
    SchedulerConfig scheduler;
    double snapshot_interval = 0;   // 0: snapshot on every present tick

    std::vector<Item> items;

    static AppConfig defaults();

    // Missing file: defaults. Unreadable or invalid: ConfigurationError.
    static AppConfig load(const std::string& path);
    static AppConfig parse(const std::string& json, const std::string& origin = "<string>");

    static std::string defaultConfigPath();
    static std::string defaultStateDir();

    void applyEnvironment();

    std::string variableLogPath() const { return state_dir + "/variables.tsv"; }
    std::string idleLogPath() const { return state_dir + "/idle.tsv"; }
    std::string pidFilePath() const { return state_dir + "/nudger.pid"; }

    // "~/x" -> $HOME/x; relative paths resolve under state_dir.
    std::string resolvePath(const std::string& path) const;
};

} // namespace nudger

#endif // NUDGER_CONFIG_HPP
