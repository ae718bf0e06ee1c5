#include "../include/app/config.hpp"
#include "../include/core/errors.hpp"

#include <boost/filesystem.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>

#include <cstdlib>
#include <fstream>
#include <optional>
#include <sstream>

namespace fs = boost::filesystem;
namespace pt = boost::property_tree;

namespace nudger {

namespace {

std::string homeDir() {
    const char* home = std::getenv("HOME");
    return home ? home : ".";
}

std::string expandHome(const std::string& path) {
    if (path == "~") return homeDir();
    if (path.rfind("~/", 0) == 0) return homeDir() + path.substr(1);
    return path;
}

std::vector<std::string> readStringList(const pt::ptree& node) {
    std::vector<std::string> out;
    for (const auto& child : node) {
        out.push_back(child.second.get_value<std::string>());
    }
    return out;
}

std::optional<int> readCap(const pt::ptree& node, const std::string& key, const std::string& fn) {
    auto value = node.get_optional<int>(key);
    if (value && *value < 0) {
        throw ConfigurationError(fn + ": " + key + " must not be negative");
    }
    return value ? std::optional<int>(*value) : std::nullopt;
}

double positive(double value, const std::string& key) {
    if (value <= 0) {
        throw ConfigurationError(key + " must be positive");
    }
    return value;
}

Item readItem(const pt::ptree& node) {
    Item item;
    item.fn = node.get<std::string>("fn", "");
    if (item.fn.empty()) {
        throw ConfigurationError("item without fn");
    }
    const std::string kind = node.get<std::string>("kind", "query");
    if (!parseExecutionKind(kind, item.kind)) {
        throw ConfigurationError(item.fn + ": unknown kind '" + kind + "'");
    }
    item.min_hours_wait = node.get<double>("min_hours_wait", item.min_hours_wait);
    item.max_calls_per_day = readCap(node, "max_calls_per_day", item.fn);
    item.max_entries_per_day = readCap(node, "max_entries_per_day", item.fn);
    item.max_successes_per_day = readCap(node, "max_successes_per_day", item.fn);
    item.lookup_posted_time = node.get<bool>("lookup_posted_time", false);
    item.dataset = node.get<std::string>("dataset", "");
    item.prompt = node.get<std::string>("prompt", "");
    if (auto command = node.get_child_optional("command")) {
        item.command = readStringList(*command);
    }
    if (item.kind == ExecutionKind::Excursion && item.command.empty()) {
        throw ConfigurationError(item.fn + ": excursion items need a command");
    }
    return item;
}

} // namespace

AppConfig AppConfig::defaults() {
    AppConfig config;
    config.state_dir = defaultStateDir();
    config.probe.command = {"xprintidle"};
    config.probe.command_units_per_second = 1000;
    return config;
}

std::string AppConfig::defaultConfigPath() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    std::string base = (xdg && *xdg) ? xdg : homeDir() + "/.config";
    return base + "/nudger/config.json";
}

std::string AppConfig::defaultStateDir() {
    const char* xdg = std::getenv("XDG_CACHE_HOME");
    std::string base = (xdg && *xdg) ? xdg : homeDir() + "/.cache";
    return base + "/nudger";
}

AppConfig AppConfig::load(const std::string& path) {
    boost::system::error_code ec;
    if (!fs::exists(path, ec)) {
        Logger::getInstance().warning("Config: " + path + " not found, using defaults");
        return defaults();
    }
    std::ifstream in(path);
    if (!in) {
        throw ConfigurationError("cannot read " + path);
    }
    std::stringstream ss;
    ss << in.rdbuf();
    return parse(ss.str(), path);
}

AppConfig AppConfig::parse(const std::string& json, const std::string& origin) {
    pt::ptree root;
    try {
        std::istringstream iss(json);
        pt::read_json(iss, root);
    } catch (const pt::ptree_error& e) {
        throw ConfigurationError(origin + ": " + e.what());
    }

    AppConfig config = defaults();
    try {
        config.state_dir = expandHome(root.get<std::string>("state_dir", config.state_dir));
        config.log_file = root.get<std::string>("log_file", "");
        const std::string level = root.get<std::string>("log_level", "info");
        if (!Logger::parseLevel(level, config.log_level)) {
            throw ConfigurationError(origin + ": unknown log_level '" + level + "'");
        }

        if (auto idle = root.get_child_optional("idle")) {
            config.idle.short_idle_threshold =
                positive(idle->get<double>("short_threshold", config.idle.short_idle_threshold), "idle.short_threshold");
            config.idle.long_idle_threshold =
                positive(idle->get<double>("long_threshold", config.idle.long_idle_threshold), "idle.long_threshold");
            config.idle.present_poll_interval =
                positive(idle->get<double>("present_poll", config.idle.present_poll_interval), "idle.present_poll");
            config.idle.idle_poll_interval =
                positive(idle->get<double>("idle_poll", config.idle.idle_poll_interval), "idle.idle_poll");
            config.idle.subtract_threshold = idle->get<bool>("subtract_threshold", false);
            if (auto command = idle->get_child_optional("probe_command")) {
                config.probe.command = readStringList(*command);
            }
            config.probe.command_units_per_second =
                positive(idle->get<double>("probe_units_per_second", config.probe.command_units_per_second),
                         "idle.probe_units_per_second");
            config.probe.allow_internal = idle->get<bool>("allow_internal", false);
        }

        if (auto excursion = root.get_child_optional("excursion")) {
            config.scheduler.excursion_watchdog =
                positive(excursion->get<double>("watchdog", config.scheduler.excursion_watchdog), "excursion.watchdog");
            config.scheduler.excursion_poll_interval =
                positive(excursion->get<double>("poll", config.scheduler.excursion_poll_interval), "excursion.poll");
        }
        config.snapshot_interval = root.get<double>("snapshot_interval", 0);

        if (auto items = root.get_child_optional("items")) {
            for (const auto& child : *items) {
                config.items.push_back(readItem(child.second));
            }
        }
    } catch (const pt::ptree_error& e) {
        throw ConfigurationError(origin + ": " + e.what());
    }

    return config;
}

void AppConfig::applyEnvironment() {
    if (const char* dir = std::getenv("NUDGER_STATE_DIR")) {
        if (*dir) state_dir = expandHome(dir);
    }
    if (const char* file = std::getenv("NUDGER_LOG_FILE")) {
        log_file = file;
    }
    if (const char* level = std::getenv("NUDGER_LOG_LEVEL")) {
        if (!Logger::parseLevel(level, log_level)) {
            Logger::getInstance().warning(std::string("Config: ignoring NUDGER_LOG_LEVEL=") + level);
        }
    }
    if (const char* command = std::getenv("NUDGER_IDLE_COMMAND")) {
        probe.command.clear();
        std::istringstream iss(command);
        std::string word;
        while (iss >> word) {
            probe.command.push_back(word);
        }
    }
}

std::string AppConfig::resolvePath(const std::string& path) const {
    std::string expanded = expandHome(path);
    if (expanded.empty() || fs::path(expanded).is_absolute()) return expanded;
    return state_dir + "/" + expanded;
}

} // namespace nudger
