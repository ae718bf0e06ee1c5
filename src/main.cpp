#include "app/builtin_items.hpp"
#include "app/config.hpp"
#include "app/console_prompter.hpp"
#include "app/engine.hpp"
#include "core/errors.hpp"
#include "storage/event_log.hpp"
#include "utils/logger.hpp"
#include <signal.h>
#include <csignal>
#include <iostream>
#include <optional>
#include <cstdlib>
#include <string>
#include <vector>

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void interruptHandler(int) {
    g_interrupted = 1;
}

// No SA_RESTART, so a prompt blocked in read() returns and counts as a cancel.
void installInterruptHandler() {
    struct sigaction action = {};
    action.sa_handler = interruptHandler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

void printUsage() {
    std::cout << "Usage: nudger [--config FILE] <command>\n"
              << "\n"
              << "Commands:\n"
              << "  run            monitor idle time and run pending items after long idle\n"
              << "  session        run pending items now\n"
              << "  force          run every enabled item now\n"
              << "  status         show each item's scheduling state\n"
              << "  check          report anomalies in the state logs\n"
              << "  enable FN      re-enable a disabled item\n"
              << "  purge NAME     remove a variable from the variable log\n";
}

std::string formatOptionalTime(const std::optional<double>& t) {
    return t ? nudger::timeutil::formatPosted(*t, false) : std::string("-");
}

int printStatus(nudger::Engine& engine) {
    auto& registry = engine.registry();
    const double now = nudger::timeutil::unixNow();
    for (const auto& fn : registry.ids()) {
        const nudger::Item& item = registry.require(fn);
        const nudger::ItemState& st = registry.state(fn);
        std::cout << fn
                  << "\t" << nudger::executionKindName(item.kind)
                  << "\t" << (registry.isDisabled(fn)
                                  ? "disabled"
                                  : nudger::pendingVerdictName(engine.policy().evaluate(item, now)))
                  << "\tdismissals=" << st.dismissals
                  << "\tlast_called=" << formatOptionalTime(st.last_called)
                  << "\tsuccesses_today=" << registry.countSuccessesToday(fn, now)
                  << "\n";
    }
    return 0;
}

int checkLogs(nudger::Engine& engine) {
    auto& registry = engine.registry();
    const auto& config = engine.config();
    std::vector<std::string> paths = {config.variableLogPath(), config.idleLogPath()};
    for (const auto& fn : registry.ids()) {
        paths.push_back(registry.recencyLogPath(registry.require(fn)));
    }

    const double now = nudger::timeutil::unixNow();
    std::size_t total = 0;
    for (const auto& path : paths) {
        if (!nudger::EventLog::exists(path)) continue;
        for (const auto& anomaly : nudger::EventLog::findAnomalies(path, now)) {
            std::cout << path << ":" << anomaly.line << ": " << anomaly.reason
                      << " (" << anomaly.posted << ")\n";
            ++total;
        }
    }
    try {
        engine.memory().verifyLog();
    } catch (const nudger::CorruptLogError& e) {
        std::cout << e.what() << "\n";
        ++total;
    }
    std::cout << total << " anomal" << (total == 1 ? "y" : "ies") << "\n";
    return total == 0 ? 0 : 2;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path = nudger::AppConfig::defaultConfigPath();
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            printUsage();
            return 0;
        } else {
            args.push_back(arg);
        }
    }
    const std::string command = args.empty() ? "run" : args[0];

    auto& logger = nudger::Logger::getInstance();
    try {
        nudger::AppConfig config = nudger::AppConfig::load(config_path);
        config.applyEnvironment();
        logger.setMinLevel(config.log_level);
        logger.setLogFile(config.log_file);

        nudger::ConsolePrompter prompter;
        nudger::Engine engine(config, prompter);
        engine.initialize();
        nudger::registerBuiltinBodies(engine.scheduler(), engine.registry(), prompter,
                                      nudger::timeutil::systemClock());

        if (command == "status") {
            return printStatus(engine);
        }
        if (command == "check") {
            return checkLogs(engine);
        }
        if (command == "purge" || command == "enable") {
            if (args.size() < 2) {
                printUsage();
                return 1;
            }
            if (command == "purge") {
                // Not activated, so the engine does not write the variable back on exit.
                nudger::InstanceLock lock(config.pidFilePath());
                if (!lock.acquire()) {
                    return 1;
                }
                std::cout << engine.memory().purge(args[1]) << " record(s) removed\n";
                return 0;
            }
            if (!engine.activate(false)) {
                return 1;
            }
            engine.registry().enable(args[1]);
            engine.registry().resetDismissals(args[1]);
            return 0;
        }
        if (command == "session" || command == "force") {
            if (!engine.activate(false)) {
                return 1;
            }
            installInterruptHandler();
            engine.setInterruptCheck([]() { return g_interrupted != 0; });
            engine.runSessionToCompletion(command == "force");
            while (!g_interrupted && !engine.scheduler().state().queue.empty() &&
                   prompter.confirm("Resume the remaining " +
                                    std::to_string(engine.scheduler().state().queue.size()) +
                                    " item(s)?")) {
                engine.resumeToCompletion();
            }
            if (g_interrupted) {
                logger.info("Interrupted, saving state");
            }
            // ~Engine saves state and releases the PID marker.
            return 0;
        }
        if (command == "run") {
            logger.info("Starting nudger...");
            if (!engine.activate()) {
                return 1;
            }
            engine.startupSession();
            engine.run();
            logger.info("nudger stopped");
            return 0;
        }

        printUsage();
        return 1;
    } catch (const nudger::ConfigurationError& e) {
        logger.error(std::string("Configuration error: ") + e.what());
        return 1;
    } catch (const std::exception& e) {
        logger.error(std::string("Fatal: ") + e.what());
        return 1;
    }
}
