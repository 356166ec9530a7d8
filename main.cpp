#include "pch.hpp"
#include "commands/commands_core.hpp"
#include "commands/commands_timers.hpp"
#include "bootstrap_config.hpp"
#include "builtin_actions.hpp"
#include "console_history.hpp"
#include "error_manager.hpp"
#include "logger.hpp"
#include "timers/clock_source.hpp"
#include "timers/timer_action.hpp"
#include "timers/timer_errors.hpp"
#include "timers/timer_registry.hpp"

namespace fs = std::filesystem;

// ------------------------------------------------------------
// Command line
// ------------------------------------------------------------
struct LaunchOptions {
    fs::path configPath = "polltimer_config.json";
    std::string timersFile;      // overrides settings.timersFile
    long long runMs = 0;         // > 0: headless poll loop
};

static void printUsage() {
    std::cerr << "usage: polltimer [--config <file>] [--timers <file>] [--run <ms>]\n";
}

static bool parseArgs(int argc, char* argv[], LaunchOptions& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if ((a == "--config" || a == "--timers" || a == "--run") && i + 1 >= argc) {
            std::cerr << "polltimer: " << a << " needs a value\n";
            return false;
        }
        if (a == "--config") {
            opts.configPath = argv[++i];
        } else if (a == "--timers") {
            opts.timersFile = argv[++i];
        } else if (a == "--run") {
            try {
                opts.runMs = std::stoll(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "polltimer: --run expects milliseconds\n";
                return false;
            }
        } else {
            std::cerr << "polltimer: unknown option " << a << "\n";
            return false;
        }
    }
    return true;
}

// ============================================================
// Main entry point
// ============================================================
int main(int argc, char* argv[]) {
    LaunchOptions opts;
    if (!parseArgs(argc, argv, opts)) {
        printUsage();
        return 2;
    }

    // Config phases are buffered until the log file is open
    beginPhaseGroup();
    bootstrap_config::Settings settings = bootstrap_config::initAll(opts.configPath);
    initLogger(settings.logFile);
    endPhaseGroup();
    LOG_PHASE("Startup begin", true);

    ConsoleHistory history;
    polltimer::SystemClock clock(settings.tickPeriod);
    polltimer::TimerRegistry registry(clock);
    polltimer::ActionCatalog actions;
    registerBuiltinActions(actions, registry, history);

    CommandContext ctx{ registry, actions, history, settings.pollIntervalMs };

    // Timer definitions
    const std::string timersFile = opts.timersFile.empty() ? settings.timersFile : opts.timersFile;
    if (fs::exists(timersFile)) {
        auto report = bootstrap_config::loadTimerDefinitions(timersFile, registry, actions);
        history.push("[Timer] Loaded " + std::to_string(report.loaded) + " timer(s) from " + timersFile,
                     report.failed.empty() ? sf::Color::Green : sf::Color::Yellow);
    } else {
        LOG_DEBUG("Config", "No timer definitions at " + timersFile);
    }
    history.flush(std::cout);

    int exitCode = 0;

    // ============================================================
    // Headless: poll for the requested duration, then exit
    // ============================================================
    if (opts.runMs > 0) {
        LOG_PHASE("Headless poll loop", true);
        try {
            std::size_t fired = runPollLoop(ctx, opts.runMs);
            history.flush(std::cout);
            LOG_DEBUG("Timers", std::to_string(fired) + " timer(s) fired");
        } catch (const polltimer::TimerError& e) {
            history.flush(std::cout);
            ErrorManager::report(e.errorCode(), e.what());
            exitCode = 1;
        } catch (const std::exception& e) {
            history.flush(std::cout);
            LOG_ERROR("Timers", std::string("Action failed: ") + e.what());
            exitCode = 1;
        }
        LOG_PHASE("Shutdown complete", exitCode == 0);
        shutdownLogger();
        return exitCode;
    }

    // ============================================================
    // Console REPL loop: one poll pass after every line
    // ============================================================
    LOG_PHASE("Startup complete, entering main loop", true);
    std::string line;
    while (true) {
        std::cout << "> " << std::flush;
        if (!std::getline(std::cin, line)) {
            break; // EOF / Ctrl+D
        }

        if (!line.empty()) {
            if (line == "quit" || line == "exit") {
                LOG_PHASE("Shutdown requested", true);
                break;
            }
            LOG_TRACE("Console", "Dispatching command: " + line);
            handleCommand(ctx, line);
        }

        try {
            registry.poll();
        } catch (const polltimer::TimerError& e) {
            history.push(ErrorManager::report(e.errorCode(), e.what()).message, sf::Color::Red);
        } catch (const std::exception& e) {
            LOG_ERROR("Timers", std::string("Action failed: ") + e.what());
            history.push(std::string("[Timer] Action failed: ") + e.what(), sf::Color::Red);
        }
        history.flush(std::cout);
    }

    LOG_PHASE("Shutdown complete", true);
    shutdownLogger();
    return exitCode;
}
