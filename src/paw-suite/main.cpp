#include <iostream>
#include <fstream>
#include <getopt.h>
#include "common/config.h"
#include "common/logger.h"
#include "common/command_runner.h"
#include "common/interface_locks.h"
#include "common/text_utils.h"
#include "paw-mon/interface_probe.h"
#include "paw-mon/mode_controller.h"
#include "paw-mon/mac_changer.h"
#include "paw-dump/session_controller.h"
#include "paw-dump/network_scanner.h"
#include "paw-dump/capture_inspector.h"
#include "paw-lib/network_database.h"
#include "paw-suite/command_dispatcher.h"
#include "paw-suite/shutdown_coordinator.h"
#include "paw-suite/console.h"

using namespace paw;

void printUsage(const char* program_name) {
    std::cout << "PAW Wireless Assistant v1.0\n";
    std::cout << "Usage: " << program_name << " [OPTIONS] [COMMAND...]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config FILE        Configuration file (default: ~/.config/paw/paw.conf)\n";
    std::cout << "  -d, --database FILE      Network database (default: paw_networks.db)\n";
    std::cout << "  -o, --output DIR         Directory for capture files\n";
    std::cout << "  -v, --verbose            Verbose output\n";
    std::cout << "  -h, --help               Show this help\n";
    std::cout << "\nWithout a command an interactive shell is started. A capture started as a\n";
    std::cout << "command runs until Ctrl+C, which also restores the interface.\n";
    std::cout << "\nExamples:\n";
    std::cout << "  " << program_name << "\n";
    std::cout << "  " << program_name << " interface list\n";
    std::cout << "  " << program_name << " -o /tmp/caps capture start wlan0mon AA:BB:CC:DD:EE:FF 6\n";
}

static bool fileExists(const std::string& path) {
    std::ifstream file(path);
    return file.good();
}

int main(int argc, char* argv[]) {
    // Before any thread exists, so every thread inherits the blocked mask
    ShutdownCoordinator::blockSignals();

    std::string config_file;
    std::string database_path;
    std::string output_dir;
    bool verbose = false;

    static struct option long_options[] = {
        {"config", required_argument, 0, 'c'},
        {"database", required_argument, 0, 'd'},
        {"output", required_argument, 0, 'o'},
        {"verbose", no_argument, 0, 'v'},
        {"help", no_argument, 0, 'h'},
        {0, 0, 0, 0}
    };

    int c;
    // '+' stops at the first non-option so commands keep their own arguments
    while ((c = getopt_long(argc, argv, "+c:d:o:vh", long_options, nullptr)) != -1) {
        switch (c) {
            case 'c':
                config_file = optarg;
                break;
            case 'd':
                database_path = optarg;
                break;
            case 'o':
                output_dir = optarg;
                break;
            case 'v':
                verbose = true;
                break;
            case 'h':
                printUsage(argv[0]);
                return 0;
            default:
                printUsage(argv[0]);
                return 1;
        }
    }

    std::vector<std::string> command_words;
    for (int i = optind; i < argc; ++i) {
        command_words.push_back(argv[i]);
    }

    ConfigManager& config_manager = ConfigManager::getInstance();
    if (!config_file.empty()) {
        if (!config_manager.loadConfig(config_file)) {
            std::cerr << "Error: cannot read configuration file " << config_file << std::endl;
            return 1;
        }
    } else {
        std::string default_path = ConfigManager::defaultConfigPath();
        if (!default_path.empty() && fileExists(default_path)) {
            config_manager.loadConfig(default_path);
        }
    }

    if (!database_path.empty()) config_manager.setDatabasePath(database_path);
    if (!output_dir.empty()) config_manager.setCaptureDir(output_dir);
    if (verbose) config_manager.setVerbose(true);

    const Config& config = config_manager.getConfig();

    // Initialize logger
    Logger& logger = Logger::getInstance();
    LogLevel console_level;
    if (Logger::parseLevel(config.console_log_level, console_level)) {
        logger.setConsoleLevel(console_level);
    }
    logger.setVerbose(config.verbose);
    if (!config.log_file.empty() && !logger.setLogFile(config.log_file)) {
        std::cerr << "Warning: cannot open log file " << config.log_file << std::endl;
    }

    SystemCommandRunner runner;
    InterfaceLocks locks;

    InterfaceProbe probe(runner);
    probe.setMacchangerBinary(config.macchanger_binary);
    ModeController modes(runner, probe, locks, config);
    MacChanger macs(runner, locks, config);
    SessionController sessions(runner, locks, config);
    NetworkScanner scanner(sessions, config);
    CaptureInspector inspector;

    NetworkDatabase database;
    if (!database.open(config.database_path)) {
        logger.warning("Continuing without the network database");
    }

    ConsoleOutput output;
    ConsolePrompt prompt;
    StaticKeywordAdvisor advisor;

    CommandDispatcher dispatcher(probe, modes, macs, sessions, scanner, inspector, database,
                                 output, prompt, advisor);
    dispatcher.setLineOutput([&output](const std::string& line) { output.line(line); });

    ShutdownCoordinator coordinator(sessions, probe, modes, output);
    coordinator.setCleanupHook([&database, &logger]() {
        database.close();
        logger.closeLogFile();
    });
    if (!coordinator.install()) {
        logger.warning("Signal handling is unavailable; Ctrl+C will not restore interfaces");
    }

    if (!command_words.empty()) {
        coordinator.setRestoreOnFinish(false);
        dispatcher.runOnce(joinArgs(command_words));
        coordinator.shutdown("command finished");
        return 0;
    }

    std::cout << R"(
    ╔═══════════════════════════════════════════════════════════════╗
    ║                              PAW                              ║
    ║             Wireless Interface and Capture Assistant          ║
    ║                  Type 'help' for the commands                 ║
    ╚═══════════════════════════════════════════════════════════════╝
    )" << std::endl;

    std::string line;
    std::string reason = "end of input";
    while (true) {
        std::cout << "paw> " << std::flush;
        if (!std::getline(std::cin, line)) {
            std::cout << std::endl;
            break;
        }
        if (!dispatcher.handleLine(line)) {
            reason = "exit";
            break;
        }
    }

    coordinator.shutdown(reason);
    return 0;
}
