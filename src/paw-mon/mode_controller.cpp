#include "paw-mon/mode_controller.h"
#include "paw-mon/airmon_parser.h"
#include "common/logger.h"
#include "common/text_utils.h"

namespace paw {

namespace {

std::string toolText(const CommandResult& result) {
    std::string text = trim(result.error);
    if (text.empty()) text = trim(result.output);
    if (text.empty()) text = "exit code " + std::to_string(result.exit_code);
    return tailLines(text, 8);
}

} // namespace

ModeController::ModeController(CommandRunner& runner, InterfaceProbe& probe, InterfaceLocks& locks,
                               const Config& config)
    : runner_(runner), probe_(probe), locks_(locks),
      airmon_(config.airmon_binary), restart_network_manager_(config.restart_network_manager) {
}

ModeChangeResult ModeController::toolMissing(const std::string& interface) const {
    ModeChangeResult result;
    result.new_name = interface;
    result.outcome = ModeOutcome::TOOL_UNAVAILABLE;
    result.message = airmon_ + " is not installed. Install with: sudo apt-get install aircrack-ng";
    return result;
}

ModeChangeResult ModeController::enableMonitorMode(const std::string& interface) {
    try {
        auto lock = locks_.acquire(interface);
        return doEnableMonitor(interface);
    } catch (const std::exception& e) {
        Logger::getInstance().error("Unexpected error enabling monitor mode on " + interface + ": " + e.what());
        ModeChangeResult result;
        result.new_name = interface;
        result.outcome = ModeOutcome::FAILED;
        result.message = std::string("Error enabling monitor mode: ") + e.what();
        return result;
    }
}

ModeChangeResult ModeController::doEnableMonitor(const std::string& interface) {
    if (!runner_.isAvailable(airmon_)) {
        Logger::getInstance().warning(airmon_ + " not found in PATH");
        return toolMissing(interface);
    }

    // Kill processes that might interfere with monitor mode
    CommandResult killed = runner_.run({airmon_, "check", "kill"});
    if (!killed.succeeded()) {
        Logger::getInstance().warning("airmon-ng check kill failed: " + toolText(killed));
    }

    CommandResult started = runner_.run({airmon_, "start", interface});
    ModeChangeResult result;
    result.new_name = interface;

    if (!started.launched) {
        result.outcome = ModeOutcome::FAILED;
        result.message = "Error enabling monitor mode on " + interface + ": " + toolText(started);
        return result;
    }

    AirmonParse parsed = parseAirmonStart(interface, started.output + "\n" + started.error, started.exit_code);
    result.new_name = parsed.new_name;

    switch (parsed.verdict) {
        case AirmonVerdict::CONFIRMED:
            result.outcome = ModeOutcome::CONFIRMED;
            result.message = "Monitor mode enabled on " + result.new_name;
            if (result.new_name != interface) {
                result.message += " (renamed from " + interface + ")";
            }
            result.message += describeAddress(result.new_name);
            Logger::getInstance().info(result.message);
            break;
        case AirmonVerdict::UNCERTAIN:
            result.outcome = ModeOutcome::UNCERTAIN;
            result.message = "Monitor mode may be enabled on " + interface +
                             ", but couldn't confirm. Verify manually with 'interface list'.";
            Logger::getInstance().warning("Unrecognized airmon-ng start output for " + interface);
            break;
        case AirmonVerdict::FAILED:
            result.outcome = ModeOutcome::FAILED;
            result.message = "Error enabling monitor mode on " + interface + ": " + toolText(started);
            Logger::getInstance().error(result.message);
            break;
    }

    return result;
}

ModeChangeResult ModeController::setManagedMode(const std::string& interface) {
    try {
        auto lock = locks_.acquire(interface);
        return doSetManaged(interface);
    } catch (const std::exception& e) {
        Logger::getInstance().error("Unexpected error setting managed mode on " + interface + ": " + e.what());
        ModeChangeResult result;
        result.new_name = interface;
        result.outcome = ModeOutcome::FAILED;
        result.message = std::string("Error setting managed mode: ") + e.what();
        return result;
    }
}

ModeChangeResult ModeController::doSetManaged(const std::string& interface) {
    if (!runner_.isAvailable(airmon_)) {
        Logger::getInstance().warning(airmon_ + " not found in PATH");
        return toolMissing(interface);
    }

    CommandResult stopped = runner_.run({airmon_, "stop", interface});
    ModeChangeResult result;
    result.new_name = interface;

    if (!stopped.launched) {
        result.outcome = ModeOutcome::FAILED;
        result.message = "Error setting managed mode on " + interface + ": " + toolText(stopped);
        return result;
    }

    AirmonParse parsed = parseAirmonStop(interface, stopped.output + "\n" + stopped.error, stopped.exit_code);
    result.new_name = parsed.new_name;

    switch (parsed.verdict) {
        case AirmonVerdict::CONFIRMED:
            result.outcome = ModeOutcome::CONFIRMED;
            result.message = "Managed mode enabled on " + result.new_name;
            if (result.new_name != interface) {
                result.message += " (renamed from " + interface + ")";
            }
            Logger::getInstance().info(result.message);
            break;
        case AirmonVerdict::UNCERTAIN:
            result.outcome = ModeOutcome::UNCERTAIN;
            result.message = "Managed mode may be enabled on " + interface +
                             ", but couldn't confirm. Verify manually with 'interface list'.";
            Logger::getInstance().warning("Unrecognized airmon-ng stop output for " + interface);
            break;
        case AirmonVerdict::FAILED:
            result.outcome = ModeOutcome::FAILED;
            result.message = "Error setting managed mode on " + interface + ": " + toolText(stopped);
            Logger::getInstance().error(result.message);
            return result;
    }

    // check kill stopped NetworkManager when monitor mode was enabled
    if (restart_network_manager_) {
        restartNetworkManager();
    }
    return result;
}

void ModeController::restartNetworkManager() {
    CommandResult nm = runner_.run({"service", "NetworkManager", "start"});
    if (!nm.succeeded()) {
        Logger::getInstance().warning("Could not restart NetworkManager: " + toolText(nm));
    }
}

std::string ModeController::checkInterference() {
    if (!runner_.isAvailable(airmon_)) {
        return toolMissing("").message;
    }

    CommandResult checked = runner_.run({airmon_, "check"});
    if (!checked.launched) {
        return "Error: " + toolText(checked);
    }
    if (checked.exit_code != 0) {
        return "Error: " + toolText(checked);
    }

    std::string text = trim(checked.output);
    if (text.empty() || text.find("Found") == std::string::npos) {
        return "No interfering processes found.";
    }
    return text;
}

std::string ModeController::describeAddress(const std::string& interface) {
    Interface iface;
    if (probe_.findInterface(interface, iface) && !iface.hardware_address.empty()) {
        return " (MAC: " + iface.hardware_address + ")";
    }
    return "";
}

} // namespace paw
