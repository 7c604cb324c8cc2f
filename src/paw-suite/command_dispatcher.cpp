#include "paw-suite/command_dispatcher.h"
#include "common/logger.h"
#include "common/text_utils.h"
#include <cstdlib>
#include <ctime>
#include <sstream>
#include <iomanip>

namespace paw {

namespace {

std::string formatTime(const std::chrono::system_clock::time_point& when) {
    std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm tm_buf;
    localtime_r(&t, &tm_buf);
    std::ostringstream out;
    out << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return out.str();
}

std::string withNotes(const std::string& notes, const std::string& text) {
    if (notes.empty()) return text;
    return notes + "\n" + text;
}

} // namespace

CommandDispatcher::CommandDispatcher(InterfaceProbe& probe, ModeController& modes, MacChanger& macs,
                                     SessionController& sessions, NetworkScanner& scanner,
                                     CaptureInspector& inspector, NetworkDatabase& database,
                                     OutputSink& output, ConfirmationPrompt& prompt, KeywordAdvisor& advisor)
    : probe_(probe), modes_(modes), macs_(macs), sessions_(sessions), scanner_(scanner),
      inspector_(inspector), database_(database), output_(output), prompt_(prompt), advisor_(advisor) {
    sessions_.setCompletionHandler([this](const SessionSummary& summary) { onCaptureFinished(summary); });
}

CommandDispatcher::~CommandDispatcher() {
    sessions_.setCompletionHandler(nullptr);
}

bool CommandDispatcher::handleLine(const std::string& line) {
    if (trim(line).empty()) {
        return true;
    }

    ParsedCommand command = parser_.parse(line);
    DispatchResult result = dispatch(command);
    if (result.exit_requested) {
        return false;
    }

    output_.display(result.text, result.title);
    previous_output_ = result.text;
    return true;
}

void CommandDispatcher::runOnce(const std::string& line) {
    handleLine(line);
    if (!sessions_.isActive()) {
        return;
    }

    if (on_line_) {
        on_line_("Capture running. Press Ctrl+C to stop it and restore the interface.");
    }
    sessions_.waitForCaptureEnd();
    Logger::getInstance().info("One-shot capture ended");
}

DispatchResult CommandDispatcher::dispatch(const ParsedCommand& command) {
    DispatchResult result;

    if (!command.valid()) {
        result.title = "Error";
        result.text = command.error;
        return result;
    }

    if (!command.explanation.empty()) {
        Logger::getInstance().debug(operationToString(command.operation) + ": " + command.explanation);
    }

    try {
        switch (command.operation) {
            case Operation::LIST_INTERFACES:
                return listInterfaces();
            case Operation::SET_MONITOR_MODE:
                return setMonitorMode(command);
            case Operation::SET_MANAGED_MODE:
                return setManagedMode(command);
            case Operation::CHECK_INTERFERENCE:
                result.title = "Interference Check";
                result.text = modes_.checkInterference();
                return result;
            case Operation::SCAN_NETWORKS:
                return scanNetworks(command);
            case Operation::START_CAPTURE:
                return startCapture(command);
            case Operation::STOP_CAPTURE:
                return stopCapture();
            case Operation::CAPTURE_STATUS:
                result.title = "Capture Status";
                result.text = sessions_.status();
                return result;
            case Operation::DEAUTH_ATTACK:
                return deauthAttack(command);
            case Operation::CHANGE_MAC:
                return changeMac(command);
            case Operation::DATABASE:
                return database(command);
            case Operation::HELP:
                result.title = "Help";
                result.text = CommandParser::helpText();
                return result;
            case Operation::EXIT:
                result.exit_requested = true;
                return result;
            case Operation::UNKNOWN:
                return unknown(command);
        }
    } catch (const std::exception& e) {
        Logger::getInstance().error(std::string("Command failed: ") + e.what());
        result.title = "Error";
        result.text = std::string("Error: ") + e.what();
        return result;
    }

    return unknown(command);
}

bool CommandDispatcher::ensureMonitorMode(std::string& interface, std::string& notes, std::string& error) {
    InterfaceMode mode = probe_.modeOf(interface);
    if (mode == InterfaceMode::MONITOR) {
        return true;
    }

    std::string question = "Interface " + interface + " is not in monitor mode (" + modeToString(mode) +
                           "). Enable monitor mode now?";
    if (!prompt_.confirm(question)) {
        error = "Operation cancelled: " + interface + " is not in monitor mode.";
        return false;
    }

    // Shutdown may have restored the interfaces while the prompt was open
    if (sessions_.isShuttingDown()) {
        error = "Shutting down: monitor mode not enabled on " + interface;
        return false;
    }

    ModeChangeResult changed = modes_.enableMonitorMode(interface);
    if (!changed.changed()) {
        error = changed.message;
        return false;
    }

    notes = changed.message;
    interface = changed.new_name;
    return true;
}

void CommandDispatcher::onCaptureFinished(const SessionSummary& summary) {
    HandshakeReport report;
    if (endsWith(summary.output_file, ".cap")) {
        report = inspector_.inspect(summary.output_file, summary.bssid);
    } else {
        report.file = summary.output_file;
        report.error = "no capture file written";
    }

    {
        std::lock_guard<std::mutex> lock(report_mutex_);
        last_report_ = report;
    }

    if (!database_.isOpen()) {
        return;
    }

    CaptureRecord record;
    record.interface_name = summary.interface_name;
    record.bssid = summary.bssid;
    record.channel = summary.channel;
    record.file = summary.output_file;
    record.sha256 = NetworkDatabase::sha256File(summary.output_file);
    record.handshake = report.complete;
    record.started_at = formatTime(summary.started_at);
    record.ended_at = formatTime(summary.ended_at);
    database_.recordCapture(record);
}

DispatchResult CommandDispatcher::listInterfaces() {
    DispatchResult result;
    result.title = "Wireless Interfaces";
    result.text = InterfaceProbe::formatTable(probe_.listInterfaces());
    return result;
}

DispatchResult CommandDispatcher::setMonitorMode(const ParsedCommand& command) {
    DispatchResult result;
    result.title = "Monitor Mode";
    result.text = modes_.enableMonitorMode(command.arguments[0]).message;
    return result;
}

DispatchResult CommandDispatcher::setManagedMode(const ParsedCommand& command) {
    DispatchResult result;
    result.title = "Managed Mode";
    result.text = modes_.setManagedMode(command.arguments[0]).message;
    return result;
}

DispatchResult CommandDispatcher::scanNetworks(const ParsedCommand& command) {
    DispatchResult result;
    result.title = "Network Scan";

    std::string interface = command.arguments[0];
    int seconds = command.arguments.size() > 1 ? std::atoi(command.arguments[1].c_str()) : 0;

    std::string notes;
    std::string error;
    if (!ensureMonitorMode(interface, notes, error)) {
        result.text = error;
        return result;
    }

    ScanResult scan = scanner_.scan(interface, seconds, on_line_);
    std::string text = NetworkScanner::formatResult(scan);

    if (scan.ok && database_.isOpen()) {
        size_t stored = 0;
        for (const auto& network : scan.networks) {
            NetworkRecord record;
            record.bssid = network.bssid;
            record.essid = network.essid;
            record.channel = network.channel;
            record.encryption = network.privacy;
            record.power = network.power;
            if (database_.upsertNetwork(record)) stored++;
        }
        for (const auto& client : scan.clients) {
            ClientRecord record;
            record.mac = client.mac;
            record.bssid = client.bssid;
            record.power = client.power;
            record.probed_essids = client.probed_essids;
            database_.upsertClient(record);
        }
        text += "\n\nSaved " + std::to_string(stored) + " network(s) to " + database_.path();
    }

    result.text = withNotes(notes, text);
    return result;
}

DispatchResult CommandDispatcher::startCapture(const ParsedCommand& command) {
    DispatchResult result;
    result.title = "Capture";

    std::string interface = command.arguments[0];
    const std::string& bssid = command.arguments[1];
    const std::string& channel = command.arguments[2];

    std::string notes;
    std::string error;
    if (!ensureMonitorMode(interface, notes, error)) {
        result.text = error;
        return result;
    }

    SessionResult started = sessions_.startCapture(interface, bssid, channel);
    if (started.ok() && database_.isOpen()) {
        NetworkRecord record;
        record.bssid = bssid;
        record.channel = std::atoi(channel.c_str());
        database_.upsertNetwork(record);
    }

    result.text = withNotes(notes, started.message);
    return result;
}

DispatchResult CommandDispatcher::stopCapture() {
    DispatchResult result;
    result.title = "Capture Stopped";

    SessionResult stopped = sessions_.stop();
    result.text = stopped.message;

    if (stopped.ok()) {
        std::lock_guard<std::mutex> lock(report_mutex_);
        if (last_report_.file == stopped.output_file) {
            result.text += "\n" + CaptureInspector::formatReport(last_report_);
        }
    }
    return result;
}

DispatchResult CommandDispatcher::deauthAttack(const ParsedCommand& command) {
    DispatchResult result;
    result.title = "Deauthentication Attack";

    std::string interface = command.arguments[0];
    const std::string& bssid = command.arguments[1];
    const std::string& client = command.arguments[2];
    int count = std::atoi(command.arguments[3].c_str());

    std::string notes;
    std::string error;
    if (!ensureMonitorMode(interface, notes, error)) {
        result.text = error;
        return result;
    }

    SessionResult attack = sessions_.startAttack(interface, bssid, client, count, on_line_);
    result.text = withNotes(notes, attack.message);
    return result;
}

DispatchResult CommandDispatcher::changeMac(const ParsedCommand& command) {
    DispatchResult result;
    result.title = "MAC Address";

    MacChangeMode mode;
    if (!macChangeModeFromString(command.arguments[1], mode)) {
        result.text = "Error: invalid MAC mode: " + command.arguments[1];
        return result;
    }

    std::string mac = mode == MacChangeMode::SPECIFIC ? command.arguments[1] : "";
    result.text = macs_.changeMac(command.arguments[0], mode, mac);
    return result;
}

DispatchResult CommandDispatcher::database(const ParsedCommand& command) {
    DispatchResult result;
    result.title = "Database";

    if (!database_.isOpen()) {
        result.text = "Database is not available";
        return result;
    }

    const std::string& sub = command.arguments[0];
    if (sub == "networks") {
        result.text = NetworkDatabase::formatNetworks(database_.listNetworks());
    } else if (sub == "clients") {
        std::string bssid = command.arguments.size() > 1 ? command.arguments[1] : "";
        result.text = NetworkDatabase::formatClients(database_.listClients(bssid));
    } else if (sub == "captures") {
        result.text = NetworkDatabase::formatCaptures(database_.listCaptures());
    } else if (sub == "add") {
        NetworkRecord record;
        record.bssid = command.arguments[1];
        record.essid = command.arguments[2];
        if (command.arguments.size() > 3) {
            record.channel = std::atoi(command.arguments[3].c_str());
        }
        result.text = database_.upsertNetwork(record)
            ? "Network " + record.bssid + " saved"
            : "Error: could not save network " + record.bssid;
    } else if (sub == "remove") {
        result.text = database_.removeNetwork(command.arguments[1])
            ? "Network " + command.arguments[1] + " removed"
            : "Network " + command.arguments[1] + " not found";
    } else if (sub == "export") {
        std::string message;
        database_.exportCsv(command.arguments[1], message);
        result.text = message;
    } else {
        result.text = "Error: invalid db subcommand: " + sub;
    }
    return result;
}

DispatchResult CommandDispatcher::unknown(const ParsedCommand& command) {
    DispatchResult result;
    result.title = "Suggestion";

    std::string advice = advisor_.advise(command.raw, previous_output_);
    if (!advice.empty()) {
        result.text = advice;
    } else {
        std::string verb = command.arguments.empty() ? command.raw : command.arguments[0];
        result.text = "Unknown command: " + verb + ". Type 'help' for available commands.";
    }
    return result;
}

} // namespace paw
