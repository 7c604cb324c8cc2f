#include "paw-suite/command_parser.h"
#include "common/types.h"
#include "common/text_utils.h"
#include <cstdlib>

namespace paw {

namespace {

bool isNumber(const std::string& text) {
    return !text.empty() && text.size() <= 9 && text.find_first_not_of("0123456789") == std::string::npos;
}

bool isClientSentinel(const std::string& text) {
    std::string lower = toLower(text);
    return lower == "broadcast" || lower == "all" || lower == "*";
}

bool require(const std::vector<std::string>& tokens, size_t index, const std::string& name,
             ParsedCommand& command) {
    if (tokens.size() <= index) {
        command.error = "Error: missing parameter: " + name;
        return false;
    }
    return true;
}

void invalid(ParsedCommand& command, const std::string& name, const std::string& value) {
    command.error = "Error: invalid " + name + ": " + value;
}

bool checkInterface(const std::string& name, ParsedCommand& command) {
    if (!CommandParser::isValidInterfaceName(name)) {
        invalid(command, "interface", name);
        return false;
    }
    return true;
}

bool checkBssid(const std::string& bssid, ParsedCommand& command) {
    if (!isValidMacAddress(bssid)) {
        invalid(command, "BSSID", bssid);
        return false;
    }
    return true;
}

} // namespace

std::string operationToString(Operation operation) {
    switch (operation) {
        case Operation::LIST_INTERFACES: return "list_interfaces";
        case Operation::SET_MONITOR_MODE: return "set_monitor_mode";
        case Operation::SET_MANAGED_MODE: return "set_managed_mode";
        case Operation::CHECK_INTERFERENCE: return "check_interference";
        case Operation::SCAN_NETWORKS: return "scan_networks";
        case Operation::START_CAPTURE: return "start_capture";
        case Operation::STOP_CAPTURE: return "stop_capture";
        case Operation::CAPTURE_STATUS: return "capture_status";
        case Operation::DEAUTH_ATTACK: return "deauth_attack";
        case Operation::CHANGE_MAC: return "change_mac";
        case Operation::DATABASE: return "database";
        case Operation::HELP: return "help";
        case Operation::EXIT: return "exit";
        case Operation::UNKNOWN: return "unknown";
    }
    return "unknown";
}

bool CommandParser::isValidInterfaceName(const std::string& name) {
    // IFNAMSIZ - 1
    if (name.empty() || name.size() > 15) return false;
    for (char c : name) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                  c == '_' || c == '-' || c == '.';
        if (!ok) return false;
    }
    return true;
}

bool CommandParser::isValidChannel(const std::string& text) {
    if (!isNumber(text)) return false;
    int channel = std::atoi(text.c_str());
    return channel >= 1 && channel <= 196;
}

ParsedCommand CommandParser::parse(const std::string& line) const {
    ParsedCommand command;
    command.raw = trim(line);

    std::vector<std::string> tokens = splitWhitespace(command.raw);
    if (tokens.empty()) {
        return command;
    }

    std::string verb = toLower(tokens[0]);
    if (verb == "interface" || verb == "iface") {
        parseInterface(tokens, command);
    } else if (verb == "scan") {
        parseScan(tokens, command);
    } else if (verb == "capture") {
        parseCapture(tokens, command);
    } else if (verb == "attack") {
        parseAttack(tokens, command);
    } else if (verb == "db") {
        parseDatabase(tokens, command);
    } else if (verb == "macchanger") {
        parseMacChanger(tokens, command);
    } else if (verb == "help" || verb == "?") {
        command.operation = Operation::HELP;
    } else if (verb == "exit" || verb == "quit") {
        command.operation = Operation::EXIT;
    } else {
        command.operation = Operation::UNKNOWN;
        command.arguments = tokens;
    }
    return command;
}

void CommandParser::parseInterface(const std::vector<std::string>& tokens, ParsedCommand& command) const {
    std::string sub = tokens.size() > 1 ? toLower(tokens[1]) : "list";

    if (sub == "list") {
        command.operation = Operation::LIST_INTERFACES;
        command.explanation = "Listing wireless interfaces and their current mode";
    } else if (sub == "monitor" || sub == "managed") {
        command.operation = sub == "monitor" ? Operation::SET_MONITOR_MODE : Operation::SET_MANAGED_MODE;
        command.explanation = sub == "monitor"
            ? "Switching the interface to monitor mode so it can capture all nearby wireless traffic"
            : "Returning the interface to managed mode for normal network use";
        if (!require(tokens, 2, "interface", command)) return;
        if (!checkInterface(tokens[2], command)) return;
        command.arguments.push_back(tokens[2]);
    } else if (sub == "check") {
        command.operation = Operation::CHECK_INTERFERENCE;
        command.explanation = "Checking for processes that could interfere with monitor mode";
    } else {
        command.operation = Operation::LIST_INTERFACES;
        invalid(command, "interface subcommand", tokens[1]);
    }
}

void CommandParser::parseScan(const std::vector<std::string>& tokens, ParsedCommand& command) const {
    command.operation = Operation::SCAN_NETWORKS;
    command.explanation = "Scanning for nearby access points and their clients";

    if (!require(tokens, 1, "subcommand", command)) return;
    if (toLower(tokens[1]) != "networks") {
        invalid(command, "scan subcommand", tokens[1]);
        return;
    }
    if (!require(tokens, 2, "interface", command)) return;
    if (!checkInterface(tokens[2], command)) return;
    command.arguments.push_back(tokens[2]);

    if (tokens.size() > 3) {
        if (!isNumber(tokens[3]) || std::atoi(tokens[3].c_str()) <= 0) {
            invalid(command, "duration", tokens[3]);
            return;
        }
        command.arguments.push_back(tokens[3]);
    }
}

void CommandParser::parseCapture(const std::vector<std::string>& tokens, ParsedCommand& command) const {
    command.operation = Operation::START_CAPTURE;
    if (!require(tokens, 1, "subcommand", command)) return;

    std::string sub = toLower(tokens[1]);
    if (sub == "stop") {
        command.operation = Operation::STOP_CAPTURE;
        command.explanation = "Stopping the active capture session";
        return;
    }
    if (sub == "status") {
        command.operation = Operation::CAPTURE_STATUS;
        command.explanation = "Showing the active capture session";
        return;
    }
    if (sub != "start") {
        invalid(command, "capture subcommand", tokens[1]);
        return;
    }

    command.explanation = "Capturing packets for a specific access point and saving to file";
    if (!require(tokens, 2, "interface", command)) return;
    if (!require(tokens, 3, "bssid", command)) return;
    if (!require(tokens, 4, "channel", command)) return;
    if (!checkInterface(tokens[2], command)) return;
    if (!checkBssid(tokens[3], command)) return;
    if (!isValidChannel(tokens[4])) {
        invalid(command, "channel", tokens[4]);
        return;
    }

    command.arguments = {tokens[2], normalizeMacAddress(tokens[3]), tokens[4]};
}

void CommandParser::parseAttack(const std::vector<std::string>& tokens, ParsedCommand& command) const {
    command.operation = Operation::DEAUTH_ATTACK;
    command.explanation = "Sending deauthentication frames to disconnect clients from an access point";

    if (!require(tokens, 1, "attack type", command)) return;
    if (toLower(tokens[1]) != "deauth") {
        invalid(command, "attack type", tokens[1]);
        return;
    }
    if (!require(tokens, 2, "interface", command)) return;
    if (!require(tokens, 3, "bssid", command)) return;
    if (!checkInterface(tokens[2], command)) return;
    if (!checkBssid(tokens[3], command)) return;

    std::string client = "broadcast";
    std::string count = std::to_string(kDefaultDeauthCount);

    size_t next = 4;
    if (tokens.size() > next && !isNumber(tokens[next])) {
        if (!isClientSentinel(tokens[next]) && !isValidMacAddress(tokens[next])) {
            invalid(command, "client", tokens[next]);
            return;
        }
        client = isClientSentinel(tokens[next]) ? "broadcast" : normalizeMacAddress(tokens[next]);
        ++next;
    }
    if (tokens.size() > next) {
        if (!isNumber(tokens[next])) {
            invalid(command, "count", tokens[next]);
            return;
        }
        count = tokens[next];
        ++next;
    }
    if (tokens.size() > next) {
        invalid(command, "argument", tokens[next]);
        return;
    }

    command.arguments = {tokens[2], normalizeMacAddress(tokens[3]), client, count};
}

void CommandParser::parseDatabase(const std::vector<std::string>& tokens, ParsedCommand& command) const {
    command.operation = Operation::DATABASE;
    command.explanation = "Querying the local network database";

    std::string sub = tokens.size() > 1 ? toLower(tokens[1]) : "networks";
    command.arguments.push_back(sub);

    if (sub == "networks" || sub == "captures") {
        return;
    }
    if (sub == "clients") {
        if (tokens.size() > 2) {
            if (!checkBssid(tokens[2], command)) return;
            command.arguments.push_back(normalizeMacAddress(tokens[2]));
        }
        return;
    }
    if (sub == "add") {
        command.explanation = "Adding a network to the local database";
        if (!require(tokens, 2, "bssid", command)) return;
        if (!checkBssid(tokens[2], command)) return;
        command.arguments.push_back(normalizeMacAddress(tokens[2]));
        command.arguments.push_back(tokens.size() > 3 ? tokens[3] : "");
        if (tokens.size() > 4) {
            if (!isValidChannel(tokens[4])) {
                invalid(command, "channel", tokens[4]);
                return;
            }
            command.arguments.push_back(tokens[4]);
        }
        return;
    }
    if (sub == "remove") {
        command.explanation = "Removing a network from the local database";
        if (!require(tokens, 2, "bssid", command)) return;
        if (!checkBssid(tokens[2], command)) return;
        command.arguments.push_back(normalizeMacAddress(tokens[2]));
        return;
    }
    if (sub == "export") {
        command.explanation = "Exporting the network database to a CSV file";
        if (!require(tokens, 2, "file", command)) return;
        command.arguments.push_back(tokens[2]);
        return;
    }

    invalid(command, "db subcommand", tokens[1]);
}

void CommandParser::parseMacChanger(const std::vector<std::string>& tokens, ParsedCommand& command) const {
    command.operation = Operation::CHANGE_MAC;
    command.explanation = "Changing the hardware address of the interface";

    if (!require(tokens, 1, "interface", command)) return;
    if (!checkInterface(tokens[1], command)) return;

    std::string mode = tokens.size() > 2 ? tokens[2] : "random";
    std::string lower = toLower(mode);
    if (lower != "random" && lower != "vendor" && lower != "anyvendor" && lower != "permanent" &&
        lower != "reset" && !isValidMacAddress(mode)) {
        invalid(command, "MAC mode", mode);
        return;
    }

    command.arguments = {tokens[1], isValidMacAddress(mode) ? normalizeMacAddress(mode) : lower};
}

std::string CommandParser::helpText() {
    return
        "Interface management:\n"
        "  interface list                          Show wireless interfaces\n"
        "  interface monitor <iface>               Enable monitor mode\n"
        "  interface managed <iface>               Return to managed mode\n"
        "  interface check                         Show processes that interfere with monitor mode\n"
        "  macchanger <iface> [random|vendor|anyvendor|permanent|<mac>]\n"
        "\n"
        "Reconnaissance and capture:\n"
        "  scan networks <iface> [seconds]         Scan for access points and clients\n"
        "  capture start <iface> <bssid> <channel> Start a background capture\n"
        "  capture stop                            Stop the capture and check for a handshake\n"
        "  capture status                          Show the active capture\n"
        "\n"
        "Attacks:\n"
        "  attack deauth <iface> <bssid> [client|broadcast] [count]\n"
        "                                          Deauthenticate clients (count 0 = continuous)\n"
        "\n"
        "Database:\n"
        "  db networks | db clients [bssid] | db captures\n"
        "  db add <bssid> [essid] [channel] | db remove <bssid> | db export <file>\n"
        "\n"
        "  help                                    Show this help\n"
        "  exit                                    Restore interfaces and quit";
}

} // namespace paw
