#include "paw-mon/probe_parsers.h"
#include "common/text_utils.h"
#include <regex>
#include <set>

namespace paw {

namespace {

const std::regex kMacPattern("([0-9A-Fa-f]{2}(?::[0-9A-Fa-f]{2}){5})");

std::string firstMac(const std::string& text) {
    std::smatch match;
    if (std::regex_search(text, match, kMacPattern)) {
        return normalizeMacAddress(match[1].str());
    }
    return "";
}

void appendUnique(std::vector<Interface>& list, std::set<std::string>& seen, const Interface& iface) {
    if (iface.name.empty() || seen.count(iface.name)) return;
    seen.insert(iface.name);
    list.push_back(iface);
}

} // namespace

bool isWirelessName(const std::string& name) {
    std::string lower = toLower(name);
    return startsWith(lower, "wl") ||
           lower.find("wlan") != std::string::npos ||
           lower.find("mon") != std::string::npos ||
           lower.find("wifi") != std::string::npos ||
           startsWith(lower, "ath");
}

std::vector<Interface> parseIwDev(const std::string& output) {
    std::vector<Interface> interfaces;
    std::set<std::string> seen;
    Interface current;
    bool have_current = false;

    for (const auto& raw : splitLines(output)) {
        std::string line = trim(raw);
        if (line.empty()) continue;

        if (startsWith(line, "Interface ")) {
            if (have_current) {
                appendUnique(interfaces, seen, current);
            }
            current = Interface();
            current.name = trim(line.substr(10));
            have_current = !current.name.empty();
        } else if (startsWith(line, "phy#") || startsWith(line, "Unnamed/non-netdev")) {
            // A new phy or a wdev without a netdev closes the current block
            if (have_current) {
                appendUnique(interfaces, seen, current);
                have_current = false;
            }
        } else if (have_current && startsWith(line, "addr ")) {
            std::string mac = firstMac(line);
            if (!mac.empty()) current.hardware_address = mac;
        } else if (have_current && startsWith(line, "type ")) {
            current.mode = modeFromString(line.substr(5));
        }
    }

    if (have_current) {
        appendUnique(interfaces, seen, current);
    }
    return interfaces;
}

std::vector<Interface> parseIpLink(const std::string& output) {
    // 3: wlan0: <BROADCAST,MULTICAST,UP,LOWER_UP> mtu 1500 ...
    //     link/ieee802.11/radiotap 00:11:22:33:44:55 brd ff:ff:ff:ff:ff:ff
    static const std::regex header("^\\s*\\d+:\\s+([^:@\\s]+)(?:@[^:]*)?:");

    std::vector<Interface> interfaces;
    std::set<std::string> seen;
    Interface current;
    bool have_current = false;

    auto flush = [&]() {
        if (have_current && isWirelessName(current.name)) {
            appendUnique(interfaces, seen, current);
        }
        have_current = false;
    };

    for (const auto& line : splitLines(output)) {
        std::smatch match;
        if (std::regex_search(line, match, header)) {
            flush();
            current = Interface();
            current.name = match[1].str();
            current.mode = InterfaceMode::UNKNOWN;
            have_current = true;
            continue;
        }
        if (!have_current) continue;

        std::string trimmed = trim(line);
        if (startsWith(trimmed, "link/")) {
            if (startsWith(trimmed, "link/ieee802.11/radiotap") || startsWith(trimmed, "link/ieee802.11/prism")) {
                current.mode = InterfaceMode::MONITOR;
            }
            std::string mac = firstMac(trimmed);
            if (!mac.empty()) current.hardware_address = mac;
        }
    }
    flush();
    return interfaces;
}

std::vector<Interface> parseProcNetDev(const std::string& content) {
    std::vector<Interface> interfaces;
    std::set<std::string> seen;

    for (const auto& line : splitLines(content)) {
        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;
        std::string name = trim(line.substr(0, colon));
        if (name.empty() || name.find('|') != std::string::npos) continue;
        if (!isWirelessName(name)) continue;

        Interface iface;
        iface.name = name;
        appendUnique(interfaces, seen, iface);
    }
    return interfaces;
}

std::vector<Interface> parseNetshInterfaces(const std::string& output) {
    std::vector<Interface> interfaces;
    std::set<std::string> seen;
    Interface current;
    bool have_current = false;

    for (const auto& raw : splitLines(output)) {
        size_t colon = raw.find(':');
        if (colon == std::string::npos) continue;

        std::string key = trim(raw.substr(0, colon));
        std::string value = trim(raw.substr(colon + 1));

        if (key == "Name") {
            if (have_current) {
                appendUnique(interfaces, seen, current);
            }
            current = Interface();
            current.name = value;
            // netsh only reports station-mode adapters
            current.mode = InterfaceMode::MANAGED;
            have_current = !value.empty();
        } else if (have_current && key == "Physical address") {
            std::string mac = normalizeMacAddress(value);
            if (isValidMacAddress(mac)) current.hardware_address = mac;
        }
    }

    if (have_current) {
        appendUnique(interfaces, seen, current);
    }
    return interfaces;
}

bool parseMacchangerShow(const std::string& output, std::string& current, std::string& permanent) {
    static const std::regex current_re("Current MAC:\\s+([0-9A-Fa-f:]{17})");
    static const std::regex permanent_re("Permanent MAC:\\s+([0-9A-Fa-f:]{17})");

    std::smatch match;
    bool found = false;
    if (std::regex_search(output, match, current_re)) {
        current = normalizeMacAddress(match[1].str());
        found = true;
    }
    if (std::regex_search(output, match, permanent_re)) {
        permanent = normalizeMacAddress(match[1].str());
    }
    return found;
}

std::string parseIfconfigAddress(const std::string& output) {
    // net-tools 2.x prints "ether", 1.x prints "HWaddr"
    static const std::regex ether_re("(?:ether|HWaddr)\\s+([0-9A-Fa-f:]{17})");

    std::smatch match;
    if (std::regex_search(output, match, ether_re)) {
        return normalizeMacAddress(match[1].str());
    }
    return "";
}

} // namespace paw
