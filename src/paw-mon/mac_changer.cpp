#include "paw-mon/mac_changer.h"
#include "common/logger.h"
#include "common/text_utils.h"
#include <regex>

namespace paw {

bool macChangeModeFromString(const std::string& text, MacChangeMode& mode) {
    std::string lower = toLower(text);
    if (lower.empty() || lower == "random") {
        mode = MacChangeMode::RANDOM;
    } else if (lower == "vendor") {
        mode = MacChangeMode::SAME_VENDOR;
    } else if (lower == "anyvendor") {
        mode = MacChangeMode::ANY_VENDOR;
    } else if (lower == "permanent" || lower == "reset") {
        mode = MacChangeMode::PERMANENT;
    } else if (isValidMacAddress(text)) {
        mode = MacChangeMode::SPECIFIC;
    } else {
        return false;
    }
    return true;
}

std::string parseNewMac(const std::string& output) {
    static const std::regex new_mac("New MAC:\\s+([0-9A-Fa-f]{2}(?::[0-9A-Fa-f]{2}){5})");
    std::smatch match;
    if (std::regex_search(output, match, new_mac)) {
        return normalizeMacAddress(match[1].str());
    }
    return "";
}

MacChanger::MacChanger(CommandRunner& runner, InterfaceLocks& locks, const Config& config)
    : runner_(runner), locks_(locks), macchanger_(config.macchanger_binary) {
}

bool MacChanger::setLink(const std::string& interface, const std::string& state) {
    CommandResult result = runner_.run({"ip", "link", "set", interface, state});
    if (!result.succeeded()) {
        Logger::getInstance().warning("Could not set " + interface + " " + state + ": " + trim(result.error));
        return false;
    }
    return true;
}

std::string MacChanger::changeMac(const std::string& interface, MacChangeMode mode, const std::string& mac) {
    if (!runner_.isAvailable(macchanger_)) {
        return macchanger_ + " is not installed. Install with: sudo apt-get install macchanger";
    }

    std::vector<std::string> argv = {macchanger_};
    switch (mode) {
        case MacChangeMode::RANDOM:      argv.push_back("-r"); break;
        case MacChangeMode::SAME_VENDOR: argv.push_back("-a"); break;
        case MacChangeMode::ANY_VENDOR:  argv.push_back("-A"); break;
        case MacChangeMode::PERMANENT:   argv.push_back("-p"); break;
        case MacChangeMode::SPECIFIC:
            if (!isValidMacAddress(mac)) {
                return "Error: invalid MAC address: " + mac;
            }
            argv.push_back("-m");
            argv.push_back(normalizeMacAddress(mac));
            break;
    }
    argv.push_back(interface);

    try {
        auto lock = locks_.acquire(interface);

        setLink(interface, "down");
        CommandResult changed = runner_.run(argv);
        // The link goes back up whatever macchanger did
        setLink(interface, "up");

        if (!changed.succeeded()) {
            std::string text = trim(changed.error);
            if (text.empty()) text = trim(changed.output);
            Logger::getInstance().error("macchanger failed on " + interface + ": " + text);
            return "Error changing MAC address on " + interface + ": " + text;
        }

        std::string new_mac = parseNewMac(changed.output);
        if (new_mac.empty()) {
            return "MAC address on " + interface + " may have changed, but couldn't confirm. "
                   "Verify manually with 'interface list'.";
        }

        Logger::getInstance().info("MAC address of " + interface + " is now " + new_mac);
        return "MAC address of " + interface + " changed to " + new_mac;
    } catch (const std::exception& e) {
        Logger::getInstance().error(std::string("Unexpected error changing MAC address: ") + e.what());
        return std::string("Error changing MAC address: ") + e.what();
    }
}

} // namespace paw
