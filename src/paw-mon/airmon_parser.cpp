#include "paw-mon/airmon_parser.h"
#include "common/text_utils.h"
#include <regex>

namespace paw {

namespace {

const std::string kMonitorSuffix = "mon";

// "on [phy0]wlan0mon" or "on mon0". Interface names start with a letter;
// some airmon-ng versions print "on [phy0]10" (a channel) for an already
// enabled vif, which must not be taken as a name.
bool extractOnName(const std::string& line, std::string& name) {
    static const std::regex on_name("\\bon\\s+(?:\\[phy\\d+\\])?([A-Za-z][A-Za-z0-9_.\\-]*)");
    std::smatch match;
    if (std::regex_search(line, match, on_name)) {
        name = match[1].str();
        return true;
    }
    return false;
}

bool looksLikeError(const std::string& output) {
    std::string lower = toLower(output);
    return lower.find("error") != std::string::npos ||
           lower.find("failed") != std::string::npos ||
           lower.find("no such device") != std::string::npos ||
           lower.find("operation not supported") != std::string::npos ||
           lower.find("as root") != std::string::npos;
}

AirmonParse finish(const std::string& output, int exit_code, bool confirmed,
                   const std::string& explicit_name, const std::string& fallback_name,
                   const std::string& original_name) {
    AirmonParse result;

    if (confirmed) {
        result.verdict = AirmonVerdict::CONFIRMED;
        if (!explicit_name.empty()) {
            result.new_name = explicit_name;
            result.explicit_name = true;
        } else {
            result.new_name = fallback_name;
        }
        return result;
    }

    result.new_name = original_name;
    if (exit_code != 0 || looksLikeError(output)) {
        result.verdict = AirmonVerdict::FAILED;
    } else {
        result.verdict = AirmonVerdict::UNCERTAIN;
    }
    return result;
}

} // namespace

std::string monitorNameFor(const std::string& interface) {
    if (endsWith(interface, kMonitorSuffix)) {
        return interface;
    }
    return interface + kMonitorSuffix;
}

std::string managedNameFor(const std::string& interface) {
    if (endsWith(interface, kMonitorSuffix) && interface.size() > kMonitorSuffix.size()) {
        return interface.substr(0, interface.size() - kMonitorSuffix.size());
    }
    return interface;
}

AirmonParse parseAirmonStart(const std::string& interface, const std::string& output, int exit_code) {
    bool confirmed = false;
    std::string explicit_name;

    for (const auto& line : splitLines(output)) {
        std::string lower = toLower(line);
        if (lower.find("monitor mode") == std::string::npos) continue;

        if (lower.find("enabled") != std::string::npos) {
            confirmed = true;
            std::string name;
            if (explicit_name.empty() && extractOnName(line, name)) {
                explicit_name = name;
            }
        }
    }

    return finish(output, exit_code, confirmed, explicit_name, monitorNameFor(interface), interface);
}

AirmonParse parseAirmonStop(const std::string& interface, const std::string& output, int exit_code) {
    bool confirmed = false;
    std::string explicit_name;

    for (const auto& line : splitLines(output)) {
        std::string lower = toLower(line);

        if (lower.find("station mode") != std::string::npos && lower.find("enabled") != std::string::npos) {
            confirmed = true;
            std::string name;
            if (explicit_name.empty() && extractOnName(line, name)) {
                explicit_name = name;
            }
        } else if (lower.find("monitor mode") != std::string::npos &&
                   (lower.find("disabled") != std::string::npos || lower.find("removed") != std::string::npos)) {
            confirmed = true;
        }
    }

    return finish(output, exit_code, confirmed, explicit_name, managedNameFor(interface), interface);
}

} // namespace paw
