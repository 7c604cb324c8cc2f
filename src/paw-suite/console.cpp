#include "paw-suite/console.h"
#include "common/text_utils.h"

namespace paw {

ConsoleOutput::ConsoleOutput(std::ostream& out) : out_(out) {}

void ConsoleOutput::display(const std::string& text, const std::string& title) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!title.empty()) {
        out_ << "\n=== " << title << " ===\n";
    }
    out_ << text << "\n" << std::flush;
}

void ConsoleOutput::line(const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << "  " << text << "\n" << std::flush;
}

ConsolePrompt::ConsolePrompt(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

bool ConsolePrompt::confirm(const std::string& question) {
    out_ << question << " [y/N]: " << std::flush;
    std::string answer;
    if (!std::getline(in_, answer)) {
        return false;
    }
    answer = toLower(trim(answer));
    return answer == "y" || answer == "yes";
}

StaticKeywordAdvisor::StaticKeywordAdvisor() {
    table_ = {
        {{"handshake", "wpa", "crack"},
         "To capture a WPA handshake: 'capture start <iface> <bssid> <channel>', then "
         "'attack deauth <iface> <bssid>' to force clients to reconnect, then 'capture stop'."},
        {{"monitor"}, "Use 'interface monitor <iface>' to enable monitor mode."},
        {{"managed", "restore", "normal"}, "Use 'interface managed <iface>' to return to managed mode."},
        {{"scan", "networks", "nearby", "wifi"}, "Use 'scan networks <iface> [seconds]' to list nearby access points."},
        {{"deauth", "disconnect", "kick"}, "Use 'attack deauth <iface> <bssid> [client|broadcast] [count]'."},
        {{"mac", "spoof", "address"}, "Use 'macchanger <iface> random' or 'macchanger <iface> permanent'."},
        {{"interface", "adapter", "card"}, "Use 'interface list' to see wireless interfaces and their mode."},
        {{"database", "saved", "export"}, "Use 'db networks', 'db clients' or 'db export <file>'."}
    };
}

std::string StaticKeywordAdvisor::advise(const std::string& text, const std::string& previous_output) {
    std::string lower = toLower(text);

    for (const auto& entry : table_) {
        for (const auto& keyword : entry.keywords) {
            if (lower.find(keyword) != std::string::npos) {
                return entry.advice;
            }
        }
    }

    // "what next?" after a capture points at the handshake workflow
    if (containsIgnoreCase(previous_output, "Capture started")) {
        return "A capture is running. Deauthenticate a client with 'attack deauth' to provoke a handshake, "
               "then 'capture stop'.";
    }
    return "";
}

} // namespace paw
