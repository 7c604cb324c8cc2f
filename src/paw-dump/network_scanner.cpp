#include "paw-dump/network_scanner.h"
#include "common/logger.h"
#include "common/text_utils.h"
#include <fstream>
#include <sstream>
#include <iomanip>
#include <cstdlib>
#include <cstdio>
#include <ctime>
#include <unistd.h>

namespace paw {

namespace {

std::vector<std::string> splitCsvRow(const std::string& line) {
    std::vector<std::string> fields;
    std::stringstream ss(line);
    std::string field;
    while (std::getline(ss, field, ',')) {
        fields.push_back(trim(field));
    }
    if (!line.empty() && line.back() == ',') {
        fields.push_back("");
    }
    return fields;
}

// ESSIDs may contain commas: the ESSID is everything between the 13th comma
// and the comma before Key, which is always the last column
std::string essidColumn(const std::string& line) {
    size_t start = 0;
    for (int i = 0; i < 13; ++i) {
        start = line.find(',', start);
        if (start == std::string::npos) return "";
        ++start;
    }
    size_t end = line.find_last_of(',');
    if (end == std::string::npos || end < start) return trim(line.substr(start));
    return trim(line.substr(start, end - start));
}

int toInt(const std::string& text, int fallback) {
    if (text.empty()) return fallback;
    char* end = nullptr;
    long value = std::strtol(text.c_str(), &end, 10);
    if (end == text.c_str()) return fallback;
    return static_cast<int>(value);
}

} // namespace

bool parseAirodumpCsv(const std::string& content, std::vector<ScannedNetwork>& networks,
                      std::vector<ScannedClient>& clients) {
    enum class Section { NONE, ACCESS_POINTS, STATIONS };
    Section section = Section::NONE;
    bool saw_header = false;

    for (const auto& raw : splitLines(content)) {
        std::string line = trim(raw);
        if (line.empty()) continue;

        if (startsWith(line, "BSSID,")) {
            section = Section::ACCESS_POINTS;
            saw_header = true;
            continue;
        }
        if (startsWith(line, "Station MAC,")) {
            section = Section::STATIONS;
            saw_header = true;
            continue;
        }

        std::vector<std::string> fields = splitCsvRow(line);

        if (section == Section::ACCESS_POINTS) {
            // BSSID, First seen, Last seen, channel, Speed, Privacy, Cipher,
            // Authentication, Power, # beacons, # IV, LAN IP, ID-length, ESSID, Key
            if (fields.size() < 14 || !isValidMacAddress(fields[0])) continue;
            ScannedNetwork network;
            network.bssid = normalizeMacAddress(fields[0]);
            network.channel = toInt(fields[3], 0);
            network.privacy = fields[5];
            network.power = toInt(fields[8], 0);
            network.essid = fields.size() > 15 ? essidColumn(line) : fields[13];
            networks.push_back(network);
        } else if (section == Section::STATIONS) {
            // Station MAC, First seen, Last seen, Power, # packets, BSSID, Probed ESSIDs
            if (fields.size() < 6 || !isValidMacAddress(fields[0])) continue;
            ScannedClient client;
            client.mac = normalizeMacAddress(fields[0]);
            client.power = toInt(fields[3], 0);
            if (isValidMacAddress(fields[5])) {
                client.bssid = normalizeMacAddress(fields[5]);
            }
            std::string probed;
            for (size_t i = 6; i < fields.size(); ++i) {
                if (fields[i].empty()) continue;
                if (!probed.empty()) probed += ",";
                probed += fields[i];
            }
            client.probed_essids = probed;
            clients.push_back(client);
        }
    }

    return saw_header;
}

NetworkScanner::NetworkScanner(SessionController& sessions, const Config& config)
    : sessions_(sessions), config_(config) {
}

ScanResult NetworkScanner::scan(const std::string& interface, int seconds, OutputCallback on_output) {
    ScanResult result;
    if (seconds <= 0) {
        seconds = config_.scan_seconds;
    }

    std::string dir = config_.capture_dir.empty() ? "." : config_.capture_dir;
    if (dir.back() == '/') dir.pop_back();
    std::string prefix = dir + "/scan_" + interface + "_" + std::to_string(std::time(nullptr)) +
                         "_" + std::to_string(getpid());

    std::vector<std::string> argv = {
        config_.airodump_binary, "--output-format", "csv", "--write-interval", "1",
        "-w", prefix, interface
    };

    Logger::getInstance().info("Scanning on " + interface + " for " + std::to_string(seconds) + "s");
    SessionResult run = sessions_.runForeground(SessionKind::SCAN, interface, argv, seconds, on_output);

    if (run.status == SessionStatus::TOOL_UNAVAILABLE || run.status == SessionStatus::ALREADY_ACTIVE ||
        run.status == SessionStatus::SHUTTING_DOWN ||
        (run.status == SessionStatus::FAILED && run.exit_code < 0)) {
        result.message = run.message;
        return result;
    }

    std::string csv_path = prefix + "-01.csv";
    std::ifstream file(csv_path);
    if (!file.is_open()) {
        result.message = "Scan produced no results (" + csv_path + " missing)";
        if (run.status == SessionStatus::FAILED) {
            result.message = run.message;
        }
        return result;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    file.close();

    parseAirodumpCsv(buffer.str(), result.networks, result.clients);
    std::remove(csv_path.c_str());

    result.ok = true;
    result.message = "Found " + std::to_string(result.networks.size()) + " network(s) and " +
                     std::to_string(result.clients.size()) + " client(s)";
    if (run.status == SessionStatus::INTERRUPTED) {
        result.message += " before the scan was stopped";
    }
    Logger::getInstance().info(result.message);
    return result;
}

std::string NetworkScanner::formatResult(const ScanResult& result) {
    std::ostringstream out;
    out << result.message;
    if (!result.ok) {
        return out.str();
    }

    if (!result.networks.empty()) {
        out << "\n\n" << std::left
            << std::setw(19) << "BSSID"
            << std::setw(5) << "CH"
            << std::setw(7) << "PWR"
            << std::setw(12) << "ENC"
            << "ESSID\n"
            << std::string(60, '-');
        for (const auto& network : result.networks) {
            out << "\n" << std::setw(19) << network.bssid
                << std::setw(5) << network.channel
                << std::setw(7) << network.power
                << std::setw(12) << (network.privacy.empty() ? "?" : network.privacy)
                << (network.essid.empty() ? "<hidden>" : network.essid);
        }
    }

    if (!result.clients.empty()) {
        out << "\n\n" << std::left
            << std::setw(19) << "STATION"
            << std::setw(19) << "BSSID"
            << std::setw(7) << "PWR"
            << "PROBES\n"
            << std::string(60, '-');
        for (const auto& client : result.clients) {
            out << "\n" << std::setw(19) << client.mac
                << std::setw(19) << (client.bssid.empty() ? "(not associated)" : client.bssid)
                << std::setw(7) << client.power
                << client.probed_essids;
        }
    }

    return out.str();
}

} // namespace paw
