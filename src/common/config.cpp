#include "common/config.h"
#include "common/logger.h"
#include "common/text_utils.h"
#include <fstream>
#include <cstdlib>
#include <stdexcept>

namespace paw {

namespace {

bool parseBool(const std::string& value) {
    std::string v = toLower(value);
    return v == "true" || v == "1" || v == "yes" || v == "on";
}

bool parseInt(const std::string& value, int min_value, int& out) {
    try {
        size_t used = 0;
        int parsed = std::stoi(value, &used);
        if (used != value.size() || parsed < min_value) {
            return false;
        }
        out = parsed;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace

ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

std::string ConfigManager::defaultConfigPath() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) {
        return "";
    }
    return std::string(home) + "/.config/paw/paw.conf";
}

bool ConfigManager::loadConfig(const std::string& config_file) {
    std::ifstream file(config_file);
    if (!file.is_open()) {
        return false;
    }

    std::string line;
    int line_number = 0;
    while (std::getline(file, line)) {
        ++line_number;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        size_t pos = line.find('=');
        if (pos == std::string::npos) {
            Logger::getInstance().warning(config_file + ":" + std::to_string(line_number) +
                                          ": expected key=value");
            continue;
        }

        std::string key = trim(line.substr(0, pos));
        std::string value = trim(line.substr(pos + 1));

        if (!applyValue(key, value)) {
            Logger::getInstance().warning(config_file + ":" + std::to_string(line_number) +
                                          ": ignoring " + key + "=" + value);
        }
    }

    Logger::getInstance().debug("Loaded configuration from " + config_file);
    return true;
}

bool ConfigManager::applyValue(const std::string& key, const std::string& value) {
    if (key == "capture_dir") {
        config_.capture_dir = value.empty() ? "." : value;
    } else if (key == "database_path") {
        config_.database_path = value;
    } else if (key == "log_file") {
        config_.log_file = value;
    } else if (key == "console_log_level") {
        LogLevel level;
        if (!Logger::parseLevel(value, level)) return false;
        config_.console_log_level = value;
    } else if (key == "verbose") {
        config_.verbose = parseBool(value);
    } else if (key == "restart_network_manager") {
        config_.restart_network_manager = parseBool(value);
    } else if (key == "scan_seconds") {
        return parseInt(value, 1, config_.scan_seconds);
    } else if (key == "terminate_grace_ms") {
        return parseInt(value, 0, config_.terminate_grace_ms);
    } else if (key == "capture_settle_ms") {
        return parseInt(value, 0, config_.capture_settle_ms);
    } else if (key == "airmon_binary") {
        config_.airmon_binary = value;
    } else if (key == "airodump_binary") {
        config_.airodump_binary = value;
    } else if (key == "aireplay_binary") {
        config_.aireplay_binary = value;
    } else if (key == "macchanger_binary") {
        config_.macchanger_binary = value;
    } else {
        return false;
    }
    return true;
}

bool ConfigManager::saveConfig(const std::string& config_file) const {
    std::ofstream file(config_file);
    if (!file.is_open()) {
        return false;
    }

    file << "# PAW Configuration File\n";
    file << "capture_dir=" << config_.capture_dir << "\n";
    file << "database_path=" << config_.database_path << "\n";
    file << "log_file=" << config_.log_file << "\n";
    file << "console_log_level=" << config_.console_log_level << "\n";
    file << "verbose=" << (config_.verbose ? "true" : "false") << "\n";
    file << "restart_network_manager=" << (config_.restart_network_manager ? "true" : "false") << "\n";
    file << "scan_seconds=" << config_.scan_seconds << "\n";
    file << "terminate_grace_ms=" << config_.terminate_grace_ms << "\n";
    file << "capture_settle_ms=" << config_.capture_settle_ms << "\n";
    file << "airmon_binary=" << config_.airmon_binary << "\n";
    file << "airodump_binary=" << config_.airodump_binary << "\n";
    file << "aireplay_binary=" << config_.aireplay_binary << "\n";
    file << "macchanger_binary=" << config_.macchanger_binary << "\n";

    return file.good();
}

} // namespace paw
