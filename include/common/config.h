#ifndef PAW_CONFIG_H
#define PAW_CONFIG_H

#include "types.h"
#include <string>

namespace paw {

class ConfigManager {
public:
    static ConfigManager& getInstance();

    bool loadConfig(const std::string& config_file);
    bool saveConfig(const std::string& config_file) const;
    void reset() { config_ = Config(); }

    // $HOME/.config/paw/paw.conf, empty when HOME is unset
    static std::string defaultConfigPath();

    // Getters
    const Config& getConfig() const { return config_; }
    Config& getConfig() { return config_; }

    // Setters
    void setCaptureDir(const std::string& dir) { config_.capture_dir = dir; }
    void setDatabasePath(const std::string& path) { config_.database_path = path; }
    void setLogFile(const std::string& path) { config_.log_file = path; }
    void setVerbose(bool verbose) { config_.verbose = verbose; }
    void setScanSeconds(int seconds) { config_.scan_seconds = seconds; }

private:
    ConfigManager() = default;
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    bool applyValue(const std::string& key, const std::string& value);

    Config config_;
};

} // namespace paw

#endif // PAW_CONFIG_H
