#ifndef PAW_TYPES_H
#define PAW_TYPES_H

#include <cstdint>
#include <string>
#include <vector>
#include <chrono>
#include <cstring>

namespace paw {

// Network types
struct MacAddress {
    uint8_t bytes[6];

    MacAddress() { memset(bytes, 0, 6); }
    MacAddress(const uint8_t* addr) { memcpy(bytes, addr, 6); }

    // Accepts "aa:bb:cc:dd:ee:ff" and "aa-bb-cc-dd-ee-ff"
    static bool parse(const std::string& text, MacAddress& out);
    static MacAddress broadcast();

    std::string toString() const;
    bool isNull() const;
    bool isBroadcast() const;
    bool operator==(const MacAddress& other) const;
    bool operator!=(const MacAddress& other) const { return !(*this == other); }
    bool operator<(const MacAddress& other) const;
};

bool isValidMacAddress(const std::string& text);

// Upper-case colon form, or the input unchanged when it does not parse
std::string normalizeMacAddress(const std::string& text);

enum class InterfaceMode {
    MANAGED,
    MONITOR,
    UNKNOWN
};

std::string modeToString(InterfaceMode mode);
InterfaceMode modeFromString(const std::string& text);

struct Interface {
    std::string name;
    std::string hardware_address;   // empty when it could not be resolved
    std::string permanent_address;  // from macchanger -s, empty otherwise
    InterfaceMode mode = InterfaceMode::UNKNOWN;
};

enum class Platform {
    LINUX,
    WINDOWS
};

Platform currentPlatform();

// Configuration
struct Config {
    std::string capture_dir = ".";
    std::string database_path = "paw_networks.db";
    std::string log_file;
    std::string console_log_level = "warning";
    bool verbose = false;
    bool restart_network_manager = true;
    int scan_seconds = 15;
    int terminate_grace_ms = 2000;
    int capture_settle_ms = 500;

    std::string airmon_binary = "airmon-ng";
    std::string airodump_binary = "airodump-ng";
    std::string aireplay_binary = "aireplay-ng";
    std::string macchanger_binary = "macchanger";
};

} // namespace paw

#endif // PAW_TYPES_H
