#include "common/types.h"
#include "common/text_utils.h"
#include <iomanip>
#include <sstream>
#include <cctype>
#include <cstring>

namespace paw {

bool MacAddress::parse(const std::string& text, MacAddress& out) {
    std::string value = trim(text);
    if (value.size() != 17) return false;

    char separator = value[2];
    if (separator != ':' && separator != '-') return false;

    MacAddress parsed;
    for (int i = 0; i < 6; ++i) {
        size_t pos = static_cast<size_t>(i) * 3;
        if (i > 0 && value[pos - 1] != separator) return false;
        if (!std::isxdigit(static_cast<unsigned char>(value[pos])) ||
            !std::isxdigit(static_cast<unsigned char>(value[pos + 1]))) {
            return false;
        }
        parsed.bytes[i] = static_cast<uint8_t>(std::stoul(value.substr(pos, 2), nullptr, 16));
    }

    out = parsed;
    return true;
}

MacAddress MacAddress::broadcast() {
    MacAddress mac;
    memset(mac.bytes, 0xFF, 6);
    return mac;
}

std::string MacAddress::toString() const {
    std::stringstream ss;
    ss << std::hex << std::uppercase << std::setfill('0');
    for (int i = 0; i < 6; ++i) {
        if (i > 0) ss << ":";
        ss << std::setw(2) << static_cast<int>(bytes[i]);
    }
    return ss.str();
}

bool MacAddress::isNull() const {
    for (int i = 0; i < 6; ++i) {
        if (bytes[i] != 0) return false;
    }
    return true;
}

bool MacAddress::isBroadcast() const {
    for (int i = 0; i < 6; ++i) {
        if (bytes[i] != 0xFF) return false;
    }
    return true;
}

bool MacAddress::operator==(const MacAddress& other) const {
    return memcmp(bytes, other.bytes, 6) == 0;
}

bool MacAddress::operator<(const MacAddress& other) const {
    return memcmp(bytes, other.bytes, 6) < 0;
}

bool isValidMacAddress(const std::string& text) {
    MacAddress mac;
    return MacAddress::parse(text, mac);
}

std::string normalizeMacAddress(const std::string& text) {
    MacAddress mac;
    if (!MacAddress::parse(text, mac)) {
        return text;
    }
    return mac.toString();
}

std::string modeToString(InterfaceMode mode) {
    switch (mode) {
        case InterfaceMode::MANAGED: return "managed";
        case InterfaceMode::MONITOR: return "monitor";
        case InterfaceMode::UNKNOWN: break;
    }
    return "unknown";
}

InterfaceMode modeFromString(const std::string& text) {
    std::string value = toLower(trim(text));
    if (value == "managed" || value == "station") return InterfaceMode::MANAGED;
    if (value == "monitor") return InterfaceMode::MONITOR;
    return InterfaceMode::UNKNOWN;
}

Platform currentPlatform() {
#ifdef _WIN32
    return Platform::WINDOWS;
#else
    return Platform::LINUX;
#endif
}

} // namespace paw
