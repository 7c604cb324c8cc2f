#ifndef PAW_MAC_CHANGER_H
#define PAW_MAC_CHANGER_H

#include <string>
#include "common/types.h"
#include "common/command_runner.h"
#include "common/interface_locks.h"

namespace paw {

enum class MacChangeMode {
    RANDOM,        // -r
    SAME_VENDOR,   // -a
    ANY_VENDOR,    // -A
    PERMANENT,     // -p
    SPECIFIC       // -m <mac>
};

bool macChangeModeFromString(const std::string& text, MacChangeMode& mode);

// Extracts the address from a "New MAC:" line, empty when absent
std::string parseNewMac(const std::string& output);

class MacChanger {
public:
    MacChanger(CommandRunner& runner, InterfaceLocks& locks, const Config& config);

    std::string changeMac(const std::string& interface, MacChangeMode mode, const std::string& mac = "");

private:
    CommandRunner& runner_;
    InterfaceLocks& locks_;
    std::string macchanger_;

    bool setLink(const std::string& interface, const std::string& state);
};

} // namespace paw

#endif // PAW_MAC_CHANGER_H
