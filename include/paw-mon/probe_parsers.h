#ifndef PAW_PROBE_PARSERS_H
#define PAW_PROBE_PARSERS_H

#include "common/types.h"
#include <string>
#include <vector>

namespace paw {

// Parsers for the text printed by the interface discovery utilities.
// All of them skip lines they do not understand.

std::vector<Interface> parseIwDev(const std::string& output);
std::vector<Interface> parseIpLink(const std::string& output);
std::vector<Interface> parseProcNetDev(const std::string& content);
std::vector<Interface> parseNetshInterfaces(const std::string& output);

bool parseMacchangerShow(const std::string& output, std::string& current, std::string& permanent);
std::string parseIfconfigAddress(const std::string& output);

// wlan*, wl*, *mon*, wifi*, ath*
bool isWirelessName(const std::string& name);

} // namespace paw

#endif // PAW_PROBE_PARSERS_H
