#ifndef PAW_AIRMON_PARSER_H
#define PAW_AIRMON_PARSER_H

#include <string>

namespace paw {

enum class AirmonVerdict {
    CONFIRMED,   // a confirmation phrase was printed
    UNCERTAIN,   // exit 0, but nothing we recognize
    FAILED       // non-zero exit or an error message without confirmation
};

struct AirmonParse {
    AirmonVerdict verdict = AirmonVerdict::UNCERTAIN;
    std::string new_name;
    bool explicit_name = false;   // new_name came from "on <name>" in the output
};

// airmon-ng start <interface>
AirmonParse parseAirmonStart(const std::string& interface, const std::string& output, int exit_code);
// airmon-ng stop <interface>
AirmonParse parseAirmonStop(const std::string& interface, const std::string& output, int exit_code);

// Suffix convention used when the tool does not print the resulting name
std::string monitorNameFor(const std::string& interface);
std::string managedNameFor(const std::string& interface);

} // namespace paw

#endif // PAW_AIRMON_PARSER_H
