#ifndef PAW_COMMAND_PARSER_H
#define PAW_COMMAND_PARSER_H

#include <string>
#include <vector>

namespace paw {

enum class Operation {
    LIST_INTERFACES,
    SET_MONITOR_MODE,
    SET_MANAGED_MODE,
    CHECK_INTERFERENCE,
    SCAN_NETWORKS,
    START_CAPTURE,
    STOP_CAPTURE,
    CAPTURE_STATUS,
    DEAUTH_ATTACK,
    CHANGE_MAC,
    DATABASE,
    HELP,
    EXIT,
    UNKNOWN
};

std::string operationToString(Operation operation);

struct ParsedCommand {
    Operation operation = Operation::UNKNOWN;
    std::vector<std::string> arguments;
    std::string explanation;
    std::string error;   // set when validation failed; such a command is never run
    std::string raw;

    bool valid() const { return error.empty(); }
};

// Default packet count for "attack deauth" when none is given
const int kDefaultDeauthCount = 10;

class CommandParser {
public:
    CommandParser() = default;

    // Tokenizes and validates one line of input. Never throws.
    ParsedCommand parse(const std::string& line) const;

    static std::string helpText();
    static bool isValidInterfaceName(const std::string& name);
    static bool isValidChannel(const std::string& text);

private:
    void parseInterface(const std::vector<std::string>& tokens, ParsedCommand& command) const;
    void parseScan(const std::vector<std::string>& tokens, ParsedCommand& command) const;
    void parseCapture(const std::vector<std::string>& tokens, ParsedCommand& command) const;
    void parseAttack(const std::vector<std::string>& tokens, ParsedCommand& command) const;
    void parseDatabase(const std::vector<std::string>& tokens, ParsedCommand& command) const;
    void parseMacChanger(const std::vector<std::string>& tokens, ParsedCommand& command) const;
};

} // namespace paw

#endif // PAW_COMMAND_PARSER_H
