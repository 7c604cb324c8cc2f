#ifndef PAW_TEXT_UTILS_H
#define PAW_TEXT_UTILS_H

#include <string>
#include <vector>

namespace paw {

std::string trim(const std::string& text);
std::string toLower(const std::string& text);
std::string toUpper(const std::string& text);
std::vector<std::string> splitWhitespace(const std::string& text);
std::vector<std::string> splitLines(const std::string& text);
bool startsWith(const std::string& text, const std::string& prefix);
bool endsWith(const std::string& text, const std::string& suffix);
bool containsIgnoreCase(const std::string& haystack, const std::string& needle);

// Last non-empty lines of a block of tool output, joined with '\n'
std::string tailLines(const std::string& text, size_t count);

std::string joinArgs(const std::vector<std::string>& args);

} // namespace paw

#endif // PAW_TEXT_UTILS_H
