#ifndef PAW_LOGGER_H
#define PAW_LOGGER_H

#include <string>
#include <mutex>
#include <fstream>

namespace paw {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

class Logger {
public:
    static Logger& getInstance();

    void setVerbose(bool verbose);
    void setConsoleLevel(LogLevel level);
    bool setLogFile(const std::string& path);
    void closeLogFile();

    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);
    void debug(const std::string& message);

    static bool parseLevel(const std::string& text, LogLevel& level);

private:
    Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void log(LogLevel level, const std::string& message);

    bool verbose_;
    LogLevel console_level_;
    std::ofstream file_;
    std::mutex mutex_;
};

} // namespace paw

#endif // PAW_LOGGER_H
