#pragma once
#include <string>

enum class LogLevel { Debug, Info, Warn, Error, Quiet };

// bracket tagged console lines, "[Server] Listening on port 5612"
// info and debug go to stdout, warn and error to stderr
class Log {
public:
    static void setLevel(LogLevel level);
    static LogLevel level();

    static void debug(const std::string& tag, const std::string& message);
    static void info(const std::string& tag, const std::string& message);
    static void warn(const std::string& tag, const std::string& message);
    static void error(const std::string& tag, const std::string& message);

private:
    static void write(LogLevel level, const std::string& tag, const std::string& message);
};
