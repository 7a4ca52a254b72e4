#ifndef TICKLER_LOGGER_HPP
#define TICKLER_LOGGER_HPP

#include <string>
#include <fstream>
#include <mutex>
#include <iostream>

namespace tickler {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

class Logger {
public:
    static Logger& getInstance();
    
    void log(LogLevel level, const std::string& message);
    void debug(const std::string& message);
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);
    
    void setLogFile(const std::string& filename);
    void setMinLevel(LogLevel level);

    // Accepts debug|info|warning|error (any case); unknown names map to INFO.
    static LogLevel levelFromString(const std::string& name);
    
private:
    Logger() = default;
    ~Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    
    std::mutex mutex_;
    std::ofstream log_file_;
    bool file_logging_enabled_ = false;
    LogLevel min_level_ = LogLevel::INFO;
    
    std::string levelToString(LogLevel level);
    std::string getCurrentTime();
};

} // namespace tickler

#endif // TICKLER_LOGGER_HPP
