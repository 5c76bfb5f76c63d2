#ifndef FACEWATCH_LOGGER_H
#define FACEWATCH_LOGGER_H

#include <string>
#include <fstream>
#include <mutex>
#include <cstddef>

namespace facewatch {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

// Parse "DEBUG"/"INFO"/"WARNING"/"ERROR" (case-insensitive), INFO otherwise
LogLevel parseLogLevel(const std::string& name);

enum class LogSink {
    CONSOLE,   // stderr
    FILE,      // log file, rotated by size
    SYSLOG
};

class Logger {
public:
    static Logger& getInstance();

    // Switch to a log file. Falls back to the console if it cannot be opened.
    void setLogFile(const std::string& path);
    void setLogLevel(LogLevel level);
    LogLevel getLogLevel() const { return min_level_; }

    // stderr output (CLI tools, foreground daemon)
    void setConsoleOutput(bool enable);
    // syslog(3) output under ident
    void setSyslogOutput(const std::string& ident);

    LogSink sink() const { return sink_; }

    // Rotated file keeps one backup (<path>.1)
    void setMaxFileSize(size_t bytes) { max_file_size_ = bytes; }

    void debug(const std::string& message);
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);

    // Audit trail
    void auditNotification(const std::string& name, double confidence, bool has_snapshot);
    void auditReload(const std::string& directory, size_t classifiers, bool success);

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void log(LogLevel level, const std::string& message);
    std::string formatLine(LogLevel level, const std::string& message) const;
    void rotateIfNeeded();
    void closeSinks();

    std::ofstream log_file_;
    std::mutex mutex_;
    LogLevel min_level_ = LogLevel::INFO;
    LogSink sink_ = LogSink::CONSOLE;
    std::string log_file_path_;
    std::string syslog_ident_;
    size_t max_file_size_ = 4 * 1024 * 1024;
    size_t written_since_check_ = 0;
};

} // namespace facewatch

#endif // FACEWATCH_LOGGER_H
