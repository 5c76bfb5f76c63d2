#include "logger.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <sys/stat.h>
#include <syslog.h>
#include <unistd.h>

namespace facewatch {

namespace {

// Bytes written between two size checks of the log file
constexpr size_t ROTATION_CHECK_BYTES = 64 * 1024;

const char* levelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR:   return "ERROR";
        default:                return "UNKNOWN";
    }
}

int syslogPriority(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return LOG_DEBUG;
        case LogLevel::WARNING: return LOG_WARNING;
        case LogLevel::ERROR:   return LOG_ERR;
        default:                return LOG_INFO;
    }
}

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream out;
    out << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return out.str();
}

} // namespace

LogLevel parseLogLevel(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);

    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "WARNING" || upper == "WARN") return LogLevel::WARNING;
    if (upper == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;
}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    closeSinks();
}

void Logger::closeSinks() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
    if (sink_ == LogSink::SYSLOG) {
        closelog();
    }
}

void Logger::setLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    closeSinks();

    log_file_path_ = path;
    written_since_check_ = 0;
    log_file_.open(path, std::ios::app);
    if (!log_file_.is_open()) {
        sink_ = LogSink::CONSOLE;
        std::cerr << "Warning: Could not open log file " << path
                  << ", falling back to console output" << std::endl;
        return;
    }
    sink_ = LogSink::FILE;
}

void Logger::setLogLevel(LogLevel level) {
    min_level_ = level;
}

void Logger::setConsoleOutput(bool enable) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (enable) {
        closeSinks();
        sink_ = LogSink::CONSOLE;
    } else if (sink_ == LogSink::CONSOLE && log_file_.is_open()) {
        sink_ = LogSink::FILE;
    }
}

void Logger::setSyslogOutput(const std::string& ident) {
    std::lock_guard<std::mutex> lock(mutex_);
    closeSinks();

    // openlog keeps the pointer
    syslog_ident_ = ident;
    openlog(syslog_ident_.c_str(), LOG_PID, LOG_DAEMON);
    sink_ = LogSink::SYSLOG;
}

std::string Logger::formatLine(LogLevel level, const std::string& message) const {
    std::ostringstream out;
    out << "[" << timestamp() << "] "
        << "[" << levelName(level) << "] "
        << "[PID:" << getpid() << "] "
        << message << "\n";
    return out.str();
}

void Logger::rotateIfNeeded() {
    if (written_since_check_ < ROTATION_CHECK_BYTES) {
        return;
    }
    written_since_check_ = 0;

    struct stat st;
    if (stat(log_file_path_.c_str(), &st) != 0 || static_cast<size_t>(st.st_size) <= max_file_size_) {
        return;
    }

    log_file_.close();
    const std::string backup = log_file_path_ + ".1";
    if (std::rename(log_file_path_.c_str(), backup.c_str()) != 0) {
        std::cerr << "Warning: Could not rotate log file " << log_file_path_ << std::endl;
    }
    log_file_.open(log_file_path_, std::ios::app);
    if (!log_file_.is_open()) {
        sink_ = LogSink::CONSOLE;
    }
}

void Logger::log(LogLevel level, const std::string& message) {
    if (level < min_level_) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (sink_ == LogSink::SYSLOG) {
        syslog(syslogPriority(level), "%s", message.c_str());
        return;
    }

    const std::string line = formatLine(level, message);
    if (sink_ == LogSink::CONSOLE || !log_file_.is_open()) {
        std::cerr << line;
        return;
    }

    log_file_ << line;
    log_file_.flush();
    written_since_check_ += line.size();
    rotateIfNeeded();
}

void Logger::debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void Logger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void Logger::warning(const std::string& message) {
    log(LogLevel::WARNING, message);
}

void Logger::error(const std::string& message) {
    log(LogLevel::ERROR, message);
}

void Logger::auditNotification(const std::string& name, double confidence, bool has_snapshot) {
    std::stringstream ss;
    ss << "NOTIFY name=" << name
       << " confidence=" << std::fixed << std::setprecision(3) << confidence
       << " snapshot=" << (has_snapshot ? "yes" : "no");
    info(ss.str());
}

void Logger::auditReload(const std::string& directory, size_t classifiers, bool success) {
    std::stringstream ss;
    ss << "RELOAD dir=" << directory
       << " classifiers=" << classifiers
       << " result=" << (success ? "ok" : "failed");
    if (success) {
        info(ss.str());
    } else {
        warning(ss.str());
    }
}

} // namespace facewatch
