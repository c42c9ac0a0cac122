#pragma once

// ============================================================
// logger.hpp -- Process-wide logger
//
// The console shows what the operator needs to read:
//   INFO   plain message on stdout
//   DEBUG  "debug: <msg>" on stdout (only with -v)
//   WARN   "Warning: <msg>" on stderr
//   ERROR  "<msg>" on stderr
// The optional log file (TWS_LOG_FILE) gets every line with a
// millisecond timestamp and the level name.
// ============================================================

#include "platform.hpp"
#include <string>
#include <mutex>
#include <fstream>
#include <iostream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <ctime>

enum class LogLevel {
    DEBUG = 0,
    INFO  = 1,
    WARN  = 2,
    ERR   = 3,
};

class Logger {
public:
    static Logger& get() {
        static Logger instance;
        return instance;
    }

    void set_level(LogLevel lvl) {
        std::lock_guard<std::mutex> lk(mutex_);
        level_ = lvl;
    }

    // Returns false if the file cannot be opened for appending
    bool set_log_file(const std::string& path) {
        std::lock_guard<std::mutex> lk(mutex_);
        if (file_.is_open()) file_.close();
        file_.open(path, std::ios::app);
        return file_.is_open();
    }

    // Redirect console output (tests capture log lines this way).
    // Passing nullptr restores std::cout / std::cerr.
    void set_streams(std::ostream* out, std::ostream* err) {
        std::lock_guard<std::mutex> lk(mutex_);
        out_ = out ? out : &std::cout;
        err_ = err ? err : &std::cerr;
    }

    void log(LogLevel lvl, const std::string& msg) {
        std::lock_guard<std::mutex> lk(mutex_);
        if (lvl < level_) return;

        std::ostream& console = lvl >= LogLevel::WARN ? *err_ : *out_;
        console << console_prefix(lvl) << msg << "\n";
        console.flush();

        if (file_.is_open()) {
            file_ << timestamp() << " [" << level_str(lvl) << "] " << msg << "\n";
            file_.flush();
        }
    }

    void info(const std::string& msg)  { log(LogLevel::INFO, msg); }
    void warn(const std::string& msg)  { log(LogLevel::WARN, msg); }
    void error(const std::string& msg) { log(LogLevel::ERR,  msg); }
    void debug(const std::string& msg) { log(LogLevel::DEBUG, msg); }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger() : level_(LogLevel::INFO) {}

    static std::string timestamp() {
        auto now = std::chrono::system_clock::now();
        auto t   = std::chrono::system_clock::to_time_t(now);
        auto ms  = std::chrono::duration_cast<std::chrono::milliseconds>(
                       now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        localtime_r(&t, &tm_buf);

        std::ostringstream ss;
        ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
        ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return ss.str();
    }

    static const char* console_prefix(LogLevel lvl) {
        switch (lvl) {
            case LogLevel::DEBUG: return "debug: ";
            case LogLevel::WARN:  return "Warning: ";
            default:              return "";
        }
    }

    static const char* level_str(LogLevel lvl) {
        switch (lvl) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO:  return "INFO ";
            case LogLevel::WARN:  return "WARN ";
            case LogLevel::ERR:   return "ERROR";
        }
        return "?????";
    }

    std::mutex    mutex_;
    LogLevel      level_;
    std::ofstream file_;
    std::ostream* out_{&std::cout};
    std::ostream* err_{&std::cerr};
};

// Convenience macros
#define LOG_INFO(msg)  Logger::get().info(msg)
#define LOG_WARN(msg)  Logger::get().warn(msg)
#define LOG_ERROR(msg) Logger::get().error(msg)
#define LOG_DEBUG(msg) Logger::get().debug(msg)
