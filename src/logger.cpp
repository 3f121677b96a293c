#include "../include/logger.hpp"
#include <stdarg.h>
#include <string.h>
#include <cstdio>
#include <chrono>
#include <ctime>


Logger::Level Logger::min_level_ = Logger::INFO;
std::string Logger::log_file_;
bool Logger::flush_on_write_ = true;
FILE* Logger::file_handle_ = nullptr;
std::mutex Logger::mutex_;

void Logger::begin(const LoggingConfig& cfg) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = parseLevel(cfg.log_level, Logger::INFO);
    flush_on_write_ = cfg.flush_on_write;
    if (file_handle_) {
        fclose(file_handle_);
        file_handle_ = nullptr;
    }
    log_file_ = cfg.log_file;
    if (!log_file_.empty()) {
        file_handle_ = fopen(log_file_.c_str(), "a");
        if (!file_handle_) {
            fprintf(stderr, "[Logger] Cannot open log file %s, logging to stdout only\n", log_file_.c_str());
        }
    }
}

void Logger::setLevel(Level level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

Logger::Level Logger::parseLevel(const std::string& name, Level fallback) {
    if (name.empty()) return fallback;
    if (strcmp(name.c_str(), "DEBUG") == 0) return Logger::DEBUG;
    if (strcmp(name.c_str(), "INFO") == 0) return Logger::INFO;
    if (strcmp(name.c_str(), "WARN") == 0) return Logger::WARN;
    if (strcmp(name.c_str(), "ERROR") == 0) return Logger::ERROR;
    return fallback;
}

void Logger::write_log(Level level, const char* fmt, va_list args) {
    char buf[512];
    (void)vsnprintf(buf, sizeof(buf), fmt, args);
    const char* level_str = "INFO";
    switch (level) {
        case Logger::DEBUG: level_str = "DEBUG"; break;
        case Logger::INFO:  level_str = "INFO"; break;
        case Logger::WARN:  level_str = "WARN"; break;
        case Logger::ERROR: level_str = "ERROR"; break;
    }
    // [YYYY-MM-DD HH:MM:SS.mmm] [LEVEL] message
    auto now = std::chrono::system_clock::now();
    std::time_t secs = std::chrono::system_clock::to_time_t(now);
    long ms = (long)(std::chrono::duration_cast<std::chrono::milliseconds>(
                         now.time_since_epoch()).count() % 1000);
    std::tm local_tm;
    localtime_r(&secs, &local_tm);
    char time_buf[32];
    size_t n = strftime(time_buf, sizeof(time_buf), "%Y-%m-%d %H:%M:%S", &local_tm);
    snprintf(time_buf + n, sizeof(time_buf) - n, ".%03ld", ms);

    std::lock_guard<std::mutex> lock(mutex_);
    if (level < min_level_) return;
    printf("[%s] [%s] %s\n", time_buf, level_str, buf);
    if (flush_on_write_) fflush(stdout);
    if (file_handle_) {
        fprintf(file_handle_, "[%s] [%s] %s\n", time_buf, level_str, buf);
        if (flush_on_write_) fflush(file_handle_);
    }
}

void Logger::log(Level level, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_log(level, fmt, args);
    va_end(args);
}

void Logger::debug(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_log(DEBUG, fmt, args);
    va_end(args);
}

void Logger::info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_log(INFO, fmt, args);
    va_end(args);
}

void Logger::warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_log(WARN, fmt, args);
    va_end(args);
}

void Logger::error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_log(ERROR, fmt, args);
    va_end(args);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    fflush(stdout);
    if (file_handle_) fflush(file_handle_);
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_handle_) {
        fclose(file_handle_);
        file_handle_ = nullptr;
    }
}
