#pragma once

#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>

#include "settings.hpp"

namespace svec {
    namespace log {

        enum class Level { DEBUG, INFO, WARN, ERROR };

        inline const char* levelToString(Level level) {
            switch(level) {
                case Level::DEBUG:
                    return "DEBUG";
                case Level::INFO:
                    return "INFO";
                case Level::WARN:
                    return "WARN";
                case Level::ERROR:
                    return "ERROR";
            }
            return "?";
        }

        // Single output point so lines from server threads do not interleave
        inline void write(Level level, const std::string& message, const char* file, int line) {
            static std::mutex output_mutex;

            auto now = std::chrono::system_clock::now();
            std::time_t now_c = std::chrono::system_clock::to_time_t(now);
            auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                                  now.time_since_epoch())
                          % 1000;
            std::tm tm_buf{};
            localtime_r(&now_c, &tm_buf);

            std::lock_guard<std::mutex> lock(output_mutex);
            std::cerr << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0')
                      << std::setw(3) << millis.count() << std::setfill(' ') << " ["
                      << levelToString(level) << "] ";
            if(level == Level::DEBUG || level == Level::ERROR) {
                std::cerr << file << ':' << line << ' ';
            }
            std::cerr << message << std::endl;
        }

        // Logs the lifetime of the enclosing scope at debug level
        class ScopedTimer {
        public:
            ScopedTimer(const char* name, const char* file, int line) :
                name_(name),
                file_(file),
                line_(line),
                start_(std::chrono::steady_clock::now()) {}

            ~ScopedTimer() {
                if(!settings::ENABLE_DEBUG_LOG) {
                    return;
                }
                auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
                        std::chrono::steady_clock::now() - start_);
                try {
                    std::ostringstream oss;
                    oss << name_ << " took " << elapsed.count() << "us";
                    write(Level::DEBUG, oss.str(), file_, line_);
                } catch(const std::exception& e) {
                    // Unformatted fallback, nothing may escape the destructor
                    std::fprintf(stderr, "[DEBUG] %s: timer log failed: %s\n", name_, e.what());
                }
            }

            ScopedTimer(const ScopedTimer&) = delete;
            ScopedTimer& operator=(const ScopedTimer&) = delete;

        private:
            const char* name_;
            const char* file_;
            int line_;
            std::chrono::steady_clock::time_point start_;
        };

    }  // namespace log
}  // namespace svec

#define SVEC_LOG_AT(level, msg)                                            \
    do {                                                                   \
        std::ostringstream svec_log_oss_;                                  \
        svec_log_oss_ << msg;                                              \
        svec::log::write(level, svec_log_oss_.str(), __FILE__, __LINE__); \
    } while(0)

#define LOG_DEBUG(msg)                                     \
    do {                                                   \
        if(settings::ENABLE_DEBUG_LOG) {                   \
            SVEC_LOG_AT(svec::log::Level::DEBUG, msg);     \
        }                                                  \
    } while(0)

#define LOG_INFO(msg) SVEC_LOG_AT(svec::log::Level::INFO, msg)
#define LOG_WARN(msg) SVEC_LOG_AT(svec::log::Level::WARN, msg)
#define LOG_ERROR(msg) SVEC_LOG_AT(svec::log::Level::ERROR, msg)

#define SVEC_LOG_CONCAT_(a, b) a##b
#define SVEC_LOG_CONCAT(a, b) SVEC_LOG_CONCAT_(a, b)
#define LOG_TIME(name) \
    svec::log::ScopedTimer SVEC_LOG_CONCAT(svec_log_timer_, __LINE__)(name, __FILE__, __LINE__)
