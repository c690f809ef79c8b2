#pragma once

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <format>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace sqlmcp::utils {

// ============================================================================
// String Utilities
// ============================================================================

inline std::string to_lower(std::string_view str) {
    std::string result(str);
    for (char& c : result) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

inline std::string to_upper(std::string_view str) {
    std::string result(str);
    for (char& c : result) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return result;
}

inline std::string trim(std::string_view str) {
    const auto start = str.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string_view::npos) {
        return "";
    }
    const auto end = str.find_last_not_of(" \t\n\r\f\v");
    return std::string(str.substr(start, end - start + 1));
}

inline bool starts_with(std::string_view str, std::string_view prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

// ============================================================================
// Logging (thread-safe, level-tagged, level-filtered)
//
// stdout carries protocol traffic, so log lines go to stderr unless a log
// file has been configured.
// ============================================================================

namespace log {

enum class Level { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

namespace detail {
    inline std::mutex& log_mutex() {
        static std::mutex m;
        return m;
    }

    inline std::atomic<Level>& min_level() {
        static std::atomic<Level> level{Level::INFO};
        return level;
    }

    inline std::unique_ptr<std::ofstream>& file_sink() {
        static std::unique_ptr<std::ofstream> sink;
        return sink;
    }

    inline void write(Level level, std::string_view msg) {
        if (level < min_level().load(std::memory_order_relaxed)) {
            return;
        }

        const char* tag = "";
        switch (level) {
            case Level::DEBUG: tag = "DEBUG"; break;
            case Level::INFO:  tag = "INFO "; break;
            case Level::WARN:  tag = "WARN "; break;
            case Level::ERROR: tag = "ERROR"; break;
        }

        const auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf;
        ::localtime_r(&time, &tm_buf);

        char time_buf[16];
        std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &tm_buf);

        const auto formatted = std::format("{}.{:03d} [{}] {}\n",
            time_buf, static_cast<int>(ms.count()), tag, msg);

        std::lock_guard<std::mutex> lock(log_mutex());
        auto& sink = file_sink();
        if (sink && sink->good()) {
            *sink << formatted;
            sink->flush();
        } else {
            std::cerr << formatted;
        }
    }
} // namespace detail

/// Parse "debug" / "info" / "warn" / "error" (case-insensitive)
[[nodiscard]] inline std::optional<Level> parse_level(std::string_view name) {
    const std::string lower = to_lower(name);
    if (lower == "debug") return Level::DEBUG;
    if (lower == "info") return Level::INFO;
    if (lower == "warn" || lower == "warning") return Level::WARN;
    if (lower == "error") return Level::ERROR;
    return std::nullopt;
}

inline void set_level(Level level) {
    detail::min_level().store(level, std::memory_order_relaxed);
}

[[nodiscard]] inline Level level() {
    return detail::min_level().load(std::memory_order_relaxed);
}

/**
 * @brief Redirect log output to a file (append mode).
 * @return false if the file could not be opened; output stays on stderr.
 */
inline bool set_file(const std::string& path) {
    auto sink = std::make_unique<std::ofstream>(path, std::ios::app);
    if (!sink->is_open()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(detail::log_mutex());
    detail::file_sink() = std::move(sink);
    return true;
}

inline void debug(std::string_view msg) {
    detail::write(Level::DEBUG, msg);
}

inline void info(std::string_view msg) {
    detail::write(Level::INFO, msg);
}

inline void warn(std::string_view msg) {
    detail::write(Level::WARN, msg);
}

inline void error(std::string_view msg) {
    detail::write(Level::ERROR, msg);
}

} // namespace log

} // namespace sqlmcp::utils
