#pragma once

#include <string>
#include <iostream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <atomic>
#include <cctype>
#include <ctime>

namespace credpool {

// Line-oriented operational log for the pool, the store and the generator process.
class Logger {
public:
    enum class Level {
        DEBUG,
        INFO,
        WARNING,
        ERROR
    };

    enum class EventType {
        GENERATOR,
        IPC,
        ALLOCATION,
        REFILL,
        WARMUP,
        CACHE,
        STORE,
        LIFECYCLE
    };

    /**
     * Records an event if its level passes the process-wide threshold.
     * @param level Severity level of the event.
     * @param event The subsystem the event belongs to.
     * @param message Descriptive message (will be sanitized).
     */
    static void log(Level level, EventType event, const std::string& message = "") {
        if (static_cast<int>(level) < min_level_ref().load()) return;

        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);

        struct tm gmt;
        gmtime_r(&time_t, &gmt);

        std::stringstream ss;
        ss << "[" << std::put_time(&gmt, "%Y-%m-%d %H:%M:%S") << " UTC] "
           << "[" << level_to_string(level) << "] "
           << "[" << event_to_string(event) << "]";

        if (!message.empty()) {
            ss << " msg=\"" << sanitize(message) << "\"";
        }

        if (level == Level::ERROR) {
            std::cerr << ss.str() << "\n";
        } else {
            std::cout << ss.str() << "\n";
        }
    }

    static void set_min_level(Level level) {
        min_level_ref().store(static_cast<int>(level));
    }

    static Level min_level() {
        return static_cast<Level>(min_level_ref().load());
    }

    // Accepts "debug", "info", "warn"/"warning" and "error".
    static bool parse_level(const std::string& name, Level& out) {
        if (name == "debug") { out = Level::DEBUG; return true; }
        if (name == "info") { out = Level::INFO; return true; }
        if (name == "warn" || name == "warning") { out = Level::WARNING; return true; }
        if (name == "error") { out = Level::ERROR; return true; }
        return false;
    }

    // Escapes quotes and line breaks so external text cannot forge log lines.
    static std::string sanitize(const std::string& msg) {
        std::string result;
        result.reserve(msg.size());
        for (char c : msg) {
            if (c == '"' || c == '\\' || c == '\n' || c == '\r') {
                result += ' ';
            } else if (std::isprint(static_cast<unsigned char>(c))) {
                result += c;
            }
        }
        return result;
    }

private:
    static std::atomic<int>& min_level_ref() {
        static std::atomic<int> level{static_cast<int>(Level::INFO)};
        return level;
    }

    static std::string level_to_string(Level level) {
        switch (level) {
            case Level::DEBUG: return "DEBUG";
            case Level::INFO: return "INFO";
            case Level::WARNING: return "WARN";
            case Level::ERROR: return "ERROR";
            default: return "UNKNOWN";
        }
    }

    static std::string event_to_string(EventType event) {
        switch (event) {
            case EventType::GENERATOR: return "GENERATOR";
            case EventType::IPC: return "IPC";
            case EventType::ALLOCATION: return "ALLOCATION";
            case EventType::REFILL: return "REFILL";
            case EventType::WARMUP: return "WARMUP";
            case EventType::CACHE: return "CACHE";
            case EventType::STORE: return "STORE";
            case EventType::LIFECYCLE: return "LIFECYCLE";
            default: return "UNKNOWN_EVENT";
        }
    }
};

}
