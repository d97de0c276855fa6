#pragma once

#include <iostream>
#include <string>
#include <mutex>
#include <atomic>
#include <cstdlib>

namespace Armory {

/**
 * @brief Thread-safe logging utility for the ingestion engine.
 *
 * Messages below the active threshold are dropped. The threshold starts from
 * ARMORY_LOG_LEVEL (debug, info, warn, error) and can be changed at runtime.
 */
class Logger {
public:
    enum class Level {
        Debug,
        Info,
        Step,
        Success,
        Warning,
        Error,
        Bulk
    };

    static void log(Level level, const std::string& message) {
        if (severity(level) < threshold().load()) return;

        static std::mutex mutex;
        std::lock_guard<std::mutex> lock(mutex);

        const char* color = "";
        const char* prefix = "";

        switch (level) {
            case Level::Debug:   color = "\033[0;37m"; prefix = "... "; break; // Grey
            case Level::Info:    color = "\033[0;36m"; prefix = "=== "; break; // Cyan
            case Level::Step:    color = "\033[1;33m"; prefix = ">>> "; break; // Yellow
            case Level::Success: color = "\033[0;32m"; prefix = "✓ ";   break; // Green
            case Level::Warning: color = "\033[1;33m"; prefix = "⚠ ";   break; // Yellow
            case Level::Error:   color = "\033[0;31m"; prefix = "✗ ";   break; // Red
            case Level::Bulk:    color = "\033[0;35m"; prefix = "[BULK] "; break; // Magenta
        }

        std::ostream& out = (level == Level::Error || level == Level::Warning) ? std::cerr : std::cout;
        out << color << prefix << message << "\033[0m" << std::endl;
    }

    static void set_threshold(Level level) { threshold().store(severity(level)); }

    static void debug(const std::string& msg)   { log(Level::Debug, msg); }
    static void info(const std::string& msg)    { log(Level::Info, msg); }
    static void step(const std::string& msg)    { log(Level::Step, msg); }
    static void success(const std::string& msg) { log(Level::Success, msg); }
    static void warn(const std::string& msg)    { log(Level::Warning, msg); }
    static void error(const std::string& msg)   { log(Level::Error, msg); }
    static void bulk(const std::string& msg)    { log(Level::Bulk, msg); }

private:
    // Step, Success and Bulk are progress output and rank with Info.
    static int severity(Level level) {
        switch (level) {
            case Level::Debug:   return 0;
            case Level::Warning: return 2;
            case Level::Error:   return 3;
            default:             return 1;
        }
    }

    static std::atomic<int>& threshold() {
        static std::atomic<int> value{initial_threshold()};
        return value;
    }

    static int initial_threshold() {
        const char* env = std::getenv("ARMORY_LOG_LEVEL");
        if (!env) return 1;
        std::string v(env);
        if (v == "debug") return 0;
        if (v == "warn" || v == "warning") return 2;
        if (v == "error") return 3;
        return 1;
    }
};

} // namespace Armory
