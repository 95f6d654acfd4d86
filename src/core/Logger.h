// ============================================================================
// File: src/core/Logger.h
// Version: 1.0.0
// Project: MidiBeat - Beat-addressed MIDI conversion toolkit
// ============================================================================
//
// Description:
//   Static, header-only logger. Every call names a category (usually the
//   class emitting it) and a message:
//
//     Logger::info("RepresentationBuilder", "Built 3 tracks");
//
//   Console output goes to stderr, colored when stderr is a terminal, so
//   that a JSON dump on stdout stays clean. Lines can also be appended to a
//   file. Messages that pass the level filter are counted per level.
//
// Thread-safety: YES (one mutex guards all logger state)
//
// ============================================================================

#pragma once

#include <array>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <unistd.h>

namespace midiBeat {

class Logger {
public:
    enum class Level {
        DEBUG = 0,
        INFO = 1,
        WARNING = 2,
        ERROR = 3,
        CRITICAL = 4    ///< Broken internal invariants
    };

    // ========================================================================
    // LOGGING
    // ========================================================================

    static void debug(const std::string& category, const std::string& message) {
        write(Level::DEBUG, category, message);
    }

    static void info(const std::string& category, const std::string& message) {
        write(Level::INFO, category, message);
    }

    static void warning(const std::string& category, const std::string& message) {
        write(Level::WARNING, category, message);
    }

    static void error(const std::string& category, const std::string& message) {
        write(Level::ERROR, category, message);
    }

    static void critical(const std::string& category, const std::string& message) {
        write(Level::CRITICAL, category, message);
    }

    // ========================================================================
    // CONFIGURATION
    // ========================================================================

    /// Messages below this level are dropped (and not counted)
    static void setLevel(Level level) {
        State& s = state();
        std::lock_guard<std::mutex> lock(s.mutex);
        s.minLevel = level;
    }

    /**
     * @brief Level from its configuration name, case-insensitive
     *
     * Accepts debug, info, warning (or warn), error and critical.
     */
    static std::optional<Level> parseLevel(const std::string& name) {
        std::string key;
        for (char c : name) {
            key += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }

        if (key == "debug")                     return Level::DEBUG;
        if (key == "info")                      return Level::INFO;
        if (key == "warning" || key == "warn")  return Level::WARNING;
        if (key == "error")                     return Level::ERROR;
        if (key == "critical")                  return Level::CRITICAL;
        return std::nullopt;
    }

    static Level levelFromString(const std::string& name, Level fallback = Level::INFO) {
        return parseLevel(name).value_or(fallback);
    }

    /**
     * @brief Also append every line to filepath, creating parent directories
     * @return false if the file cannot be opened
     */
    static bool enableFileLogging(const std::string& filepath) {
        State& s = state();
        std::lock_guard<std::mutex> lock(s.mutex);

        s.file.close();
        s.file.clear();

        std::error_code ec;
        std::filesystem::path parent = std::filesystem::path(filepath).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent, ec);
        }

        s.file.open(filepath, std::ios::app);
        return s.file.is_open();
    }

    static void setConsoleEnabled(bool enabled) {
        State& s = state();
        std::lock_guard<std::mutex> lock(s.mutex);
        s.console = enabled;
    }

    // ========================================================================
    // COUNTERS
    // ========================================================================

    static uint64_t getMessageCountByLevel(Level level) {
        return state().counts[static_cast<size_t>(level)].load();
    }

    static void resetCounters() {
        for (auto& count : state().counts) {
            count = 0;
        }
    }

private:
    struct State {
        std::mutex mutex;
        Level minLevel = Level::INFO;
        bool console = true;
        std::ofstream file;
        std::array<std::atomic<uint64_t>, 5> counts{};
    };

    static State& state() {
        static State instance;
        return instance;
    }

    static void write(Level level, const std::string& category, const std::string& message) {
        State& s = state();
        std::lock_guard<std::mutex> lock(s.mutex);

        if (level < s.minLevel) {
            return;
        }
        s.counts[static_cast<size_t>(level)]++;

        std::string line = timestamp() + " " + label(level) + " [" + category + "] " + message;

        if (s.console) {
            static const bool tty = ::isatty(STDERR_FILENO) != 0;
            if (tty) {
                std::cerr << color(level) << line << "\033[0m\n";
            } else {
                std::cerr << line << '\n';
            }
        }

        if (s.file.is_open()) {
            s.file << line << std::endl;
        }
    }

    /// Local time as HH:MM:SS.mmm
    static std::string timestamp() {
        using namespace std::chrono;
        auto now = system_clock::now();
        std::time_t seconds = system_clock::to_time_t(now);
        auto millis = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;

        std::tm local{};
        localtime_r(&seconds, &local);

        std::ostringstream out;
        out << std::put_time(&local, "%H:%M:%S") << '.'
            << std::setw(3) << std::setfill('0') << millis;
        return out.str();
    }

    static const char* label(Level level) {
        switch (level) {
            case Level::DEBUG:    return "DEBUG";
            case Level::INFO:     return "INFO ";
            case Level::WARNING:  return "WARN ";
            case Level::ERROR:    return "ERROR";
            case Level::CRITICAL: return "CRIT ";
        }
        return "?????";
    }

    static const char* color(Level level) {
        switch (level) {
            case Level::DEBUG:    return "\033[36m";
            case Level::INFO:     return "\033[32m";
            case Level::WARNING:  return "\033[33m";
            case Level::ERROR:    return "\033[31m";
            case Level::CRITICAL: return "\033[35m";
        }
        return "\033[0m";
    }
};

} // namespace midiBeat

// ============================================================================
// END OF FILE Logger.h
// ============================================================================
