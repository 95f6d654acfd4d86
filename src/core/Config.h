// ============================================================================
// File: src/core/Config.h
// Version: 1.0.0
// Project: MidiBeat - Beat-addressed MIDI conversion toolkit
// ============================================================================
//
// Description:
//   Global configuration backed by nlohmann::json. Built-in defaults are
//   merged with an optional JSON file; values are read through dotted paths
//   ("conversion.output_ticks_per_beat").
//
// ============================================================================

#pragma once

#include <cmath>
#include <fstream>
#include <iterator>
#include <mutex>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "Logger.h"
#include "Error.h"

namespace midiBeat {

using json = nlohmann::json;

// ============================================================================
// DEFAULT CONFIGURATION VALUES
// ============================================================================

inline constexpr const char* DEFAULT_CONFIG_JSON = R"({
    "conversion": {
        "output_ticks_per_beat": 0,
        "default_bpm": 120.0,
        "default_instrument": 0,
        "unmatched_note_policy": "drop"
    },
    "filters": {
        "swing_multiplier": 1.0
    },
    "logging": {
        "level": "info",
        "file_enabled": false,
        "file_path": ""
    }
})";

/**
 * @class Config
 * @brief Process-wide settings: built-in defaults overlaid with a JSON file
 *
 * Every accessor takes the internal mutex. Values that fail validation are
 * replaced by their defaults with a warning, so readers never see an
 * out-of-range setting.
 */
class Config {
public:
    static Config& instance() {
        static Config config;
        return config;
    }

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    // ========================================================================
    // LOADING
    // ========================================================================

    /**
     * @brief Replace the configuration by the defaults merged with a file
     * @return true if every value passed validation
     * @throws MidiBeatException FILE_NOT_FOUND if the file cannot be opened,
     *         CONFIG_PARSE_ERROR on malformed JSON, INVALID_CONFIG when the
     *         document is not a JSON object
     */
    bool load(const std::string& filepath) {
        std::ifstream in(filepath);
        if (!in) {
            MIDIBEAT_THROW(ErrorCode::FILE_NOT_FOUND, "Cannot open config file: " + filepath);
        }
        std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

        Logger::info("Config", "Loading " + filepath);
        bool allValid = loadFromString(text);

        std::lock_guard<std::mutex> lock(mutex_);
        configPath_ = filepath;
        return allValid;
    }

    /// Same as load(), from a JSON document held in memory
    bool loadFromString(const std::string& text) {
        json overlay = json::parse(text, nullptr, false);
        if (overlay.is_discarded()) {
            MIDIBEAT_THROW(ErrorCode::CONFIG_PARSE_ERROR, "Configuration is not valid JSON");
        }
        if (!overlay.is_object()) {
            MIDIBEAT_THROW(ErrorCode::INVALID_CONFIG, "Configuration root must be a JSON object");
        }

        std::lock_guard<std::mutex> lock(mutex_);
        loadDefaults();
        config_.merge_patch(overlay);

        if (validateInternal()) {
            return true;
        }
        Logger::warning("Config", "Some configuration values were invalid and reset to defaults");
        return false;
    }

    void resetToDefaults() {
        std::lock_guard<std::mutex> lock(mutex_);
        loadDefaults();
        configPath_.clear();
    }

    // ========================================================================
    // TYPED GETTERS
    // ========================================================================
    //
    // A missing key, or a value of the wrong JSON type, yields defaultValue.
    // getInt() only accepts integers; getDouble() accepts any number.

    std::string getString(const std::string& path,
                          const std::string& defaultValue = "") const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lookup<std::string>(path, defaultValue, &json::is_string);
    }

    int getInt(const std::string& path, int defaultValue = 0) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lookup<int>(path, defaultValue, &json::is_number_integer);
    }

    bool getBool(const std::string& path, bool defaultValue = false) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lookup<bool>(path, defaultValue, &json::is_boolean);
    }

    double getDouble(const std::string& path, double defaultValue = 0.0) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lookup<double>(path, defaultValue, &json::is_number);
    }

    /**
     * @brief Store value at a dotted path, creating intermediate objects
     * @throws MidiBeatException INVALID_ARGUMENT if the path crosses a
     *         non-object value
     */
    template<typename T>
    void set(const std::string& path, const T& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        store(path, json(value));
    }

    bool has(const std::string& path) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return find(path) != nullptr;
    }

    json getAll() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return config_;
    }

    /// Path of the last file given to load(), empty after resetToDefaults()
    std::string getConfigPath() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return configPath_;
    }

private:
    using TypeCheck = bool (json::*)() const noexcept;

    Config() {
        loadDefaults();
    }

    void loadDefaults() {
        config_ = json::parse(DEFAULT_CONFIG_JSON);
    }

    // ========================================================================
    // PATH ACCESS (callers hold mutex_)
    // ========================================================================

    /// "conversion.default_bpm" -> "/conversion/default_bpm"
    static json::json_pointer pointerFor(const std::string& path) {
        std::string pointer;
        std::istringstream keys(path);
        std::string key;
        while (std::getline(keys, key, '.')) {
            if (!key.empty()) {
                pointer += "/" + key;
            }
        }
        return json::json_pointer(pointer);
    }

    const json* find(const std::string& path) const {
        json::json_pointer pointer = pointerFor(path);
        if (!config_.contains(pointer)) {
            return nullptr;
        }
        return &config_.at(pointer);
    }

    template<typename T>
    T lookup(const std::string& path, const T& defaultValue, TypeCheck accepts) const {
        const json* value = find(path);
        if (value == nullptr || !(value->*accepts)()) {
            return defaultValue;
        }
        return value->get<T>();
    }

    void store(const std::string& path, json value) {
        json::json_pointer pointer = pointerFor(path);
        if (pointer.empty()) {
            MIDIBEAT_THROW(ErrorCode::INVALID_ARGUMENT, "Empty configuration path");
        }
        try {
            config_[pointer] = std::move(value);
        } catch (const json::exception& e) {
            MIDIBEAT_THROW(ErrorCode::INVALID_ARGUMENT,
                           "Cannot set '" + path + "': " + e.what());
        }
    }

    // ========================================================================
    // VALIDATION (callers hold mutex_)
    // ========================================================================

    /**
     * @brief Reset every out-of-range value to its default
     * @return false if anything was reset
     */
    bool validateInternal() {
        bool valid = true;

        auto reset = [&](const std::string& path, json fallback, const std::string& why) {
            Logger::warning("Config", "Invalid " + path + " (" + why + "), using " +
                            fallback.dump());
            store(path, std::move(fallback));
            valid = false;
        };

        const json* ticks = find("conversion.output_ticks_per_beat");
        if (ticks == nullptr || !ticks->is_number_integer() ||
            ticks->get<int64_t>() < 0 || ticks->get<int64_t>() > 32767) {
            reset("conversion.output_ticks_per_beat", json(0), "expected an integer in 0..32767");
        }

        double bpm = lookup<double>("conversion.default_bpm", -1.0, &json::is_number);
        if (!std::isfinite(bpm) || bpm <= 0.0) {
            reset("conversion.default_bpm", 120.0, "expected a positive number");
        }

        int instrument = lookup<int>("conversion.default_instrument", -1,
                                     &json::is_number_integer);
        if (instrument < 0 || instrument > 127) {
            reset("conversion.default_instrument", json(0), "expected a program in 0..127");
        }

        std::string policy = lookup<std::string>("conversion.unmatched_note_policy", "",
                                                  &json::is_string);
        if (policy != "drop" && policy != "reject") {
            reset("conversion.unmatched_note_policy", "drop", "expected drop or reject");
        }

        double multiplier = lookup<double>("filters.swing_multiplier", -1.0, &json::is_number);
        if (!std::isfinite(multiplier) || multiplier <= 0.0) {
            reset("filters.swing_multiplier", 1.0, "expected a positive number");
        }

        std::string level = lookup<std::string>("logging.level", "", &json::is_string);
        if (!Logger::parseLevel(level)) {
            reset("logging.level", "info", "expected debug, info, warning, error or critical");
        }

        return valid;
    }

    mutable std::mutex mutex_;
    json config_;
    std::string configPath_;
};

} // namespace midiBeat

// ============================================================================
// END OF FILE Config.h
// ============================================================================
