// ============================================================================
// File: src/midi/filters/FilterRegistry.cpp
// Version: 1.0.0
// Project: MidiBeat - Beat-addressed MIDI conversion toolkit
// ============================================================================

#include "FilterRegistry.h"
#include "IdentityFilter.h"
#include "NoChordsFilter.h"
#include "SwingFilter.h"
#include "TempoIntegratorFilter.h"
#include "../../core/Config.h"
#include "../../core/Logger.h"

namespace midiBeat {

// ============================================================================
// CONSTRUCTION
// ============================================================================

FilterRegistry::FilterRegistry() {
    registerBuiltins();
    Logger::debug("FilterRegistry", "Registered " + std::to_string(filters_.size()) + " filters");
}

FilterRegistry::FilterRegistry(EmptyTag) {
}

void FilterRegistry::registerBuiltins() {
    double multiplier = Config::instance().getDouble("filters.swing_multiplier", 1.0);

    registerFilter(std::make_unique<IdentityFilter>());
    registerFilter(std::make_unique<NoChordsFilter>());
    registerFilter(std::make_unique<SwingFilter>(SwingFilter::Direction::SWING, multiplier));
    registerFilter(std::make_unique<SwingFilter>(SwingFilter::Direction::UNSWING, multiplier));
    registerFilter(std::make_unique<TempoIntegratorFilter>());
}

// ============================================================================
// REGISTRATION / LOOKUP
// ============================================================================

void FilterRegistry::registerFilter(std::unique_ptr<RepresentationFilter> filter) {
    if (!filter) {
        MIDIBEAT_THROW(ErrorCode::INVALID_ARGUMENT, "Cannot register a null filter");
    }
    std::string name = filter->getName();
    if (filters_.count(name)) {
        Logger::warning("FilterRegistry", "Replacing filter: " + name);
    }
    filters_[name] = std::move(filter);
}

bool FilterRegistry::hasFilter(const std::string& name) const {
    return filters_.count(name) > 0;
}

RepresentationFilter& FilterRegistry::getFilter(const std::string& name) {
    auto it = filters_.find(name);
    if (it == filters_.end()) {
        MIDIBEAT_THROW(ErrorCode::FILTER_NOT_FOUND,
                       "Unknown filter '" + name + "'. Available filters: " + knownNames());
    }
    return *it->second;
}

const RepresentationFilter& FilterRegistry::getFilter(const std::string& name) const {
    auto it = filters_.find(name);
    if (it == filters_.end()) {
        MIDIBEAT_THROW(ErrorCode::FILTER_NOT_FOUND,
                       "Unknown filter '" + name + "'. Available filters: " + knownNames());
    }
    return *it->second;
}

std::vector<std::string> FilterRegistry::listFilters() const {
    std::vector<std::string> names;
    names.reserve(filters_.size());
    for (const auto& [name, filter] : filters_) {
        names.push_back(name);
    }
    return names;
}

std::string FilterRegistry::knownNames() const {
    std::string result;
    for (const auto& [name, filter] : filters_) {
        if (!result.empty()) {
            result += ", ";
        }
        result += name;
    }
    return result.empty() ? "(none)" : result;
}

nlohmann::json FilterRegistry::toJson() const {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& [name, filter] : filters_) {
        j.push_back(filter->toJson());
    }
    return j;
}

} // namespace midiBeat

// ============================================================================
// END OF FILE FilterRegistry.cpp
// ============================================================================
