// ============================================================================
// File: src/midi/filters/FilterRegistry.h
// Version: 1.0.0
// Project: MidiBeat - Beat-addressed MIDI conversion toolkit
// ============================================================================
//
// Description:
//   Owns the representation filters and resolves them by name.
//
// ============================================================================

#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "RepresentationFilter.h"

namespace midiBeat {

/**
 * @class FilterRegistry
 * @brief Name to filter lookup
 *
 * The default constructor registers the built-in filters:
 * no_filter, no_chords, swing, unswing, tempo_integrator.
 * Swing and unswing take their initial multiplier from
 * filters.swing_multiplier.
 */
class FilterRegistry {
public:
    FilterRegistry();

    /// Empty registry, no built-ins
    struct EmptyTag {};
    explicit FilterRegistry(EmptyTag);

    FilterRegistry(const FilterRegistry&) = delete;
    FilterRegistry& operator=(const FilterRegistry&) = delete;

    /**
     * @brief Add a filter, replacing any filter of the same name
     * @throws MidiBeatException INVALID_ARGUMENT on a null filter
     */
    void registerFilter(std::unique_ptr<RepresentationFilter> filter);

    bool hasFilter(const std::string& name) const;

    /**
     * @throws MidiBeatException FILTER_NOT_FOUND listing the known names
     */
    RepresentationFilter& getFilter(const std::string& name);
    const RepresentationFilter& getFilter(const std::string& name) const;

    /// Registered names, sorted
    std::vector<std::string> listFilters() const;

    size_t size() const { return filters_.size(); }

    nlohmann::json toJson() const;

private:
    void registerBuiltins();
    std::string knownNames() const;

    std::map<std::string, std::unique_ptr<RepresentationFilter>> filters_;
};

} // namespace midiBeat

// ============================================================================
// END OF FILE FilterRegistry.h
// ============================================================================
