// ============================================================================
// File: src/midi/filters/RepresentationFilter.h
// Version: 1.0.0
// Project: MidiBeat - Beat-addressed MIDI conversion toolkit
// ============================================================================
//
// Description:
//   Abstract base class for transformations applied to a MidiRepresentation
//   between building and serializing.
//
// ============================================================================

#pragma once

#include <string>
#include <nlohmann/json.hpp>

#include "../representation/MidiRepresentation.h"
#include "../../core/Error.h"

namespace midiBeat {

/**
 * @class RepresentationFilter
 * @brief Abstract base class for representation filters
 *
 * A filter takes the representation by value and returns the transformed
 * one. Filters hold only their parameters, so apply() is const.
 *
 * Ownership:
 * - Filters are owned by FilterRegistry through unique_ptr
 * - Copy operations are disabled
 */
class RepresentationFilter {
public:
    /**
     * @param name Registry key, e.g. "no_chords"
     * @param description One-line help text
     */
    RepresentationFilter(std::string name, std::string description)
        : name_(std::move(name))
        , description_(std::move(description))
    {}

    virtual ~RepresentationFilter() = default;

    RepresentationFilter(const RepresentationFilter&) = delete;
    RepresentationFilter& operator=(const RepresentationFilter&) = delete;

    /**
     * @brief Transform a representation
     * @param representation Input, taken by value
     * @return Transformed representation
     */
    virtual MidiRepresentation apply(MidiRepresentation representation) const = 0;

    const std::string& getName() const { return name_; }
    const std::string& getDescription() const { return description_; }

    /**
     * @brief Set a numeric parameter
     *
     * Default implementation rejects every name. Override in filters that
     * take parameters.
     *
     * @throws MidiBeatException INVALID_ARGUMENT for an unknown name or a
     *         value out of range
     */
    virtual void setParameter(const std::string& name, double value) {
        (void)value;
        MIDIBEAT_THROW(ErrorCode::INVALID_ARGUMENT,
                       "Filter '" + name_ + "' has no parameter '" + name + "'");
    }

    /**
     * @throws MidiBeatException INVALID_ARGUMENT for an unknown name
     */
    virtual double getParameter(const std::string& name) const {
        MIDIBEAT_THROW(ErrorCode::INVALID_ARGUMENT,
                       "Filter '" + name_ + "' has no parameter '" + name + "'");
    }

    virtual nlohmann::json toJson() const {
        nlohmann::json j;
        j["name"] = name_;
        j["description"] = description_;
        return j;
    }

protected:
    std::string name_;
    std::string description_;
};

} // namespace midiBeat

// ============================================================================
// END OF FILE RepresentationFilter.h
// ============================================================================
