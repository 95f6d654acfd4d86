// ============================================================================
// File: src/midi/filters/IdentityFilter.h
// Version: 1.0.0
// Project: MidiBeat - Beat-addressed MIDI conversion toolkit
// ============================================================================

#pragma once

#include "RepresentationFilter.h"

namespace midiBeat {

/**
 * @class IdentityFilter
 * @brief Returns the representation unchanged
 *
 * Output still differs from the input file by whatever the build and
 * serialize round trip normalizes (running status, event order, dropped
 * controller and meta events).
 */
class IdentityFilter : public RepresentationFilter {
public:
    IdentityFilter()
        : RepresentationFilter("no_filter", "Pass the MIDI data through unchanged")
    {}

    MidiRepresentation apply(MidiRepresentation representation) const override {
        return representation;
    }
};

} // namespace midiBeat

// ============================================================================
// END OF FILE IdentityFilter.h
// ============================================================================
