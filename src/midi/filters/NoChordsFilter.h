// ============================================================================
// File: src/midi/filters/NoChordsFilter.h
// Version: 1.0.0
// Project: MidiBeat - Beat-addressed MIDI conversion toolkit
// ============================================================================

#pragma once

#include <vector>

#include "RepresentationFilter.h"

namespace midiBeat {

/**
 * @class NoChordsFilter
 * @brief Reduce every chord to its highest note
 *
 * Within one track, notes on the same channel whose start beats are equal
 * (relative tolerance 1e-9) form a chord. Only the highest pitch of each
 * chord is kept; among equal pitches, the first one. Chords are emitted in
 * the order their first note appears.
 */
class NoChordsFilter : public RepresentationFilter {
public:
    NoChordsFilter();

    MidiRepresentation apply(MidiRepresentation representation) const override;

    /// Chord reduction of a single note list
    static std::vector<Note> reduceChords(const std::vector<Note>& notes);

    /// Same start beat (relative tolerance) and same channel
    static bool sameChord(const Note& a, const Note& b);
};

} // namespace midiBeat

// ============================================================================
// END OF FILE NoChordsFilter.h
// ============================================================================
