// ============================================================================
// File: src/midi/representation/RepresentationBuilder.h
// Version: 1.0.0
// Project: MidiBeat - Beat-addressed MIDI conversion toolkit
// ============================================================================
//
// Description:
//   Builds a MidiRepresentation from a parsed MIDI file: pairs note-on and
//   note-off events into Notes, collects tempo and time signature changes
//   from every track, and fills the channel to instrument map.
//
// ============================================================================

#pragma once

#include <string>

#include "MidiRepresentation.h"
#include "../file/MidiFileStructures.h"

namespace midiBeat {

// ============================================================================
// OPTIONS
// ============================================================================

/**
 * @enum UnmatchedNotePolicy
 * @brief What to do with a note-on still sounding at the end of its track
 */
enum class UnmatchedNotePolicy {
    DROP,     ///< Discard the note and log a warning
    REJECT    ///< Fail the conversion with INVALID_MIDI
};

UnmatchedNotePolicy unmatchedNotePolicyFromString(const std::string& name);
const char* unmatchedNotePolicyToString(UnmatchedNotePolicy policy);

/**
 * @struct BuilderOptions
 */
struct BuilderOptions {
    double defaultBpm = 120.0;        ///< Tempo synthesized at beat 0 when absent
    int defaultInstrument = 0;        ///< Program for channels without a program change
    UnmatchedNotePolicy unmatchedNotePolicy = UnmatchedNotePolicy::DROP;

    /// Options from the "conversion" section of the global Config
    static BuilderOptions fromConfig();
};

// ============================================================================
// CLASS: RepresentationBuilder
// ============================================================================

/**
 * @class RepresentationBuilder
 * @brief MidiFile -> MidiRepresentation
 *
 * @details
 * - Track ids are track indexes in the file; tracks without notes are kept
 * - Note-on with velocity 0 counts as note-off
 * - Velocities are clamped to 0..100
 * - A note-on on a sounding (channel, pitch) closes the earlier note first
 * - Note-offs with nothing sounding and zero-length notes are discarded
 * - Program changes: last one wins across the whole file
 *
 * The input file is never modified.
 */
class RepresentationBuilder {
public:
    explicit RepresentationBuilder(BuilderOptions options = BuilderOptions());

    /**
     * @brief Convert a parsed MIDI file
     * @throws MidiBeatException INVALID_MIDI for SMPTE division, malformed
     *         tempo or time signature payloads, or (REJECT policy) unmatched
     *         note-ons; INVALID_TEMPO for an unusable default tempo
     */
    MidiRepresentation build(const MidiFile& file) const;

    const BuilderOptions& getOptions() const { return options_; }

private:
    void collectTempoChanges(const MidiFile& file, int ticksPerBeat,
                             MidiRepresentation& representation) const;

    void collectTimeSignatures(const MidiFile& file, int ticksPerBeat,
                               MidiRepresentation& representation) const;

    Track buildTrack(const MidiTrack& midiTrack, size_t trackIndex, int ticksPerBeat,
                     MidiRepresentation& representation) const;

    BuilderOptions options_;
};

} // namespace midiBeat

// ============================================================================
// END OF FILE RepresentationBuilder.h
// ============================================================================
