// ============================================================================
// File: src/midi/representation/MidiRepresentation.h
// Version: 1.0.0
// Project: MidiBeat - Beat-addressed MIDI conversion toolkit
// ============================================================================
//
// Description:
//   Beat-addressed view of a MIDI piece. Every note, tempo change and time
//   signature change sits at an absolute beat position (beat 0 = start of
//   piece, one beat = one quarter note); tracks carry notes only.
//
// Invariants (established by RepresentationBuilder):
//   - bpmChanges sorted ascending by beat, no two entries on the same beat
//   - every channel used by a note has an entry in channelInstrumentMap
//   - all beat and duration values are finite and non-negative
//   - track ids carry no ordering meaning
//
// ============================================================================

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace midiBeat {

using json = nlohmann::json;

// ============================================================================
// VALUE TYPES
// ============================================================================

/**
 * @struct Note
 * @brief One sounding note
 */
struct Note {
    int channel = 0;          ///< 0-based MIDI channel
    int pitch = 60;           ///< MIDI note number, 60 = middle C
    int velocity = 100;       ///< 0..100
    double beat = 0.0;        ///< Absolute start position in beats
    double duration = 0.0;    ///< Length in beats

    double endBeat() const { return beat + duration; }

    bool operator==(const Note& other) const {
        return channel == other.channel && pitch == other.pitch &&
               velocity == other.velocity && beat == other.beat &&
               duration == other.duration;
    }
    bool operator!=(const Note& other) const { return !(*this == other); }

    json toJson() const;
};

/**
 * @struct TempoChange
 * @brief New tempo taking effect at a beat
 */
struct TempoChange {
    double beat = 0.0;
    double bpm = 120.0;

    bool operator==(const TempoChange& other) const {
        return beat == other.beat && bpm == other.bpm;
    }
    bool operator!=(const TempoChange& other) const { return !(*this == other); }
};

/**
 * @struct TimeSignatureChange
 * @brief Time signature taking effect at a beat
 */
struct TimeSignatureChange {
    int numerator = 4;
    int denominatorLog2 = 2;  ///< denominator = 2^denominatorLog2
    double beat = 0.0;

    int denominator() const { return 1 << denominatorLog2; }

    /// Quarter-note beats in one bar, e.g. 3.0 for 6/8
    double barLengthBeats() const;

    bool operator==(const TimeSignatureChange& other) const {
        return numerator == other.numerator &&
               denominatorLog2 == other.denominatorLog2 && beat == other.beat;
    }
    bool operator!=(const TimeSignatureChange& other) const { return !(*this == other); }
};

// ============================================================================
// TRACK
// ============================================================================

/**
 * @struct Track
 * @brief Notes of one track plus its name. Note order is irrelevant.
 */
struct Track {
    std::vector<Note> notes;
    std::string name;

    bool empty() const { return notes.empty(); }

    /**
     * @brief Most common channel among the notes (lowest channel on ties)
     * @return std::nullopt for a track without notes
     */
    std::optional<int> mostUsedChannel() const;

    /**
     * @brief Sort notes by beat and shorten repeated pitches
     *
     * For consecutive notes of the same pitch, the earlier one is shortened
     * so it ends at least `gap` beats before the later one starts. A note
     * is never lengthened, and never shortened below zero.
     */
    void clampNotes(double gap = 0.1);

    /**
     * @brief Copy holding the notes that start in [begin, end), moved so
     *        that `begin` becomes beat 0
     */
    Track slice(double begin, double end) const;

    /// Shift every note by `beats`
    void offset(double beats);

    json toJson() const;
};

// ============================================================================
// MIDI REPRESENTATION
// ============================================================================

/**
 * @struct MidiRepresentation
 * @brief Complete beat-addressed piece
 *
 * Constructed once per conversion, transformed by one filter and consumed
 * by the serializer. Not designed for concurrent mutation.
 */
struct MidiRepresentation {
    std::map<int, Track> tracks;                 ///< Opaque track id -> track
    std::map<int, int> channelInstrumentMap;     ///< Channel -> program
    std::vector<TempoChange> bpmChanges;
    std::vector<TimeSignatureChange> timeSignatureChanges;

    /// Tempo of the first change, 120 BPM when there is none
    double startingBpm() const;

    /// Time signature at beat 0, 4/4 when there is none
    TimeSignatureChange startingTimeSignature() const;

    /// Latest note end, rounded up to a whole beat
    int songLengthBeats() const;

    /**
     * @brief Remove tracks without notes
     * @return Number of tracks removed
     */
    size_t clearEmptyTracks();

    size_t noteCount() const;

    json toJson() const;
};

} // namespace midiBeat

// ============================================================================
// END OF FILE MidiRepresentation.h
// ============================================================================
