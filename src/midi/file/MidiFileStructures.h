// ============================================================================
// File: src/midi/file/MidiFileStructures.h
// Version: 1.0.0
// Project: MidiBeat - Beat-addressed MIDI conversion toolkit
// ============================================================================
//
// Description:
//   Raw Standard MIDI File structures shared by MidiFileReader and
//   MidiFileWriter: per-track events with delta and absolute tick times.
//
//   Channels are 0-based (0-15) at this level, the value carried in the
//   low nibble of the status byte.
//
// ============================================================================

#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace midiBeat {

// ============================================================================
// CONSTANTS
// ============================================================================

namespace MidiStatus {
    constexpr uint8_t NOTE_OFF         = 0x80;
    constexpr uint8_t NOTE_ON          = 0x90;
    constexpr uint8_t POLY_PRESSURE    = 0xA0;
    constexpr uint8_t CONTROL_CHANGE   = 0xB0;
    constexpr uint8_t PROGRAM_CHANGE   = 0xC0;
    constexpr uint8_t CHANNEL_PRESSURE = 0xD0;
    constexpr uint8_t PITCH_BEND       = 0xE0;
    constexpr uint8_t SYSEX            = 0xF0;
    constexpr uint8_t SYSEX_ESCAPE     = 0xF7;
    constexpr uint8_t META             = 0xFF;
}

namespace MetaType {
    constexpr uint8_t TEXT           = 0x01;
    constexpr uint8_t COPYRIGHT      = 0x02;
    constexpr uint8_t TRACK_NAME     = 0x03;
    constexpr uint8_t INSTRUMENT     = 0x04;
    constexpr uint8_t LYRIC          = 0x05;
    constexpr uint8_t MARKER         = 0x06;
    constexpr uint8_t CUE_POINT      = 0x07;
    constexpr uint8_t CHANNEL_PREFIX = 0x20;
    constexpr uint8_t END_OF_TRACK   = 0x2F;
    constexpr uint8_t SET_TEMPO      = 0x51;
    constexpr uint8_t SMPTE_OFFSET   = 0x54;
    constexpr uint8_t TIME_SIGNATURE = 0x58;
    constexpr uint8_t KEY_SIGNATURE  = 0x59;
    constexpr uint8_t SEQUENCER      = 0x7F;
}

// ============================================================================
// ENUMS
// ============================================================================

/**
 * @enum MidiEventType
 * @brief Type of MIDI event in file
 */
enum class MidiEventType {
    MIDI_CHANNEL,    ///< Channel messages (Note On/Off, CC, etc.)
    META,            ///< Meta-events (tempo, time signature, etc.)
    SYSEX            ///< System Exclusive messages
};

// ============================================================================
// STRUCTURES
// ============================================================================

/**
 * @struct TimeSignature
 * @brief Decoded time signature meta payload
 */
struct TimeSignature {
    uint8_t numerator = 4;
    uint8_t denominatorLog2 = 2;         ///< denominator = 2^denominatorLog2
    uint8_t clocksPerClick = 24;
    uint8_t notated32ndNotesPerBeat = 8;
};

/**
 * @struct MidiEvent
 * @brief MIDI event in a file
 *
 * @details
 * `data` always holds the bytes that follow the status byte (for meta events,
 * the payload after type and length). The decoded fields below are filled by
 * the reader and by the factory helpers; the writer only looks at `status`,
 * `metaType` and `data`.
 */
struct MidiEvent {
    uint32_t deltaTime = 0;          ///< Delta time in ticks
    uint64_t absoluteTime = 0;       ///< Absolute time in ticks
    MidiEventType type = MidiEventType::MIDI_CHANNEL;
    uint8_t status = 0;
    uint8_t channel = 0;             ///< MIDI channel (0-15)
    std::vector<uint8_t> data;

    // Meta-events
    uint8_t metaType = 0;
    std::string text;                ///< Text payload of text-like meta events
    uint32_t tempo = 500000;         ///< Microseconds per quarter note
    TimeSignature timeSignature;

    // MIDI channel events
    uint8_t note = 0;
    uint8_t velocity = 0;
    uint8_t program = 0;

    // ========================================================================
    // PREDICATES
    // ========================================================================

    uint8_t command() const { return status & 0xF0; }

    bool isMeta(uint8_t kind) const {
        return type == MidiEventType::META && metaType == kind;
    }

    /// Note-on with non-zero velocity
    bool isNoteOn() const {
        return type == MidiEventType::MIDI_CHANNEL &&
               command() == MidiStatus::NOTE_ON && velocity > 0;
    }

    /// Note-off, or note-on with velocity 0
    bool isNoteOff() const {
        return type == MidiEventType::MIDI_CHANNEL &&
               (command() == MidiStatus::NOTE_OFF ||
                (command() == MidiStatus::NOTE_ON && velocity == 0));
    }

    bool isProgramChange() const {
        return type == MidiEventType::MIDI_CHANNEL &&
               command() == MidiStatus::PROGRAM_CHANGE;
    }

    bool isEndOfTrack() const { return isMeta(MetaType::END_OF_TRACK); }

    // ========================================================================
    // FACTORIES
    // ========================================================================

    static MidiEvent makeNoteOn(uint64_t tick, uint8_t channel, uint8_t note, uint8_t velocity);
    static MidiEvent makeNoteOff(uint64_t tick, uint8_t channel, uint8_t note, uint8_t velocity);
    static MidiEvent makeProgramChange(uint64_t tick, uint8_t channel, uint8_t program);
    static MidiEvent makeMeta(uint64_t tick, uint8_t metaType, std::vector<uint8_t> payload);
    static MidiEvent makeTrackName(uint64_t tick, const std::string& name);

    /**
     * @brief Set Tempo meta event
     * @param microsecondsPerQuarter 24-bit tempo value
     */
    static MidiEvent makeTempo(uint64_t tick, uint32_t microsecondsPerQuarter);

    static MidiEvent makeTimeSignature(uint64_t tick, uint8_t numerator, uint8_t denominatorLog2,
                                       uint8_t clocksPerClick = 24,
                                       uint8_t notated32ndNotesPerBeat = 8);
    static MidiEvent makeEndOfTrack(uint64_t tick);
};

/**
 * @struct MidiTrack
 * @brief MIDI track container
 */
struct MidiTrack {
    std::vector<MidiEvent> events;
    std::string name;                ///< First Track Name meta event, if any
    uint16_t noteCount = 0;

    /**
     * @brief Recompute deltaTime of every event from absoluteTime
     * @note Events must already be ordered by absoluteTime
     */
    void computeDeltaTimes();
};

/**
 * @struct MidiHeader
 * @brief MIDI file header (MThd chunk)
 */
struct MidiHeader {
    uint16_t format = 1;             ///< 0, 1, or 2
    uint16_t numTracks = 0;
    uint16_t division = 480;         ///< Ticks per quarter note (bit 15 clear)

    /// SMPTE time division (bit 15 set), not supported by the beat model
    bool isSmpte() const { return (division & 0x8000) != 0; }
};

/**
 * @struct MidiFile
 * @brief Complete MIDI file structure
 */
struct MidiFile {
    MidiHeader header;
    std::vector<MidiTrack> tracks;

    // Computed values
    uint64_t durationTicks = 0;

    uint16_t ticksPerBeat() const { return header.division; }
};

} // namespace midiBeat

// ============================================================================
// END OF FILE MidiFileStructures.h
// ============================================================================
