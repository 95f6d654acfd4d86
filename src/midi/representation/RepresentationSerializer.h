// ============================================================================
// File: src/midi/representation/RepresentationSerializer.h
// Version: 1.0.0
// Project: MidiBeat - Beat-addressed MIDI conversion toolkit
// ============================================================================
//
// Description:
//   Turns a MidiRepresentation back into a format 1 MidiFile at a chosen
//   resolution, ready for MidiFileWriter.
//
// Layout of the output:
//   - one MTrk per representation track, in ascending track id order
//   - tempo and time signature meta events on the first of those tracks
//     (a bare conductor track when there are no tracks)
//   - one program change per channel at tick 0, on the first track whose
//     notes use that channel (first track otherwise)
//   - within a track, at equal ticks: meta, program change, note-off,
//     note-on, then channel and pitch
//
// ============================================================================

#pragma once

#include <cstdint>

#include "MidiRepresentation.h"
#include "../file/MidiFileStructures.h"

namespace midiBeat {

/**
 * @class RepresentationSerializer
 * @brief MidiRepresentation + ticks per beat -> MidiFile
 */
class RepresentationSerializer {
public:
    static constexpr int MAX_TICKS_PER_BEAT = 0x7FFF;

    /**
     * @param ticksPerBeat Output resolution (1..32767)
     * @throws MidiBeatException INVALID_ARGUMENT for an out of range resolution
     */
    explicit RepresentationSerializer(int ticksPerBeat);

    /**
     * @brief Serialize a representation
     *
     * Either returns a complete file or throws; there is no partial output.
     *
     * @throws MidiBeatException INVALID_TEMPO for a bpm <= 0 or one that does
     *         not fit the Set Tempo field; INVALID_ARGUMENT for negative or
     *         non-finite beats, durations or out of range note fields
     */
    MidiFile serialize(const MidiRepresentation& representation) const;

    int getTicksPerBeat() const { return ticksPerBeat_; }

private:
    void validateNote(const Note& note, int trackId) const;

    MidiTrack buildConductorEvents(const MidiRepresentation& representation) const;

    int ticksPerBeat_;
};

} // namespace midiBeat

// ============================================================================
// END OF FILE RepresentationSerializer.h
// ============================================================================
