// ============================================================================
// File: src/midi/file/MidiFileWriter.h
// Version: 1.0.0
// Project: MidiBeat - Beat-addressed MIDI conversion toolkit
// ============================================================================
//
// Description:
//   Standard MIDI File (SMF) writer, the inverse of MidiFileReader.
//   The whole file is encoded in memory before anything touches the disk,
//   so an invalid MidiFile never leaves a partial .mid behind.
//
// ============================================================================

#pragma once

#include "MidiFileStructures.h"

#include <cstdint>
#include <string>
#include <vector>

namespace midiBeat {

/**
 * @class MidiFileWriter
 * @brief Encode a MidiFile as SMF bytes
 *
 * Events are encoded from their `deltaTime`, `status`, `metaType` and `data`
 * fields. Running status is used by default; a track that does not end with
 * an End-of-Track meta event gets one appended.
 *
 * Thread Safety: NO (create one instance per thread)
 */
class MidiFileWriter {
public:
    MidiFileWriter() = default;

    MidiFileWriter(const MidiFileWriter&) = delete;
    MidiFileWriter& operator=(const MidiFileWriter&) = delete;

    /**
     * @throws MidiBeatException MIDI_FILE_INVALID_FORMAT if validation fails,
     *         FILE_WRITE_ERROR if the file cannot be written
     */
    void writeToFile(const std::string& filepath, const MidiFile& midiFile);

    /// @throws MidiBeatException MIDI_FILE_INVALID_FORMAT if validation fails
    std::vector<uint8_t> writeToBuffer(const MidiFile& midiFile);

    /**
     * @brief Check header/track consistency and encodability
     * @param errorMessage Set to the first problem found
     */
    bool validate(const MidiFile& midiFile, std::string& errorMessage) const;

    void setRunningStatusEnabled(bool enabled) { runningStatus_ = enabled; }
    void setAutoEndOfTrack(bool enabled) { autoEndOfTrack_ = enabled; }

    /// Size of the last encoded file
    uint32_t getBytesWritten() const { return bytesWritten_; }

    /// Events encoded in the last file, appended End-of-Track events included
    uint32_t getEventsWritten() const { return eventsWritten_; }

private:
    void encodeTrack(std::vector<uint8_t>& out, const MidiTrack& track);

    bool runningStatus_ = true;
    bool autoEndOfTrack_ = true;
    uint32_t bytesWritten_ = 0;
    uint32_t eventsWritten_ = 0;
};

} // namespace midiBeat

// ============================================================================
// END OF FILE MidiFileWriter.h
// ============================================================================
