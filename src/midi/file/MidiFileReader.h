// ============================================================================
// File: src/midi/file/MidiFileReader.h
// Version: 1.0.0
// Project: MidiBeat - Beat-addressed MIDI conversion toolkit
// ============================================================================
//
// Description:
//   Standard MIDI File (SMF) reader, formats 0, 1 and 2.
//
//   Every event gets its cumulative tick (absoluteTime) next to its delta.
//   Running status, SysEx and all meta events are read; tempo, time
//   signature and text payloads are also decoded into MidiEvent fields.
//   Chunks other than MTrk are skipped with a warning, and bytes after a
//   track's End-of-Track are ignored.
//
// ============================================================================

#pragma once

#include "MidiFileStructures.h"
#include "../../core/Error.h"

#include <cstdint>
#include <string>
#include <vector>

namespace midiBeat {

/**
 * @class MidiFileReader
 * @brief Parse Standard MIDI File bytes into a MidiFile
 *
 * Errors are reported as MidiBeatException:
 * - FILE_NOT_FOUND / FILE_READ_ERROR for I/O problems
 * - MIDI_FILE_INVALID_FORMAT when the data is not a supported SMF
 * - MIDI_FILE_CORRUPTED for truncated chunks and malformed events
 */
class MidiFileReader {
public:
    MidiFileReader() = default;

    MidiFileReader(const MidiFileReader&) = delete;
    MidiFileReader& operator=(const MidiFileReader&) = delete;

    MidiFile readFromFile(const std::string& filepath);

    MidiFile readFromBuffer(const uint8_t* data, size_t size);

    MidiFile readFromBuffer(const std::vector<uint8_t>& buffer) {
        return readFromBuffer(buffer.data(), buffer.size());
    }

    /// True if filepath can be opened and starts with "MThd". Never throws.
    bool validate(const std::string& filepath) const;
};

} // namespace midiBeat

// ============================================================================
// END OF FILE MidiFileReader.h
// ============================================================================
