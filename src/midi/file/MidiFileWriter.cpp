// ============================================================================
// File: src/midi/file/MidiFileWriter.cpp
// Version: 1.0.0
// Project: MidiBeat - Beat-addressed MIDI conversion toolkit
// ============================================================================

#include "MidiFileWriter.h"
#include "../../core/Logger.h"
#include "../../core/Error.h"

#include <fstream>

namespace midiBeat {

namespace {

constexpr uint32_t MAX_VLQ = 0x0FFFFFFF;

void putBigEndian(std::vector<uint8_t>& out, uint32_t value, int bytes) {
    for (int shift = 8 * (bytes - 1); shift >= 0; shift -= 8) {
        out.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
    }
}

/// Variable-length quantity: 7 bits per byte, most significant group first
void putVariableLength(std::vector<uint8_t>& out, uint32_t value) {
    uint8_t groups[4];
    int count = 0;
    do {
        groups[count++] = static_cast<uint8_t>(value & 0x7F);
        value >>= 7;
    } while (value > 0);

    while (count > 1) {
        out.push_back(groups[--count] | 0x80);
    }
    out.push_back(groups[0]);
}

void putChunkHeader(std::vector<uint8_t>& out, const char* id, uint32_t length) {
    out.insert(out.end(), id, id + 4);
    putBigEndian(out, length, 4);
}

bool endsWithEndOfTrack(const MidiTrack& track) {
    return !track.events.empty() && track.events.back().isEndOfTrack();
}

} // namespace

// ============================================================================
// WRITE
// ============================================================================

void MidiFileWriter::writeToFile(const std::string& filepath, const MidiFile& midiFile) {
    std::vector<uint8_t> bytes = writeToBuffer(midiFile);

    std::ofstream file(filepath, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        MIDIBEAT_THROW(ErrorCode::FILE_WRITE_ERROR, "Cannot create file: " + filepath);
    }

    file.write(reinterpret_cast<const char*>(bytes.data()),
               static_cast<std::streamsize>(bytes.size()));
    file.close();
    if (!file) {
        MIDIBEAT_THROW(ErrorCode::FILE_WRITE_ERROR, "Failed to write MIDI file: " + filepath);
    }

    Logger::debug("MidiFileWriter", "Wrote " + filepath + " (" +
                  std::to_string(bytes.size()) + " bytes)");
}

std::vector<uint8_t> MidiFileWriter::writeToBuffer(const MidiFile& midiFile) {
    std::string problem;
    if (!validate(midiFile, problem)) {
        MIDIBEAT_THROW(ErrorCode::MIDI_FILE_INVALID_FORMAT, "Cannot write MIDI file: " + problem);
    }

    eventsWritten_ = 0;

    std::vector<uint8_t> out;
    putChunkHeader(out, "MThd", 6);
    putBigEndian(out, midiFile.header.format, 2);
    putBigEndian(out, midiFile.header.numTracks, 2);
    putBigEndian(out, midiFile.header.division, 2);

    for (const auto& track : midiFile.tracks) {
        encodeTrack(out, track);
    }

    bytesWritten_ = static_cast<uint32_t>(out.size());
    return out;
}

bool MidiFileWriter::validate(const MidiFile& midiFile, std::string& errorMessage) const {
    const MidiHeader& header = midiFile.header;
    errorMessage.clear();

    if (header.format > 2) {
        errorMessage = "Invalid format: " + std::to_string(header.format);
    } else if (header.numTracks != midiFile.tracks.size()) {
        errorMessage = "Header declares " + std::to_string(header.numTracks) +
                       " tracks, file has " + std::to_string(midiFile.tracks.size());
    } else if (header.format == 0 && midiFile.tracks.size() != 1) {
        errorMessage = "Format 0 must have exactly 1 track";
    } else if (header.division == 0) {
        errorMessage = "Invalid division: 0";
    }

    for (size_t i = 0; errorMessage.empty() && i < midiFile.tracks.size(); ++i) {
        const MidiTrack& track = midiFile.tracks[i];
        const std::string where = "Track " + std::to_string(i);

        if (!autoEndOfTrack_ && !endsWithEndOfTrack(track)) {
            errorMessage = where + " missing End-of-Track";
        }
        for (const auto& event : track.events) {
            if (!errorMessage.empty()) {
                break;
            }
            if (event.deltaTime > MAX_VLQ) {
                errorMessage = where + " has a delta time too large for VLQ encoding";
            } else if (event.type == MidiEventType::MIDI_CHANNEL &&
                       (event.status < 0x80 || event.status > 0xEF)) {
                errorMessage = where + " has an invalid channel status byte";
            }
        }
    }

    return errorMessage.empty();
}

// ============================================================================
// ENCODING
// ============================================================================

void MidiFileWriter::encodeTrack(std::vector<uint8_t>& out, const MidiTrack& track) {
    std::vector<uint8_t> body;
    uint8_t runningStatus = 0;

    auto encode = [&](const MidiEvent& event) {
        putVariableLength(body, event.deltaTime);

        switch (event.type) {
            case MidiEventType::META:
                body.push_back(MidiStatus::META);
                body.push_back(event.metaType);
                putVariableLength(body, static_cast<uint32_t>(event.data.size()));
                runningStatus = 0;
                break;

            case MidiEventType::SYSEX:
                body.push_back(event.status);
                putVariableLength(body, static_cast<uint32_t>(event.data.size()));
                runningStatus = 0;
                break;

            case MidiEventType::MIDI_CHANNEL:
                if (!runningStatus_ || event.status != runningStatus) {
                    body.push_back(event.status);
                    runningStatus = event.status;
                }
                break;
        }

        body.insert(body.end(), event.data.begin(), event.data.end());
        eventsWritten_++;
    };

    for (const auto& event : track.events) {
        encode(event);
    }
    if (autoEndOfTrack_ && !endsWithEndOfTrack(track)) {
        uint64_t lastTick = track.events.empty() ? 0 : track.events.back().absoluteTime;
        MidiEvent endOfTrack = MidiEvent::makeEndOfTrack(lastTick);
        endOfTrack.deltaTime = 0;
        encode(endOfTrack);
    }

    putChunkHeader(out, "MTrk", static_cast<uint32_t>(body.size()));
    out.insert(out.end(), body.begin(), body.end());
}

} // namespace midiBeat

// ============================================================================
// END OF FILE MidiFileWriter.cpp
// ============================================================================
