// ============================================================================
// File: src/midi/file/MidiFileReader.cpp
// Version: 1.0.0
// Project: MidiBeat - Beat-addressed MIDI conversion toolkit
// ============================================================================

#include "MidiFileReader.h"
#include "../../core/Logger.h"

#include <algorithm>
#include <cstring>
#include <fstream>
#include <iterator>

namespace midiBeat {

namespace {

constexpr size_t SMF_HEADER_SIZE = 14;

/**
 * @brief Bounds-checked big-endian reader over [data + pos, data + end)
 *
 * Every read past `end` throws MIDI_FILE_CORRUPTED naming what was being
 * read.
 */
class ByteCursor {
public:
    ByteCursor(const uint8_t* data, size_t pos, size_t end)
        : data_(data), pos_(pos), end_(end) {}

    bool atEnd() const { return pos_ >= end_; }
    size_t position() const { return pos_; }
    size_t remaining() const { return end_ - pos_; }

    uint8_t peek(const char* what) const {
        require(1, what);
        return data_[pos_];
    }

    uint8_t u8(const char* what) {
        require(1, what);
        return data_[pos_++];
    }

    uint16_t u16(const char* what) {
        require(2, what);
        uint16_t value = static_cast<uint16_t>((data_[pos_] << 8) | data_[pos_ + 1]);
        pos_ += 2;
        return value;
    }

    uint32_t u32(const char* what) {
        require(4, what);
        uint32_t value = 0;
        for (int i = 0; i < 4; ++i) {
            value = (value << 8) | data_[pos_++];
        }
        return value;
    }

    /// SMF variable-length quantity, at most 4 bytes
    uint32_t vlq(const char* what) {
        uint32_t value = 0;
        for (int i = 0; i < 4; ++i) {
            uint8_t byte = u8(what);
            value = (value << 7) | (byte & 0x7F);
            if ((byte & 0x80) == 0) {
                return value;
            }
        }
        MIDIBEAT_THROW(ErrorCode::MIDI_FILE_CORRUPTED,
                       std::string("Variable length value too long in ") + what);
    }

    std::vector<uint8_t> bytes(size_t count, const char* what) {
        require(count, what);
        std::vector<uint8_t> result(data_ + pos_, data_ + pos_ + count);
        pos_ += count;
        return result;
    }

    void skip(size_t count, const char* what) {
        require(count, what);
        pos_ += count;
    }

private:
    void require(size_t count, const char* what) const {
        if (count > remaining()) {
            MIDIBEAT_THROW(ErrorCode::MIDI_FILE_CORRUPTED,
                           std::string("Unexpected end of data reading ") + what);
        }
    }

    const uint8_t* data_;
    size_t pos_;
    size_t end_;
};

/// Data bytes after a channel status byte
size_t channelDataLength(uint8_t status) {
    uint8_t command = status & 0xF0;
    return (command == MidiStatus::PROGRAM_CHANGE || command == MidiStatus::CHANNEL_PRESSURE)
        ? 1 : 2;
}

// ============================================================================
// EVENT DECODING
// ============================================================================

void readMetaEvent(ByteCursor& in, MidiEvent& event) {
    event.type = MidiEventType::META;
    event.status = MidiStatus::META;
    event.metaType = in.u8("meta type");

    uint32_t length = in.vlq("meta length");
    event.data = in.bytes(length, "meta payload");

    // A payload of unexpected length keeps its raw bytes and default
    // decoded fields; the representation builder rejects it if it matters.
    if (event.metaType >= MetaType::TEXT && event.metaType <= MetaType::CUE_POINT) {
        event.text.assign(event.data.begin(), event.data.end());
    } else if (event.metaType == MetaType::SET_TEMPO && length == 3) {
        event.tempo = (static_cast<uint32_t>(event.data[0]) << 16) |
                      (static_cast<uint32_t>(event.data[1]) << 8) |
                       static_cast<uint32_t>(event.data[2]);
    } else if (event.metaType == MetaType::TIME_SIGNATURE && length == 4) {
        event.timeSignature = {event.data[0], event.data[1], event.data[2], event.data[3]};
    }
}

void readSysExEvent(ByteCursor& in, MidiEvent& event, uint8_t status) {
    event.type = MidiEventType::SYSEX;
    event.status = status;
    uint32_t length = in.vlq("sysex length");
    event.data = in.bytes(length, "sysex payload");
}

void readChannelEvent(ByteCursor& in, MidiEvent& event, uint8_t status) {
    event.type = MidiEventType::MIDI_CHANNEL;
    event.status = status;
    event.channel = status & 0x0F;
    event.data = in.bytes(channelDataLength(status), "channel event data");

    for (uint8_t byte : event.data) {
        if (byte & 0x80) {
            MIDIBEAT_THROW(ErrorCode::MIDI_FILE_CORRUPTED,
                           "Unexpected status byte inside channel event data");
        }
    }

    uint8_t command = event.command();
    if (command == MidiStatus::NOTE_ON || command == MidiStatus::NOTE_OFF ||
        command == MidiStatus::POLY_PRESSURE) {
        event.note = event.data[0];
        event.velocity = event.data[1];
    } else if (command == MidiStatus::PROGRAM_CHANGE) {
        event.program = event.data[0];
    }
}

MidiTrack readTrack(ByteCursor in) {
    MidiTrack track;
    uint64_t tick = 0;
    uint8_t runningStatus = 0;

    while (!in.atEnd()) {
        MidiEvent event;
        event.deltaTime = in.vlq("delta time");
        tick += event.deltaTime;
        event.absoluteTime = tick;

        uint8_t status = in.peek("status byte");
        if (status & 0x80) {
            in.skip(1, "status byte");
        } else if (runningStatus != 0) {
            status = runningStatus;
        } else {
            MIDIBEAT_THROW(ErrorCode::MIDI_FILE_CORRUPTED,
                           "Running status without previous status");
        }

        // Meta and sysex events cancel running status
        if (status == MidiStatus::META) {
            readMetaEvent(in, event);
            runningStatus = 0;
        } else if (status == MidiStatus::SYSEX || status == MidiStatus::SYSEX_ESCAPE) {
            readSysExEvent(in, event, status);
            runningStatus = 0;
        } else if (status < MidiStatus::SYSEX) {
            readChannelEvent(in, event, status);
            runningStatus = status;
        } else {
            MIDIBEAT_THROW(ErrorCode::MIDI_FILE_INVALID_FORMAT,
                           "Unsupported status byte in file: " + std::to_string(status));
        }

        if (event.isNoteOn()) {
            track.noteCount++;
        }
        if (track.name.empty() && event.isMeta(MetaType::TRACK_NAME)) {
            track.name = event.text;
        }

        bool last = event.isEndOfTrack();
        track.events.push_back(std::move(event));
        if (last) {
            break;
        }
    }

    return track;
}

} // namespace

// ============================================================================
// PUBLIC METHODS
// ============================================================================

MidiFile MidiFileReader::readFromFile(const std::string& filepath) {
    Logger::info("MidiFileReader", "Reading MIDI file: " + filepath);

    std::ifstream file(filepath, std::ios::binary);
    if (!file.is_open()) {
        MIDIBEAT_THROW(ErrorCode::FILE_NOT_FOUND, "Cannot open file: " + filepath);
    }

    std::vector<uint8_t> buffer((std::istreambuf_iterator<char>(file)),
                                std::istreambuf_iterator<char>());
    if (file.bad()) {
        MIDIBEAT_THROW(ErrorCode::FILE_READ_ERROR, "Failed to read file: " + filepath);
    }

    return readFromBuffer(buffer);
}

MidiFile MidiFileReader::readFromBuffer(const uint8_t* data, size_t size) {
    if (data == nullptr && size > 0) {
        MIDIBEAT_THROW(ErrorCode::INVALID_ARGUMENT, "Null MIDI buffer");
    }
    if (size < SMF_HEADER_SIZE) {
        MIDIBEAT_THROW(ErrorCode::MIDI_FILE_CORRUPTED,
                       "Buffer too small for a MIDI file (" + std::to_string(size) + " bytes)");
    }
    if (std::memcmp(data, "MThd", 4) != 0) {
        MIDIBEAT_THROW(ErrorCode::MIDI_FILE_INVALID_FORMAT,
                       "Invalid MIDI signature (expected 'MThd')");
    }

    ByteCursor in(data, 4, size);
    MidiFile midiFile;

    uint32_t headerLength = in.u32("header length");
    if (headerLength < 6 || headerLength > in.remaining()) {
        MIDIBEAT_THROW(ErrorCode::MIDI_FILE_INVALID_FORMAT,
                       "Invalid header length: " + std::to_string(headerLength));
    }
    midiFile.header.format = in.u16("format");
    midiFile.header.numTracks = in.u16("track count");
    midiFile.header.division = in.u16("division");
    in.skip(headerLength - 6, "header");

    if (midiFile.header.format > 2) {
        MIDIBEAT_THROW(ErrorCode::MIDI_FILE_INVALID_FORMAT,
                       "Unsupported MIDI format: " + std::to_string(midiFile.header.format));
    }

    midiFile.tracks.reserve(midiFile.header.numTracks);

    while (midiFile.tracks.size() < midiFile.header.numTracks) {
        std::vector<uint8_t> id = in.bytes(4, "chunk id");
        uint32_t length = in.u32("chunk length");
        if (length > in.remaining()) {
            MIDIBEAT_THROW(ErrorCode::MIDI_FILE_CORRUPTED,
                           "Chunk length exceeds file size in chunk " +
                           std::to_string(midiFile.tracks.size()));
        }

        if (std::memcmp(id.data(), "MTrk", 4) != 0) {
            Logger::warning("MidiFileReader",
                            "Skipping unknown chunk '" + std::string(id.begin(), id.end()) + "'");
        } else {
            midiFile.tracks.push_back(readTrack(ByteCursor(data, in.position(),
                                                           in.position() + length)));
            if (!midiFile.tracks.back().events.empty()) {
                midiFile.durationTicks = std::max(midiFile.durationTicks,
                                                  midiFile.tracks.back().events.back().absoluteTime);
            }
        }
        in.skip(length, "chunk");
    }

    Logger::debug("MidiFileReader",
                  "Format " + std::to_string(midiFile.header.format) + ", " +
                  std::to_string(midiFile.tracks.size()) + " tracks, division " +
                  std::to_string(midiFile.header.division) + ", " +
                  std::to_string(midiFile.durationTicks) + " ticks");

    return midiFile;
}

bool MidiFileReader::validate(const std::string& filepath) const {
    std::ifstream file(filepath, std::ios::binary);
    char signature[4] = {};
    return file.read(signature, sizeof(signature)) &&
           std::memcmp(signature, "MThd", sizeof(signature)) == 0;
}

} // namespace midiBeat

// ============================================================================
// END OF FILE MidiFileReader.cpp
// ============================================================================
