// ============================================================================
// File: src/midi/representation/RepresentationSerializer.cpp
// Version: 1.0.0
// Project: MidiBeat - Beat-addressed MIDI conversion toolkit
// ============================================================================

#include "RepresentationSerializer.h"
#include "TimeBase.h"
#include "../../core/Error.h"
#include "../../core/Logger.h"

#include <algorithm>
#include <cmath>
#include <map>
#include <tuple>

namespace midiBeat {

namespace {

/// Order of events sharing a tick
enum EventRank {
    RANK_META = 0,
    RANK_PROGRAM = 1,
    RANK_NOTE_OFF = 2,
    RANK_NOTE_ON = 3
};

struct PendingEvent {
    uint64_t tick;
    int rank;
    int channel;
    int pitch;
    MidiEvent event;
};

void sortPending(std::vector<PendingEvent>& pending) {
    std::stable_sort(pending.begin(), pending.end(),
                     [](const PendingEvent& a, const PendingEvent& b) {
                         return std::tie(a.tick, a.rank, a.channel, a.pitch) <
                                std::tie(b.tick, b.rank, b.channel, b.pitch);
                     });
}

MidiTrack finishTrack(std::vector<PendingEvent>& pending, const std::string& name) {
    sortPending(pending);

    MidiTrack track;
    track.name = name;
    track.events.reserve(pending.size() + 1);

    for (auto& item : pending) {
        if (item.event.isNoteOn()) {
            track.noteCount++;
        }
        track.events.push_back(std::move(item.event));
    }

    uint64_t lastTick = track.events.empty() ? 0 : track.events.back().absoluteTime;
    track.events.push_back(MidiEvent::makeEndOfTrack(lastTick));
    track.computeDeltaTimes();

    return track;
}

} // namespace

// ============================================================================
// CONSTRUCTION
// ============================================================================

RepresentationSerializer::RepresentationSerializer(int ticksPerBeat)
    : ticksPerBeat_(ticksPerBeat)
{
    if (ticksPerBeat < 1 || ticksPerBeat > MAX_TICKS_PER_BEAT) {
        MIDIBEAT_THROW(ErrorCode::INVALID_ARGUMENT,
                       "ticks_per_beat must be in 1.." + std::to_string(MAX_TICKS_PER_BEAT) +
                       ", got " + std::to_string(ticksPerBeat));
    }
}

// ============================================================================
// SERIALIZE
// ============================================================================

MidiFile RepresentationSerializer::serialize(const MidiRepresentation& representation) const {
    // Conductor events are built first: an unencodable tempo fails before
    // any track work is done.
    MidiTrack conductor = buildConductorEvents(representation);

    if (representation.tracks.size() > 0xFFFF) {
        MIDIBEAT_THROW(ErrorCode::INVALID_ARGUMENT,
                       "Too many tracks for a MIDI file: " +
                       std::to_string(representation.tracks.size()));
    }

    for (const auto& [channel, program] : representation.channelInstrumentMap) {
        if (channel < 0 || channel > 15 || program < 0 || program > 127) {
            MIDIBEAT_THROW(ErrorCode::INVALID_ARGUMENT,
                           "Invalid instrument mapping: channel " + std::to_string(channel) +
                           " -> program " + std::to_string(program));
        }
    }

    MidiFile file;
    file.header.format = 1;
    file.header.division = static_cast<uint16_t>(ticksPerBeat_);

    if (representation.tracks.empty()) {
        std::vector<PendingEvent> pending;
        for (auto& event : conductor.events) {
            pending.push_back(PendingEvent{event.absoluteTime, RANK_META, 0, 0, std::move(event)});
        }
        for (const auto& [channel, program] : representation.channelInstrumentMap) {
            pending.push_back(PendingEvent{0, RANK_PROGRAM, channel, 0,
                MidiEvent::makeProgramChange(0, static_cast<uint8_t>(channel),
                                             static_cast<uint8_t>(program))});
        }
        file.tracks.push_back(finishTrack(pending, ""));
    } else {
        // Channel -> track id that receives its program change
        const int firstTrackId = representation.tracks.begin()->first;
        std::map<int, int> programTrack;
        for (const auto& [channel, program] : representation.channelInstrumentMap) {
            programTrack[channel] = firstTrackId;
            for (const auto& [id, track] : representation.tracks) {
                bool uses = std::any_of(track.notes.begin(), track.notes.end(),
                                        [channel = channel](const Note& n) {
                                            return n.channel == channel;
                                        });
                if (uses) {
                    programTrack[channel] = id;
                    break;
                }
            }
        }

        for (const auto& [id, track] : representation.tracks) {
            std::vector<PendingEvent> pending;
            pending.reserve(track.notes.size() * 2 + 4);

            if (!track.name.empty()) {
                pending.push_back(PendingEvent{0, RANK_META, 0, 0,
                                               MidiEvent::makeTrackName(0, track.name)});
            }

            if (id == firstTrackId) {
                for (auto& event : conductor.events) {
                    pending.push_back(PendingEvent{event.absoluteTime, RANK_META, 0, 0,
                                                   std::move(event)});
                }
            }

            for (const auto& [channel, program] : representation.channelInstrumentMap) {
                if (programTrack[channel] == id) {
                    pending.push_back(PendingEvent{0, RANK_PROGRAM, channel, 0,
                        MidiEvent::makeProgramChange(0, static_cast<uint8_t>(channel),
                                                     static_cast<uint8_t>(program))});
                }
            }

            for (const auto& note : track.notes) {
                validateNote(note, id);

                uint64_t onTick = TimeBase::beatsToTicks(note.beat, ticksPerBeat_);
                uint64_t offTick = TimeBase::beatsToTicks(note.beat + note.duration, ticksPerBeat_);
                if (offTick <= onTick) {
                    offTick = onTick + 1;
                }

                // Velocity 0 would read back as a note-off
                uint8_t velocity = static_cast<uint8_t>(std::max(note.velocity, 1));
                uint8_t channel = static_cast<uint8_t>(note.channel);
                uint8_t pitch = static_cast<uint8_t>(note.pitch);

                pending.push_back(PendingEvent{onTick, RANK_NOTE_ON, note.channel, note.pitch,
                    MidiEvent::makeNoteOn(onTick, channel, pitch, velocity)});
                pending.push_back(PendingEvent{offTick, RANK_NOTE_OFF, note.channel, note.pitch,
                    MidiEvent::makeNoteOff(offTick, channel, pitch, velocity)});
            }

            file.tracks.push_back(finishTrack(pending, track.name));
        }
    }

    file.header.numTracks = static_cast<uint16_t>(file.tracks.size());
    for (const auto& track : file.tracks) {
        file.durationTicks = std::max(file.durationTicks, track.events.back().absoluteTime);
    }

    Logger::info("RepresentationSerializer",
                 "Serialized " + std::to_string(representation.noteCount()) + " notes into " +
                 std::to_string(file.tracks.size()) + " tracks at " +
                 std::to_string(ticksPerBeat_) + " ticks per beat");

    return file;
}

// ============================================================================
// HELPERS
// ============================================================================

MidiTrack RepresentationSerializer::buildConductorEvents(
    const MidiRepresentation& representation) const {
    MidiTrack conductor;

    for (const auto& change : representation.bpmChanges) {
        uint32_t tempo = TimeBase::bpmToMicrosecondsPerQuarter(change.bpm);
        uint64_t tick = TimeBase::beatsToTicks(change.beat, ticksPerBeat_);
        conductor.events.push_back(MidiEvent::makeTempo(tick, tempo));
    }

    for (const auto& change : representation.timeSignatureChanges) {
        if (change.numerator < 1 || change.numerator > 255 ||
            change.denominatorLog2 < 0 || change.denominatorLog2 > 7) {
            MIDIBEAT_THROW(ErrorCode::INVALID_ARGUMENT,
                           "Time signature cannot be encoded: " +
                           std::to_string(change.numerator) + "/2^" +
                           std::to_string(change.denominatorLog2));
        }

        uint64_t tick = TimeBase::beatsToTicks(change.beat, ticksPerBeat_);
        conductor.events.push_back(MidiEvent::makeTimeSignature(
            tick, static_cast<uint8_t>(change.numerator),
            static_cast<uint8_t>(change.denominatorLog2)));
    }

    return conductor;
}

void RepresentationSerializer::validateNote(const Note& note, int trackId) const {
    if (note.channel < 0 || note.channel > 15 ||
        note.pitch < 0 || note.pitch > 127 ||
        note.velocity < 0 || note.velocity > 100) {
        MIDIBEAT_THROW(ErrorCode::INVALID_ARGUMENT,
                       "Note out of range in track " + std::to_string(trackId) +
                       ": channel " + std::to_string(note.channel) +
                       ", pitch " + std::to_string(note.pitch) +
                       ", velocity " + std::to_string(note.velocity));
    }

    if (!std::isfinite(note.duration) || note.duration < 0.0) {
        MIDIBEAT_THROW(ErrorCode::INVALID_ARGUMENT,
                       "Note duration must be finite and non-negative in track " +
                       std::to_string(trackId) + ", got " + std::to_string(note.duration));
    }
}

} // namespace midiBeat

// ============================================================================
// END OF FILE RepresentationSerializer.cpp
// ============================================================================
