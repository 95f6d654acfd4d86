// ============================================================================
// File: src/midi/representation/RepresentationBuilder.cpp
// Version: 1.0.0
// Project: MidiBeat - Beat-addressed MIDI conversion toolkit
// ============================================================================

#include "RepresentationBuilder.h"
#include "TempoMap.h"
#include "TimeBase.h"
#include "../../core/Config.h"
#include "../../core/Error.h"
#include "../../core/Logger.h"

#include <algorithm>
#include <map>
#include <utility>

namespace midiBeat {

// ============================================================================
// OPTIONS
// ============================================================================

UnmatchedNotePolicy unmatchedNotePolicyFromString(const std::string& name) {
    if (name == "drop") {
        return UnmatchedNotePolicy::DROP;
    }
    if (name == "reject") {
        return UnmatchedNotePolicy::REJECT;
    }
    MIDIBEAT_THROW(ErrorCode::INVALID_CONFIG,
                   "Unknown unmatched note policy: '" + name + "'");
}

const char* unmatchedNotePolicyToString(UnmatchedNotePolicy policy) {
    switch (policy) {
        case UnmatchedNotePolicy::DROP:   return "drop";
        case UnmatchedNotePolicy::REJECT: return "reject";
        default:                          return "unknown";
    }
}

BuilderOptions BuilderOptions::fromConfig() {
    const Config& config = Config::instance();

    BuilderOptions options;
    options.defaultBpm = config.getDouble("conversion.default_bpm", 120.0);
    options.defaultInstrument = config.getInt("conversion.default_instrument", 0);
    options.unmatchedNotePolicy = unmatchedNotePolicyFromString(
        config.getString("conversion.unmatched_note_policy", "drop"));
    return options;
}

// ============================================================================
// CONSTRUCTION
// ============================================================================

RepresentationBuilder::RepresentationBuilder(BuilderOptions options)
    : options_(std::move(options))
{
}

// ============================================================================
// BUILD
// ============================================================================

MidiRepresentation RepresentationBuilder::build(const MidiFile& file) const {
    if (file.header.isSmpte()) {
        MIDIBEAT_THROW(ErrorCode::INVALID_MIDI,
                       "SMPTE time division is not supported");
    }
    if (file.header.division == 0) {
        MIDIBEAT_THROW(ErrorCode::INVALID_MIDI, "Time division of zero ticks per beat");
    }

    const int ticksPerBeat = file.ticksPerBeat();
    MidiRepresentation representation;

    collectTempoChanges(file, ticksPerBeat, representation);
    collectTimeSignatures(file, ticksPerBeat, representation);

    for (size_t i = 0; i < file.tracks.size(); ++i) {
        representation.tracks[static_cast<int>(i)] =
            buildTrack(file.tracks[i], i, ticksPerBeat, representation);
    }

    for (const auto& [id, track] : representation.tracks) {
        for (const auto& note : track.notes) {
            // emplace keeps an existing program change
            representation.channelInstrumentMap.emplace(note.channel, options_.defaultInstrument);
        }
    }

    Logger::info("RepresentationBuilder",
                 "Built representation: " + std::to_string(representation.tracks.size()) +
                 " tracks, " + std::to_string(representation.noteCount()) + " notes, " +
                 std::to_string(representation.bpmChanges.size()) + " tempo changes");

    return representation;
}

// ============================================================================
// TEMPO / TIME SIGNATURE
// ============================================================================

void RepresentationBuilder::collectTempoChanges(const MidiFile& file, int ticksPerBeat,
                                                MidiRepresentation& representation) const {
    // The default goes first so that a real change at beat 0 overrides it
    std::vector<TempoChange> changes;
    changes.push_back(TempoChange{0.0, options_.defaultBpm});

    for (const auto& track : file.tracks) {
        for (const auto& event : track.events) {
            if (!event.isMeta(MetaType::SET_TEMPO)) {
                continue;
            }

            if (event.data.size() != 3) {
                MIDIBEAT_THROW(ErrorCode::INVALID_MIDI,
                               "Set Tempo event with " + std::to_string(event.data.size()) +
                               " data bytes (expected 3) at tick " +
                               std::to_string(event.absoluteTime));
            }
            if (event.tempo == 0) {
                MIDIBEAT_THROW(ErrorCode::INVALID_MIDI,
                               "Set Tempo event of zero at tick " +
                               std::to_string(event.absoluteTime));
            }

            changes.push_back(TempoChange{
                TimeBase::ticksToBeats(event.absoluteTime, ticksPerBeat),
                TimeBase::microsecondsPerQuarterToBpm(event.tempo)
            });
        }
    }

    representation.bpmChanges = TempoMap::normalize(std::move(changes));
}

void RepresentationBuilder::collectTimeSignatures(const MidiFile& file, int ticksPerBeat,
                                                  MidiRepresentation& representation) const {
    std::vector<TimeSignatureChange> changes;

    for (const auto& track : file.tracks) {
        for (const auto& event : track.events) {
            if (!event.isMeta(MetaType::TIME_SIGNATURE)) {
                continue;
            }

            if (event.data.size() != 4) {
                MIDIBEAT_THROW(ErrorCode::INVALID_MIDI,
                               "Time Signature event with " + std::to_string(event.data.size()) +
                               " data bytes (expected 4) at tick " +
                               std::to_string(event.absoluteTime));
            }
            if (event.timeSignature.numerator == 0 || event.timeSignature.denominatorLog2 > 7) {
                MIDIBEAT_THROW(ErrorCode::INVALID_MIDI,
                               "Unusable time signature at tick " +
                               std::to_string(event.absoluteTime));
            }

            changes.push_back(TimeSignatureChange{
                event.timeSignature.numerator,
                event.timeSignature.denominatorLog2,
                TimeBase::ticksToBeats(event.absoluteTime, ticksPerBeat)
            });
        }
    }

    std::stable_sort(changes.begin(), changes.end(),
                     [](const TimeSignatureChange& a, const TimeSignatureChange& b) {
                         return a.beat < b.beat;
                     });

    for (const auto& change : changes) {
        if (!representation.timeSignatureChanges.empty() &&
            representation.timeSignatureChanges.back().beat == change.beat) {
            representation.timeSignatureChanges.back() = change;
        } else {
            representation.timeSignatureChanges.push_back(change);
        }
    }
}

// ============================================================================
// NOTES
// ============================================================================

Track RepresentationBuilder::buildTrack(const MidiTrack& midiTrack, size_t trackIndex,
                                        int ticksPerBeat,
                                        MidiRepresentation& representation) const {
    struct Sounding {
        uint64_t tick;
        int velocity;
    };

    const std::string trackLabel = "track " + std::to_string(trackIndex);

    Track track;
    bool hasName = false;
    std::map<std::pair<int, int>, Sounding> sounding;

    auto closeNote = [&](const std::pair<int, int>& key, const Sounding& on, uint64_t offTick) {
        if (offTick == on.tick) {
            Logger::debug("RepresentationBuilder",
                          "Dropping zero-length note " + std::to_string(key.second) +
                          " on channel " + std::to_string(key.first) + " in " + trackLabel);
            return;
        }

        Note note;
        note.channel = key.first;
        note.pitch = key.second;
        note.velocity = std::clamp(on.velocity, 0, 100);
        note.beat = TimeBase::ticksToBeats(on.tick, ticksPerBeat);
        note.duration = TimeBase::ticksToBeats(offTick - on.tick, ticksPerBeat);
        track.notes.push_back(note);
    };

    for (const auto& event : midiTrack.events) {
        if (event.isMeta(MetaType::TRACK_NAME)) {
            if (!hasName) {
                track.name = event.text;
                hasName = true;
            }
            continue;
        }

        if (event.isProgramChange()) {
            representation.channelInstrumentMap[event.channel] = event.program;
            continue;
        }

        if (event.isNoteOn()) {
            std::pair<int, int> key(event.channel, event.note);

            auto it = sounding.find(key);
            if (it != sounding.end()) {
                // Re-trigger: the earlier note ends where the new one starts
                closeNote(key, it->second, event.absoluteTime);
                sounding.erase(it);
            }

            sounding.emplace(key, Sounding{event.absoluteTime, event.velocity});
            continue;
        }

        if (event.isNoteOff()) {
            std::pair<int, int> key(event.channel, event.note);

            auto it = sounding.find(key);
            if (it == sounding.end()) {
                Logger::debug("RepresentationBuilder",
                              "Ignoring note-off without note-on: note " +
                              std::to_string(event.note) + " on channel " +
                              std::to_string(event.channel) + " at tick " +
                              std::to_string(event.absoluteTime) + " in " + trackLabel);
                continue;
            }

            closeNote(key, it->second, event.absoluteTime);
            sounding.erase(it);
        }
    }

    for (const auto& [key, on] : sounding) {
        std::string description = "note " + std::to_string(key.second) + " on channel " +
                                  std::to_string(key.first) + " starting at tick " +
                                  std::to_string(on.tick) + " in " + trackLabel;

        if (options_.unmatchedNotePolicy == UnmatchedNotePolicy::REJECT) {
            MIDIBEAT_THROW(ErrorCode::INVALID_MIDI, "Note-on without note-off: " + description);
        }

        Logger::warning("RepresentationBuilder", "Dropping unterminated " + description);
    }

    std::stable_sort(track.notes.begin(), track.notes.end(),
                     [](const Note& a, const Note& b) { return a.beat < b.beat; });

    return track;
}

} // namespace midiBeat

// ============================================================================
// END OF FILE RepresentationBuilder.cpp
// ============================================================================
