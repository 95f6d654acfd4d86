// ============================================================================
// File: src/midi/representation/MidiRepresentation.cpp
// Version: 1.0.0
// Project: MidiBeat - Beat-addressed MIDI conversion toolkit
// ============================================================================

#include "MidiRepresentation.h"
#include "TimeBase.h"

#include <algorithm>
#include <cmath>
#include <unordered_map>

namespace midiBeat {

namespace {

constexpr double BEAT_EPSILON = 1e-7;

bool beatLessOrEqual(double a, double b) {
    return a <= b || std::fabs(a - b) <= BEAT_EPSILON;
}

bool beatLess(double a, double b) {
    return a < b && std::fabs(a - b) > BEAT_EPSILON;
}

} // namespace

// ============================================================================
// NOTE / TIME SIGNATURE
// ============================================================================

json Note::toJson() const {
    return {
        {"channel", channel},
        {"pitch", pitch},
        {"velocity", velocity},
        {"beat", beat},
        {"duration", duration}
    };
}

double TimeSignatureChange::barLengthBeats() const {
    return numerator * (4.0 / static_cast<double>(denominator()));
}

// ============================================================================
// TRACK
// ============================================================================

std::optional<int> Track::mostUsedChannel() const {
    if (notes.empty()) {
        return std::nullopt;
    }

    std::map<int, size_t> counts;
    for (const auto& note : notes) {
        counts[note.channel]++;
    }

    auto best = counts.begin();
    for (auto it = counts.begin(); it != counts.end(); ++it) {
        if (it->second > best->second) {
            best = it;
        }
    }
    return best->first;
}

void Track::clampNotes(double gap) {
    std::stable_sort(notes.begin(), notes.end(),
                     [](const Note& a, const Note& b) { return a.beat < b.beat; });

    std::unordered_map<int, size_t> previousByPitch;

    for (size_t i = 0; i < notes.size(); ++i) {
        const Note& current = notes[i];

        auto it = previousByPitch.find(current.pitch);
        if (it != previousByPitch.end()) {
            Note& previous = notes[it->second];
            double allowed = std::max(current.beat - previous.beat - gap, 0.0);
            previous.duration = std::min(previous.duration, allowed);
        }

        previousByPitch[current.pitch] = i;
    }
}

Track Track::slice(double begin, double end) const {
    Track result;
    result.name = name;

    for (const auto& note : notes) {
        if (beatLessOrEqual(begin, note.beat) && beatLess(note.beat, end)) {
            Note moved = note;
            moved.beat = std::max(0.0, note.beat - begin);
            result.notes.push_back(moved);
        }
    }

    return result;
}

void Track::offset(double beats) {
    for (auto& note : notes) {
        note.beat += beats;
    }
}

json Track::toJson() const {
    json j;
    j["name"] = name;
    j["notes"] = json::array();
    for (const auto& note : notes) {
        j["notes"].push_back(note.toJson());
    }
    return j;
}

// ============================================================================
// MIDI REPRESENTATION
// ============================================================================

double MidiRepresentation::startingBpm() const {
    if (bpmChanges.empty()) {
        return TimeBase::DEFAULT_BPM;
    }
    return bpmChanges.front().bpm;
}

TimeSignatureChange MidiRepresentation::startingTimeSignature() const {
    for (const auto& change : timeSignatureChanges) {
        if (change.beat == 0.0) {
            return change;
        }
    }
    return TimeSignatureChange{};
}

int MidiRepresentation::songLengthBeats() const {
    double highest = 0.0;
    for (const auto& [id, track] : tracks) {
        for (const auto& note : track.notes) {
            highest = std::max(highest, note.endBeat());
        }
    }
    return static_cast<int>(std::ceil(highest));
}

size_t MidiRepresentation::clearEmptyTracks() {
    size_t removed = 0;
    for (auto it = tracks.begin(); it != tracks.end();) {
        if (it->second.empty()) {
            it = tracks.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t MidiRepresentation::noteCount() const {
    size_t count = 0;
    for (const auto& [id, track] : tracks) {
        count += track.notes.size();
    }
    return count;
}

json MidiRepresentation::toJson() const {
    json j;

    j["tracks"] = json::object();
    for (const auto& [id, track] : tracks) {
        j["tracks"][std::to_string(id)] = track.toJson();
    }

    j["channel_instrument_map"] = json::object();
    for (const auto& [channel, program] : channelInstrumentMap) {
        j["channel_instrument_map"][std::to_string(channel)] = program;
    }

    j["bpm_changes"] = json::array();
    for (const auto& change : bpmChanges) {
        j["bpm_changes"].push_back({{"beat", change.beat}, {"bpm", change.bpm}});
    }

    j["time_signature_changes"] = json::array();
    for (const auto& change : timeSignatureChanges) {
        j["time_signature_changes"].push_back({
            {"beat", change.beat},
            {"numerator", change.numerator},
            {"denominator", change.denominator()}
        });
    }

    return j;
}

} // namespace midiBeat

// ============================================================================
// END OF FILE MidiRepresentation.cpp
// ============================================================================
