// ============================================================================
// File: src/midi/representation/TempoMap.cpp
// Version: 1.0.0
// Project: MidiBeat - Beat-addressed MIDI conversion toolkit
// ============================================================================

#include "TempoMap.h"
#include "TimeBase.h"
#include "../../core/Error.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace midiBeat {

// ============================================================================
// CONSTRUCTION
// ============================================================================

TempoMap::TempoMap(std::vector<TempoChange> changes)
    : changes_(normalize(std::move(changes)))
{
}

std::vector<TempoChange> TempoMap::normalize(std::vector<TempoChange> changes) {
    for (const auto& change : changes) {
        if (!std::isfinite(change.bpm) || change.bpm <= 0.0) {
            MIDIBEAT_THROW(ErrorCode::INVALID_TEMPO,
                           "Tempo must be positive, got " + std::to_string(change.bpm) + " BPM");
        }

        if (!std::isfinite(change.beat) || change.beat < 0.0) {
            MIDIBEAT_THROW(ErrorCode::INVALID_ARGUMENT,
                           "Tempo change at invalid beat " + std::to_string(change.beat));
        }
    }

    std::stable_sort(changes.begin(), changes.end(),
                     [](const TempoChange& a, const TempoChange& b) { return a.beat < b.beat; });

    std::vector<TempoChange> result;
    result.reserve(changes.size());

    for (const auto& change : changes) {
        // Later entries on the same beat override earlier ones
        if (!result.empty() && result.back().beat == change.beat) {
            result.pop_back();
        }

        if (!result.empty() && result.back().bpm == change.bpm) {
            continue;
        }

        result.push_back(change);
    }

    return result;
}

// ============================================================================
// QUERIES
// ============================================================================

size_t TempoMap::indexAt(double beat) const {
    auto it = std::upper_bound(changes_.begin(), changes_.end(), beat,
                               [](double value, const TempoChange& change) {
                                   return value < change.beat;
                               });

    if (it == changes_.begin()) {
        MIDIBEAT_THROW(ErrorCode::NO_TEMPO_DEFINED,
                       "No tempo defined at beat " + std::to_string(beat));
    }

    return static_cast<size_t>(std::distance(changes_.begin(), it)) - 1;
}

double TempoMap::tempoAt(double beat) const {
    return changes_[indexAt(beat)].bpm;
}

double TempoMap::elapsedSeconds(double from, double to) const {
    if (!std::isfinite(from) || !std::isfinite(to)) {
        MIDIBEAT_THROW(ErrorCode::INVALID_ARGUMENT, "elapsedSeconds: beats must be finite");
    }

    if (from > to) {
        MIDIBEAT_THROW(ErrorCode::INVALID_ARGUMENT,
                       "elapsedSeconds: start beat " + std::to_string(from) +
                       " is after end beat " + std::to_string(to));
    }

    size_t index = indexAt(from);
    double position = from;
    double seconds = 0.0;

    while (true) {
        double next = index + 1 < changes_.size()
            ? changes_[index + 1].beat
            : std::numeric_limits<double>::infinity();
        double segmentEnd = std::min(next, to);

        seconds += (segmentEnd - position) * TimeBase::secondsPerBeat(changes_[index].bpm);

        if (next >= to) {
            break;
        }

        position = next;
        ++index;
    }

    return seconds;
}

double TempoMap::beatsForSeconds(double from, double seconds) const {
    if (!std::isfinite(from) || !std::isfinite(seconds)) {
        MIDIBEAT_THROW(ErrorCode::INVALID_ARGUMENT, "beatsForSeconds: arguments must be finite");
    }

    if (seconds < 0.0) {
        MIDIBEAT_THROW(ErrorCode::NEGATIVE_DURATION,
                       "beatsForSeconds: negative duration " + std::to_string(seconds));
    }

    size_t index = indexAt(from);
    double position = from;
    double remaining = seconds;

    while (true) {
        double secondsPerBeat = TimeBase::secondsPerBeat(changes_[index].bpm);

        if (index + 1 >= changes_.size()) {
            return position + remaining / secondsPerBeat;
        }

        double next = changes_[index + 1].beat;
        double segmentSeconds = (next - position) * secondsPerBeat;

        if (remaining <= segmentSeconds) {
            return position + remaining / secondsPerBeat;
        }

        remaining -= segmentSeconds;
        position = next;
        ++index;
    }
}

} // namespace midiBeat

// ============================================================================
// END OF FILE TempoMap.cpp
// ============================================================================
