// ============================================================================
// File: src/midi/filters/NoChordsFilter.cpp
// Version: 1.0.0
// Project: MidiBeat - Beat-addressed MIDI conversion toolkit
// ============================================================================

#include "NoChordsFilter.h"
#include "../../core/Logger.h"

#include <algorithm>
#include <cmath>

namespace midiBeat {

namespace {

constexpr double RELATIVE_TOLERANCE = 1e-9;

} // namespace

NoChordsFilter::NoChordsFilter()
    : RepresentationFilter("no_chords",
                           "Keep only the highest note of notes starting together on a channel")
{
}

bool NoChordsFilter::sameChord(const Note& a, const Note& b) {
    if (a.channel != b.channel) {
        return false;
    }
    double scale = std::max(std::fabs(a.beat), std::fabs(b.beat));
    return std::fabs(a.beat - b.beat) <= RELATIVE_TOLERANCE * scale;
}

std::vector<Note> NoChordsFilter::reduceChords(const std::vector<Note>& notes) {
    std::vector<std::vector<Note>> groups;

    for (const auto& note : notes) {
        auto group = std::find_if(groups.begin(), groups.end(),
                                  [&note](const std::vector<Note>& g) {
                                      return sameChord(note, g.front());
                                  });
        if (group != groups.end()) {
            group->push_back(note);
        } else {
            groups.push_back({note});
        }
    }

    std::vector<Note> result;
    result.reserve(groups.size());

    for (const auto& group : groups) {
        // max_element returns the first of equal maxima
        auto highest = std::max_element(group.begin(), group.end(),
                                        [](const Note& a, const Note& b) {
                                            return a.pitch < b.pitch;
                                        });
        result.push_back(*highest);
    }

    return result;
}

MidiRepresentation NoChordsFilter::apply(MidiRepresentation representation) const {
    size_t removed = 0;

    for (auto& [id, track] : representation.tracks) {
        size_t before = track.notes.size();
        track.notes = reduceChords(track.notes);
        removed += before - track.notes.size();
    }

    Logger::info("NoChordsFilter", "Removed " + std::to_string(removed) + " chord notes");

    return representation;
}

} // namespace midiBeat

// ============================================================================
// END OF FILE NoChordsFilter.cpp
// ============================================================================
