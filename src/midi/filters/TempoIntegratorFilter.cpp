// ============================================================================
// File: src/midi/filters/TempoIntegratorFilter.cpp
// Version: 1.0.0
// Project: MidiBeat - Beat-addressed MIDI conversion toolkit
// ============================================================================

#include "TempoIntegratorFilter.h"
#include "../representation/TempoMap.h"
#include "../../core/Logger.h"

namespace midiBeat {

TempoIntegratorFilter::TempoIntegratorFilter()
    : RepresentationFilter("tempo_integrator",
                           "Remove tempo changes (constant 60 BPM), keeping real-time note timing")
{
}

MidiRepresentation TempoIntegratorFilter::apply(MidiRepresentation representation) const {
    std::vector<TempoChange> changes = representation.bpmChanges;
    if (changes.empty() || changes.front().beat > 0.0) {
        // Implicit 120 BPM before the first change
        changes.insert(changes.begin(), TempoChange{0.0, 120.0});
    }
    const TempoMap tempoMap(std::move(changes));

    for (auto& [id, track] : representation.tracks) {
        for (auto& note : track.notes) {
            double start = tempoMap.elapsedSeconds(0.0, note.beat);
            double end = tempoMap.elapsedSeconds(0.0, note.beat + note.duration);

            if (end < start) {
                MIDIBEAT_THROW(ErrorCode::NEGATIVE_DURATION,
                               "Integrated duration is negative for note at beat " +
                               std::to_string(note.beat) + " in track " + std::to_string(id));
            }

            note.beat = start;
            note.duration = end - start;
        }
    }

    representation.bpmChanges = {TempoChange{0.0, TARGET_BPM}};

    Logger::info("TempoIntegratorFilter",
                 "Integrated " + std::to_string(tempoMap.size()) + " tempo segments into " +
                 std::to_string(TARGET_BPM) + " BPM");

    return representation;
}

} // namespace midiBeat

// ============================================================================
// END OF FILE TempoIntegratorFilter.cpp
// ============================================================================
