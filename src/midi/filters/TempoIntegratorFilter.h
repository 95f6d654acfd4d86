// ============================================================================
// File: src/midi/filters/TempoIntegratorFilter.h
// Version: 1.0.0
// Project: MidiBeat - Beat-addressed MIDI conversion toolkit
// ============================================================================

#pragma once

#include "RepresentationFilter.h"

namespace midiBeat {

/**
 * @class TempoIntegratorFilter
 * @brief Replace the tempo map by a constant 60 BPM, keeping wall-clock time
 *
 * At 60 BPM one beat lasts one second, so each note's new beat is the
 * elapsed time of its old beat under the original tempo map:
 *
 *     beat'     = T.elapsedSeconds(0, beat)
 *     duration' = T.elapsedSeconds(0, beat + duration) - beat'
 *
 * bpmChanges becomes [{0, 60}]. Time signature changes keep their beat
 * positions and are therefore only approximately placed afterwards.
 */
class TempoIntegratorFilter : public RepresentationFilter {
public:
    static constexpr double TARGET_BPM = 60.0;

    TempoIntegratorFilter();

    /**
     * @throws MidiBeatException INVALID_TEMPO from the tempo map,
     *         NEGATIVE_DURATION if a rescaled duration comes out negative
     */
    MidiRepresentation apply(MidiRepresentation representation) const override;
};

} // namespace midiBeat

// ============================================================================
// END OF FILE TempoIntegratorFilter.h
// ============================================================================
