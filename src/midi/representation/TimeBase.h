// ============================================================================
// File: src/midi/representation/TimeBase.h
// Version: 1.0.0
// Project: MidiBeat - Beat-addressed MIDI conversion toolkit
// ============================================================================
//
// Description:
//   Conversions between the tick grid of a MIDI file and beat positions,
//   and between BPM, seconds per beat and the SMF microseconds-per-quarter
//   tempo field. Header-only.
//
// ============================================================================

#pragma once

#include <cmath>
#include <cstdint>
#include <string>

#include "../../core/Error.h"

namespace midiBeat {

/**
 * @namespace TimeBase
 * @brief Tick, beat and tempo unit conversions
 *
 * One beat is one quarter note; a file's resolution is its ticks per beat.
 *
 * @note beatsToTicks() rounds half to even. The builder and the serializer
 *       both go through it, so repeated round trips land on the same ticks.
 */
namespace TimeBase {

/// Largest tick value accepted when converting beats to ticks
constexpr double MAX_TICKS = 9.0e15;

/// Largest value of the 24-bit Set Tempo field
constexpr uint32_t MAX_MICROSECONDS_PER_QUARTER = 0xFFFFFF;

constexpr double DEFAULT_BPM = 120.0;

inline void requireTicksPerBeat(int ticksPerBeat) {
    if (ticksPerBeat <= 0) {
        MIDIBEAT_THROW(ErrorCode::INVALID_ARGUMENT,
                       "ticks_per_beat must be positive, got " + std::to_string(ticksPerBeat));
    }
}

/**
 * @brief Absolute tick offset to beat position
 * @throws MidiBeatException INVALID_ARGUMENT if ticksPerBeat <= 0
 */
inline double ticksToBeats(uint64_t ticks, int ticksPerBeat) {
    requireTicksPerBeat(ticksPerBeat);
    return static_cast<double>(ticks) / static_cast<double>(ticksPerBeat);
}

/**
 * @brief Beat position to the nearest tick (ties to even)
 * @throws MidiBeatException INVALID_ARGUMENT for a negative or non-finite
 *         beat, or a non-positive ticksPerBeat
 */
inline uint64_t beatsToTicks(double beats, int ticksPerBeat) {
    requireTicksPerBeat(ticksPerBeat);

    if (!std::isfinite(beats) || beats < 0.0) {
        MIDIBEAT_THROW(ErrorCode::INVALID_ARGUMENT,
                       "Beat position must be finite and non-negative, got " +
                       std::to_string(beats));
    }

    double ticks = std::nearbyint(beats * static_cast<double>(ticksPerBeat));
    if (ticks > MAX_TICKS) {
        MIDIBEAT_THROW(ErrorCode::INVALID_ARGUMENT,
                       "Beat position out of range: " + std::to_string(beats));
    }

    return static_cast<uint64_t>(ticks);
}

/**
 * @brief Seconds per beat at a tempo
 * @throws MidiBeatException INVALID_TEMPO when bpm <= 0 or not finite
 */
inline double secondsPerBeat(double bpm) {
    if (!std::isfinite(bpm) || bpm <= 0.0) {
        MIDIBEAT_THROW(ErrorCode::INVALID_TEMPO,
                       "Tempo must be positive, got " + std::to_string(bpm) + " BPM");
    }
    return 60.0 / bpm;
}

/**
 * @brief BPM to the Set Tempo meta value
 * @throws MidiBeatException INVALID_TEMPO when bpm <= 0, or when the result
 *         does not fit 24 bits or rounds to zero
 */
inline uint32_t bpmToMicrosecondsPerQuarter(double bpm) {
    double us = std::nearbyint(secondsPerBeat(bpm) * 1.0e6);

    if (us < 1.0 || us > static_cast<double>(MAX_MICROSECONDS_PER_QUARTER)) {
        MIDIBEAT_THROW(ErrorCode::INVALID_TEMPO,
                       "Tempo cannot be encoded in a MIDI file: " +
                       std::to_string(bpm) + " BPM");
    }

    return static_cast<uint32_t>(us);
}

/**
 * @brief Set Tempo meta value to BPM
 * @throws MidiBeatException INVALID_TEMPO when the value is zero
 */
inline double microsecondsPerQuarterToBpm(uint32_t microsecondsPerQuarter) {
    if (microsecondsPerQuarter == 0) {
        MIDIBEAT_THROW(ErrorCode::INVALID_TEMPO, "Set Tempo value of zero");
    }
    return 60.0e6 / static_cast<double>(microsecondsPerQuarter);
}

} // namespace TimeBase
} // namespace midiBeat

// ============================================================================
// END OF FILE TimeBase.h
// ============================================================================
