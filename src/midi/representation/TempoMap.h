// ============================================================================
// File: src/midi/representation/TempoMap.h
// Version: 1.0.0
// Project: MidiBeat - Beat-addressed MIDI conversion toolkit
// ============================================================================
//
// Description:
//   Piecewise-constant tempo function over beats. Answers point queries
//   and converts beat intervals to wall-clock seconds and back, exactly,
//   by summing whole constant-tempo segments.
//
// ============================================================================

#pragma once

#include <vector>

#include "MidiRepresentation.h"

namespace midiBeat {

/**
 * @class TempoMap
 * @brief Sorted, deduplicated tempo changes keyed by beat
 *
 * A change governs the half-open range from its own beat up to the next
 * change. Queries before the first change fail with NO_TEMPO_DEFINED.
 *
 * Example:
 * @code
 * TempoMap map({{0.0, 120.0}, {4.0, 60.0}});
 * map.elapsedSeconds(0.0, 8.0);      // 2 + 4 = 6 seconds
 * map.beatsForSeconds(0.0, 6.0);     // 8 beats
 * @endcode
 */
class TempoMap {
public:
    /**
     * @brief Build from tempo changes in any order
     * @throws MidiBeatException INVALID_TEMPO for a bpm <= 0 or not finite,
     *         INVALID_ARGUMENT for a negative or non-finite beat
     * @see normalize()
     */
    explicit TempoMap(std::vector<TempoChange> changes);

    /**
     * @brief Canonical form of a tempo change list
     *
     * Stable sort by beat, keep the last entry among entries sharing a beat,
     * then drop entries that repeat the tempo already in effect.
     */
    static std::vector<TempoChange> normalize(std::vector<TempoChange> changes);

    /**
     * @brief Tempo in effect at a beat
     * @throws MidiBeatException NO_TEMPO_DEFINED if no change is at or before `beat`
     */
    double tempoAt(double beat) const;

    /**
     * @brief Wall-clock seconds between two beat positions
     *
     * A change exactly at `from` governs the first segment; changes after
     * `to` have no effect.
     *
     * @throws MidiBeatException INVALID_ARGUMENT if from > to,
     *         NO_TEMPO_DEFINED if `from` precedes the first change
     */
    double elapsedSeconds(double from, double to) const;

    /**
     * @brief Beats covered by `seconds` of wall-clock time starting at `from`
     * @throws MidiBeatException NEGATIVE_DURATION if seconds < 0,
     *         NO_TEMPO_DEFINED if `from` precedes the first change
     */
    double beatsForSeconds(double from, double seconds) const;

    const std::vector<TempoChange>& changes() const { return changes_; }
    bool empty() const { return changes_.empty(); }
    size_t size() const { return changes_.size(); }

private:
    /// Index of the last change with beat <= `beat`
    size_t indexAt(double beat) const;

    std::vector<TempoChange> changes_;
};

} // namespace midiBeat

// ============================================================================
// END OF FILE TempoMap.h
// ============================================================================
