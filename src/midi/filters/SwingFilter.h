// ============================================================================
// File: src/midi/filters/SwingFilter.h
// Version: 1.0.0
// Project: MidiBeat - Beat-addressed MIDI conversion toolkit
// ============================================================================
//
// Description:
//   Swing and unswing: remap the position of each note inside its beat so
//   that straight eighths become a 2:1 triplet feel, or back.
//
//   Swing maps the fractional part f of a beat as
//       f <= 0.5 : f * 4/3
//       f >  0.5 : (2f + 1) / 3
//   so the off-beat eighth (0.5) lands on the last triplet (2/3).
//   Unswing is the inverse mapping, split at 2/3.
//
// ============================================================================

#pragma once

#include "RepresentationFilter.h"

namespace midiBeat {

/**
 * @class SwingFilter
 * @brief Swing ("swing") or unswing ("unswing") every note start
 *
 * Parameter "multiplier" (default 1) sets what counts as a beat for the
 * purpose of swinging: with 2, each half beat is swung, the same effect as
 * a time signature denominator of 8. Durations are kept; after moving the
 * notes, each track's repeated pitches are clamped so they do not overlap.
 */
class SwingFilter : public RepresentationFilter {
public:
    enum class Direction {
        SWING,
        UNSWING
    };

    /**
     * @param direction SWING or UNSWING
     * @param multiplier Beat subdivision factor, must be > 0
     */
    explicit SwingFilter(Direction direction, double multiplier = 1.0);

    MidiRepresentation apply(MidiRepresentation representation) const override;

    void setParameter(const std::string& name, double value) override;
    double getParameter(const std::string& name) const override;

    nlohmann::json toJson() const override;

    Direction getDirection() const { return direction_; }

    /// Swung position of a straight beat position
    static double toSwing(double beat, double multiplier);

    /// Straight position of a swung beat position
    static double fromSwing(double beat, double multiplier);

private:
    Direction direction_;
    double multiplier_;
};

} // namespace midiBeat

// ============================================================================
// END OF FILE SwingFilter.h
// ============================================================================
