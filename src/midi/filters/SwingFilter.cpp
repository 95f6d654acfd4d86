// ============================================================================
// File: src/midi/filters/SwingFilter.cpp
// Version: 1.0.0
// Project: MidiBeat - Beat-addressed MIDI conversion toolkit
// ============================================================================

#include "SwingFilter.h"
#include "../../core/Logger.h"

#include <cmath>
#include <sstream>

namespace midiBeat {

namespace {

/// Tolerance on the on-beat half so that 0.5 itself swings as the first half
constexpr double SWING_SPLIT = 0.500000001;

/// Swung off-beat position (2/3) as the unswing split point
constexpr double UNSWING_SPLIT = 0.667;

void requireMultiplier(double multiplier) {
    if (!std::isfinite(multiplier) || multiplier <= 0.0) {
        std::ostringstream msg;
        msg << "Swing multiplier must be positive, got " << multiplier;
        MIDIBEAT_THROW(ErrorCode::INVALID_ARGUMENT, msg.str());
    }
}

} // namespace

// ============================================================================
// CONSTRUCTION
// ============================================================================

SwingFilter::SwingFilter(Direction direction, double multiplier)
    : RepresentationFilter(direction == Direction::SWING ? "swing" : "unswing",
                           direction == Direction::SWING
                               ? "Swing straight eighth notes into a triplet feel"
                               : "Straighten swung eighth notes")
    , direction_(direction)
    , multiplier_(multiplier)
{
    requireMultiplier(multiplier);
}

// ============================================================================
// MAPPINGS
// ============================================================================

double SwingFilter::toSwing(double beat, double multiplier) {
    requireMultiplier(multiplier);

    double scaled = beat * multiplier;
    double whole = std::floor(scaled);
    double fraction = scaled - whole;

    double swung = fraction <= SWING_SPLIT
        ? fraction * (4.0 / 3.0)
        : (2.0 * fraction + 1.0) / 3.0;

    return (whole + swung) / multiplier;
}

double SwingFilter::fromSwing(double beat, double multiplier) {
    requireMultiplier(multiplier);

    double scaled = beat * multiplier;
    double whole = std::floor(scaled);
    double fraction = scaled - whole;

    double straight = fraction <= UNSWING_SPLIT
        ? fraction * (3.0 / 4.0)
        : (3.0 * fraction - 1.0) / 2.0;

    return (whole + straight) / multiplier;
}

// ============================================================================
// APPLY
// ============================================================================

MidiRepresentation SwingFilter::apply(MidiRepresentation representation) const {
    for (auto& [id, track] : representation.tracks) {
        for (auto& note : track.notes) {
            note.beat = direction_ == Direction::SWING
                ? toSwing(note.beat, multiplier_)
                : fromSwing(note.beat, multiplier_);
        }
        track.clampNotes();
    }

    Logger::info("SwingFilter",
                 std::string(direction_ == Direction::SWING ? "Swung " : "Unswung ") +
                 std::to_string(representation.noteCount()) + " notes (multiplier " +
                 std::to_string(multiplier_) + ")");

    return representation;
}

// ============================================================================
// PARAMETERS
// ============================================================================

void SwingFilter::setParameter(const std::string& name, double value) {
    if (name != "multiplier") {
        RepresentationFilter::setParameter(name, value);
        return;
    }
    requireMultiplier(value);
    multiplier_ = value;
}

double SwingFilter::getParameter(const std::string& name) const {
    if (name != "multiplier") {
        return RepresentationFilter::getParameter(name);
    }
    return multiplier_;
}

nlohmann::json SwingFilter::toJson() const {
    nlohmann::json j = RepresentationFilter::toJson();
    j["multiplier"] = multiplier_;
    return j;
}

} // namespace midiBeat

// ============================================================================
// END OF FILE SwingFilter.cpp
// ============================================================================
