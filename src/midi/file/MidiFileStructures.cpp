// ============================================================================
// File: src/midi/file/MidiFileStructures.cpp
// Version: 1.0.0
// Project: MidiBeat - Beat-addressed MIDI conversion toolkit
// ============================================================================

#include "MidiFileStructures.h"
#include "../../core/Error.h"

#include <limits>

namespace midiBeat {

// ============================================================================
// EVENT FACTORIES
// ============================================================================

MidiEvent MidiEvent::makeNoteOn(uint64_t tick, uint8_t channel, uint8_t note, uint8_t velocity) {
    MidiEvent event;
    event.absoluteTime = tick;
    event.type = MidiEventType::MIDI_CHANNEL;
    event.status = MidiStatus::NOTE_ON | (channel & 0x0F);
    event.channel = channel & 0x0F;
    event.note = note & 0x7F;
    event.velocity = velocity & 0x7F;
    event.data = {event.note, event.velocity};
    return event;
}

MidiEvent MidiEvent::makeNoteOff(uint64_t tick, uint8_t channel, uint8_t note, uint8_t velocity) {
    MidiEvent event;
    event.absoluteTime = tick;
    event.type = MidiEventType::MIDI_CHANNEL;
    event.status = MidiStatus::NOTE_OFF | (channel & 0x0F);
    event.channel = channel & 0x0F;
    event.note = note & 0x7F;
    event.velocity = velocity & 0x7F;
    event.data = {event.note, event.velocity};
    return event;
}

MidiEvent MidiEvent::makeProgramChange(uint64_t tick, uint8_t channel, uint8_t program) {
    MidiEvent event;
    event.absoluteTime = tick;
    event.type = MidiEventType::MIDI_CHANNEL;
    event.status = MidiStatus::PROGRAM_CHANGE | (channel & 0x0F);
    event.channel = channel & 0x0F;
    event.program = program & 0x7F;
    event.data = {event.program};
    return event;
}

MidiEvent MidiEvent::makeMeta(uint64_t tick, uint8_t metaType, std::vector<uint8_t> payload) {
    MidiEvent event;
    event.absoluteTime = tick;
    event.type = MidiEventType::META;
    event.status = MidiStatus::META;
    event.metaType = metaType;
    event.data = std::move(payload);
    return event;
}

MidiEvent MidiEvent::makeTrackName(uint64_t tick, const std::string& name) {
    MidiEvent event = makeMeta(tick, MetaType::TRACK_NAME,
                               std::vector<uint8_t>(name.begin(), name.end()));
    event.text = name;
    return event;
}

MidiEvent MidiEvent::makeTempo(uint64_t tick, uint32_t microsecondsPerQuarter) {
    if (microsecondsPerQuarter == 0 || microsecondsPerQuarter > 0xFFFFFF) {
        MIDIBEAT_THROW(ErrorCode::INVALID_TEMPO,
                       "Tempo does not fit the 24-bit Set Tempo field: " +
                       std::to_string(microsecondsPerQuarter));
    }

    MidiEvent event = makeMeta(tick, MetaType::SET_TEMPO, {
        static_cast<uint8_t>((microsecondsPerQuarter >> 16) & 0xFF),
        static_cast<uint8_t>((microsecondsPerQuarter >> 8) & 0xFF),
        static_cast<uint8_t>(microsecondsPerQuarter & 0xFF)
    });
    event.tempo = microsecondsPerQuarter;
    return event;
}

MidiEvent MidiEvent::makeTimeSignature(uint64_t tick, uint8_t numerator, uint8_t denominatorLog2,
                                       uint8_t clocksPerClick, uint8_t notated32ndNotesPerBeat) {
    MidiEvent event = makeMeta(tick, MetaType::TIME_SIGNATURE,
                               {numerator, denominatorLog2, clocksPerClick, notated32ndNotesPerBeat});
    event.timeSignature.numerator = numerator;
    event.timeSignature.denominatorLog2 = denominatorLog2;
    event.timeSignature.clocksPerClick = clocksPerClick;
    event.timeSignature.notated32ndNotesPerBeat = notated32ndNotesPerBeat;
    return event;
}

MidiEvent MidiEvent::makeEndOfTrack(uint64_t tick) {
    MidiEvent event = makeMeta(tick, MetaType::END_OF_TRACK, {});
    return event;
}

// ============================================================================
// TRACK HELPERS
// ============================================================================

void MidiTrack::computeDeltaTimes() {
    uint64_t previous = 0;

    for (auto& event : events) {
        if (event.absoluteTime < previous) {
            MIDIBEAT_THROW(ErrorCode::INTERNAL_ERROR,
                           "Track events are not ordered by absolute time");
        }

        uint64_t delta = event.absoluteTime - previous;
        if (delta > std::numeric_limits<uint32_t>::max()) {
            MIDIBEAT_THROW(ErrorCode::INVALID_ARGUMENT,
                           "Delta time too large: " + std::to_string(delta));
        }

        event.deltaTime = static_cast<uint32_t>(delta);
        previous = event.absoluteTime;
    }
}

} // namespace midiBeat

// ============================================================================
// END OF FILE MidiFileStructures.cpp
// ============================================================================
