// ============================================================================
// tests/test_tempo_integrator.cpp - Constant 60 BPM rewrite
// ============================================================================

#include <gtest/gtest.h>

#include "TestMidiHelpers.h"
#include "../src/midi/filters/TempoIntegratorFilter.h"
#include "../src/midi/representation/TempoMap.h"

using namespace midiBeat;
using namespace midiBeat::test;

// ============================================================================
// TEST FIXTURE
// ============================================================================

class TempoIntegratorTest : public MidiBeatTest {
protected:
    static MidiRepresentation withNotes(std::vector<Note> notes,
                                        std::vector<TempoChange> tempo) {
        MidiRepresentation rep;
        rep.tracks[0].notes = std::move(notes);
        rep.bpmChanges = std::move(tempo);
        rep.channelInstrumentMap[0] = 0;
        return rep;
    }

    TempoIntegratorFilter filter_;
};

// ============================================================================
// TESTS
// ============================================================================

TEST_F(TempoIntegratorTest, NoteAfterTempoChange) {
    MidiRepresentation rep = withNotes({makeNote(0, 60, 100, 4.0, 4.0)},
                                       {{0.0, 120.0}, {4.0, 60.0}});

    MidiRepresentation result = filter_.apply(rep);

    const Note& note = result.tracks.at(0).notes.at(0);
    EXPECT_DOUBLE_EQ(note.beat, 2.0);
    EXPECT_DOUBLE_EQ(note.duration, 4.0);
    EXPECT_EQ(result.bpmChanges, (std::vector<TempoChange>{{0.0, 60.0}}));
}

TEST_F(TempoIntegratorTest, NoteStraddlingTempoChange) {
    MidiRepresentation rep = withNotes({
        makeNote(0, 60, 100, 0.0, 4.0),
        makeNote(0, 62, 100, 2.0, 4.0)
    }, {{0.0, 120.0}, {4.0, 60.0}});

    MidiRepresentation result = filter_.apply(rep);
    const auto& notes = result.tracks.at(0).notes;

    EXPECT_DOUBLE_EQ(notes[0].beat, 0.0);
    EXPECT_DOUBLE_EQ(notes[0].duration, 2.0);
    EXPECT_DOUBLE_EQ(notes[1].beat, 1.0);
    EXPECT_DOUBLE_EQ(notes[1].duration, 3.0);
}

TEST_F(TempoIntegratorTest, KeepsEverythingButTiming) {
    MidiRepresentation rep = withNotes({makeNote(4, 48, 77, 1.0, 1.0)}, {{0.0, 90.0}});
    rep.tracks[0].name = "Strings";
    rep.channelInstrumentMap[4] = 48;
    rep.timeSignatureChanges = {{3, 2, 0.0}, {5, 3, 6.0}};

    MidiRepresentation result = filter_.apply(rep);

    EXPECT_EQ(result.tracks.at(0).name, "Strings");
    EXPECT_EQ(result.channelInstrumentMap, rep.channelInstrumentMap);
    EXPECT_EQ(result.timeSignatureChanges, rep.timeSignatureChanges);

    const Note& note = result.tracks.at(0).notes.at(0);
    EXPECT_EQ(note.channel, 4);
    EXPECT_EQ(note.pitch, 48);
    EXPECT_EQ(note.velocity, 77);
    EXPECT_DOUBLE_EQ(note.beat, 2.0 / 3.0);
}

TEST_F(TempoIntegratorTest, PreservesRealTime) {
    std::vector<TempoChange> tempo = {{0.0, 97.0}, {1.5, 143.0}, {5.25, 61.0}, {9.0, 200.0}};
    std::vector<Note> notes;
    for (int i = 0; i < 40; ++i) {
        notes.push_back(makeNote(0, 40 + i, 100, i * 0.29, 0.1 + (i % 5) * 0.4));
    }

    MidiRepresentation rep = withNotes(notes, tempo);
    MidiRepresentation result = filter_.apply(rep);

    TempoMap before(tempo);
    TempoMap after(result.bpmChanges);

    const auto& integrated = result.tracks.at(0).notes;
    ASSERT_EQ(integrated.size(), notes.size());

    for (size_t i = 0; i < notes.size(); ++i) {
        EXPECT_NEAR(after.elapsedSeconds(0.0, integrated[i].beat),
                    before.elapsedSeconds(0.0, notes[i].beat), 1e-9);
        EXPECT_NEAR(after.elapsedSeconds(0.0, integrated[i].endBeat()),
                    before.elapsedSeconds(0.0, notes[i].endBeat()), 1e-9);
    }
}

TEST_F(TempoIntegratorTest, EmptyTempoListUsesDefault) {
    MidiRepresentation rep = withNotes({makeNote(0, 60, 100, 2.0, 2.0)}, {});

    const Note& note = filter_.apply(rep).tracks.at(0).notes.at(0);
    EXPECT_DOUBLE_EQ(note.beat, 1.0);
    EXPECT_DOUBLE_EQ(note.duration, 1.0);
}

TEST_F(TempoIntegratorTest, DefaultTempoBeforeFirstChange) {
    MidiRepresentation rep = withNotes({makeNote(0, 60, 100, 4.0, 1.0)}, {{2.0, 60.0}});

    const Note& note = filter_.apply(rep).tracks.at(0).notes.at(0);
    EXPECT_DOUBLE_EQ(note.beat, 3.0);
    EXPECT_DOUBLE_EQ(note.duration, 1.0);
}

TEST_F(TempoIntegratorTest, RejectsInvalidTempo) {
    MidiRepresentation rep = withNotes({makeNote(0, 60, 100, 0.0, 1.0)}, {{0.0, 0.0}});
    EXPECT_EQ(captureErrorCode([&] { filter_.apply(rep); }), ErrorCode::INVALID_TEMPO);
}

TEST_F(TempoIntegratorTest, RejectsNegativeDuration) {
    MidiRepresentation rep = withNotes({makeNote(0, 60, 100, 2.0, -1.0)}, {{0.0, 120.0}});
    EXPECT_EQ(captureErrorCode([&] { filter_.apply(rep); }), ErrorCode::NEGATIVE_DURATION);
}

TEST_F(TempoIntegratorTest, Metadata) {
    EXPECT_EQ(filter_.getName(), "tempo_integrator");
    EXPECT_FALSE(filter_.getDescription().empty());
    EXPECT_EQ(captureErrorCode([&] { filter_.setParameter("multiplier", 2.0); }),
              ErrorCode::INVALID_ARGUMENT);
}
