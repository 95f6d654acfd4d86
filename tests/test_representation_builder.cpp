// ============================================================================
// tests/test_representation_builder.cpp - MidiFile -> MidiRepresentation
// ============================================================================

#include <gtest/gtest.h>

#include "TestMidiHelpers.h"
#include "../src/midi/representation/RepresentationBuilder.h"

using namespace midiBeat;
using namespace midiBeat::test;

// ============================================================================
// TEST FIXTURE
// ============================================================================

class RepresentationBuilderTest : public MidiBeatTest {
protected:
    MidiRepresentation build(const MidiFile& file,
                             BuilderOptions options = BuilderOptions()) const {
        return RepresentationBuilder(options).build(file);
    }
};

// ============================================================================
// BASIC CONVERSION
// ============================================================================

TEST_F(RepresentationBuilderTest, SingleNoteAt480Ppq) {
    MidiFile file = makeFile({makeTrack({
        MidiEvent::makeTempo(0, 500000),
        MidiEvent::makeNoteOn(0, 0, 60, 100),
        MidiEvent::makeNoteOff(480, 0, 60, 0)
    })});

    MidiRepresentation rep = build(file);

    ASSERT_EQ(rep.tracks.size(), 1u);
    ASSERT_EQ(rep.tracks.count(0), 1u);
    ASSERT_EQ(rep.tracks.at(0).notes.size(), 1u);
    EXPECT_EQ(rep.tracks.at(0).notes[0], makeNote(0, 60, 100, 0.0, 1.0));

    ASSERT_EQ(rep.bpmChanges.size(), 1u);
    EXPECT_EQ(rep.bpmChanges[0], (TempoChange{0.0, 120.0}));
    EXPECT_TRUE(rep.timeSignatureChanges.empty());
}

TEST_F(RepresentationBuilderTest, TicksBecomeBeats) {
    MidiFile file = makeFile({makeTrack({
        MidiEvent::makeNoteOn(240, 2, 64, 80),
        MidiEvent::makeNoteOff(1200, 2, 64, 0)
    })}, 480);

    MidiRepresentation rep = build(file);
    const Note& note = rep.tracks.at(0).notes.at(0);

    EXPECT_DOUBLE_EQ(note.beat, 0.5);
    EXPECT_DOUBLE_EQ(note.duration, 2.0);
    EXPECT_EQ(note.channel, 2);
    EXPECT_EQ(note.velocity, 80);
}

TEST_F(RepresentationBuilderTest, VelocityClampedToHundred) {
    MidiFile file = makeFile({makeTrack({
        MidiEvent::makeNoteOn(0, 0, 60, 127),
        MidiEvent::makeNoteOff(480, 0, 60, 0),
        MidiEvent::makeNoteOn(480, 0, 62, 100),
        MidiEvent::makeNoteOff(960, 0, 62, 0),
        MidiEvent::makeNoteOn(960, 0, 64, 1),
        MidiEvent::makeNoteOff(1440, 0, 64, 0)
    })}, 480);

    const auto notes = build(file).tracks.at(0).notes;
    ASSERT_EQ(notes.size(), 3u);
    EXPECT_EQ(notes[0].velocity, 100);
    EXPECT_EQ(notes[1].velocity, 100);
    EXPECT_EQ(notes[2].velocity, 1);
}

TEST_F(RepresentationBuilderTest, ZeroVelocityNoteOnEndsNote) {
    MidiFile file = makeFile({makeTrack({
        MidiEvent::makeNoteOn(0, 0, 60, 100),
        MidiEvent::makeNoteOn(960, 0, 60, 0)
    })});

    MidiRepresentation rep = build(file);
    ASSERT_EQ(rep.tracks.at(0).notes.size(), 1u);
    EXPECT_DOUBLE_EQ(rep.tracks.at(0).notes[0].duration, 2.0);
}

TEST_F(RepresentationBuilderTest, TrackIdsAndNamesFollowFileOrder) {
    MidiFile file = makeFile({
        makeTrack({MidiEvent::makeTrackName(0, "Conductor"), MidiEvent::makeTempo(0, 500000)}),
        makeTrack({
            MidiEvent::makeTrackName(0, "Piano"),
            MidiEvent::makeNoteOn(0, 0, 60, 100),
            MidiEvent::makeNoteOff(480, 0, 60, 0)
        }),
        makeTrack({
            MidiEvent::makeTrackName(0, "Bass"),
            MidiEvent::makeNoteOn(0, 1, 36, 100),
            MidiEvent::makeNoteOff(480, 1, 36, 0)
        })
    });

    MidiRepresentation rep = build(file);

    ASSERT_EQ(rep.tracks.size(), 3u);
    EXPECT_TRUE(rep.tracks.at(0).empty());
    EXPECT_EQ(rep.tracks.at(0).name, "Conductor");
    EXPECT_EQ(rep.tracks.at(1).name, "Piano");
    EXPECT_EQ(rep.tracks.at(2).name, "Bass");
    EXPECT_EQ(rep.tracks.at(2).notes.at(0).pitch, 36);

    EXPECT_EQ(rep.clearEmptyTracks(), 1u);
    EXPECT_EQ(rep.tracks.size(), 2u);
}

TEST_F(RepresentationBuilderTest, NotesSortedByBeat) {
    MidiFile file = makeFile({makeTrack({
        MidiEvent::makeNoteOn(0, 0, 60, 100),
        MidiEvent::makeNoteOn(120, 0, 64, 100),
        MidiEvent::makeNoteOff(240, 0, 64, 0),
        MidiEvent::makeNoteOff(960, 0, 60, 0)
    })});

    const auto notes = build(file).tracks.at(0).notes;
    ASSERT_EQ(notes.size(), 2u);
    EXPECT_EQ(notes[0].pitch, 60);
    EXPECT_EQ(notes[1].pitch, 64);
}

// ============================================================================
// NOTE PAIRING
// ============================================================================

TEST_F(RepresentationBuilderTest, RetriggerClosesSoundingNote) {
    MidiFile file = makeFile({makeTrack({
        MidiEvent::makeNoteOn(0, 0, 60, 100),
        MidiEvent::makeNoteOn(240, 0, 60, 90),
        MidiEvent::makeNoteOff(480, 0, 60, 0)
    })});

    const auto notes = build(file).tracks.at(0).notes;
    ASSERT_EQ(notes.size(), 2u);
    EXPECT_EQ(notes[0], makeNote(0, 60, 100, 0.0, 0.5));
    EXPECT_EQ(notes[1], makeNote(0, 60, 90, 0.5, 0.5));
}

TEST_F(RepresentationBuilderTest, PairingIsPerChannel) {
    MidiFile file = makeFile({makeTrack({
        MidiEvent::makeNoteOn(0, 0, 60, 100),
        MidiEvent::makeNoteOn(0, 1, 60, 100),
        MidiEvent::makeNoteOff(480, 1, 60, 0),
        MidiEvent::makeNoteOff(960, 0, 60, 0)
    })});

    const auto notes = build(file).tracks.at(0).notes;
    ASSERT_EQ(notes.size(), 2u);
    for (const auto& note : notes) {
        EXPECT_DOUBLE_EQ(note.duration, note.channel == 0 ? 2.0 : 1.0);
    }
}

TEST_F(RepresentationBuilderTest, OrphanNoteOffAndZeroLengthNotesAreIgnored) {
    MidiFile file = makeFile({makeTrack({
        MidiEvent::makeNoteOff(0, 0, 50, 0),
        MidiEvent::makeNoteOn(100, 0, 60, 100),
        MidiEvent::makeNoteOff(100, 0, 60, 0),
        MidiEvent::makeNoteOn(200, 0, 62, 100),
        MidiEvent::makeNoteOff(680, 0, 62, 0)
    })});

    const auto notes = build(file).tracks.at(0).notes;
    ASSERT_EQ(notes.size(), 1u);
    EXPECT_EQ(notes[0].pitch, 62);
    EXPECT_EQ(warningCount(), 0u);
}

TEST_F(RepresentationBuilderTest, UnterminatedNoteDroppedWithWarning) {
    MidiFile file = makeFile({makeTrack({
        MidiEvent::makeNoteOn(0, 0, 60, 100),
        MidiEvent::makeNoteOn(0, 0, 64, 100),
        MidiEvent::makeNoteOff(480, 0, 64, 0)
    })});

    MidiRepresentation rep = build(file);

    ASSERT_EQ(rep.tracks.at(0).notes.size(), 1u);
    EXPECT_EQ(rep.tracks.at(0).notes[0].pitch, 64);
    EXPECT_EQ(warningCount(), 1u);
}

TEST_F(RepresentationBuilderTest, UnterminatedNoteRejectedByPolicy) {
    MidiFile file = makeFile({makeTrack({MidiEvent::makeNoteOn(0, 0, 60, 100)})});

    BuilderOptions options;
    options.unmatchedNotePolicy = UnmatchedNotePolicy::REJECT;

    EXPECT_EQ(captureErrorCode([&] { build(file, options); }), ErrorCode::INVALID_MIDI);
}

// ============================================================================
// INSTRUMENTS
// ============================================================================

TEST_F(RepresentationBuilderTest, ChannelWithoutProgramChangeGetsDefault) {
    MidiFile file = makeFile({makeTrack({
        MidiEvent::makeNoteOn(0, 5, 60, 100),
        MidiEvent::makeNoteOff(480, 5, 60, 0)
    })});

    MidiRepresentation rep = build(file);
    ASSERT_EQ(rep.channelInstrumentMap.count(5), 1u);
    EXPECT_EQ(rep.channelInstrumentMap.at(5), 0);

    BuilderOptions options;
    options.defaultInstrument = 19;
    EXPECT_EQ(build(file, options).channelInstrumentMap.at(5), 19);
}

TEST_F(RepresentationBuilderTest, LastProgramChangeWins) {
    MidiFile file = makeFile({
        makeTrack({MidiEvent::makeProgramChange(0, 1, 24)}),
        makeTrack({
            MidiEvent::makeProgramChange(0, 1, 33),
            MidiEvent::makeNoteOn(0, 1, 40, 100),
            MidiEvent::makeNoteOff(480, 1, 40, 0),
            MidiEvent::makeProgramChange(480, 9, 0)
        })
    });

    MidiRepresentation rep = build(file);

    EXPECT_EQ(rep.channelInstrumentMap.at(1), 33);
    // A program change without notes is still recorded
    EXPECT_EQ(rep.channelInstrumentMap.at(9), 0);
    EXPECT_EQ(rep.channelInstrumentMap.size(), 2u);
}

// ============================================================================
// TEMPO AND TIME SIGNATURES
// ============================================================================

TEST_F(RepresentationBuilderTest, DefaultTempoWhenFileHasNone) {
    MidiFile file = makeFile({makeTrack({})});

    EXPECT_EQ(build(file).bpmChanges, (std::vector<TempoChange>{{0.0, 120.0}}));

    BuilderOptions options;
    options.defaultBpm = 90.0;
    EXPECT_EQ(build(file, options).bpmChanges, (std::vector<TempoChange>{{0.0, 90.0}}));
}

TEST_F(RepresentationBuilderTest, TempoChangesAcrossTracks) {
    MidiFile file = makeFile({
        makeTrack({MidiEvent::makeTempo(0, 1000000)}),
        makeTrack({MidiEvent::makeTempo(960, 500000), MidiEvent::makeTempo(1920, 500000)})
    });

    MidiRepresentation rep = build(file);

    ASSERT_EQ(rep.bpmChanges.size(), 2u);
    EXPECT_EQ(rep.bpmChanges[0], (TempoChange{0.0, 60.0}));
    EXPECT_EQ(rep.bpmChanges[1], (TempoChange{2.0, 120.0}));
    EXPECT_DOUBLE_EQ(rep.startingBpm(), 60.0);
}

TEST_F(RepresentationBuilderTest, DefaultTempoUntilFirstLateChange) {
    MidiFile file = makeFile({makeTrack({MidiEvent::makeTempo(480, 1000000)})});

    MidiRepresentation rep = build(file);

    ASSERT_EQ(rep.bpmChanges.size(), 2u);
    EXPECT_EQ(rep.bpmChanges[0], (TempoChange{0.0, 120.0}));
    EXPECT_EQ(rep.bpmChanges[1], (TempoChange{1.0, 60.0}));
}

TEST_F(RepresentationBuilderTest, TimeSignatures) {
    MidiFile file = makeFile({makeTrack({
        MidiEvent::makeTimeSignature(0, 3, 2),
        MidiEvent::makeTimeSignature(1440, 6, 3)
    })});

    MidiRepresentation rep = build(file);

    ASSERT_EQ(rep.timeSignatureChanges.size(), 2u);
    EXPECT_EQ(rep.timeSignatureChanges[0], (TimeSignatureChange{3, 2, 0.0}));
    EXPECT_EQ(rep.timeSignatureChanges[1], (TimeSignatureChange{6, 3, 3.0}));
    EXPECT_EQ(rep.timeSignatureChanges[1].denominator(), 8);
    EXPECT_DOUBLE_EQ(rep.timeSignatureChanges[1].barLengthBeats(), 3.0);
    EXPECT_EQ(rep.startingTimeSignature().numerator, 3);
}

// ============================================================================
// MALFORMED INPUT
// ============================================================================

TEST_F(RepresentationBuilderTest, RejectsMalformedMetaPayloads) {
    MidiFile shortTempo = makeFile({makeTrack({MidiEvent::makeMeta(0, MetaType::SET_TEMPO, {7, 0xA1})})});
    EXPECT_EQ(captureErrorCode([&] { build(shortTempo); }), ErrorCode::INVALID_MIDI);

    MidiFile zeroTempo = makeFile({makeTrack({MidiEvent::makeMeta(0, MetaType::SET_TEMPO, {0, 0, 0})})});
    zeroTempo.tracks[0].events[0].tempo = 0;
    EXPECT_EQ(captureErrorCode([&] { build(zeroTempo); }), ErrorCode::INVALID_MIDI);

    MidiFile shortSignature = makeFile({makeTrack({MidiEvent::makeMeta(0, MetaType::TIME_SIGNATURE, {4, 2})})});
    EXPECT_EQ(captureErrorCode([&] { build(shortSignature); }), ErrorCode::INVALID_MIDI);

    MidiFile zeroNumerator = makeFile({makeTrack({MidiEvent::makeTimeSignature(0, 0, 2)})});
    EXPECT_EQ(captureErrorCode([&] { build(zeroNumerator); }), ErrorCode::INVALID_MIDI);
}

TEST_F(RepresentationBuilderTest, RejectsSmpteDivision) {
    MidiFile file = makeFile({makeTrack({})}, 0xE728);
    EXPECT_EQ(captureErrorCode([&] { build(file); }), ErrorCode::INVALID_MIDI);
}

TEST_F(RepresentationBuilderTest, OptionsFromConfig) {
    Config::instance().set("conversion.default_bpm", 100.0);
    Config::instance().set("conversion.default_instrument", 12);
    Config::instance().set("conversion.unmatched_note_policy", std::string("reject"));

    BuilderOptions options = BuilderOptions::fromConfig();

    EXPECT_DOUBLE_EQ(options.defaultBpm, 100.0);
    EXPECT_EQ(options.defaultInstrument, 12);
    EXPECT_EQ(options.unmatchedNotePolicy, UnmatchedNotePolicy::REJECT);
    EXPECT_STREQ(unmatchedNotePolicyToString(options.unmatchedNotePolicy), "reject");
}
