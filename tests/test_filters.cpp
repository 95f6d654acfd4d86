// ============================================================================
// tests/test_filters.cpp - Representation filters and the filter registry
// ============================================================================

#include <gtest/gtest.h>

#include "TestMidiHelpers.h"
#include "../src/midi/filters/FilterRegistry.h"
#include "../src/midi/filters/IdentityFilter.h"
#include "../src/midi/filters/NoChordsFilter.h"
#include "../src/midi/filters/SwingFilter.h"

using namespace midiBeat;
using namespace midiBeat::test;

class FilterTest : public MidiBeatTest {
protected:
    static MidiRepresentation withNotes(std::vector<Note> notes) {
        MidiRepresentation rep;
        rep.tracks[0].notes = std::move(notes);
        rep.bpmChanges = {{0.0, 120.0}};
        rep.channelInstrumentMap[0] = 0;
        return rep;
    }
};

// ============================================================================
// TRACK HELPERS
// ============================================================================

TEST_F(FilterTest, ClampNotesShortensRepeatedPitch) {
    Track track;
    track.notes = {
        makeNote(0, 60, 100, 1.0, 2.0),
        makeNote(0, 60, 100, 0.0, 3.0),
        makeNote(0, 64, 100, 0.5, 5.0)
    };

    track.clampNotes();

    ASSERT_EQ(track.notes.size(), 3u);
    EXPECT_DOUBLE_EQ(track.notes[0].beat, 0.0);
    EXPECT_DOUBLE_EQ(track.notes[0].duration, 0.9);
    EXPECT_DOUBLE_EQ(track.notes[1].beat, 0.5);
    EXPECT_DOUBLE_EQ(track.notes[1].duration, 5.0);
    EXPECT_DOUBLE_EQ(track.notes[2].duration, 2.0);
}

TEST_F(FilterTest, ClampNotesNeverGoesNegative) {
    Track track;
    track.notes = {makeNote(0, 60, 100, 0.0, 1.0), makeNote(0, 60, 100, 0.05, 1.0)};

    track.clampNotes(0.1);

    EXPECT_DOUBLE_EQ(track.notes[0].duration, 0.0);
}

TEST_F(FilterTest, MostUsedChannel) {
    Track track;
    EXPECT_FALSE(track.mostUsedChannel().has_value());

    track.notes = {
        makeNote(3, 60, 100, 0.0, 1.0),
        makeNote(1, 60, 100, 1.0, 1.0),
        makeNote(3, 62, 100, 2.0, 1.0),
        makeNote(1, 62, 100, 3.0, 1.0)
    };
    EXPECT_EQ(track.mostUsedChannel(), 1);

    track.notes.push_back(makeNote(3, 64, 100, 4.0, 1.0));
    EXPECT_EQ(track.mostUsedChannel(), 3);
}

TEST_F(FilterTest, SliceAndOffset) {
    Track track;
    track.name = "Piano";
    track.notes = {
        makeNote(0, 60, 100, 0.0, 1.0),
        makeNote(0, 62, 100, 4.0, 1.0),
        makeNote(0, 64, 100, 6.5, 1.0),
        makeNote(0, 65, 100, 8.0, 1.0)
    };

    Track bar = track.slice(4.0, 8.0);
    EXPECT_EQ(bar.name, "Piano");
    ASSERT_EQ(bar.notes.size(), 2u);
    EXPECT_DOUBLE_EQ(bar.notes[0].beat, 0.0);
    EXPECT_DOUBLE_EQ(bar.notes[1].beat, 2.5);

    bar.offset(8.0);
    EXPECT_DOUBLE_EQ(bar.notes[0].beat, 8.0);
}

TEST_F(FilterTest, SongLength) {
    MidiRepresentation rep = withNotes({makeNote(0, 60, 100, 3.0, 1.25)});
    rep.tracks[2].notes = {makeNote(1, 40, 100, 1.0, 0.5)};

    EXPECT_EQ(rep.songLengthBeats(), 5);
    EXPECT_EQ(rep.noteCount(), 2u);
    EXPECT_EQ(MidiRepresentation().songLengthBeats(), 0);
    EXPECT_DOUBLE_EQ(MidiRepresentation().startingBpm(), 120.0);
}

// ============================================================================
// IDENTITY / NO CHORDS
// ============================================================================

TEST_F(FilterTest, IdentityLeavesRepresentationUnchanged) {
    MidiRepresentation rep = withNotes({
        makeNote(0, 60, 100, 0.0, 1.0),
        makeNote(0, 60, 100, 0.5, 1.0)
    });

    IdentityFilter filter;
    MidiRepresentation result = filter.apply(rep);

    EXPECT_EQ(filter.getName(), "no_filter");
    EXPECT_EQ(result.tracks.at(0).notes, rep.tracks.at(0).notes);
    EXPECT_EQ(result.bpmChanges, rep.bpmChanges);
    EXPECT_EQ(result.channelInstrumentMap, rep.channelInstrumentMap);
}

TEST_F(FilterTest, NoChordsKeepsHighestNote) {
    MidiRepresentation rep = withNotes({
        makeNote(0, 60, 100, 0.0, 1.0),
        makeNote(0, 67, 100, 0.0, 1.0),
        makeNote(0, 64, 100, 0.0, 1.0),
        makeNote(1, 50, 100, 0.0, 1.0),
        makeNote(0, 62, 100, 1.0, 1.0),
        makeNote(0, 65, 100, 1.0 + 1e-12, 1.0),
        makeNote(0, 59, 100, 1.5, 1.0)
    });

    MidiRepresentation result = NoChordsFilter().apply(rep);
    const auto& notes = result.tracks.at(0).notes;

    ASSERT_EQ(notes.size(), 4u);
    EXPECT_EQ(notes[0].pitch, 67);
    EXPECT_EQ(notes[1].pitch, 50);
    EXPECT_EQ(notes[1].channel, 1);
    EXPECT_EQ(notes[2].pitch, 65);
    EXPECT_EQ(notes[3].pitch, 59);
}

TEST_F(FilterTest, NoChordsKeepsFirstOfEqualPitches) {
    auto notes = NoChordsFilter::reduceChords({
        makeNote(0, 60, 10, 2.0, 1.0),
        makeNote(0, 60, 20, 2.0, 1.0)
    });

    ASSERT_EQ(notes.size(), 1u);
    EXPECT_EQ(notes[0].velocity, 10);
}

TEST_F(FilterTest, SameChordUsesRelativeTolerance) {
    EXPECT_TRUE(NoChordsFilter::sameChord(makeNote(0, 60, 100, 0.0, 1.0),
                                          makeNote(0, 64, 100, 0.0, 1.0)));
    EXPECT_TRUE(NoChordsFilter::sameChord(makeNote(0, 60, 100, 1000.0, 1.0),
                                          makeNote(0, 64, 100, 1000.0 + 1e-7, 1.0)));
    EXPECT_FALSE(NoChordsFilter::sameChord(makeNote(0, 60, 100, 1.0, 1.0),
                                           makeNote(0, 64, 100, 1.001, 1.0)));
    EXPECT_FALSE(NoChordsFilter::sameChord(makeNote(0, 60, 100, 1.0, 1.0),
                                           makeNote(1, 64, 100, 1.0, 1.0)));
}

// ============================================================================
// SWING / UNSWING
// ============================================================================

TEST_F(FilterTest, SwingMapping) {
    EXPECT_DOUBLE_EQ(SwingFilter::toSwing(0.0, 1.0), 0.0);
    EXPECT_DOUBLE_EQ(SwingFilter::toSwing(0.25, 1.0), 1.0 / 3.0);
    EXPECT_DOUBLE_EQ(SwingFilter::toSwing(0.5, 1.0), 2.0 / 3.0);
    EXPECT_DOUBLE_EQ(SwingFilter::toSwing(0.75, 1.0), 5.0 / 6.0);
    EXPECT_DOUBLE_EQ(SwingFilter::toSwing(1.0, 1.0), 1.0);
    EXPECT_DOUBLE_EQ(SwingFilter::toSwing(2.5, 1.0), 2.0 + 2.0 / 3.0);

    // Multiplier 2 swings sixteenths within each half beat
    EXPECT_DOUBLE_EQ(SwingFilter::toSwing(0.25, 2.0), 1.0 / 3.0);
    EXPECT_DOUBLE_EQ(SwingFilter::toSwing(0.5, 2.0), 0.5);
}

TEST_F(FilterTest, UnswingMapping) {
    EXPECT_DOUBLE_EQ(SwingFilter::fromSwing(1.0 / 3.0, 1.0), 0.25);
    EXPECT_DOUBLE_EQ(SwingFilter::fromSwing(2.0 / 3.0, 1.0), 0.5);
    EXPECT_DOUBLE_EQ(SwingFilter::fromSwing(5.0 / 6.0, 1.0), 0.75);
    EXPECT_DOUBLE_EQ(SwingFilter::fromSwing(3.0, 1.0), 3.0);
}

TEST_F(FilterTest, UnswingUndoesSwingOnEighthGrid) {
    for (double multiplier : {1.0, 2.0, 0.5}) {
        for (int k = 0; k < 32; ++k) {
            double beat = k / 8.0;
            EXPECT_NEAR(SwingFilter::fromSwing(SwingFilter::toSwing(beat, multiplier), multiplier),
                        beat, 1e-9) << "beat " << beat << " multiplier " << multiplier;
        }
    }
}

TEST_F(FilterTest, SwingApplyMovesStartsAndClamps) {
    MidiRepresentation rep = withNotes({
        makeNote(0, 60, 100, 0.0, 1.0),
        makeNote(0, 60, 100, 0.5, 0.25),
        makeNote(0, 72, 100, 1.5, 0.5)
    });

    SwingFilter swing(SwingFilter::Direction::SWING);
    MidiRepresentation result = swing.apply(rep);
    const auto& notes = result.tracks.at(0).notes;

    ASSERT_EQ(notes.size(), 3u);
    EXPECT_DOUBLE_EQ(notes[0].beat, 0.0);
    EXPECT_NEAR(notes[0].duration, 2.0 / 3.0 - 0.1, 1e-12);
    EXPECT_DOUBLE_EQ(notes[1].beat, 2.0 / 3.0);
    EXPECT_DOUBLE_EQ(notes[1].duration, 0.25);
    EXPECT_DOUBLE_EQ(notes[2].beat, 1.0 + 2.0 / 3.0);
    EXPECT_DOUBLE_EQ(notes[2].duration, 0.5);
}

TEST_F(FilterTest, UnswingApply) {
    MidiRepresentation rep = withNotes({
        makeNote(0, 60, 100, 2.0 / 3.0, 0.3),
        makeNote(0, 62, 100, 1.0 + 1.0 / 3.0, 0.3)
    });

    SwingFilter unswing(SwingFilter::Direction::UNSWING);
    const auto& notes = unswing.apply(rep).tracks.at(0).notes;

    EXPECT_EQ(unswing.getName(), "unswing");
    EXPECT_NEAR(notes[0].beat, 0.5, 1e-12);
    EXPECT_NEAR(notes[1].beat, 1.25, 1e-12);
}

TEST_F(FilterTest, SwingMultiplierParameter) {
    SwingFilter swing(SwingFilter::Direction::SWING, 2.0);
    EXPECT_EQ(swing.getName(), "swing");
    EXPECT_DOUBLE_EQ(swing.getParameter("multiplier"), 2.0);

    swing.setParameter("multiplier", 0.5);
    EXPECT_DOUBLE_EQ(swing.getParameter("multiplier"), 0.5);
    EXPECT_DOUBLE_EQ(swing.toJson()["multiplier"].get<double>(), 0.5);

    EXPECT_EQ(captureErrorCode([&] { swing.setParameter("multiplier", 0.0); }),
              ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(captureErrorCode([&] { swing.setParameter("ratio", 1.0); }),
              ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(captureErrorCode([&] { swing.getParameter("ratio"); }),
              ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(captureErrorCode([] { SwingFilter(SwingFilter::Direction::SWING, -1.0); }),
              ErrorCode::INVALID_ARGUMENT);
    EXPECT_DOUBLE_EQ(swing.getParameter("multiplier"), 0.5);
}

// ============================================================================
// REGISTRY
// ============================================================================

TEST_F(FilterTest, RegistryHasBuiltins) {
    FilterRegistry registry;

    std::vector<std::string> expected = {
        "no_chords", "no_filter", "swing", "tempo_integrator", "unswing"
    };
    EXPECT_EQ(registry.listFilters(), expected);
    EXPECT_EQ(registry.size(), 5u);
    EXPECT_TRUE(registry.hasFilter("swing"));
    EXPECT_FALSE(registry.hasFilter("reverse"));
    EXPECT_EQ(registry.getFilter("tempo_integrator").getName(), "tempo_integrator");
    EXPECT_EQ(registry.toJson().size(), 5u);
}

TEST_F(FilterTest, RegistryUnknownFilterListsNames) {
    FilterRegistry registry;

    try {
        registry.getFilter("reverse");
        FAIL() << "Expected FILTER_NOT_FOUND";
    } catch (const MidiBeatException& e) {
        EXPECT_EQ(e.getCode(), ErrorCode::FILTER_NOT_FOUND);
        std::string message = e.what();
        EXPECT_NE(message.find("reverse"), std::string::npos);
        EXPECT_NE(message.find("no_chords"), std::string::npos);
        EXPECT_NE(message.find("tempo_integrator"), std::string::npos);
    }
}

TEST_F(FilterTest, RegistryReadsSwingMultiplierFromConfig) {
    Config::instance().set("filters.swing_multiplier", 2.0);

    FilterRegistry registry;

    EXPECT_DOUBLE_EQ(registry.getFilter("swing").getParameter("multiplier"), 2.0);
    EXPECT_DOUBLE_EQ(registry.getFilter("unswing").getParameter("multiplier"), 2.0);
}

TEST_F(FilterTest, RegistryRegistration) {
    FilterRegistry registry{FilterRegistry::EmptyTag{}};
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_EQ(captureErrorCode([&] { registry.getFilter("no_filter"); }),
              ErrorCode::FILTER_NOT_FOUND);

    registry.registerFilter(std::make_unique<IdentityFilter>());
    registry.registerFilter(std::make_unique<IdentityFilter>());
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(warningCount(), 1u);

    EXPECT_EQ(captureErrorCode([&] { registry.registerFilter(nullptr); }),
              ErrorCode::INVALID_ARGUMENT);
}
