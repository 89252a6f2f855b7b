/*
  ==============================================================================

    PlaybackSessionTests.cpp

  ==============================================================================
*/

#include <gtest/gtest.h>
#include "../Source/PlaybackSession.h"

namespace
{
    // Uhr, die der Test von Hand stellt
    class ManualClock : public AudioPlaybackClock
    {
    public:
        bool loadAudio(const juce::MemoryBlock& audioBytes) override
        {
            loaded = audioBytes.getSize() > 0;
            return loaded;
        }

        double getCurrentPlaybackTime() const override { return position; }
        double getLengthInSeconds() const override { return length; }
        bool isPlaying() const override { return playing; }
        void play() override { playing = true; }
        void pause() override { playing = false; }
        void seek(double seconds) override { position = seconds; ++seekCount; }

        double position = 0.0;
        double length = 2.0;
        bool playing = false;
        bool loaded = false;
        int seekCount = 0;
    };

    Arrangement makeArrangement()
    {
        Arrangement arrangement;

        Beat beat;
        beat.time = 0.5;
        arrangement.beats.add(beat);

        NoteEvent note;
        note.startTime = 1.0;
        note.sustain = 0.5;

        DifficultyLevel level;
        level.notes.add(note);
        arrangement.difficultyLevels.add(level);
        return arrangement;
    }

    juce::MemoryBlock someAudio()
    {
        return juce::MemoryBlock("RIFF", 4);
    }
}

//==============================================================================
TEST(PlaybackSession, BeginStartsClockAndSynchronizer)
{
    ManualClock clock;
    PlaybackSession session(clock);
    auto arrangement = makeArrangement();

    ASSERT_TRUE(session.begin(arrangement, someAudio(), 0));
    EXPECT_TRUE(clock.loaded);
    EXPECT_TRUE(clock.playing);
    EXPECT_EQ(session.getSynchronizer().getState(), PlaybackState::Playing);
}

TEST(PlaybackSession, RejectedAudioLeavesSessionStopped)
{
    ManualClock clock;
    PlaybackSession session(clock);
    auto arrangement = makeArrangement();

    EXPECT_FALSE(session.begin(arrangement, juce::MemoryBlock(), 0));
    EXPECT_FALSE(clock.playing);
    EXPECT_EQ(session.getSynchronizer().getState(), PlaybackState::Stopped);
    EXPECT_TRUE(session.hasFinished());
}

TEST(PlaybackSession, TickFollowsTheClock)
{
    ManualClock clock;
    PlaybackSession session(clock);
    auto arrangement = makeArrangement();
    ASSERT_TRUE(session.begin(arrangement, someAudio(), 0));

    clock.position = 0.6;
    auto update = session.tick();
    EXPECT_EQ(update.crossedBeats.size(), 1);
    EXPECT_TRUE(update.newlyActiveNotes.isEmpty());

    clock.position = 1.1;
    EXPECT_EQ(session.tick().newlyActiveNotes.size(), 1);
}

TEST(PlaybackSession, LatencyOffsetDelaysArrangement)
{
    ManualClock clock;
    PlaybackSession session(clock);
    auto arrangement = makeArrangement();
    ASSERT_TRUE(session.begin(arrangement, someAudio(), 0));

    session.setLatencyOffset(0.2);
    clock.position = 1.1;
    EXPECT_TRUE(session.tick().newlyActiveNotes.isEmpty());
    EXPECT_DOUBLE_EQ(session.getSynchronizer().getCurrentTime(), 0.9);

    clock.position = 1.25;
    EXPECT_EQ(session.tick().newlyActiveNotes.size(), 1);
}

TEST(PlaybackSession, ExplicitSeekIsNoRegression)
{
    ManualClock clock;
    PlaybackSession session(clock);
    auto arrangement = makeArrangement();
    ASSERT_TRUE(session.begin(arrangement, someAudio(), 0));

    clock.position = 1.2;
    session.tick();

    session.seek(0.0);
    EXPECT_EQ(clock.seekCount, 1);

    clock.position = 0.1;
    auto update = session.tick();
    EXPECT_FALSE(update.clockRegression);
    EXPECT_EQ(session.getSynchronizer().getRegressionCount(), 0);
}

TEST(PlaybackSession, ClockJumpingBackIsCounted)
{
    ManualClock clock;
    PlaybackSession session(clock);
    auto arrangement = makeArrangement();
    ASSERT_TRUE(session.begin(arrangement, someAudio(), 0));

    clock.position = 1.2;
    session.tick();
    clock.position = 0.3;

    EXPECT_TRUE(session.tick().clockRegression);
    EXPECT_EQ(session.getSynchronizer().getRegressionCount(), 1);
}

TEST(PlaybackSession, PauseStopsBothSides)
{
    ManualClock clock;
    PlaybackSession session(clock);
    auto arrangement = makeArrangement();
    ASSERT_TRUE(session.begin(arrangement, someAudio(), 0));

    session.pause();
    EXPECT_FALSE(clock.playing);
    EXPECT_EQ(session.getSynchronizer().getState(), PlaybackState::Paused);
    EXPECT_FALSE(session.hasFinished());

    session.resume();
    EXPECT_TRUE(clock.playing);
    EXPECT_EQ(session.getSynchronizer().getState(), PlaybackState::Playing);
}

TEST(PlaybackSession, FinishesAtEndOfAudio)
{
    ManualClock clock;
    PlaybackSession session(clock);
    auto arrangement = makeArrangement();
    ASSERT_TRUE(session.begin(arrangement, someAudio(), 0));

    clock.position = 1.0;
    EXPECT_FALSE(session.hasFinished());

    clock.position = 2.0;
    clock.playing = false;
    EXPECT_TRUE(session.hasFinished());

    session.stop();
    EXPECT_EQ(session.getSynchronizer().getState(), PlaybackState::Stopped);
}
