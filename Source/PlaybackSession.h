/*
  ==============================================================================

    PlaybackSession.h

    Couples an AudioPlaybackClock with a PlaybackSynchronizer: the clock
    is the time base, tick() feeds its position into advance().

  ==============================================================================
*/

#pragma once

#include <juce_core/juce_core.h>
#include "AudioPlaybackClock.h"
#include "PlaybackSynchronizer.h"

class PlaybackSession
{
public:
    explicit PlaybackSession(AudioPlaybackClock& clock);
    ~PlaybackSession();

    /** Loads the audio, starts the synchronizer and the clock.
        Returns false if the clock rejects the audio.
        Throws PsarcException(NoSuchDifficulty) for an invalid level.
    */
    bool begin(const Arrangement& arrangement, const juce::MemoryBlock& audioBytes, int difficulty);

    /** Reads the clock and advances the synchronizer. */
    PlaybackUpdate tick();

    void pause();
    void resume();
    void seek(double seconds);
    void setDifficulty(int level) { synchronizer.setDifficulty(level); }
    void stop();

    /** Positive values move the arrangement later relative to the audio. */
    void setLatencyOffset(double seconds) { latencyOffset = seconds; }
    double getLatencyOffset() const { return latencyOffset; }

    bool hasFinished() const;

    PlaybackSynchronizer& getSynchronizer() { return synchronizer; }
    const PlaybackSynchronizer& getSynchronizer() const { return synchronizer; }

private:
    AudioPlaybackClock& clock;
    PlaybackSynchronizer synchronizer;
    double latencyOffset = 0.0;

    double getArrangementTime() const;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(PlaybackSession)
};
