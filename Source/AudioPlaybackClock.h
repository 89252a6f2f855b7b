/*
  ==============================================================================

    AudioPlaybackClock.h

    Audio playback collaborator. The clock's position is the time base
    every arrangement event is measured against.

  ==============================================================================
*/

#pragma once

#include <juce_core/juce_core.h>

class AudioPlaybackClock
{
public:
    virtual ~AudioPlaybackClock() = default;

    /** Takes an encoded audio file (as extracted from the archive or converted). */
    virtual bool loadAudio(const juce::MemoryBlock& audioBytes) = 0;

    /** Seconds since the start of the track. */
    virtual double getCurrentPlaybackTime() const = 0;

    virtual double getLengthInSeconds() const = 0;
    virtual bool isPlaying() const = 0;

    virtual void play() = 0;
    virtual void pause() = 0;
    virtual void seek(double seconds) = 0;
};
