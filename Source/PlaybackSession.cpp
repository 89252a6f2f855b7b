/*
  ==============================================================================

    PlaybackSession.cpp

  ==============================================================================
*/

#include "PlaybackSession.h"

//==============================================================================
PlaybackSession::PlaybackSession(AudioPlaybackClock& c)
    : clock(c)
{
}

PlaybackSession::~PlaybackSession()
{
    stop();
}

bool PlaybackSession::begin(const Arrangement& arrangement, const juce::MemoryBlock& audioBytes, int difficulty)
{
    stop();

    if (! clock.loadAudio(audioBytes))
        return false;

    synchronizer.start(arrangement, difficulty);

    clock.play();
    return true;
}

PlaybackUpdate PlaybackSession::tick()
{
    return synchronizer.advance(getArrangementTime());
}

void PlaybackSession::pause()
{
    clock.pause();
    synchronizer.pause();
}

void PlaybackSession::resume()
{
    synchronizer.resume();
    clock.play();
}

void PlaybackSession::seek(double seconds)
{
    // Expliziter Seek auf beiden Seiten, damit kein ClockRegression gezählt wird
    clock.seek(seconds);
    synchronizer.seek(getArrangementTime());
}

void PlaybackSession::stop()
{
    if (synchronizer.getState() == PlaybackState::Stopped)
        return;

    clock.pause();
    synchronizer.stop();
}

bool PlaybackSession::hasFinished() const
{
    if (synchronizer.getState() == PlaybackState::Stopped)
        return true;

    return synchronizer.getState() == PlaybackState::Playing
        && ! clock.isPlaying()
        && clock.getCurrentPlaybackTime() >= clock.getLengthInSeconds() - 0.05;
}

double PlaybackSession::getArrangementTime() const
{
    return juce::jmax(0.0, clock.getCurrentPlaybackTime() - latencyOffset);
}
