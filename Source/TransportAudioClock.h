/*
  ==============================================================================

    TransportAudioClock.h

    AudioPlaybackClock on top of juce::AudioTransportSource.
    Plays every format the AudioFormatManager knows (WAV, AIFF, FLAC,
    Ogg Vorbis). Wwise .wem audio has to be converted first.

  ==============================================================================
*/

#pragma once

#include <juce_audio_basics/juce_audio_basics.h>
#include <juce_audio_formats/juce_audio_formats.h>
#include <juce_audio_devices/juce_audio_devices.h>
#include "AudioPlaybackClock.h"

class TransportAudioClock : public AudioPlaybackClock
{
public:
    TransportAudioClock();
    ~TransportAudioClock() override;

    /** Opens the default output device. Without it the transport does not run. */
    bool openOutputDevice();

    juce::String getLastError() const { return lastError; }

    //==============================================================================
    bool loadAudio(const juce::MemoryBlock& audioBytes) override;

    double getCurrentPlaybackTime() const override;
    double getLengthInSeconds() const override;
    bool isPlaying() const override;

    void play() override;
    void pause() override;
    void seek(double seconds) override;

    bool hasStreamFinished() const { return transport.hasStreamFinished(); }

private:
    juce::AudioFormatManager formatManager;
    juce::AudioDeviceManager deviceManager;
    juce::AudioSourcePlayer sourcePlayer;
    juce::AudioTransportSource transport;
    std::unique_ptr<juce::AudioFormatReaderSource> readerSource;

    bool deviceOpen = false;
    juce::String lastError;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(TransportAudioClock)
};
