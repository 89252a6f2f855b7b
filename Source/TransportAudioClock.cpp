/*
  ==============================================================================

    TransportAudioClock.cpp

  ==============================================================================
*/

#include "TransportAudioClock.h"

//==============================================================================
TransportAudioClock::TransportAudioClock()
{
    formatManager.registerBasicFormats();
    sourcePlayer.setSource(&transport);
}

TransportAudioClock::~TransportAudioClock()
{
    transport.stop();

    if (deviceOpen)
        deviceManager.removeAudioCallback(&sourcePlayer);

    sourcePlayer.setSource(nullptr);
    transport.setSource(nullptr);
}

bool TransportAudioClock::openOutputDevice()
{
    if (deviceOpen)
        return true;

    auto error = deviceManager.initialiseWithDefaultDevices(0, 2);
    if (error.isNotEmpty())
    {
        lastError = "Audio device: " + error;
        DBG(lastError);
        return false;
    }

    deviceManager.addAudioCallback(&sourcePlayer);
    deviceOpen = true;

    if (auto* device = deviceManager.getCurrentAudioDevice())
        DBG("Audio output: " << device->getName() << " @ " << device->getCurrentSampleRate() << " Hz");

    return true;
}

//==============================================================================
bool TransportAudioClock::loadAudio(const juce::MemoryBlock& audioBytes)
{
    transport.stop();
    transport.setSource(nullptr);
    readerSource.reset();

    auto stream = std::make_unique<juce::MemoryInputStream>(audioBytes, true);
    std::unique_ptr<juce::AudioFormatReader> reader(formatManager.createReaderFor(std::move(stream)));

    if (reader == nullptr)
    {
        lastError = "Unsupported audio format (" + juce::String((juce::int64) audioBytes.getSize())
                  + " bytes); convert .wem files to Ogg Vorbis or WAV first";
        DBG(lastError);
        return false;
    }

    auto sampleRate = reader->sampleRate;
    DBG("Audio: " << reader->getFormatName() << ", " << sampleRate << " Hz, "
        << (int) reader->numChannels << " channels, " << reader->lengthInSamples << " samples");

    readerSource = std::make_unique<juce::AudioFormatReaderSource>(reader.release(), true);
    transport.setSource(readerSource.get(), 0, nullptr, sampleRate);
    lastError.clear();
    return true;
}

double TransportAudioClock::getCurrentPlaybackTime() const
{
    return transport.getCurrentPosition();
}

double TransportAudioClock::getLengthInSeconds() const
{
    return transport.getLengthInSeconds();
}

bool TransportAudioClock::isPlaying() const
{
    return transport.isPlaying();
}

void TransportAudioClock::play()
{
    if (readerSource != nullptr)
        transport.start();
}

void TransportAudioClock::pause()
{
    transport.stop();
}

void TransportAudioClock::seek(double seconds)
{
    transport.setPosition(juce::jmax(0.0, seconds));
}
