/*
  ==============================================================================

    PlayerSettings.h

    Persistent player configuration, stored as a ValueTree in an XML file.

  ==============================================================================
*/

#pragma once

#include <juce_core/juce_core.h>
#include <juce_data_structures/juce_data_structures.h>

class PlayerSettings
{
public:
    PlayerSettings();

    //==============================================================================
    juce::String getLastArchive() const;
    void setLastArchive(const juce::String& path);

    int getPreferredDifficulty() const;         // -1 = höchste Stufe
    void setPreferredDifficulty(int level);

    double getLookaheadSeconds() const;
    void setLookaheadSeconds(double seconds);

    /** Directory searched for converted audio (<songKey>.ogg/.wav/.flac). */
    juce::File getAudioOverrideDirectory() const;
    void setAudioOverrideDirectory(const juce::File& directory);

    /** Added to the audio clock before advancing the arrangement. */
    double getLatencyOffsetSeconds() const;
    void setLatencyOffsetSeconds(double seconds);

    //==============================================================================
    bool loadFromFile(const juce::File& file);
    bool saveToFile(const juce::File& file) const;

    const juce::ValueTree& getState() const { return state; }

    static juce::File getDefaultSettingsFile();

private:
    juce::ValueTree state;

    JUCE_LEAK_DETECTOR(PlayerSettings)
};
