/*
  ==============================================================================

    PlayerSettings.cpp

  ==============================================================================
*/

#include "PlayerSettings.h"

namespace
{
    const juce::Identifier settingsType       ("SmithereensSettings");
    const juce::Identifier lastArchiveId      ("lastArchive");
    const juce::Identifier difficultyId       ("preferredDifficulty");
    const juce::Identifier lookaheadId        ("lookaheadSeconds");
    const juce::Identifier audioDirectoryId   ("audioOverrideDirectory");
    const juce::Identifier latencyId          ("latencyOffsetSeconds");

    constexpr double defaultLookahead = 2.0;
}

//==============================================================================
PlayerSettings::PlayerSettings()
    : state(settingsType)
{
}

juce::String PlayerSettings::getLastArchive() const
{
    return state.getProperty(lastArchiveId, "").toString();
}

void PlayerSettings::setLastArchive(const juce::String& path)
{
    state.setProperty(lastArchiveId, path, nullptr);
}

int PlayerSettings::getPreferredDifficulty() const
{
    return static_cast<int>(state.getProperty(difficultyId, -1));
}

void PlayerSettings::setPreferredDifficulty(int level)
{
    state.setProperty(difficultyId, level, nullptr);
}

double PlayerSettings::getLookaheadSeconds() const
{
    return static_cast<double>(state.getProperty(lookaheadId, defaultLookahead));
}

void PlayerSettings::setLookaheadSeconds(double seconds)
{
    state.setProperty(lookaheadId, juce::jmax(0.0, seconds), nullptr);
}

juce::File PlayerSettings::getAudioOverrideDirectory() const
{
    auto path = state.getProperty(audioDirectoryId, "").toString();
    return path.isNotEmpty() && juce::File::isAbsolutePath(path) ? juce::File(path) : juce::File();
}

void PlayerSettings::setAudioOverrideDirectory(const juce::File& directory)
{
    state.setProperty(audioDirectoryId, directory.getFullPathName(), nullptr);
}

double PlayerSettings::getLatencyOffsetSeconds() const
{
    return static_cast<double>(state.getProperty(latencyId, 0.0));
}

void PlayerSettings::setLatencyOffsetSeconds(double seconds)
{
    state.setProperty(latencyId, seconds, nullptr);
}

//==============================================================================
bool PlayerSettings::loadFromFile(const juce::File& file)
{
    if (! file.existsAsFile())
    {
        DBG("Settings: " << file.getFullPathName() << " not found, using defaults");
        return false;
    }

    auto xml = juce::parseXML(file);
    if (xml == nullptr)
    {
        DBG("Settings: could not parse " << file.getFullPathName());
        return false;
    }

    auto loaded = juce::ValueTree::fromXml(*xml);
    if (! loaded.isValid() || ! loaded.hasType(settingsType))
    {
        DBG("Settings: " << file.getFullPathName() << " is not a settings file");
        return false;
    }

    state.copyPropertiesFrom(loaded, nullptr);
    return true;
}

bool PlayerSettings::saveToFile(const juce::File& file) const
{
    auto xml = state.createXml();
    if (xml == nullptr)
        return false;

    if (! file.getParentDirectory().createDirectory().wasOk())
        return false;

    return xml->writeTo(file);
}

juce::File PlayerSettings::getDefaultSettingsFile()
{
    return juce::File::getSpecialLocation(juce::File::userApplicationDataDirectory)
        .getChildFile("Smithereens")
        .getChildFile("settings.xml");
}
