/*
  ==============================================================================

    SoundBank.h

    Minimal Wwise sound bank (.bnk) reader.
    A bank is a sequence of chunks: 4 byte tag | u32 LE size | data.
    The DIDX chunk lists the embedded/streamed media, 12 bytes per file
    (u32 wem id, u32 offset, u32 size).

  ==============================================================================
*/

#pragma once

#include <juce_core/juce_core.h>
#include "PsarcError.h"

class SoundBank
{
public:
    SoundBank() = default;

    bool parse(const juce::MemoryBlock& bankBytes);

    const PsarcError& getLastError() const { return lastError; }

    bool hasSection(const juce::String& tag) const { return sectionTags.contains(tag); }

    const juce::Array<juce::uint32>& getWemIds() const { return wemIds; }

    /** "<id>.wem" for every DIDX record, in bank order. */
    juce::StringArray getWemFileNames() const;

private:
    static constexpr int didxRecordSize = 12;

    PsarcError lastError;
    juce::StringArray sectionTags;
    juce::Array<juce::uint32> wemIds;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(SoundBank)
};
