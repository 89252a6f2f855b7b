/*
  ==============================================================================

    SoundBank.cpp

  ==============================================================================
*/

#include "SoundBank.h"

bool SoundBank::parse(const juce::MemoryBlock& bankBytes)
{
    lastError = {};
    sectionTags.clear();
    wemIds.clear();

    const auto* data = static_cast<const juce::uint8*>(bankBytes.getData());
    const auto size = bankBytes.getSize();
    size_t pos = 0;
    bool foundIndex = false;

    while (pos < size)
    {
        if (size - pos < 8)
        {
            lastError.kind = PsarcError::Kind::CorruptEntry;
            lastError.message = "sound bank chunk header cut off";
            lastError.offset = (juce::int64) pos;
            return false;
        }

        juce::String tag(reinterpret_cast<const char*>(data + pos), 4);
        auto chunkSize = juce::ByteOrder::littleEndianInt(data + pos + 4);
        pos += 8;

        if (chunkSize > size - pos)
        {
            lastError.kind = PsarcError::Kind::CorruptEntry;
            lastError.message = "sound bank chunk " + tag + " exceeds the bank";
            lastError.offset = (juce::int64) pos;
            return false;
        }

        sectionTags.add(tag);

        if (tag == "DIDX")
        {
            foundIndex = true;
            for (size_t r = 0; r + didxRecordSize <= chunkSize; r += didxRecordSize)
                wemIds.add(juce::ByteOrder::littleEndianInt(data + pos + r));
        }

        pos += chunkSize;
    }

    if (! foundIndex)
    {
        lastError.kind = PsarcError::Kind::CorruptEntry;
        lastError.message = "sound bank has no DIDX section";
        return false;
    }

    DBG("SoundBank: " << sectionTags.joinIntoString(",") << ", " << wemIds.size() << " media files");
    return true;
}

juce::StringArray SoundBank::getWemFileNames() const
{
    juce::StringArray names;
    for (auto id : wemIds)
        names.add(juce::String((juce::int64) id) + ".wem");
    return names;
}
