/*
  ==============================================================================

    PathHash.cpp

  ==============================================================================
*/

#include "PathHash.h"

//==============================================================================
juce::String PathHash::normalise(const juce::String& path)
{
    return path.trim().replaceCharacter('\\', '/').toLowerCase();
}

NameHash PathHash::hashPath(const juce::String& path)
{
    auto utf8 = normalise(path).toStdString();
    juce::MD5 md5(utf8.data(), utf8.size());

    NameHash hash {};
    auto raw = md5.getRawChecksumData();
    jassert(raw.getSize() == hash.size());
    std::memcpy(hash.data(), raw.getData(), hash.size());
    return hash;
}

juce::String PathHash::toHex(const NameHash& hash)
{
    return juce::String::toHexString(hash.data(), static_cast<int>(hash.size()), 0).toLowerCase();
}

bool PathHash::fromHex(const juce::String& text, NameHash& result)
{
    auto digits = text.retainCharacters("0123456789abcdefABCDEF");
    if (digits.length() != 32)
        return false;

    juce::MemoryBlock block;
    block.loadFromHexString(digits);
    if (block.getSize() != result.size())
        return false;

    std::memcpy(result.data(), block.getData(), result.size());
    return true;
}

bool PathHash::isZero(const NameHash& hash)
{
    for (auto b : hash)
        if (b != 0)
            return false;

    return true;
}
