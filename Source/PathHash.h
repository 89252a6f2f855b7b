/*
  ==============================================================================

    PathHash.h

    Content addressing used by PSARC archives: every entry is stored under
    the MD5 digest of its logical path, the readable paths only live in the
    archive's names block (entry 0).

  ==============================================================================
*/

#pragma once

#include <juce_core/juce_core.h>
#include <juce_cryptography/juce_cryptography.h>
#include <array>

using NameHash = std::array<juce::uint8, 16>;

struct PathHash
{
    /** Lower-cases, turns backslashes into forward slashes and trims whitespace. */
    static juce::String normalise(const juce::String& path);

    /** MD5 of the normalised path. */
    static NameHash hashPath(const juce::String& path);

    /** 32 lower-case hex digits, no separators. */
    static juce::String toHex(const NameHash& hash);

    /** Accepts 32 hex digits (separators are ignored). Returns false on anything else. */
    static bool fromHex(const juce::String& text, NameHash& result);

    static bool isZero(const NameHash& hash);
};
