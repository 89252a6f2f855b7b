/*
  ==============================================================================

    BlockDecompressor.h

    Reassembles one archive entry from its blocks.
    zlib blocks are inflated with JUCE's GZIPDecompressorInputStream,
    lzma blocks with liblzma.

  ==============================================================================
*/

#pragma once

#include <juce_core/juce_core.h>
#include "ArchiveIndex.h"

class BlockDecompressor
{
public:
    BlockDecompressor() = default;

    /** Decompresses the entry into result. Returns false on failure,
        see getLastError(). The output is never cached.
    */
    bool extract(const ArchiveIndex& index, const ArchiveEntry& entry,
                 ByteSource& source, juce::MemoryBlock& result);

    const PsarcError& getLastError() const { return lastError; }

    /** Throwing variant used by the other decoders. */
    static juce::MemoryBlock decompressEntry(const ArchiveIndex& index, const ArchiveEntry& entry,
                                             ByteSource& source);

    /** Inflates a single zlib stream. Returns false if the data is not valid zlib
        or does not produce exactly expectedSize bytes.
    */
    static bool inflateZlib(const void* data, size_t numBytes, size_t expectedSize,
                            juce::MemoryBlock& output);

    static bool decodeLzma(const void* data, size_t numBytes, size_t expectedSize,
                           juce::MemoryBlock& output);

private:
    PsarcError lastError;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(BlockDecompressor)
};
