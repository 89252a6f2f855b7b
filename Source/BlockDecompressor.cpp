/*
  ==============================================================================

    BlockDecompressor.cpp

  ==============================================================================
*/

#include "BlockDecompressor.h"
#include <lzma.h>

//==============================================================================
bool BlockDecompressor::extract(const ArchiveIndex& index, const ArchiveEntry& entry,
                                ByteSource& source, juce::MemoryBlock& result)
{
    lastError = {};

    try
    {
        result = decompressEntry(index, entry, source);
        return true;
    }
    catch (const PsarcException& e)
    {
        lastError = e.getError();
        DBG("Extract failed: " << lastError.toString());
    }

    result.reset();
    return false;
}

//==============================================================================
juce::MemoryBlock BlockDecompressor::decompressEntry(const ArchiveIndex& index, const ArchiveEntry& entry,
                                                     ByteSource& source)
{
    const auto hash = entry.getHashString();
    const auto spans = index.describeBlocks(entry);

    juce::MemoryOutputStream output(static_cast<size_t>(entry.uncompressedSize));

    for (const auto& span : spans)
    {
        auto stored = source.readBlock(span.fileOffset, span.storedLength);

        if (span.isStoredRaw)
        {
            output.write(stored.getData(), stored.getSize());
            continue;
        }

        juce::MemoryBlock inflated;
        bool ok = index.header.compression == CompressionMethod::Lzma
                      ? decodeLzma(stored.getData(), stored.getSize(), span.outputLength, inflated)
                      : inflateZlib(stored.getData(), stored.getSize(), span.outputLength, inflated);

        // Kurzer Block, der sich nicht dekodieren lässt, wurde roh abgelegt
        if (! ok && span.mayBeRaw)
        {
            output.write(stored.getData(), stored.getSize());
            continue;
        }

        if (! ok)
        {
            throw PsarcException(PsarcError::Kind::CorruptEntry,
                                 "block " + juce::String((juce::int64) span.blockIndex) + " ("
                                     + juce::String((juce::int64) span.storedLength) + " bytes) did not "
                                     + ArchiveHeader::compressionToString(index.header.compression)
                                     + "-decode to " + juce::String((juce::int64) span.outputLength) + " bytes",
                                 span.fileOffset, hash);
        }

        output.write(inflated.getData(), inflated.getSize());
    }

    if (static_cast<juce::uint64>(output.getDataSize()) != entry.uncompressedSize)
    {
        throw PsarcException(PsarcError::Kind::CorruptEntry,
                             "entry " + juce::String(entry.index) + " produced "
                                 + juce::String((juce::int64) output.getDataSize()) + " bytes, expected "
                                 + juce::String((juce::int64) entry.uncompressedSize),
                             (juce::int64) entry.offset, hash);
    }

    return output.getMemoryBlock();
}

//==============================================================================
bool BlockDecompressor::inflateZlib(const void* data, size_t numBytes, size_t expectedSize,
                                    juce::MemoryBlock& output)
{
    juce::MemoryInputStream compressed(data, numBytes, false);
    juce::GZIPDecompressorInputStream zlib(&compressed, false,
                                           juce::GZIPDecompressorInputStream::zlibFormat);

    // Ein Byte mehr anfordern, um zu lange Blöcke zu erkennen
    output.setSize(expectedSize + 1, false);
    auto total = 0;

    while (total < static_cast<int>(expectedSize + 1))
    {
        auto got = zlib.read(static_cast<char*>(output.getData()) + total,
                             static_cast<int>(expectedSize + 1) - total);
        if (got <= 0)
            break;
        total += got;
    }

    if (static_cast<size_t>(total) != expectedSize)
        return false;

    output.setSize(expectedSize);
    return true;
}

bool BlockDecompressor::decodeLzma(const void* data, size_t numBytes, size_t expectedSize,
                                   juce::MemoryBlock& output)
{
    // PSARC lzma blocks use the legacy .lzma ("alone") container
    lzma_stream strm = LZMA_STREAM_INIT;

    if (lzma_alone_decoder(&strm, UINT64_MAX) != LZMA_OK)
        return false;

    output.setSize(expectedSize + 1, false);

    strm.next_in = static_cast<const uint8_t*>(data);
    strm.avail_in = numBytes;
    strm.next_out = static_cast<uint8_t*>(output.getData());
    strm.avail_out = expectedSize + 1;

    auto ret = lzma_code(&strm, LZMA_FINISH);
    auto produced = (expectedSize + 1) - strm.avail_out;
    lzma_end(&strm);

    if ((ret != LZMA_STREAM_END && ret != LZMA_OK) || produced != expectedSize)
        return false;

    output.setSize(expectedSize);
    return true;
}
