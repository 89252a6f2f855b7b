/*
  ==============================================================================

    ArchiveIndex.h

    PSARC (PlayStation archive) header, table of contents and block table.

    Layout (big endian):
      header (32 bytes) | TOC records | block length table | block data

    Entries are identified only by the MD5 of their path. Entry 0 is the
    names block listing the real paths (see ManifestResolver).

  ==============================================================================
*/

#pragma once

#include <juce_core/juce_core.h>
#include "ByteSource.h"
#include "PathHash.h"
#include "PsarcError.h"
#include <vector>

enum class CompressionMethod
{
    Zlib,
    Lzma
};

//==============================================================================
struct ArchiveHeader
{
    static constexpr juce::uint32 magic = 0x50534152;   // "PSAR"
    static constexpr int headerSize = 32;

    // Archive flags
    static constexpr juce::uint32 flagIgnoreCase   = 0x01;
    static constexpr juce::uint32 flagAbsolutePath = 0x02;
    static constexpr juce::uint32 flagEncryptedToc = 0x04;

    int versionMajor = 1;
    int versionMinor = 4;
    CompressionMethod compression = CompressionMethod::Zlib;
    juce::uint32 tocLength = 0;         // Inklusive der 32 Header-Bytes
    juce::uint32 tocEntrySize = 30;
    juce::uint32 entryCount = 0;
    juce::uint32 blockSize = 65536;
    juce::uint32 archiveFlags = 0;

    bool isTocEncrypted() const { return (archiveFlags & flagEncryptedToc) != 0; }
    bool hasAbsolutePaths() const { return (archiveFlags & flagAbsolutePath) != 0; }

    // Width of the size/offset fields of one TOC record (5 in every shipped archive)
    int getFieldWidth() const { return (static_cast<int>(tocEntrySize) - 20) / 2; }

    // Width of one stored block length: 2 bytes up to 64 KiB blocks, 3 up to 16 MiB, else 4
    static int getBlockLengthWidth(juce::uint32 blockSize);

    static juce::String compressionToString(CompressionMethod method);
};

//==============================================================================
struct ArchiveEntry
{
    int index = 0;
    NameHash nameHash {};
    juce::uint64 uncompressedSize = 0;
    juce::uint32 firstBlockIndex = 0;
    juce::uint64 offset = 0;            // Absolute file offset of the first block

    juce::uint32 getBlockCount(juce::uint32 blockSize) const
    {
        return static_cast<juce::uint32>((uncompressedSize + blockSize - 1) / blockSize);
    }

    juce::String getHashString() const { return PathHash::toHex(nameHash); }
};

//==============================================================================
// Where one block of an entry lives and what it has to produce
struct BlockSpan
{
    juce::uint32 blockIndex = 0;
    juce::int64 fileOffset = 0;
    juce::uint32 storedLength = 0;      // Bytes to read from the archive
    juce::uint32 outputLength = 0;      // Bytes this block contributes to the entry
    bool isStoredRaw = false;
    bool mayBeRaw = false;              // storedLength == outputLength: raw oder zufällig gleich groß komprimiert
};

//==============================================================================
struct ArchiveIndex
{
    ArchiveHeader header;
    juce::Array<ArchiveEntry> entries;
    std::vector<juce::uint32> blockLengths;     // Shared by all entries

    juce::uint32 getBlockSize() const { return header.blockSize; }

    const ArchiveEntry* findByHash(const NameHash& hash) const;

    /** Walks the entry's block range.
        Throws TruncatedArchive if the range leaves the block table.
    */
    std::vector<BlockSpan> describeBlocks(const ArchiveEntry& entry) const;

    /** Number of archive bytes the entry occupies. */
    juce::uint64 getStoredSize(const ArchiveEntry& entry) const;
};

//==============================================================================
class ArchiveIndexReader
{
public:
    ArchiveIndexReader() = default;

    /** Parses header, TOC and block table. On failure returns false and
        getLastError() describes the problem.
    */
    bool read(ByteSource& source, ArchiveIndex& result);

    const PsarcError& getLastError() const { return lastError; }

private:
    PsarcError lastError;

    ArchiveHeader readHeader(ByteSource& source);
    void readToc(ByteSource& source, ArchiveIndex& index);
    void validateEntries(ByteSource& source, const ArchiveIndex& index);

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(ArchiveIndexReader)
};
