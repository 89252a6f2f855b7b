/*
  ==============================================================================

    ArchiveIndex.cpp

  ==============================================================================
*/

#include "ArchiveIndex.h"
#include "ArchiveCipher.h"

namespace
{
    // Big-endian integer of arbitrary width (1..8 bytes)
    juce::uint64 readBigEndian(const juce::uint8* data, int width)
    {
        juce::uint64 value = 0;
        for (int i = 0; i < width; ++i)
            value = (value << 8) | data[i];
        return value;
    }

    juce::uint32 readU32BE(const juce::uint8* data)
    {
        return static_cast<juce::uint32>(readBigEndian(data, 4));
    }

    bool isPowerOfTwo(juce::uint32 value)
    {
        return value != 0 && (value & (value - 1)) == 0;
    }
}

//==============================================================================
int ArchiveHeader::getBlockLengthWidth(juce::uint32 blockSize)
{
    if (blockSize <= 0x10000)
        return 2;
    if (blockSize <= 0x1000000)
        return 3;
    return 4;
}

juce::String ArchiveHeader::compressionToString(CompressionMethod method)
{
    return method == CompressionMethod::Lzma ? "lzma" : "zlib";
}

//==============================================================================
const ArchiveEntry* ArchiveIndex::findByHash(const NameHash& hash) const
{
    for (const auto& entry : entries)
        if (entry.nameHash == hash)
            return &entry;

    return nullptr;
}

std::vector<BlockSpan> ArchiveIndex::describeBlocks(const ArchiveEntry& entry) const
{
    std::vector<BlockSpan> spans;

    const auto blockSize = header.blockSize;
    const auto blockCount = entry.getBlockCount(blockSize);

    if (static_cast<juce::uint64>(entry.firstBlockIndex) + blockCount > blockLengths.size())
    {
        throw PsarcException(PsarcError::Kind::TruncatedArchive,
                             "entry " + juce::String(entry.index) + " uses blocks "
                                 + juce::String(entry.firstBlockIndex) + ".."
                                 + juce::String(entry.firstBlockIndex + blockCount)
                                 + " but the block table has "
                                 + juce::String(static_cast<juce::int64>(blockLengths.size())),
                             -1, entry.getHashString());
    }

    spans.reserve(blockCount);

    auto fileOffset = static_cast<juce::int64>(entry.offset);
    auto remaining = entry.uncompressedSize;

    for (juce::uint32 i = 0; i < blockCount; ++i)
    {
        BlockSpan span;
        span.blockIndex = entry.firstBlockIndex + i;
        span.fileOffset = fileOffset;
        span.outputLength = static_cast<juce::uint32>(juce::jmin<juce::uint64>(remaining, blockSize));

        auto stored = blockLengths[span.blockIndex];

        // 0 = voller Block, unkomprimiert abgelegt
        if (stored == 0)
        {
            span.storedLength = span.outputLength;
            span.isStoredRaw = true;
        }
        else
        {
            span.storedLength = stored;
            span.isStoredRaw = (stored == blockSize);
            span.mayBeRaw = ! span.isStoredRaw && stored == span.outputLength;
        }

        spans.push_back(span);

        fileOffset += span.storedLength;
        remaining -= span.outputLength;
    }

    return spans;
}

juce::uint64 ArchiveIndex::getStoredSize(const ArchiveEntry& entry) const
{
    juce::uint64 total = 0;
    for (const auto& span : describeBlocks(entry))
        total += span.storedLength;
    return total;
}

//==============================================================================
bool ArchiveIndexReader::read(ByteSource& source, ArchiveIndex& result)
{
    lastError = {};
    result = {};

    try
    {
        result.header = readHeader(source);
        readToc(source, result);
        validateEntries(source, result);

        DBG("PSARC: " << result.entries.size() << " entries, "
            << (int) result.blockLengths.size() << " blocks of "
            << (int) result.header.blockSize << " bytes ("
            << ArchiveHeader::compressionToString(result.header.compression)
            << (result.header.isTocEncrypted() ? ", encrypted TOC)" : ")"));
        return true;
    }
    catch (const PsarcException& e)
    {
        lastError = e.getError();
        DBG("PSARC index error: " << lastError.toString());
    }
    catch (const std::exception& e)
    {
        lastError.kind = PsarcError::Kind::MalformedHeader;
        lastError.message = juce::String("Parse error: ") + e.what();
        DBG("PSARC index error: " << lastError.toString());
    }

    result = {};
    return false;
}

//==============================================================================
ArchiveHeader ArchiveIndexReader::readHeader(ByteSource& source)
{
    if (source.getSize() < ArchiveHeader::headerSize)
        throw PsarcException(PsarcError::Kind::TruncatedArchive,
                             "archive is " + juce::String(source.getSize())
                                 + " bytes, smaller than the 32 byte header", 0);

    juce::uint8 raw[ArchiveHeader::headerSize];
    source.readExactly(0, raw, sizeof(raw));

    if (readU32BE(raw) != ArchiveHeader::magic)
        throw PsarcException(PsarcError::Kind::MalformedHeader, "magic is not PSAR", 0);

    ArchiveHeader header;
    header.versionMajor = (raw[4] << 8) | raw[5];
    header.versionMinor = (raw[6] << 8) | raw[7];

    if (header.versionMajor != 1 || header.versionMinor != 4)
        throw PsarcException(PsarcError::Kind::MalformedHeader,
                             "unsupported version " + juce::String(header.versionMajor)
                                 + "." + juce::String(header.versionMinor), 4);

    juce::String method(reinterpret_cast<const char*>(raw + 8), 4);
    if (method == "zlib")
        header.compression = CompressionMethod::Zlib;
    else if (method == "lzma")
        header.compression = CompressionMethod::Lzma;
    else
        throw PsarcException(PsarcError::Kind::MalformedHeader,
                             "unknown compression method '" + method + "'", 8);

    header.tocLength    = readU32BE(raw + 12);
    header.tocEntrySize = readU32BE(raw + 16);
    header.entryCount   = readU32BE(raw + 20);
    header.blockSize    = readU32BE(raw + 24);
    header.archiveFlags = readU32BE(raw + 28);

    if (! isPowerOfTwo(header.blockSize))
        throw PsarcException(PsarcError::Kind::MalformedHeader,
                             "block size " + juce::String((juce::int64) header.blockSize)
                                 + " is not a power of two", 24);

    if (header.tocEntrySize < 22 || ((header.tocEntrySize - 20) % 2) != 0
        || header.getFieldWidth() > 8)
        throw PsarcException(PsarcError::Kind::MalformedHeader,
                             "unsupported TOC entry size " + juce::String((juce::int64) header.tocEntrySize), 16);

    auto minimumToc = static_cast<juce::uint64>(ArchiveHeader::headerSize)
                      + static_cast<juce::uint64>(header.entryCount) * header.tocEntrySize;

    if (header.tocLength < minimumToc)
        throw PsarcException(PsarcError::Kind::MalformedHeader,
                             "TOC length " + juce::String((juce::int64) header.tocLength)
                                 + " cannot hold " + juce::String((juce::int64) header.entryCount)
                                 + " entries", 12);

    if (static_cast<juce::int64>(header.tocLength) > source.getSize())
        throw PsarcException(PsarcError::Kind::TruncatedArchive,
                             "TOC extends past the end of the archive", 12);

    return header;
}

//==============================================================================
void ArchiveIndexReader::readToc(ByteSource& source, ArchiveIndex& index)
{
    const auto& header = index.header;
    const auto tocBytes = static_cast<size_t>(header.tocLength) - ArchiveHeader::headerSize;

    auto toc = source.readBlock(ArchiveHeader::headerSize, tocBytes);

    if (header.isTocEncrypted())
        toc = ArchiveCipher::decryptToc(toc.getData(), toc.getSize());

    const auto* data = static_cast<const juce::uint8*>(toc.getData());
    const int fieldWidth = header.getFieldWidth();
    size_t pos = 0;

    index.entries.ensureStorageAllocated(static_cast<int>(header.entryCount));

    for (juce::uint32 i = 0; i < header.entryCount; ++i)
    {
        ArchiveEntry entry;
        entry.index = static_cast<int>(i);
        std::memcpy(entry.nameHash.data(), data + pos, entry.nameHash.size());
        entry.firstBlockIndex  = readU32BE(data + pos + 16);
        entry.uncompressedSize = readBigEndian(data + pos + 20, fieldWidth);
        entry.offset           = readBigEndian(data + pos + 20 + fieldWidth, fieldWidth);

        index.entries.add(entry);
        pos += header.tocEntrySize;
    }

    // Rest des TOC ist die Blocklängen-Tabelle
    const int width = ArchiveHeader::getBlockLengthWidth(header.blockSize);
    const size_t tableBytes = tocBytes - pos;
    const size_t blockCount = tableBytes / static_cast<size_t>(width);

    index.blockLengths.reserve(blockCount);
    for (size_t i = 0; i < blockCount; ++i)
    {
        index.blockLengths.push_back(static_cast<juce::uint32>(readBigEndian(data + pos, width)));
        pos += static_cast<size_t>(width);
    }

    if (tableBytes % static_cast<size_t>(width) != 0)
        DBG("PSARC: ignoring " << (int) (tableBytes % static_cast<size_t>(width))
            << " trailing bytes after the block table");
}

//==============================================================================
void ArchiveIndexReader::validateEntries(ByteSource& source, const ArchiveIndex& index)
{
    const auto archiveSize = static_cast<juce::uint64>(source.getSize());

    for (const auto& entry : index.entries)
    {
        if (entry.uncompressedSize == 0)
            continue;

        auto stored = index.getStoredSize(entry);

        if (entry.offset + stored > archiveSize)
        {
            throw PsarcException(PsarcError::Kind::TruncatedArchive,
                                 "entry " + juce::String(entry.index) + " needs bytes up to "
                                     + juce::String((juce::int64) (entry.offset + stored))
                                     + " but the archive has " + juce::String((juce::int64) archiveSize),
                                 (juce::int64) entry.offset, entry.getHashString());
        }
    }
}
