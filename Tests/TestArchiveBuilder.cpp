/*
  ==============================================================================

    TestArchiveBuilder.cpp

  ==============================================================================
*/

#include "TestArchiveBuilder.h"
#include "../Source/ArchiveCipher.h"
#include "../Source/ArchiveIndex.h"

namespace
{
    constexpr int fieldWidth = 5;
    constexpr juce::uint32 tocEntrySize = 20 + 2 * fieldWidth;

    void writeBigEndian(juce::MemoryOutputStream& out, juce::uint64 value, int width)
    {
        for (int i = width - 1; i >= 0; --i)
            out.writeByte(static_cast<char>((value >> (8 * i)) & 0xFF));
    }

    struct StoredEntry
    {
        NameHash hash {};
        juce::uint64 size = 0;
        juce::uint32 firstBlock = 0;
        juce::uint64 offset = 0;      // Relativ zum Datenbereich
    };
}

//==============================================================================
juce::MemoryBlock makeBytes(std::initializer_list<int> bytes)
{
    juce::MemoryBlock block;
    for (auto b : bytes)
    {
        auto c = static_cast<char>(b);
        block.append(&c, 1);
    }
    return block;
}

juce::MemoryBlock makeText(const juce::String& text)
{
    return juce::MemoryBlock(text.toRawUTF8(), text.getNumBytesAsUTF8());
}

juce::MemoryBlock zlibCompress(const void* data, size_t numBytes)
{
    juce::MemoryOutputStream compressed;
    {
        juce::GZIPCompressorOutputStream zlib(compressed, 9);
        zlib.write(data, numBytes);
        zlib.flush();
    }
    return compressed.getMemoryBlock();
}

//==============================================================================
TestArchiveBuilder::TestArchiveBuilder(juce::uint32 size)
    : blockSize(size)
{
}

void TestArchiveBuilder::addFile(const juce::String& path, const juce::MemoryBlock& data,
                                 std::vector<BlockStorage> storage)
{
    files.push_back({ path, data, true, std::move(storage) });
}

void TestArchiveBuilder::addFile(const juce::String& path, const juce::String& text)
{
    addFile(path, makeText(text));
}

void TestArchiveBuilder::addUnlistedFile(const juce::String& path, const juce::MemoryBlock& data)
{
    files.push_back({ path, data, false, {} });
}

juce::uint32 TestArchiveBuilder::getTocLength(int entryCount, int blockCount, juce::uint32 size)
{
    return static_cast<juce::uint32>(ArchiveHeader::headerSize)
         + static_cast<juce::uint32>(entryCount) * tocEntrySize
         + static_cast<juce::uint32>(blockCount * ArchiveHeader::getBlockLengthWidth(size));
}

//==============================================================================
juce::MemoryBlock TestArchiveBuilder::build() const
{
    juce::StringArray names;
    for (const auto& file : files)
        if (file.listed)
            names.add(file.path);

    std::vector<File> all;
    all.push_back({ {}, makeText(hasNamesOverride ? namesOverride : names.joinIntoString("\n")), true, {} });
    for (const auto& file : files)
        all.push_back(file);

    const int widthBytes = ArchiveHeader::getBlockLengthWidth(blockSize);
    const juce::uint64 widthLimit = juce::uint64(1) << (8 * widthBytes);

    std::vector<StoredEntry> entries;
    std::vector<juce::uint32> blockLengths;
    juce::MemoryOutputStream data;

    for (size_t f = 0; f < all.size(); ++f)
    {
        const auto& file = all[f];

        StoredEntry entry;
        if (f > 0)
            entry.hash = PathHash::hashPath(file.path);
        entry.size = file.data.getSize();
        entry.firstBlock = static_cast<juce::uint32>(blockLengths.size());
        entry.offset = data.getDataSize();

        const auto* bytes = static_cast<const char*>(file.data.getData());
        size_t position = 0;
        size_t blockNumber = 0;

        while (position < file.data.getSize())
        {
            auto length = juce::jmin(static_cast<size_t>(blockSize), file.data.getSize() - position);
            auto mode = blockNumber < file.storage.size() ? file.storage[blockNumber] : BlockStorage::Auto;
            auto compressed = zlibCompress(bytes + position, length);

            if (mode == BlockStorage::Auto)
                mode = compressed.getSize() < length ? BlockStorage::Compressed : BlockStorage::Raw;

            if (mode == BlockStorage::Raw)
            {
                data.write(bytes + position, length);
                blockLengths.push_back(length >= widthLimit ? 0u : static_cast<juce::uint32>(length));
            }
            else
            {
                data.write(compressed.getData(), compressed.getSize());
                blockLengths.push_back(static_cast<juce::uint32>(compressed.getSize()));
            }

            position += length;
            ++blockNumber;
        }

        entries.push_back(entry);
    }

    const auto tocLength = getTocLength(static_cast<int>(entries.size()),
                                        static_cast<int>(blockLengths.size()), blockSize);

    juce::MemoryOutputStream toc;
    for (const auto& entry : entries)
    {
        toc.write(entry.hash.data(), entry.hash.size());
        writeBigEndian(toc, entry.firstBlock, 4);
        writeBigEndian(toc, entry.size, fieldWidth);
        writeBigEndian(toc, entry.offset + tocLength, fieldWidth);
    }
    for (auto length : blockLengths)
        writeBigEndian(toc, length, widthBytes);

    auto tocBytes = toc.getMemoryBlock();
    if (encryptToc)
        tocBytes = ArchiveCipher::encryptToc(tocBytes.getData(), tocBytes.getSize());

    juce::MemoryOutputStream archive;
    archive.write("PSAR", 4);
    writeBigEndian(archive, 1, 2);
    writeBigEndian(archive, 4, 2);
    archive.write("zlib", 4);
    writeBigEndian(archive, tocLength, 4);
    writeBigEndian(archive, tocEntrySize, 4);
    writeBigEndian(archive, entries.size(), 4);
    writeBigEndian(archive, blockSize, 4);
    writeBigEndian(archive, encryptToc ? ArchiveHeader::flagEncryptedToc : 0, 4);

    archive << tocBytes;
    archive << data.getMemoryBlock();

    return archive.getMemoryBlock();
}

//==============================================================================
juce::MemoryBlock makeSoundBank(std::initializer_list<juce::uint32> wemIds)
{
    juce::MemoryOutputStream bank;

    bank.write("BKHD", 4);
    bank.writeInt(8);
    bank.writeInt(0x78);                // bank version
    bank.writeInt(0x1234);              // bank id

    bank.write("DIDX", 4);
    bank.writeInt(static_cast<int>(wemIds.size() * 12));
    for (auto id : wemIds)
    {
        bank.writeInt(static_cast<int>(id));
        bank.writeInt(0);
        bank.writeInt(1000);
    }

    return bank.getMemoryBlock();
}

juce::String makeManifestJson(const juce::String& songKey, const juce::String& arrangementName,
                              const juce::String& songBank, int maxPhraseDifficulty)
{
    auto* attributes = new juce::DynamicObject();
    attributes->setProperty("ArrangementName", arrangementName);
    attributes->setProperty("SongKey", songKey);
    attributes->setProperty("SongName", "Test Song");
    attributes->setProperty("ArtistName", "The Testers");
    attributes->setProperty("AlbumName", "Fixtures");
    attributes->setProperty("SongYear", 2014);
    attributes->setProperty("SongLength", 12.5);
    attributes->setProperty("SongAverageTempo", 120.0);
    attributes->setProperty("MaxPhraseDifficulty", maxPhraseDifficulty);
    attributes->setProperty("CapoFret", 2);
    attributes->setProperty("CentOffset", 0.0);
    attributes->setProperty("SongAsset", "urn:application:musicgame-song:" + songKey.toLowerCase()
                                             + "_" + arrangementName.toLowerCase());
    attributes->setProperty("SongBank", songBank);

    auto* tuning = new juce::DynamicObject();
    for (int s = 0; s < 6; ++s)
        tuning->setProperty("string" + juce::String(s), s < 1 ? -2 : 0);
    attributes->setProperty("Tuning", juce::var(tuning));

    auto* entry = new juce::DynamicObject();
    entry->setProperty("Attributes", juce::var(attributes));

    auto* entries = new juce::DynamicObject();
    entries->setProperty("0123456789ABCDEF" + arrangementName, juce::var(entry));

    auto* root = new juce::DynamicObject();
    root->setProperty("Entries", juce::var(entries));
    root->setProperty("ModelsGeneratedTimestamp", "2014-06-11T12:00:00");

    return juce::JSON::toString(juce::var(root));
}
