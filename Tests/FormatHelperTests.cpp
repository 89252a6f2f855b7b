/*
  ==============================================================================

    FormatHelperTests.cpp

    Path hashing, ciphers, sound banks, byte sources and error formatting.

  ==============================================================================
*/

#include <gtest/gtest.h>
#include "TestArchiveBuilder.h"
#include "../Source/ArchiveCipher.h"
#include "../Source/ByteSource.h"
#include "../Source/PathHash.h"
#include "../Source/PsarcError.h"
#include "../Source/SoundBank.h"

//==============================================================================
TEST(PathHash, HashIsMd5OfNormalisedPath)
{
    EXPECT_EQ(PathHash::toHex(PathHash::hashPath("")), "d41d8cd98f00b204e9800998ecf8427e");
    EXPECT_EQ(PathHash::hashPath("Songs\\Bin\\Test.SNG"), PathHash::hashPath("songs/bin/test.sng"));
    EXPECT_NE(PathHash::hashPath("songs/a"), PathHash::hashPath("songs/b"));
}

TEST(PathHash, HexRoundTripAndValidation)
{
    auto hash = PathHash::hashPath("manifests/songs.hsan");
    NameHash parsed {};

    ASSERT_TRUE(PathHash::fromHex(PathHash::toHex(hash), parsed));
    EXPECT_EQ(parsed, hash);

    EXPECT_FALSE(PathHash::fromHex("abc", parsed));
    EXPECT_FALSE(PathHash::fromHex("songs/bin/generic/test_lead.sng", parsed));
    EXPECT_TRUE(PathHash::isZero(NameHash {}));
    EXPECT_FALSE(PathHash::isZero(hash));
}

//==============================================================================
TEST(ArchiveCipher, TocEncryptionIsReversible)
{
    auto plain = makeText("table of contents, thirty bytes per entry");
    auto encrypted = ArchiveCipher::encryptToc(plain.getData(), plain.getSize());

    EXPECT_EQ(encrypted.getSize(), plain.getSize());
    EXPECT_NE(encrypted, plain);
    EXPECT_EQ(ArchiveCipher::decryptToc(encrypted.getData(), encrypted.getSize()), plain);
}

TEST(ArchiveCipher, SngKeystreamIsSymmetric)
{
    juce::uint8 iv[ArchiveCipher::ivSize] = {};
    iv[15] = 1;

    auto plain = makeText("arrangement payload");
    auto once = ArchiveCipher::applySngKeystream(plain.getData(), plain.getSize(), iv);

    EXPECT_NE(once, plain);
    EXPECT_EQ(ArchiveCipher::applySngKeystream(once.getData(), once.getSize(), iv), plain);
}

//==============================================================================
TEST(SoundBank, ListsMediaFromDidx)
{
    SoundBank bank;
    ASSERT_TRUE(bank.parse(makeSoundBank({ 123, 456789 })));
    EXPECT_TRUE(bank.hasSection("BKHD"));
    EXPECT_TRUE(bank.hasSection("DIDX"));

    auto names = bank.getWemFileNames();
    ASSERT_EQ(names.size(), 2);
    EXPECT_EQ(names[0], "123.wem");
    EXPECT_EQ(names[1], "456789.wem");
}

TEST(SoundBank, RejectsBanksWithoutMediaIndex)
{
    juce::MemoryOutputStream out;
    out.write("BKHD", 4);
    out.writeInt(4);
    out.writeInt(0x78);

    SoundBank bank;
    EXPECT_FALSE(bank.parse(out.getMemoryBlock()));
    EXPECT_EQ(bank.getLastError().kind, PsarcError::Kind::CorruptEntry);
}

TEST(SoundBank, RejectsChunkPastEnd)
{
    auto bytes = makeSoundBank({ 1 });
    bytes.setSize(bytes.getSize() - 4);

    SoundBank bank;
    EXPECT_FALSE(bank.parse(bytes));
    EXPECT_EQ(bank.getLastError().kind, PsarcError::Kind::CorruptEntry);
}

//==============================================================================
TEST(ByteSource, ReadExactlyThrowsPastEnd)
{
    MemoryByteSource source(makeBytes({ 1, 2, 3, 4 }));

    auto block = source.readBlock(1, 2);
    EXPECT_EQ(block, makeBytes({ 2, 3 }));

    juce::uint8 buffer[4];
    EXPECT_EQ(source.readAt(2, buffer, 4), 2u);
    EXPECT_EQ(source.readAt(9, buffer, 1), 0u);

    try
    {
        source.readExactly(2, buffer, 4);
        FAIL() << "expected TruncatedArchive";
    }
    catch (const PsarcException& e)
    {
        EXPECT_EQ(e.getKind(), PsarcError::Kind::TruncatedArchive);
        EXPECT_EQ(e.getError().offset, 2);
    }
}

TEST(ByteSource, FileSourceReadsAtOffsets)
{
    juce::TemporaryFile temp;
    ASSERT_TRUE(temp.getFile().replaceWithText("0123456789"));

    FileByteSource source(temp.getFile());
    ASSERT_TRUE(source.openedOk());
    EXPECT_EQ(source.getSize(), 10);
    EXPECT_EQ(source.readBlock(7, 3).toString(), "789");
    EXPECT_EQ(source.readBlock(0, 2).toString(), "01");
}

//==============================================================================
TEST(PsarcError, ToStringCarriesLocation)
{
    PsarcError error;
    EXPECT_FALSE(error.failed());

    error.kind = PsarcError::Kind::CorruptEntry;
    error.message = "block 3 did not inflate";
    error.entryHash = "00ff";
    error.offset = 128;

    EXPECT_TRUE(error.failed());
    EXPECT_EQ(error.toString(), "CorruptEntry: block 3 did not inflate [hash=00ff, offset=128]");

    PsarcException exception(error);
    EXPECT_STREQ(exception.what(), error.toString().toRawUTF8());
}
