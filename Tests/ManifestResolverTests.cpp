/*
  ==============================================================================

    ManifestResolverTests.cpp

  ==============================================================================
*/

#include <gtest/gtest.h>
#include "TestArchiveBuilder.h"
#include "../Source/ManifestResolver.h"

namespace
{
    struct Resolved
    {
        explicit Resolved(const TestArchiveBuilder& builder) : source(builder.build())
        {
            ArchiveIndexReader reader;
            EXPECT_TRUE(reader.read(source, index));
            ok = resolver.resolve(index, source, result);
        }

        MemoryByteSource source;
        ArchiveIndex index;
        ManifestResolver resolver;
        ManifestResolution result;
        bool ok = false;
    };

    TestArchiveBuilder makeSongArchive()
    {
        TestArchiveBuilder builder;
        builder.addFile("manifests/songs_dlc_test/test_lead.json",
                        makeManifestJson("Test", "Lead", "song_test.bnk", 11));
        builder.addFile("manifests/songs_dlc_test/test_vocals.json",
                        makeManifestJson("Test", "Vocals", "song_test.bnk", 0));
        builder.addFile("songs/bin/generic/test_lead.sng", makeBytes({ 1, 2, 3 }));
        builder.addFile("audio/windows/song_test.bnk", makeSoundBank({ 991234 }));
        builder.addFile("audio/windows/991234.wem", makeBytes({ 'R', 'I', 'F', 'F' }));
        return builder;
    }
}

//==============================================================================
TEST(ManifestResolver, MapsEveryListedPathToItsEntry)
{
    TestArchiveBuilder builder;
    builder.addFile("gfxassets/album_art/test_256.dds", "dds");
    builder.addFile("flatmodels/rs/rsenumerable_root.flat", "flat");

    Resolved resolved(builder);
    ASSERT_TRUE(resolved.ok) << resolved.resolver.getLastError().toString();

    const auto& result = resolved.result;
    EXPECT_EQ(result.findEntryByPath("gfxassets/album_art/test_256.dds"), 1);
    EXPECT_EQ(result.findEntryByPath("FLATMODELS\\RS\\rsenumerable_root.flat"), 2);
    EXPECT_EQ(result.findEntryByPath("nothing/here"), -1);
    EXPECT_EQ(result.getPath(2), "flatmodels/rs/rsenumerable_root.flat");
    EXPECT_TRUE(result.orphanEntries.isEmpty());

    // Jeder aufgelöste Pfad hasht auf den Eintrag, der ihn trägt
    for (const auto& [path, entryIndex] : result.pathToEntry)
        EXPECT_EQ(PathHash::hashPath(path), resolved.index.entries[entryIndex].nameHash) << path;

    EXPECT_EQ(result.getAllPaths().size(), 2);
}

TEST(ManifestResolver, UnlistedEntriesBecomeOrphans)
{
    TestArchiveBuilder builder;
    builder.addFile("songs/arr/listed.xml", "<song/>");
    builder.addUnlistedFile("songs/arr/secret.xml", makeText("<hidden/>"));

    Resolved resolved(builder);
    ASSERT_TRUE(resolved.ok);

    ASSERT_EQ(resolved.result.orphanEntries.size(), 1);
    EXPECT_EQ(resolved.result.orphanEntries[0], 2);
    EXPECT_TRUE(resolved.result.isOrphan(2));
    EXPECT_TRUE(resolved.result.getPath(2).isEmpty());

    auto hex = PathHash::toHex(PathHash::hashPath("songs/arr/secret.xml"));
    EXPECT_EQ(ManifestResolution::findEntryByHash(resolved.index, hex), 2);
    EXPECT_EQ(ManifestResolution::findEntryByHash(resolved.index, hex.toUpperCase()), 2);
    EXPECT_EQ(ManifestResolution::findEntryByHash(resolved.index, "not a hash"), -1);
}

TEST(ManifestResolver, AcceptsWindowsLineEndingsAndMixedCase)
{
    TestArchiveBuilder builder;
    builder.addFile("songs/a.txt", "a");
    builder.addFile("songs/b.txt", "b");
    builder.setNamesBlock("Songs\\A.txt\r\n\r\n  songs/b.txt  \r\n");

    Resolved resolved(builder);
    ASSERT_TRUE(resolved.ok) << resolved.resolver.getLastError().toString();
    EXPECT_EQ(resolved.result.findEntryByPath("songs/a.txt"), 1);
    EXPECT_EQ(resolved.result.findEntryByPath("songs/b.txt"), 2);
}

TEST(ManifestResolver, NameWithoutEntryIsCorrupt)
{
    TestArchiveBuilder builder;
    builder.addFile("songs/a.txt", "a");
    builder.setNamesBlock("songs/a.txt\nsongs/ghost.txt");

    Resolved resolved(builder);
    EXPECT_FALSE(resolved.ok);
    EXPECT_EQ(resolved.resolver.getLastError().kind, PsarcError::Kind::CorruptEntry);
    EXPECT_TRUE(resolved.result.pathToEntry.empty());
}

TEST(ManifestResolver, DuplicateNameIsCorrupt)
{
    TestArchiveBuilder builder;
    builder.addFile("songs/a.txt", "a");
    builder.setNamesBlock("songs/a.txt\nSONGS/A.TXT");

    Resolved resolved(builder);
    EXPECT_FALSE(resolved.ok);
    EXPECT_EQ(resolved.resolver.getLastError().kind, PsarcError::Kind::CorruptEntry);
}

//==============================================================================
TEST(ManifestResolver, ReadsSongManifests)
{
    Resolved resolved(makeSongArchive());
    ASSERT_TRUE(resolved.ok) << resolved.resolver.getLastError().toString();

    ASSERT_EQ(resolved.result.songs.size(), 1);
    const auto& song = resolved.result.songs.getReference(0);
    EXPECT_EQ(song.songKey, "Test");
    EXPECT_EQ(song.title, "Test Song");
    EXPECT_EQ(song.artist, "The Testers");
    EXPECT_EQ(song.year, 2014);
    EXPECT_DOUBLE_EQ(song.songLength, 12.5);

    // Vocals haben keine Noten und werden übersprungen
    ASSERT_EQ(song.arrangements.size(), 1);
    EXPECT_EQ(song.findArrangement("vocals"), nullptr);

    auto* lead = song.findArrangement("lead");
    ASSERT_NE(lead, nullptr);
    EXPECT_EQ(lead->instrument, "guitar");
    EXPECT_EQ(lead->difficultyTierCount, 12);
    EXPECT_EQ(lead->capoFret, 2);
    EXPECT_EQ(lead->arrangementEntryPath, "songs/bin/generic/test_lead.sng");
    EXPECT_EQ(lead->manifestEntryPath, "manifests/songs_dlc_test/test_lead.json");
    ASSERT_EQ(lead->tuning.size(), 6);
    EXPECT_EQ(lead->tuning[0], -2);
    EXPECT_EQ(lead->tuning[5], 0);
}

TEST(ManifestResolver, AudioPathComesFromTheSoundBank)
{
    Resolved resolved(makeSongArchive());
    ASSERT_TRUE(resolved.ok);

    auto* lead = resolved.result.songs.getReference(0).findArrangement("Lead");
    ASSERT_NE(lead, nullptr);
    EXPECT_EQ(lead->audioEntryPath, "audio/windows/991234.wem");
}

TEST(ManifestResolver, MissingWemFallsBackToTheBank)
{
    TestArchiveBuilder builder;
    builder.addFile("manifests/songs_dlc_test/test_bass.json",
                    makeManifestJson("Test", "Bass", "song_test.bnk", 5));
    builder.addFile("audio/windows/song_test.bnk", makeSoundBank({ 42 }));

    Resolved resolved(builder);
    ASSERT_TRUE(resolved.ok);

    const auto& bass = resolved.result.songs.getReference(0).arrangements.getReference(0);
    EXPECT_EQ(bass.instrument, "bass");
    EXPECT_EQ(bass.audioEntryPath, "audio/windows/song_test.bnk");
    EXPECT_EQ(bass.arrangementEntryPath, "songs/bin/generic/test_bass.sng");
}

TEST(ManifestResolver, InvalidManifestJsonSkipsOnlyThatSong)
{
    auto builder = makeSongArchive();
    builder.addFile("manifests/songs_dlc_test/broken.json", "{ \"Entries\": ");

    Resolved resolved(builder);
    ASSERT_TRUE(resolved.ok) << resolved.resolver.getLastError().toString();

    const auto& result = resolved.result;
    ASSERT_EQ(result.failedManifests.size(), 1);
    EXPECT_EQ(result.failedManifests[0].kind, PsarcError::Kind::CorruptEntry);
    EXPECT_EQ(result.failedManifests[0].entryHash,
              PathHash::toHex(PathHash::hashPath("manifests/songs_dlc_test/broken.json")));

    EXPECT_EQ(result.songs.size(), 1);
    EXPECT_GE(result.findEntryByPath("manifests/songs_dlc_test/broken.json"), 0);
    EXPECT_GE(result.findEntryByPath("audio/windows/991234.wem"), 0);
    EXPECT_TRUE(result.orphanEntries.isEmpty());
}

TEST(ManifestResolver, UnreadableSoundBankFallsBackToBankPath)
{
    TestArchiveBuilder builder;
    builder.addFile("manifests/songs_dlc_test/test_lead.json",
                    makeManifestJson("Test", "Lead", "song_test.bnk", 3));
    builder.addFile("audio/windows/song_test.bnk", makeSoundBank({ 991234 }), { TestArchiveBuilder::BlockStorage::Compressed });
    builder.addFile("audio/windows/991234.wem", makeBytes({ 'R', 'I', 'F', 'F' }));
    auto bytes = builder.build();

    // zlib-Header der Bank zerstören
    {
        MemoryByteSource source(bytes);
        ArchiveIndex index;
        ArchiveIndexReader reader;
        ASSERT_TRUE(reader.read(source, index));

        auto* bank = index.findByHash(PathHash::hashPath("audio/windows/song_test.bnk"));
        ASSERT_NE(bank, nullptr);
        auto* raw = static_cast<juce::uint8*>(bytes.getData());
        raw[bank->offset] = 0xFF;
        raw[bank->offset + 1] = 0xFF;
    }

    MemoryByteSource source(bytes);
    ArchiveIndex index;
    ArchiveIndexReader reader;
    ASSERT_TRUE(reader.read(source, index));

    ManifestResolver resolver;
    ManifestResolution result;
    ASSERT_TRUE(resolver.resolve(index, source, result)) << resolver.getLastError().toString();

    ASSERT_EQ(result.songs.size(), 1);
    EXPECT_EQ(result.songs[0].arrangements[0].audioEntryPath, "audio/windows/song_test.bnk");
    EXPECT_TRUE(result.failedManifests.isEmpty());
}

//==============================================================================
TEST(ManifestResolver, SplitsNamesBlock)
{
    auto lines = ManifestResolver::splitNamesBlock(makeText("a.txt\n\nb.txt\r\n c.txt \n"));
    ASSERT_EQ(lines.size(), 3);
    EXPECT_EQ(lines[0], "a.txt");
    EXPECT_EQ(lines[2], "c.txt");
}

TEST(ManifestResolver, AssetNameFromUrn)
{
    EXPECT_EQ(ManifestResolver::assetNameFromUrn("urn:application:musicgame-song:test_lead"), "test_lead");
    EXPECT_EQ(ManifestResolver::assetNameFromUrn("plain"), "plain");
}
