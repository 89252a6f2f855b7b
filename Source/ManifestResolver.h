/*
  ==============================================================================

    ManifestResolver.h

    Turns the hash-addressed archive into a path-addressed one and
    collects the song metadata.

    1. Entry 0 (names block) lists one logical path per line.
    2. Each path is hashed (PathHash) and matched to an archive entry.
       Entries nobody names are orphans: kept, logged, reachable by hash.
    3. manifests/.../*.json describe the arrangements of each song.

  ==============================================================================
*/

#pragma once

#include <juce_core/juce_core.h>
#include "ArchiveIndex.h"
#include <map>

//==============================================================================
struct ArrangementRef
{
    juce::String instrument;                // "guitar" oder "bass"
    juce::String arrangementName;           // "Lead", "Rhythm", "Combo", "Bass"
    int difficultyTierCount = 0;
    juce::String audioEntryPath;
    juce::String arrangementEntryPath;
    juce::String manifestEntryPath;
    juce::Array<int> tuning;                // Halbtöne pro Saite, relativ zu E-Standard
    int capoFret = 0;
    double centOffset = 0.0;
};

//==============================================================================
struct SongManifest
{
    juce::String songKey;
    juce::String title;
    juce::String artist;
    juce::String album;
    int year = 0;
    double songLength = 0.0;
    double averageTempo = 0.0;
    juce::Array<int> tuning;
    juce::Array<ArrangementRef> arrangements;

    const ArrangementRef* findArrangement(const juce::String& name) const;
};

//==============================================================================
struct ManifestResolution
{
    juce::StringArray entryPaths;               // Pro Entry-Index, leer = unbenannt
    std::map<juce::String, int> pathToEntry;    // Normalisierter Pfad -> Entry-Index
    juce::Array<int> orphanEntries;
    juce::Array<SongManifest> songs;
    juce::Array<PsarcError> failedManifests;    // Übersprungene Song-Manifeste

    /** -1 if no entry carries that path. */
    int findEntryByPath(const juce::String& logicalPath) const;

    /** Accepts 32 hex digits. -1 if nothing matches. */
    static int findEntryByHash(const ArchiveIndex& index, const juce::String& hexHash);

    juce::String getPath(int entryIndex) const { return entryPaths[entryIndex]; }

    bool isOrphan(int entryIndex) const { return orphanEntries.contains(entryIndex); }

    /** All resolved paths in entry order. */
    juce::StringArray getAllPaths() const;
};

//==============================================================================
class ManifestResolver
{
public:
    ManifestResolver() = default;

    bool resolve(const ArchiveIndex& index, ByteSource& source, ManifestResolution& result);

    const PsarcError& getLastError() const { return lastError; }

    /** Splits a names block into trimmed, non-empty lines. */
    static juce::StringArray splitNamesBlock(const juce::MemoryBlock& namesBlock);

    /** "urn:application:musicgame-song:foo_lead" -> "foo_lead" */
    static juce::String assetNameFromUrn(const juce::String& urn);

private:
    PsarcError lastError;

    void resolvePaths(const ArchiveIndex& index, ByteSource& source, ManifestResolution& result);
    void readSongManifests(const ArchiveIndex& index, ByteSource& source, ManifestResolution& result);
    void readSongManifestEntry(const juce::String& path, int entryIndex, const ArchiveIndex& index,
                               ByteSource& source, ManifestResolution& result);
    void readSongManifest(const juce::String& manifestPath, const juce::var& json,
                          const ArchiveIndex& index, ByteSource& source, ManifestResolution& result);

    juce::String findArrangementPath(const juce::String& songAsset, const ManifestResolution& result) const;
    juce::String findAudioPath(const juce::String& songBank, const ArchiveIndex& index,
                               ByteSource& source, const ManifestResolution& result);

    std::map<juce::String, juce::String> audioPathCache;   // Bank -> Audio-Pfad

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(ManifestResolver)
};
