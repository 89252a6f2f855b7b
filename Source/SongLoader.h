/*
  ==============================================================================

    SongLoader.h

    One-stop facade: open an archive, resolve its manifest, extract entries
    and load arrangements plus their audio.

  ==============================================================================
*/

#pragma once

#include <juce_core/juce_core.h>
#include "ArchiveIndex.h"
#include "ArrangementDecoder.h"
#include "ManifestResolver.h"

class SongLoader
{
public:
    SongLoader();
    ~SongLoader();

    bool open(const juce::File& archiveFile);
    bool open(std::unique_ptr<ByteSource> archiveSource);

    bool isOpen() const { return source != nullptr; }
    const PsarcError& getLastError() const { return lastError; }

    //==============================================================================
    const ArchiveIndex& getIndex() const { return index; }
    const ManifestResolution& getManifest() const { return manifest; }
    const juce::Array<SongManifest>& getSongs() const { return manifest.songs; }

    //==============================================================================
    bool extractEntry(int entryIndex, juce::MemoryBlock& result);

    /** Accepts a logical path or a 32 digit hex hash. */
    bool extract(const juce::String& pathOrHash, juce::MemoryBlock& result);

    /** -1 (and MissingEntry as last error) when unknown. */
    int findEntry(const juce::String& pathOrHash);

    bool loadArrangement(const juce::String& logicalPath, Arrangement& result);
    bool loadArrangement(const ArrangementRef& ref, Arrangement& result);

    /** Raw bytes of the arrangement's audio entry (.wem, or the bank as fallback). */
    bool loadAudio(const ArrangementRef& ref, juce::MemoryBlock& result);

    /** File below directory for a logical path; false if the path leaves the directory. */
    static bool getExtractionTarget(const juce::File& directory, const juce::String& logicalPath, juce::File& target);

private:
    std::unique_ptr<ByteSource> source;
    ArchiveIndex index;
    ManifestResolution manifest;
    PsarcError lastError;

    void close();
    void setMissing(const juce::String& what);

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(SongLoader)
};
