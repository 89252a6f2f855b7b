/*
  ==============================================================================

    SongLoader.cpp

  ==============================================================================
*/

#include "SongLoader.h"
#include "BlockDecompressor.h"

//==============================================================================
SongLoader::SongLoader() {}
SongLoader::~SongLoader() {}

void SongLoader::close()
{
    source.reset();
    index = ArchiveIndex();
    manifest = ManifestResolution();
}

void SongLoader::setMissing(const juce::String& what)
{
    lastError = {};
    lastError.kind = PsarcError::Kind::MissingEntry;
    lastError.message = "no archive entry " + what.quoted();
}

//==============================================================================
bool SongLoader::open(const juce::File& archiveFile)
{
    auto fileSource = std::make_unique<FileByteSource>(archiveFile);

    if (! fileSource->openedOk())
    {
        close();
        lastError = {};
        lastError.kind = PsarcError::Kind::TruncatedArchive;
        lastError.message = "could not open " + archiveFile.getFullPathName();
        return false;
    }

    return open(std::move(fileSource));
}

bool SongLoader::open(std::unique_ptr<ByteSource> archiveSource)
{
    close();
    lastError = {};

    ArchiveIndexReader reader;
    if (! reader.read(*archiveSource, index))
    {
        lastError = reader.getLastError();
        close();
        return false;
    }

    ManifestResolver resolver;
    if (! resolver.resolve(index, *archiveSource, manifest))
    {
        lastError = resolver.getLastError();
        close();
        return false;
    }

    source = std::move(archiveSource);
    return true;
}

//==============================================================================
bool SongLoader::extractEntry(int entryIndex, juce::MemoryBlock& result)
{
    if (source == nullptr || ! juce::isPositiveAndBelow(entryIndex, index.entries.size()))
    {
        setMissing("#" + juce::String(entryIndex));
        return false;
    }

    BlockDecompressor decompressor;
    if (! decompressor.extract(index, index.entries.getReference(entryIndex), *source, result))
    {
        lastError = decompressor.getLastError();
        return false;
    }

    return true;
}

int SongLoader::findEntry(const juce::String& pathOrHash)
{
    auto entryIndex = manifest.findEntryByPath(pathOrHash);

    if (entryIndex < 0)
        entryIndex = ManifestResolution::findEntryByHash(index, pathOrHash);

    if (entryIndex < 0)
        setMissing(pathOrHash);

    return entryIndex;
}

bool SongLoader::extract(const juce::String& pathOrHash, juce::MemoryBlock& result)
{
    auto entryIndex = findEntry(pathOrHash);
    return entryIndex >= 0 && extractEntry(entryIndex, result);
}

//==============================================================================
bool SongLoader::loadArrangement(const juce::String& logicalPath, Arrangement& result)
{
    auto entryIndex = findEntry(logicalPath);
    if (entryIndex < 0)
        return false;

    juce::MemoryBlock bytes;
    if (! extractEntry(entryIndex, bytes))
        return false;

    ArrangementDecoder decoder;
    decoder.setEntryHash(index.entries.getReference(entryIndex).getHashString());

    auto ok = ArrangementDecoder::isEnvelopePath(manifest.getPath(entryIndex))
                  ? decoder.decodeEnvelope(bytes, result)
                  : decoder.decode(bytes, result);

    if (! ok)
        lastError = decoder.getLastError();

    return ok;
}

bool SongLoader::loadArrangement(const ArrangementRef& ref, Arrangement& result)
{
    return loadArrangement(ref.arrangementEntryPath, result);
}

bool SongLoader::loadAudio(const ArrangementRef& ref, juce::MemoryBlock& result)
{
    if (ref.audioEntryPath.isEmpty())
    {
        setMissing("audio for " + ref.arrangementName);
        return false;
    }

    return extract(ref.audioEntryPath, result);
}

//==============================================================================
bool SongLoader::getExtractionTarget(const juce::File& directory, const juce::String& logicalPath, juce::File& target)
{
    // getChildFile löst ".." auf, Pfade aus dem Namensblock sind nicht vertrauenswürdig
    target = directory.getChildFile(logicalPath);

    if (logicalPath.isEmpty() || ! target.isAChildOf(directory))
    {
        target = juce::File();
        return false;
    }

    return true;
}
