/*
  ==============================================================================

    ManifestResolver.cpp

  ==============================================================================
*/

#include "ManifestResolver.h"
#include "BlockDecompressor.h"
#include "SoundBank.h"

namespace
{
    juce::String readJsonString(const juce::var& object, const char* name)
    {
        auto value = object[name];
        return value.isVoid() ? juce::String() : value.toString();
    }

    juce::Array<int> readTuning(const juce::var& attributes)
    {
        juce::Array<int> tuning;
        auto tuningObject = attributes["Tuning"];

        if (tuningObject.isObject())
            for (int s = 0; s < 6; ++s)
                tuning.add(static_cast<int>(tuningObject[juce::Identifier("string" + juce::String(s))]));

        return tuning;
    }

    bool isVocalArrangement(const juce::String& arrangementName)
    {
        return arrangementName.containsIgnoreCase("vocals");
    }
}

//==============================================================================
const ArrangementRef* SongManifest::findArrangement(const juce::String& name) const
{
    for (const auto& arrangement : arrangements)
        if (arrangement.arrangementName.equalsIgnoreCase(name))
            return &arrangement;

    return nullptr;
}

//==============================================================================
int ManifestResolution::findEntryByPath(const juce::String& logicalPath) const
{
    auto it = pathToEntry.find(PathHash::normalise(logicalPath));
    return it != pathToEntry.end() ? it->second : -1;
}

int ManifestResolution::findEntryByHash(const ArchiveIndex& index, const juce::String& hexHash)
{
    NameHash hash;
    if (! PathHash::fromHex(hexHash, hash))
        return -1;

    auto* entry = index.findByHash(hash);
    return entry != nullptr ? entry->index : -1;
}

juce::StringArray ManifestResolution::getAllPaths() const
{
    juce::StringArray paths;
    for (const auto& path : entryPaths)
        if (path.isNotEmpty())
            paths.add(path);
    return paths;
}

//==============================================================================
bool ManifestResolver::resolve(const ArchiveIndex& index, ByteSource& source, ManifestResolution& result)
{
    lastError = {};
    result = ManifestResolution();
    audioPathCache.clear();

    try
    {
        resolvePaths(index, source, result);
        readSongManifests(index, source, result);

        DBG("Manifest: " << (int) result.pathToEntry.size() << " paths, "
            << result.orphanEntries.size() << " orphans, "
            << result.songs.size() << " songs");
        return true;
    }
    catch (const PsarcException& e)
    {
        lastError = e.getError();
        DBG("Manifest error: " << lastError.toString());
    }

    result = ManifestResolution();
    return false;
}

//==============================================================================
juce::StringArray ManifestResolver::splitNamesBlock(const juce::MemoryBlock& namesBlock)
{
    juce::StringArray lines;
    lines.addLines(namesBlock.toString());     // \n und \r\n

    lines.trim();
    lines.removeEmptyStrings();
    return lines;
}

juce::String ManifestResolver::assetNameFromUrn(const juce::String& urn)
{
    return urn.fromLastOccurrenceOf(":", false, false).trim();
}

//==============================================================================
void ManifestResolver::resolvePaths(const ArchiveIndex& index, ByteSource& source, ManifestResolution& result)
{
    if (index.entries.isEmpty())
        throw PsarcException(PsarcError::Kind::CorruptEntry, "archive has no names block");

    auto names = BlockDecompressor::decompressEntry(index, index.entries.getReference(0), source);
    auto lines = splitNamesBlock(names);

    std::map<NameHash, int> hashToEntry;
    for (int i = 1; i < index.entries.size(); ++i)
    {
        const auto& entry = index.entries.getReference(i);
        if (! hashToEntry.emplace(entry.nameHash, i).second)
            DBG("Manifest: entry " << i << " repeats hash " << entry.getHashString());
    }

    for (int i = 0; i < index.entries.size(); ++i)
        result.entryPaths.add(juce::String());

    for (const auto& line : lines)
    {
        auto path = PathHash::normalise(line);
        auto hash = PathHash::hashPath(path);
        auto it = hashToEntry.find(hash);

        if (it == hashToEntry.end())
            throw PsarcException(PsarcError::Kind::CorruptEntry,
                                 "names block lists " + path.quoted() + " but no entry has hash "
                                     + PathHash::toHex(hash),
                                 -1, PathHash::toHex(hash));

        const int entryIndex = it->second;

        if (result.entryPaths[entryIndex].isNotEmpty())
            throw PsarcException(PsarcError::Kind::CorruptEntry,
                                 path.quoted() + " and " + result.entryPaths[entryIndex].quoted()
                                     + " both resolve to entry " + juce::String(entryIndex),
                                 -1, PathHash::toHex(hash));

        result.entryPaths.set(entryIndex, path);
        result.pathToEntry[path] = entryIndex;
    }

    for (int i = 1; i < index.entries.size(); ++i)
    {
        if (result.entryPaths[i].isEmpty())
        {
            result.orphanEntries.add(i);
            juce::Logger::writeToLog("Unresolved archive entry " + juce::String(i)
                                     + " (hash " + index.entries.getReference(i).getHashString() + ")");
        }
    }
}

//==============================================================================
void ManifestResolver::readSongManifests(const ArchiveIndex& index, ByteSource& source, ManifestResolution& result)
{
    for (const auto& [path, entryIndex] : result.pathToEntry)
    {
        if (! path.startsWith("manifests/") || ! path.endsWith(".json"))
            continue;

        try
        {
            readSongManifestEntry(path, entryIndex, index, source, result);
        }
        catch (const PsarcException& e)
        {
            // Ein kaputtes Manifest kostet nur diesen Song
            result.failedManifests.add(e.getError());
            juce::Logger::writeToLog("Skipping song manifest " + path + ": " + e.getError().toString());
        }
    }
}

void ManifestResolver::readSongManifestEntry(const juce::String& path, int entryIndex, const ArchiveIndex& index,
                                             ByteSource& source, ManifestResolution& result)
{
    auto bytes = BlockDecompressor::decompressEntry(index, index.entries.getReference(entryIndex), source);

    // UTF-8 BOM ist erlaubt
    auto text = juce::String::fromUTF8(static_cast<const char*>(bytes.getData()),
                                       static_cast<int>(bytes.getSize()));
    if (text.startsWithChar(juce::juce_wchar(0xfeff)))
        text = text.substring(1);

    juce::var json;
    auto parseResult = juce::JSON::parse(text, json);

    if (parseResult.failed() || ! json.isObject())
        throw PsarcException(PsarcError::Kind::CorruptEntry,
                             "song manifest " + path.quoted() + " is not valid JSON: "
                                 + parseResult.getErrorMessage(),
                             -1, index.entries.getReference(entryIndex).getHashString());

    readSongManifest(path, json, index, source, result);
}

void ManifestResolver::readSongManifest(const juce::String& manifestPath, const juce::var& json,
                                        const ArchiveIndex& index, ByteSource& source,
                                        ManifestResolution& result)
{
    auto* entries = json["Entries"].getDynamicObject();
    if (entries == nullptr)
    {
        DBG("Manifest: " << manifestPath << " has no Entries");
        return;
    }

    for (const auto& property : entries->getProperties())
    {
        auto attributes = property.value["Attributes"];
        if (! attributes.isObject())
            continue;

        ArrangementRef arrangement;
        arrangement.arrangementName = readJsonString(attributes, "ArrangementName");

        if (isVocalArrangement(arrangement.arrangementName))
            continue;

        auto songKey = readJsonString(attributes, "SongKey");
        if (songKey.isEmpty())
            songKey = readJsonString(attributes, "DLCKey");
        if (songKey.isEmpty())
            songKey = manifestPath.fromLastOccurrenceOf("/", false, false).upToFirstOccurrenceOf("_", false, false);

        arrangement.instrument = arrangement.arrangementName.equalsIgnoreCase("bass") ? "bass" : "guitar";
        arrangement.difficultyTierCount = static_cast<int>(attributes["MaxPhraseDifficulty"]) + 1;
        arrangement.manifestEntryPath = manifestPath;
        arrangement.arrangementEntryPath = findArrangementPath(readJsonString(attributes, "SongAsset"), result);
        arrangement.audioEntryPath = findAudioPath(readJsonString(attributes, "SongBank"), index, source, result);
        arrangement.tuning = readTuning(attributes);
        arrangement.capoFret = juce::jmax(0, static_cast<int>(attributes["CapoFret"]));
        arrangement.centOffset = static_cast<double>(attributes["CentOffset"]);

        SongManifest* song = nullptr;
        for (auto& existing : result.songs)
            if (existing.songKey == songKey)
                song = &existing;

        if (song == nullptr)
        {
            SongManifest fresh;
            fresh.songKey = songKey;
            fresh.title = readJsonString(attributes, "SongName");
            fresh.artist = readJsonString(attributes, "ArtistName");
            fresh.album = readJsonString(attributes, "AlbumName");
            fresh.year = static_cast<int>(attributes["SongYear"]);
            fresh.songLength = static_cast<double>(attributes["SongLength"]);
            fresh.averageTempo = static_cast<double>(attributes["SongAverageTempo"]);
            fresh.tuning = arrangement.tuning;
            result.songs.add(fresh);
            song = &result.songs.getReference(result.songs.size() - 1);
        }

        DBG("Manifest: " << songKey << " / " << arrangement.arrangementName
            << " -> " << arrangement.arrangementEntryPath);

        song->arrangements.add(arrangement);
    }
}

//==============================================================================
juce::String ManifestResolver::findArrangementPath(const juce::String& songAsset,
                                                   const ManifestResolution& result) const
{
    auto assetName = assetNameFromUrn(songAsset).toLowerCase();
    if (assetName.isEmpty())
        return {};

    const auto fileName = "/" + assetName + ".sng";

    for (const auto& [path, entryIndex] : result.pathToEntry)
        if (path.startsWith("songs/bin/") && path.endsWith(fileName))
            return path;

    // Nicht im Archiv: Standardplattform annehmen, Laden meldet MissingEntry
    return "songs/bin/generic" + fileName;
}

juce::String ManifestResolver::findAudioPath(const juce::String& songBank, const ArchiveIndex& index,
                                             ByteSource& source, const ManifestResolution& result)
{
    auto bankName = PathHash::normalise(songBank);
    if (bankName.isEmpty())
        return {};

    auto cached = audioPathCache.find(bankName);
    if (cached != audioPathCache.end())
        return cached->second;

    juce::String bankPath;
    for (const auto& [path, entryIndex] : result.pathToEntry)
        if (path == bankName || path.endsWith("/" + bankName))
            bankPath = path;

    if (bankPath.isEmpty())
    {
        DBG("Manifest: sound bank " << bankName << " not in archive");
        return audioPathCache[bankName] = juce::String();
    }

    juce::String audioPath = bankPath;
    juce::MemoryBlock bankBytes;

    try
    {
        bankBytes = BlockDecompressor::decompressEntry(index, index.entries.getReference(result.findEntryByPath(bankPath)),
                                                       source);
    }
    catch (const PsarcException& e)
    {
        juce::Logger::writeToLog("Sound bank " + bankPath + " unreadable: " + e.getError().toString());
        return audioPathCache[bankName] = audioPath;
    }

    SoundBank bank;
    if (bank.parse(bankBytes))
    {
        for (const auto& wemName : bank.getWemFileNames())
        {
            for (const auto& [path, entryIndex] : result.pathToEntry)
            {
                if (path.endsWith("/" + wemName))
                {
                    audioPath = path;
                    break;
                }
            }

            if (audioPath != bankPath)
                break;
        }
    }
    else
    {
        DBG("Manifest: " << bankPath << ": " << bank.getLastError().toString());
    }

    return audioPathCache[bankName] = audioPath;
}
