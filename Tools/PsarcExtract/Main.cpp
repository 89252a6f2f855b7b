/*
  ==============================================================================

    Main.cpp (psarc_extract)

    Inspect and export files from a .psarc archive.

      psarc_extract <archive> list
      psarc_extract <archive> extract <path|hash> <target>
      psarc_extract <archive> extract-all <directory>
      psarc_extract <archive> info
      psarc_extract <archive> dump <arrangement path>

  ==============================================================================
*/

#include <iostream>
#include "../../Source/SongLoader.h"

namespace
{
    void openArchive(const juce::ArgumentList& args, SongLoader& loader)
    {
        args.checkMinNumArguments(2);
        auto archive = args[0].resolveAsExistingFile();

        if (! loader.open(archive))
            juce::ConsoleApplication::fail("Could not read " + archive.getFullPathName()
                                           + ": " + loader.getLastError().toString());
    }

    juce::String argumentAfter(const juce::ArgumentList& args, const juce::String& command, int offset)
    {
        auto position = args.indexOfOption(command) + offset;
        if (position <= 0 || position >= args.size())
            juce::ConsoleApplication::fail("Missing argument for '" + command + "'");
        return args[position].text;
    }

    juce::String formatTuning(const juce::Array<int>& tuning)
    {
        juce::StringArray parts;
        for (auto offset : tuning)
            parts.add(juce::String(offset));
        return parts.joinIntoString(" ");
    }

    void writeFile(const juce::File& target, const juce::MemoryBlock& data)
    {
        if (! target.getParentDirectory().createDirectory().wasOk()
            || ! target.replaceWithData(data.getData(), data.getSize()))
        {
            juce::ConsoleApplication::fail("Could not write " + target.getFullPathName());
        }
    }

    //==============================================================================
    void listEntries(const juce::ArgumentList& args)
    {
        SongLoader loader;
        openArchive(args, loader);

        const auto& index = loader.getIndex();
        const auto& manifest = loader.getManifest();

        for (const auto& entry : index.entries)
        {
            auto path = manifest.getPath(entry.index);
            if (path.isNotEmpty())
                std::cout << path << "\t" << entry.uncompressedSize << "\n";
        }

        for (auto orphan : manifest.orphanEntries)
        {
            const auto& entry = index.entries.getReference(orphan);
            std::cout << "? " << entry.getHashString() << "\t" << entry.uncompressedSize << "\n";
        }
    }

    void extractEntry(const juce::ArgumentList& args)
    {
        SongLoader loader;
        openArchive(args, loader);

        auto what = argumentAfter(args, "extract", 1);
        auto target = juce::File::getCurrentWorkingDirectory().getChildFile(argumentAfter(args, "extract", 2));

        juce::MemoryBlock data;
        if (! loader.extract(what, data))
            juce::ConsoleApplication::fail(loader.getLastError().toString());

        writeFile(target, data);
        std::cout << "written " << data.getSize() << " bytes to " << target.getFullPathName() << "\n";
    }

    void extractAll(const juce::ArgumentList& args)
    {
        SongLoader loader;
        openArchive(args, loader);

        auto directory = juce::File::getCurrentWorkingDirectory().getChildFile(argumentAfter(args, "extract-all", 1));
        const auto& index = loader.getIndex();
        const auto& manifest = loader.getManifest();
        int written = 0;
        int failed = 0;

        for (const auto& entry : index.entries)
        {
            if (entry.index == 0)
                continue;

            auto path = manifest.getPath(entry.index);
            auto target = directory.getChildFile("_unresolved").getChildFile(entry.getHashString() + ".bin");

            if (path.isNotEmpty() && ! SongLoader::getExtractionTarget(directory, path, target))
            {
                std::cerr << "skipped " << path << ": target outside " << directory.getFullPathName() << "\n";
                ++failed;
                continue;
            }

            juce::MemoryBlock data;
            if (! loader.extractEntry(entry.index, data))
            {
                std::cerr << "skipped " << (path.isNotEmpty() ? path : entry.getHashString())
                          << ": " << loader.getLastError().toString() << "\n";
                ++failed;
                continue;
            }

            writeFile(target, data);
            ++written;
        }

        std::cout << written << " files written to " << directory.getFullPathName();
        if (failed > 0)
            std::cout << ", " << failed << " failed";
        std::cout << "\n";
    }

    void showInfo(const juce::ArgumentList& args)
    {
        SongLoader loader;
        openArchive(args, loader);

        const auto& header = loader.getIndex().header;
        std::cout << "PSARC " << header.versionMajor << "." << header.versionMinor
                  << ", " << ArchiveHeader::compressionToString(header.compression)
                  << ", block size " << header.blockSize
                  << ", " << header.entryCount << " entries"
                  << (header.isTocEncrypted() ? ", encrypted TOC" : "") << "\n";
        std::cout << loader.getManifest().orphanEntries.size() << " unresolved entries\n";

        for (const auto& failure : loader.getManifest().failedManifests)
            std::cout << "skipped manifest: " << failure.toString() << "\n";

        std::cout << "\n";

        for (const auto& song : loader.getSongs())
        {
            std::cout << song.artist << " - " << song.title;
            if (song.album.isNotEmpty())
                std::cout << " (" << song.album << ", " << song.year << ")";
            std::cout << "\n  key " << song.songKey
                      << ", " << juce::String(song.songLength, 1) << " s"
                      << ", " << juce::String(song.averageTempo, 1) << " bpm\n";

            for (const auto& arrangement : song.arrangements)
            {
                std::cout << "  " << arrangement.arrangementName << " [" << arrangement.instrument << "]"
                          << " tiers " << arrangement.difficultyTierCount
                          << ", tuning " << formatTuning(arrangement.tuning);
                if (arrangement.capoFret > 0)
                    std::cout << ", capo " << arrangement.capoFret;
                std::cout << "\n    " << arrangement.arrangementEntryPath
                          << "\n    " << arrangement.audioEntryPath << "\n";
            }

            std::cout << "\n";
        }
    }

    void dumpArrangement(const juce::ArgumentList& args)
    {
        SongLoader loader;
        openArchive(args, loader);

        Arrangement arrangement;
        if (! loader.loadArrangement(argumentAfter(args, "dump", 1), arrangement))
            juce::ConsoleApplication::fail(loader.getLastError().toString());

        std::cout << arrangement.stringCount << " strings, tuning " << formatTuning(arrangement.tuning)
                  << ", " << juce::String(arrangement.songLength, 2) << " s\n";
        std::cout << arrangement.beats.size() << " beats, "
                  << arrangement.chordTemplates.size() << " chord templates\n\n";

        std::cout << "Sections:\n";
        for (const auto& section : arrangement.sections)
            std::cout << "  " << juce::String(section.startTime, 3) << "  " << section.name
                      << " " << section.number << "\n";

        std::cout << "\nPhrases:\n";
        for (const auto& phrase : arrangement.phrases)
            std::cout << "  " << juce::String(phrase.startTime, 3) << "  " << phrase.name
                      << " (max " << phrase.maxDifficulty << ")\n";

        std::cout << "\nLevels:\n";
        for (const auto& level : arrangement.difficultyLevels)
        {
            int chordNotes = 0;
            int linked = 0;
            for (const auto& note : level.notes)
            {
                if (note.chordId >= 0)
                    ++chordNotes;
                if (note.linkedNext >= 0)
                    ++linked;
            }

            std::cout << "  " << level.levelIndex << ": " << level.notes.size() << " notes ("
                      << chordNotes << " from chords, " << linked << " linked)\n";
        }
    }
}

//==============================================================================
int main(int argc, char* argv[])
{
    juce::ConsoleApplication app;

    app.addHelpCommand("--help|-h", "Usage: psarc_extract <archive> <command> [arguments]", true);

    app.addCommand({ "list", "<archive> list",
                     "Lists every path, then unresolved entries by hash", {}, listEntries });

    app.addCommand({ "extract", "<archive> extract <path|hash> <target>",
                     "Writes one entry to a file", {}, extractEntry });

    app.addCommand({ "extract-all", "<archive> extract-all <directory>",
                     "Writes every entry below a directory", {}, extractAll });

    app.addCommand({ "info", "<archive> info",
                     "Shows songs, arrangements, tunings and difficulty tiers", {}, showInfo });

    app.addCommand({ "dump", "<archive> dump <arrangement path>",
                     "Decodes an arrangement and prints its structure", {}, dumpArrangement });

    return app.findAndRunCommand(argc, argv);
}
