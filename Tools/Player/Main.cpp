/*
  ==============================================================================

    Main.cpp (smithereens_player)

    Plays one arrangement of a .psarc song against its audio and prints the
    note stream as it happens.

      smithereens_player <archive> [--song N] [--arrangement NAME]
                         [--difficulty N] [--audio FILE] [--settings FILE]

  ==============================================================================
*/

#include <iostream>
#include <juce_events/juce_events.h>
#include "../../Source/SongLoader.h"
#include "../../Source/PlayerSettings.h"
#include "../../Source/PlaybackSession.h"
#include "../../Source/TransportAudioClock.h"

namespace
{
    //==============================================================================
    // Schreibt jedes Update als Zeile auf stdout
    class ConsoleRenderer : public PlaybackSynchronizer::Listener
    {
    public:
        ConsoleRenderer(const PlaybackSynchronizer& s, double lookaheadSeconds)
            : synchronizer(s), lookahead(lookaheadSeconds) {}

        void playbackAdvanced(const PlaybackUpdate& update) override
        {
            auto stamp = juce::String(update.currentTime, 3).paddedLeft(' ', 8);

            if (update.clockRegression)
                std::cout << stamp << "  (clock jumped back)\n";
            if (update.difficultyChanged)
                std::cout << stamp << "  difficulty " << synchronizer.getActiveDifficulty() << "\n";

            for (auto* section : update.enteredSections)
                std::cout << stamp << "  == " << section->name << " " << section->number << " ==\n";

            for (auto* phrase : update.enteredPhrases)
                std::cout << stamp << "  -- " << phrase->name << " ("
                          << synchronizer.getUpcomingNotes(lookahead).size() << " notes ahead)\n";

            for (auto* beat : update.crossedBeats)
                if (beat->isDownbeat)
                    std::cout << stamp << "  | bar " << beat->measureNumber << "\n";

            for (auto* note : update.newlyActiveNotes)
            {
                std::cout << stamp << "  S" << (note->string + 1) << " F" << note->fret;
                if (note->sustain > 0.0)
                    std::cout << " ~" << juce::String(note->sustain, 2);

                auto techniques = NoteTechnique::describe(note->techniques);
                if (techniques.isNotEmpty())
                    std::cout << " " << techniques;
                std::cout << "\n";
            }
        }

        void playbackStateChanged(PlaybackState newState) override
        {
            std::cout << "[" << PlaybackSynchronizer::stateToString(newState) << "]\n";
        }

    private:
        const PlaybackSynchronizer& synchronizer;
        double lookahead;
    };

    //==============================================================================
    juce::File findConvertedAudio(const juce::File& directory, const SongManifest& song)
    {
        if (directory == juce::File())
            return {};

        for (auto extension : { ".ogg", ".wav", ".flac", ".aiff" })
        {
            auto candidate = directory.getChildFile(song.songKey + extension);
            if (candidate.existsAsFile())
                return candidate;
        }

        return {};
    }

    void play(const juce::ArgumentList& args)
    {
        args.checkMinNumArguments(1);
        auto archive = args[0].resolveAsExistingFile();

        PlayerSettings settings;
        auto settingsFile = args.containsOption("--settings")
            ? args.getExistingFileForOption("--settings")
            : PlayerSettings::getDefaultSettingsFile();
        if (settingsFile.existsAsFile() && ! settings.loadFromFile(settingsFile))
            std::cerr << "Ignoring unreadable settings " << settingsFile.getFullPathName() << "\n";

        SongLoader loader;
        if (! loader.open(archive))
            juce::ConsoleApplication::fail(loader.getLastError().toString());

        const auto& songs = loader.getSongs();
        if (songs.isEmpty())
            juce::ConsoleApplication::fail("No songs in " + archive.getFileName());

        auto songIndex = args.containsOption("--song") ? args.getValueForOption("--song").getIntValue() : 0;
        if (! juce::isPositiveAndBelow(songIndex, songs.size()))
            juce::ConsoleApplication::fail("No song " + juce::String(songIndex));

        const auto& song = songs.getReference(songIndex);
        if (song.arrangements.isEmpty())
            juce::ConsoleApplication::fail(song.title + " has no playable arrangement");

        const ArrangementRef* ref = &song.arrangements.getReference(0);
        if (args.containsOption("--arrangement"))
        {
            ref = song.findArrangement(args.getValueForOption("--arrangement"));
            if (ref == nullptr)
                juce::ConsoleApplication::fail("No arrangement " + args.getValueForOption("--arrangement").quoted());
        }

        Arrangement arrangement;
        if (! loader.loadArrangement(*ref, arrangement))
            juce::ConsoleApplication::fail(loader.getLastError().toString());

        auto difficulty = args.containsOption("--difficulty")
            ? args.getValueForOption("--difficulty").getIntValue()
            : settings.getPreferredDifficulty();
        if (difficulty < 0)
            difficulty = arrangement.getLevelCount() - 1;

        juce::MemoryBlock audio;
        auto audioFile = args.containsOption("--audio")
            ? args.getExistingFileForOption("--audio")
            : findConvertedAudio(settings.getAudioOverrideDirectory(), song);

        if (audioFile.existsAsFile())
        {
            if (! audioFile.loadFileAsData(audio))
                juce::ConsoleApplication::fail("Could not read " + audioFile.getFullPathName());
        }
        else if (! loader.loadAudio(*ref, audio))
        {
            juce::ConsoleApplication::fail(loader.getLastError().toString());
        }

        TransportAudioClock clock;
        if (! clock.openOutputDevice())
            juce::ConsoleApplication::fail(clock.getLastError());

        PlaybackSession session(clock);
        session.setLatencyOffset(settings.getLatencyOffsetSeconds());

        ConsoleRenderer renderer(session.getSynchronizer(), settings.getLookaheadSeconds());
        session.getSynchronizer().addListener(&renderer);

        std::cout << song.artist << " - " << song.title << " / " << ref->arrangementName
                  << " (level " << difficulty << " of " << arrangement.getLevelCount() << ")\n";

        try
        {
            if (! session.begin(arrangement, audio, difficulty))
                juce::ConsoleApplication::fail("Audio could not be decoded; convert "
                                               + ref->audioEntryPath + " and pass it with --audio");
        }
        catch (const PsarcException& e)
        {
            juce::ConsoleApplication::fail(e.getError().toString());
        }

        while (! session.hasFinished())
        {
            session.tick();
            juce::Thread::sleep(15);
        }

        session.stop();
        session.getSynchronizer().removeListener(&renderer);

        std::cout << session.getSynchronizer().getRegressionCount() << " clock regressions\n";

        settings.setLastArchive(archive.getFullPathName());
        if (! settings.saveToFile(settingsFile))
            std::cerr << "Could not save " << settingsFile.getFullPathName() << "\n";
    }
}

//==============================================================================
int main(int argc, char* argv[])
{
    juce::ScopedJuceInitialiser_GUI juceInitialiser;   // AudioDeviceManager braucht den MessageManager

    juce::ConsoleApplication app;

    app.addHelpCommand("--help|-h",
                       "Usage: smithereens_player <archive> [--song N] [--arrangement NAME] "
                       "[--difficulty N] [--audio FILE] [--settings FILE]",
                       true);

    app.addDefaultCommand({ "", "<archive> [options]", "Plays an arrangement", {}, play });

    return app.findAndRunCommand(argc, argv);
}
