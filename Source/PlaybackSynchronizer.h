/*
  ==============================================================================

    PlaybackSynchronizer.h

    Keeps a cursor into a decoded Arrangement in step with the audio clock.

    Real-time playback only moves forward, so advance() walks the ordered
    event lists incrementally from the last position. Seeks and clock
    regressions rebuild the cursor by binary search instead.

    An event at time e counts as crossed once e <= t. After start() or
    seek(target) nothing at target has been crossed yet; the next advance()
    reports it.

  ==============================================================================
*/

#pragma once

#include <juce_core/juce_core.h>
#include "ArrangementModels.h"
#include "PsarcError.h"
#include <mutex>
#include <vector>

//==============================================================================
enum class PlaybackState
{
    Stopped,
    Playing,
    Paused,
    Seeking
};

//==============================================================================
// Ergebnis eines advance()-Aufrufs; Zeiger zeigen in das Arrangement
//==============================================================================
struct PlaybackUpdate
{
    double currentTime = 0.0;
    juce::Array<const NoteEvent*> newlyActiveNotes;
    juce::Array<const NoteEvent*> expiredNotes;
    juce::Array<const NoteEvent*> activeNotes;
    juce::Array<const Beat*> crossedBeats;
    juce::Array<const Phrase*> enteredPhrases;
    juce::Array<const Section*> enteredSections;
    bool clockRegression = false;
    bool difficultyChanged = false;

    bool hasEvents() const
    {
        return ! newlyActiveNotes.isEmpty() || ! expiredNotes.isEmpty()
            || ! crossedBeats.isEmpty() || ! enteredPhrases.isEmpty()
            || ! enteredSections.isEmpty() || clockRegression || difficultyChanged;
    }
};

//==============================================================================
struct PlaybackCursor
{
    double currentTime = 0.0;
    int activeDifficulty = 0;
    std::vector<int> nextNoteIndexPerString;    // Index in die Notenliste der Saite
    int nextBeatIndex = 0;
    int nextPhraseIndex = 0;
    int nextSectionIndex = 0;
};

//==============================================================================
// Kopie des zuletzt festgeschriebenen Zustands, für andere Threads
//==============================================================================
struct PlaybackSnapshot
{
    PlaybackState state = PlaybackState::Stopped;
    double currentTime = 0.0;
    int activeDifficulty = 0;
    juce::Array<NoteEvent> activeNotes;
    int lastBeatIndex = -1;
    int currentPhraseIndex = -1;
    int currentSectionIndex = -1;
    int regressionCount = 0;
};

//==============================================================================
class PlaybackSynchronizer
{
public:
    //==============================================================================
    class Listener
    {
    public:
        virtual ~Listener() = default;

        virtual void playbackAdvanced(const PlaybackUpdate& update) = 0;
        virtual void playbackStateChanged(PlaybackState) {}
    };

    //==============================================================================
    PlaybackSynchronizer();
    ~PlaybackSynchronizer();

    /** Resets the cursor to time 0 and starts playing.
        The arrangement must outlive playback.
        Throws PsarcException(NoSuchDifficulty) for an invalid level.
    */
    void start(const Arrangement& arrangement, int difficulty);

    /** Moves the cursor to audioTime. A time before the current one is
        handled as a clock regression (implicit seek).
        Returns an empty update while stopped or paused.
    */
    PlaybackUpdate advance(double audioTime);

    void seek(double targetTime);

    /** Swaps the note level, keeps the time. Reported by the next advance(). */
    void setDifficulty(int level);

    void pause();
    void resume();

    /** Discards the cursor. */
    void stop();

    //==============================================================================
    PlaybackState getState() const { return state; }
    double getCurrentTime() const { return cursor.currentTime; }
    int getActiveDifficulty() const { return cursor.activeDifficulty; }
    int getRegressionCount() const { return regressionCount; }
    const Arrangement* getArrangement() const { return arrangement; }
    const PlaybackCursor& getCursor() const { return cursor; }

    /** Notes of the active level not yet crossed and starting within window seconds. */
    juce::Array<const NoteEvent*> getUpcomingNotes(double window) const;

    /** Thread-safe copy of the committed state. */
    PlaybackSnapshot getSnapshot() const;

    void addListener(Listener* listener) { listeners.add(listener); }
    void removeListener(Listener* listener) { listeners.remove(listener); }

    static juce::String stateToString(PlaybackState state);

private:
    //==============================================================================
    const Arrangement* arrangement = nullptr;
    const DifficultyLevel* level = nullptr;
    std::vector<std::vector<int>> notesByString;   // Notenindizes pro Saite, nach Zeit

    PlaybackCursor cursor;
    PlaybackState state = PlaybackState::Stopped;

    bool hasCrossedCurrentTime = false;     // Wurden Events genau bei currentTime schon gemeldet?
    bool difficultyChangePending = false;
    int regressionCount = 0;

    std::vector<const NoteEvent*> activeNotes;      // Aktiv laut Cursor
    std::vector<const NoteEvent*> reportedNotes;    // Aktiv laut letztem Update

    mutable std::mutex snapshotMutex;
    PlaybackSnapshot snapshot;

    juce::ListenerList<Listener> listeners;

    //==============================================================================
    void validateDifficulty(const Arrangement& target, int difficulty) const;
    void selectLevel(int difficulty);
    void rebuildNoteCursor();
    void rebuildTimelineCursors();
    void stepForward(double audioTime, PlaybackUpdate& update);
    void setState(PlaybackState newState);
    void publishSnapshot();

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(PlaybackSynchronizer)
};
