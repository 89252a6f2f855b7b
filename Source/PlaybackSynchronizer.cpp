/*
  ==============================================================================

    PlaybackSynchronizer.cpp

  ==============================================================================
*/

#include "PlaybackSynchronizer.h"
#include <algorithm>

namespace
{
    bool containsNote(const std::vector<const NoteEvent*>& notes, const NoteEvent* note)
    {
        return std::find(notes.begin(), notes.end(), note) != notes.end();
    }

    // Erster Index, dessen Zeit noch nicht überschritten ist
    template <typename ElementType, typename TimeFunction>
    int firstUncrossed(const juce::Array<ElementType>& items, double time, bool includeTime, TimeFunction getTime)
    {
        auto begin = items.begin();
        auto end = items.end();

        auto it = includeTime
            ? std::upper_bound(begin, end, time, [&] (double t, const ElementType& e) { return t < getTime(e); })
            : std::lower_bound(begin, end, time, [&] (const ElementType& e, double t) { return getTime(e) < t; });

        return static_cast<int>(it - begin);
    }
}

//==============================================================================
PlaybackSynchronizer::PlaybackSynchronizer() {}
PlaybackSynchronizer::~PlaybackSynchronizer() {}

juce::String PlaybackSynchronizer::stateToString(PlaybackState s)
{
    switch (s)
    {
        case PlaybackState::Stopped: return "Stopped";
        case PlaybackState::Playing: return "Playing";
        case PlaybackState::Paused:  return "Paused";
        case PlaybackState::Seeking: return "Seeking";
    }

    return "Unknown";
}

//==============================================================================
void PlaybackSynchronizer::start(const Arrangement& newArrangement, int difficulty)
{
    validateDifficulty(newArrangement, difficulty);

    arrangement = &newArrangement;
    cursor = PlaybackCursor();
    hasCrossedCurrentTime = false;
    difficultyChangePending = false;
    regressionCount = 0;
    activeNotes.clear();
    reportedNotes.clear();

    selectLevel(difficulty);
    rebuildNoteCursor();
    rebuildTimelineCursors();

    DBG("Playback start: level " << difficulty << " of " << arrangement->getLevelCount()
        << ", " << level->notes.size() << " notes");

    setState(PlaybackState::Playing);
}

PlaybackUpdate PlaybackSynchronizer::advance(double audioTime)
{
    PlaybackUpdate update;
    update.currentTime = cursor.currentTime;

    if (state != PlaybackState::Playing || arrangement == nullptr)
        return update;

    if (audioTime < cursor.currentTime)
    {
        // Rücksprung ohne seek(): wie ein Seek behandeln, dann normal weiter
        ++regressionCount;
        juce::Logger::writeToLog("Clock regression " + juce::String(cursor.currentTime, 3)
                                 + "s -> " + juce::String(audioTime, 3) + "s (#"
                                 + juce::String(regressionCount) + ")");

        update.clockRegression = true;
        cursor.currentTime = audioTime;
        hasCrossedCurrentTime = true;   // alles bis audioTime wurde vor dem Rücksprung schon gemeldet
        rebuildNoteCursor();
        rebuildTimelineCursors();
    }

    update.difficultyChanged = difficultyChangePending;
    difficultyChangePending = false;

    stepForward(audioTime, update);
    publishSnapshot();

    listeners.call([&update] (Listener& l) { l.playbackAdvanced(update); });
    return update;
}

void PlaybackSynchronizer::seek(double targetTime)
{
    if (state == PlaybackState::Stopped || arrangement == nullptr)
        return;

    auto previousState = state;
    state = PlaybackState::Seeking;

    cursor.currentTime = juce::jmax(0.0, targetTime);
    hasCrossedCurrentTime = false;
    rebuildNoteCursor();
    rebuildTimelineCursors();

    state = previousState;
    publishSnapshot();
}

void PlaybackSynchronizer::setDifficulty(int newLevel)
{
    if (arrangement == nullptr)
        throw PsarcException(PsarcError::Kind::NoSuchDifficulty,
                             "no arrangement loaded for difficulty " + juce::String(newLevel));

    validateDifficulty(*arrangement, newLevel);

    if (newLevel == cursor.activeDifficulty && level != nullptr)
        return;

    selectLevel(newLevel);

    if (state != PlaybackState::Stopped)
    {
        rebuildNoteCursor();
        difficultyChangePending = true;
        publishSnapshot();
    }
}

void PlaybackSynchronizer::pause()
{
    if (state == PlaybackState::Playing)
        setState(PlaybackState::Paused);
}

void PlaybackSynchronizer::resume()
{
    if (state == PlaybackState::Paused)
        setState(PlaybackState::Playing);
}

void PlaybackSynchronizer::stop()
{
    if (state == PlaybackState::Stopped)
        return;

    auto keptDifficulty = cursor.activeDifficulty;
    cursor = PlaybackCursor();
    cursor.activeDifficulty = keptDifficulty;
    notesByString.clear();
    activeNotes.clear();
    reportedNotes.clear();
    hasCrossedCurrentTime = false;
    difficultyChangePending = false;

    setState(PlaybackState::Stopped);
}

//==============================================================================
juce::Array<const NoteEvent*> PlaybackSynchronizer::getUpcomingNotes(double window) const
{
    juce::Array<const NoteEvent*> upcoming;

    if (level == nullptr || state == PlaybackState::Stopped)
        return upcoming;

    const auto horizon = cursor.currentTime + window;

    for (size_t s = 0; s < notesByString.size(); ++s)
    {
        const auto& indices = notesByString[s];
        for (auto i = static_cast<size_t>(cursor.nextNoteIndexPerString[s]); i < indices.size(); ++i)
        {
            const auto& note = level->notes.getReference(indices[i]);
            if (note.startTime > horizon)
                break;
            upcoming.add(&note);
        }
    }

    std::sort(upcoming.begin(), upcoming.end(), [] (const NoteEvent* a, const NoteEvent* b)
    {
        return a->startTime < b->startTime || (a->startTime == b->startTime && a->string < b->string);
    });

    return upcoming;
}

PlaybackSnapshot PlaybackSynchronizer::getSnapshot() const
{
    std::lock_guard<std::mutex> lock(snapshotMutex);
    return snapshot;
}

//==============================================================================
void PlaybackSynchronizer::validateDifficulty(const Arrangement& target, int difficulty) const
{
    if (difficulty < 0 || difficulty >= target.getLevelCount())
        throw PsarcException(PsarcError::Kind::NoSuchDifficulty,
                             "difficulty " + juce::String(difficulty) + " requested, arrangement has "
                                 + juce::String(target.getLevelCount()) + " levels");
}

void PlaybackSynchronizer::selectLevel(int difficulty)
{
    cursor.activeDifficulty = difficulty;
    level = arrangement->getLevel(difficulty);

    int stringCount = arrangement->stringCount;
    for (const auto& note : level->notes)
        stringCount = juce::jmax(stringCount, note.string + 1);

    notesByString.assign(static_cast<size_t>(stringCount), {});
    for (int i = 0; i < level->notes.size(); ++i)
        notesByString[static_cast<size_t>(level->notes.getReference(i).string)].push_back(i);
}

void PlaybackSynchronizer::rebuildNoteCursor()
{
    const auto t = cursor.currentTime;
    const auto& notes = level->notes;

    cursor.nextNoteIndexPerString.assign(notesByString.size(), 0);
    activeNotes.clear();

    for (size_t s = 0; s < notesByString.size(); ++s)
    {
        const auto& indices = notesByString[s];

        auto it = hasCrossedCurrentTime
            ? std::upper_bound(indices.begin(), indices.end(), t,
                               [&] (double time, int i) { return time < notes.getReference(i).startTime; })
            : std::lower_bound(indices.begin(), indices.end(), t,
                               [&] (int i, double time) { return notes.getReference(i).startTime < time; });

        cursor.nextNoteIndexPerString[s] = static_cast<int>(it - indices.begin());

        // Bereits überschrittene Noten, die noch klingen
        for (auto crossed = indices.begin(); crossed != it; ++crossed)
        {
            const auto& note = notes.getReference(*crossed);
            if (note.isActiveAt(t))
                activeNotes.push_back(&note);
        }
    }
}

void PlaybackSynchronizer::rebuildTimelineCursors()
{
    const auto t = cursor.currentTime;

    cursor.nextBeatIndex = firstUncrossed(arrangement->beats, t, hasCrossedCurrentTime,
                                          [] (const Beat& b) { return b.time; });
    cursor.nextPhraseIndex = firstUncrossed(arrangement->phrases, t, hasCrossedCurrentTime,
                                            [] (const Phrase& p) { return p.startTime; });
    cursor.nextSectionIndex = firstUncrossed(arrangement->sections, t, hasCrossedCurrentTime,
                                             [] (const Section& s) { return s.startTime; });
}

//==============================================================================
void PlaybackSynchronizer::stepForward(double audioTime, PlaybackUpdate& update)
{
    const auto& notes = level->notes;
    std::vector<const NoteEvent*> crossed;

    for (size_t s = 0; s < notesByString.size(); ++s)
    {
        const auto& indices = notesByString[s];
        auto& next = cursor.nextNoteIndexPerString[s];

        while (next < static_cast<int>(indices.size())
               && notes.getReference(indices[(size_t) next]).startTime <= audioTime)
        {
            crossed.push_back(&notes.getReference(indices[(size_t) next]));
            ++next;
        }
    }

    const auto& beats = arrangement->beats;
    while (cursor.nextBeatIndex < beats.size() && beats.getReference(cursor.nextBeatIndex).time <= audioTime)
        update.crossedBeats.add(&beats.getReference(cursor.nextBeatIndex++));

    const auto& phrases = arrangement->phrases;
    while (cursor.nextPhraseIndex < phrases.size() && phrases.getReference(cursor.nextPhraseIndex).startTime <= audioTime)
        update.enteredPhrases.add(&phrases.getReference(cursor.nextPhraseIndex++));

    const auto& sections = arrangement->sections;
    while (cursor.nextSectionIndex < sections.size() && sections.getReference(cursor.nextSectionIndex).startTime <= audioTime)
        update.enteredSections.add(&sections.getReference(cursor.nextSectionIndex++));

    // Neue aktive Menge: was noch klingt plus frisch überschrittene Noten
    std::vector<const NoteEvent*> nowActive;
    for (auto* note : activeNotes)
        if (note->isActiveAt(audioTime))
            nowActive.push_back(note);
    for (auto* note : crossed)
        if (note->isActiveAt(audioTime))
            nowActive.push_back(note);

    auto byTime = [] (const NoteEvent* a, const NoteEvent* b)
    {
        return a->startTime < b->startTime || (a->startTime == b->startTime && a->string < b->string);
    };

    std::sort(crossed.begin(), crossed.end(), byTime);
    std::sort(nowActive.begin(), nowActive.end(), byTime);

    // Überschrittene Noten immer melden, auch ohne Sustain
    for (auto* note : crossed)
        update.newlyActiveNotes.add(note);

    for (auto* note : nowActive)
        if (! containsNote(reportedNotes, note) && ! containsNote(crossed, note))
            update.newlyActiveNotes.add(note);

    for (auto* note : reportedNotes)
        if (! containsNote(nowActive, note))
            update.expiredNotes.add(note);

    for (auto* note : nowActive)
        update.activeNotes.add(note);

    activeNotes = nowActive;
    reportedNotes = nowActive;

    cursor.currentTime = audioTime;
    hasCrossedCurrentTime = true;
    update.currentTime = audioTime;
}

//==============================================================================
void PlaybackSynchronizer::setState(PlaybackState newState)
{
    if (state == newState)
        return;

    DBG("Playback: " << stateToString(state) << " -> " << stateToString(newState));

    state = newState;
    publishSnapshot();

    listeners.call([newState] (Listener& l) { l.playbackStateChanged(newState); });
}

void PlaybackSynchronizer::publishSnapshot()
{
    PlaybackSnapshot fresh;
    fresh.state = state;
    fresh.currentTime = cursor.currentTime;
    fresh.activeDifficulty = cursor.activeDifficulty;
    fresh.lastBeatIndex = cursor.nextBeatIndex - 1;
    fresh.currentPhraseIndex = cursor.nextPhraseIndex - 1;
    fresh.currentSectionIndex = cursor.nextSectionIndex - 1;
    fresh.regressionCount = regressionCount;

    for (auto* note : activeNotes)
        fresh.activeNotes.add(*note);

    std::lock_guard<std::mutex> lock(snapshotMutex);
    snapshot = std::move(fresh);
}
