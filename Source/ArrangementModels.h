/*
  ==============================================================================

    ArrangementModels.h

    Datenmodell einer dekodierten Arrangement-Datei (.sng)
    Alle Zeiten in Sekunden ab Songbeginn (Ursprung der Audiospur)

  ==============================================================================
*/

#pragma once

#include <juce_core/juce_core.h>
#include <array>

//==============================================================================
// Technik-Bits einer Note (Werte wie in der .sng-Notenmaske)
//==============================================================================
struct NoteTechnique
{
    static constexpr juce::uint32 chord           = 0x00000002;
    static constexpr juce::uint32 open            = 0x00000004;
    static constexpr juce::uint32 fretHandMute    = 0x00000008;
    static constexpr juce::uint32 tremolo         = 0x00000010;
    static constexpr juce::uint32 harmonic        = 0x00000020;
    static constexpr juce::uint32 palmMute        = 0x00000040;
    static constexpr juce::uint32 slap            = 0x00000080;
    static constexpr juce::uint32 pluck           = 0x00000100;
    static constexpr juce::uint32 hammerOn        = 0x00000200;
    static constexpr juce::uint32 pullOff         = 0x00000400;
    static constexpr juce::uint32 slide           = 0x00000800;
    static constexpr juce::uint32 bend            = 0x00001000;
    static constexpr juce::uint32 sustain         = 0x00002000;
    static constexpr juce::uint32 tap             = 0x00004000;
    static constexpr juce::uint32 pinchHarmonic   = 0x00008000;
    static constexpr juce::uint32 vibrato         = 0x00010000;
    static constexpr juce::uint32 mute            = 0x00020000;
    static constexpr juce::uint32 ignore          = 0x00040000;
    static constexpr juce::uint32 slideUnpitched  = 0x00400000;
    static constexpr juce::uint32 single          = 0x00800000;
    static constexpr juce::uint32 chordNotes      = 0x01000000;
    static constexpr juce::uint32 doubleStop      = 0x02000000;
    static constexpr juce::uint32 accent          = 0x04000000;
    static constexpr juce::uint32 linkNext        = 0x08000000;   // Parent: geht in die nächste Note über
    static constexpr juce::uint32 linkedFromPrev  = 0x10000000;   // Child
    static constexpr juce::uint32 arpeggio        = 0x20000000;

    // Kurzform für Konsolen-Ausgabe, z.B. "HO PM SL"
    static juce::String describe(juce::uint32 techniques);
};

//==============================================================================
struct Beat
{
    double time = 0.0;
    int measureNumber = -1;     // -1 für Beats innerhalb eines Takts
    bool isDownbeat = false;    // Erster Schlag eines Takts
};

//==============================================================================
struct NoteEvent
{
    double startTime = 0.0;
    double sustain = 0.0;               // >= 0
    int string = 0;                     // 0 = tiefste Saite
    int fret = 0;                       // 0 = Leersaite
    juce::uint32 techniques = 0;        // NoteTechnique-Bits
    int linkedNext = -1;                // Index der Folgenote auf derselben Saite, -1 = keine
    int chordId = -1;                   // Akkord-Template bei aufgelösten Akkorden
    int slideTo = -1;
    float bendMax = 0.0f;               // In Halbtönen

    double getEndTime() const { return startTime + sustain; }

    bool hasTechnique(juce::uint32 bit) const { return (techniques & bit) != 0; }

    // Aktiv solange start <= t < start + sustain
    bool isActiveAt(double t) const { return startTime <= t && t < getEndTime(); }
};

//==============================================================================
// Eine Schwierigkeitsstufe: Noten nach Startzeit sortiert
//==============================================================================
struct DifficultyLevel
{
    int levelIndex = 0;                 // 0 = leichteste Stufe
    juce::Array<NoteEvent> notes;
};

//==============================================================================
struct Phrase
{
    juce::String name;
    double startTime = 0.0;
    double endTime = 0.0;
    int maxDifficulty = 0;
};

struct Section
{
    juce::String name;                  // z.B. "verse", "chorus"
    int number = 0;                     // Wiederholungszähler ("chorus 2")
    double startTime = 0.0;
    double endTime = 0.0;
};

//==============================================================================
struct ChordTemplate
{
    juce::String name;
    std::array<int, 6> frets { { -1, -1, -1, -1, -1, -1 } };     // -1 = Saite nicht gespielt
    std::array<int, 6> fingers { { -1, -1, -1, -1, -1, -1 } };

    int getPlayedStringCount() const
    {
        int count = 0;
        for (auto f : frets)
            if (f >= 0)
                ++count;
        return count;
    }
};

//==============================================================================
// Das komplette Arrangement (nach dem Dekodieren unveränderlich)
//==============================================================================
struct Arrangement
{
    juce::Array<Beat> beats;
    juce::Array<Phrase> phrases;
    juce::Array<Section> sections;
    juce::Array<DifficultyLevel> difficultyLevels;
    juce::Array<ChordTemplate> chordTemplates;

    int stringCount = 6;
    juce::Array<int> tuning;            // Halbton-Abweichung pro Saite von E-Standard
    int capoFret = 0;
    double songLength = 0.0;

    int getLevelCount() const { return difficultyLevels.size(); }

    const DifficultyLevel* getLevel(int levelIndex) const
    {
        if (levelIndex < 0 || levelIndex >= difficultyLevels.size())
            return nullptr;
        return &difficultyLevels.getReference(levelIndex);
    }
};
