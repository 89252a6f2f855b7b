/*
  ==============================================================================

    ArrangementDecoder.h

    Decoder for Rocksmith arrangement files (.sng)

    The plain format is little endian: a fixed sequence of count-prefixed
    sections (beats, phrases, chord templates, ..., difficulty levels,
    metadata), read in a single forward pass.

    Files stored in an archive are wrapped in an encrypted envelope:
      u32 magic (0x4A) | u32 flags | 16 byte IV | AES-CTR payload
    With flag 0x01 the decrypted payload is a u32 size followed by zlib data.

  ==============================================================================
*/

#pragma once

#include <juce_core/juce_core.h>
#include "ArrangementModels.h"
#include "PsarcError.h"
#include <vector>

//==============================================================================
class ArrangementDecoder
{
public:
    ArrangementDecoder();
    ~ArrangementDecoder();

    /** Decodes a plain (already unwrapped) arrangement. */
    bool decode(const juce::MemoryBlock& plainBytes, Arrangement& result);

    /** Unwraps an encrypted envelope and decodes the result. */
    bool decodeEnvelope(const juce::MemoryBlock& envelopeBytes, Arrangement& result);

    const PsarcError& getLastError() const { return lastError; }

    /** Tags errors with the archive entry the bytes came from. */
    void setEntryHash(const juce::String& hash) { entryHash = hash; }

    //==============================================================================
    static constexpr juce::uint32 envelopeMagic = 0x4A;
    static constexpr juce::uint32 envelopeCompressedFlag = 0x01;
    static constexpr int envelopeHeaderSize = 24;

    /** Decrypts (and inflates) an envelope. Throws PsarcException. */
    static juce::MemoryBlock unwrapEnvelope(const juce::MemoryBlock& envelopeBytes);

    /** Archive arrangements live under songs/bin/<platform>/ and are always wrapped. */
    static bool isEnvelopePath(const juce::String& logicalPath);

private:
    //==============================================================================
    // Rohdaten, nur so weit wie für das Modell benötigt
    struct RawPhrase
    {
        juce::String name;
        int maxDifficulty = 0;
    };

    struct RawChordNotes
    {
        std::array<juce::uint32, 6> masks {};
        std::array<int, 6> slideTo {};
        std::array<float, 6> maxBend {};
    };

    struct RawNote
    {
        juce::uint32 mask = 0;
        float time = 0.0f;
        int string = 0;
        int fret = 0;
        int chordId = -1;
        int chordNotesId = -1;
        int parentPrev = -1;
        int slideTo = -1;
        float sustain = 0.0f;
        float maxBend = 0.0f;
    };

    struct RawLevel
    {
        int difficulty = 0;
        std::vector<RawNote> notes;
    };

    //==============================================================================
    std::unique_ptr<juce::MemoryInputStream> inputStream;
    PsarcError lastError;
    juce::String entryHash;

    std::vector<RawPhrase> rawPhrases;
    std::vector<RawChordNotes> rawChordNotes;
    std::vector<RawLevel> rawLevels;

    //==============================================================================
    // High-level reading, in file order
    void readBeats(Arrangement& result);
    void readPhrases();
    void readChordTemplates(Arrangement& result);
    void readChordNotes();
    void readVocals();
    void readPhraseIterations(Arrangement& result);
    void skipPhraseExtraInfo();
    void skipLinkedDifficulties();
    void skipTimedNames();          // Actions und Events
    void skipTimedIds();            // Tones und DNA
    void readSections(Arrangement& result);
    void readLevels();
    RawNote readNote();
    void readMetadata(Arrangement& result);

    // Raw levels -> NoteEvents (Akkorde aufgelöst, Links geprüft)
    void buildLevels(Arrangement& result);
    void buildLevel(const RawLevel& raw, int levelIndex, Arrangement& result);

    //==============================================================================
    // Low-level reading (little endian)
    int readCount(int recordSize);
    void ensureAvailable(juce::int64 numBytes);
    juce::uint8 readU8();
    juce::int8 readI8();
    juce::int16 readI16();
    juce::int32 readI32();
    juce::uint32 readU32();
    float readF32();
    double readF64();
    juce::String readFixedString(int size);
    void skip(juce::int64 numBytes);

    [[noreturn]] void fail(PsarcError::Kind kind, const juce::String& message);

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(ArrangementDecoder)
};
