/*
  ==============================================================================

    PsarcError.h

    Error taxonomy shared by the archive reader, the manifest resolver,
    the arrangement decoder and the playback synchronizer.

  ==============================================================================
*/

#pragma once

#include <juce_core/juce_core.h>
#include <stdexcept>

//==============================================================================
struct PsarcError
{
    enum class Kind
    {
        None,
        MalformedHeader,
        TruncatedArchive,
        CorruptEntry,
        UnresolvedHash,
        UnorderedBeatData,
        NoteOutOfRange,
        InvalidNoteLink,
        NoSuchDifficulty,
        ClockRegression,
        DecryptionFailed,
        MissingEntry
    };

    Kind kind = Kind::None;
    juce::String message;
    juce::String entryHash;     // Hex-MD5 des betroffenen Eintrags (falls bekannt)
    juce::int64 offset = -1;    // Byte-Offset im Archiv bzw. in der Datei (-1 = unbekannt)

    bool failed() const { return kind != Kind::None; }

    // "CorruptEntry: block 3 inflated to 12 bytes, expected 4 [hash=..., offset=...]"
    juce::String toString() const;

    static juce::String kindToString(Kind kind);
};

//==============================================================================
// Wird von den Low-Level-Readern geworfen und an der öffentlichen
// Schnittstelle in getLastError() umgewandelt
//==============================================================================
class PsarcException : public std::runtime_error
{
public:
    PsarcException(PsarcError::Kind kind, const juce::String& message,
                   juce::int64 offset = -1, const juce::String& entryHash = {});

    explicit PsarcException(const PsarcError& error);

    const PsarcError& getError() const noexcept { return error; }
    PsarcError::Kind getKind() const noexcept { return error.kind; }

private:
    PsarcError error;
};
