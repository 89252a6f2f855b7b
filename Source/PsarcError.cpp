/*
  ==============================================================================

    PsarcError.cpp

  ==============================================================================
*/

#include "PsarcError.h"

//==============================================================================
juce::String PsarcError::kindToString(Kind kind)
{
    switch (kind)
    {
        case Kind::None:              return "None";
        case Kind::MalformedHeader:   return "MalformedHeader";
        case Kind::TruncatedArchive:  return "TruncatedArchive";
        case Kind::CorruptEntry:      return "CorruptEntry";
        case Kind::UnresolvedHash:    return "UnresolvedHash";
        case Kind::UnorderedBeatData: return "UnorderedBeatData";
        case Kind::NoteOutOfRange:    return "NoteOutOfRange";
        case Kind::InvalidNoteLink:   return "InvalidNoteLink";
        case Kind::NoSuchDifficulty:  return "NoSuchDifficulty";
        case Kind::ClockRegression:   return "ClockRegression";
        case Kind::DecryptionFailed:  return "DecryptionFailed";
        case Kind::MissingEntry:      return "MissingEntry";
    }

    return "Unknown";
}

juce::String PsarcError::toString() const
{
    juce::String text = kindToString(kind);

    if (message.isNotEmpty())
        text << ": " << message;

    if (entryHash.isNotEmpty() || offset >= 0)
    {
        juce::StringArray details;
        if (entryHash.isNotEmpty())
            details.add("hash=" + entryHash);
        if (offset >= 0)
            details.add("offset=" + juce::String(offset));

        text << " [" << details.joinIntoString(", ") << "]";
    }

    return text;
}

//==============================================================================
static PsarcError makeError(PsarcError::Kind kind, const juce::String& message,
                            juce::int64 offset, const juce::String& entryHash)
{
    PsarcError error;
    error.kind = kind;
    error.message = message;
    error.offset = offset;
    error.entryHash = entryHash;
    return error;
}

PsarcException::PsarcException(PsarcError::Kind kind, const juce::String& message,
                               juce::int64 offset, const juce::String& entryHash)
    : PsarcException(makeError(kind, message, offset, entryHash))
{
}

PsarcException::PsarcException(const PsarcError& e)
    : std::runtime_error(e.toString().toStdString()),
      error(e)
{
}
