/*
  ==============================================================================

    ArrangementDecoder.cpp

    Record layouts follow the Rocksmith 2014 .sng format.

  ==============================================================================
*/

#include "ArrangementDecoder.h"
#include "ArchiveCipher.h"

namespace
{
    // Byte sizes of records that are skipped as a whole
    constexpr int bendValueSize = 12;           // time, step, i16, u8, u8
    constexpr int bendSlots = 32;
    constexpr int vocalSize = 4 + 4 + 4 + 48;
    constexpr int symbolHeaderSize = 8 * 4;
    constexpr int symbolTextureSize = 128 + 4 * 4;
    constexpr int symbolDefinitionSize = 12 + 4 * 4 + 4 * 4;
    constexpr int phraseExtraInfoSize = 4 + 4 + 4 + 1 + 2 + 1;
    constexpr int timedNameSize = 4 + 256;
    constexpr int timedIdSize = 4 + 4;
    constexpr int anchorSize = 4 * 4 + 3 * 4;
    constexpr int anchorExtensionSize = 4 + 1 + 4 + 2 + 1;
    constexpr int fingerprintSize = 4 + 4 * 4;
    constexpr int noteFixedSize = 4 * 3 + 4 + 4 + 4 * 4 + 2 * 5 + 7 + 2 + 4 + 4 + 4;

    constexpr float linkTolerance = 1.0e-3f;   // f32-Rundung bei Sustain-Ende == Zielbeginn
}

//==============================================================================
ArrangementDecoder::ArrangementDecoder() {}
ArrangementDecoder::~ArrangementDecoder() {}

//==============================================================================
bool ArrangementDecoder::decode(const juce::MemoryBlock& plainBytes, Arrangement& result)
{
    result = Arrangement();
    lastError = {};
    rawPhrases.clear();
    rawChordNotes.clear();
    rawLevels.clear();

    inputStream = std::make_unique<juce::MemoryInputStream>(plainBytes, false);

    try
    {
        if (plainBytes.getSize() == 0)
            fail(PsarcError::Kind::CorruptEntry, "arrangement data is empty");

        readBeats(result);
        readPhrases();
        readChordTemplates(result);
        readChordNotes();
        readVocals();
        readPhraseIterations(result);
        skipPhraseExtraInfo();
        skipLinkedDifficulties();
        skipTimedNames();   // Actions
        skipTimedNames();   // Events
        skipTimedIds();     // Tones
        skipTimedIds();     // DNA
        readSections(result);
        readLevels();
        readMetadata(result);

        if (inputStream->getNumBytesRemaining() != 0)
            fail(PsarcError::Kind::CorruptEntry,
                 juce::String(inputStream->getNumBytesRemaining()) + " trailing bytes after metadata");

        buildLevels(result);

        DBG("Arrangement: " << result.beats.size() << " beats, "
            << result.phrases.size() << " phrases, "
            << result.sections.size() << " sections, "
            << result.difficultyLevels.size() << " levels");

        inputStream.reset();
        return true;
    }
    catch (const PsarcException& e)
    {
        lastError = e.getError();
        if (lastError.entryHash.isEmpty())
            lastError.entryHash = entryHash;
        DBG("Arrangement decode error: " << lastError.toString());
    }

    inputStream.reset();
    result = Arrangement();
    return false;
}

bool ArrangementDecoder::decodeEnvelope(const juce::MemoryBlock& envelopeBytes, Arrangement& result)
{
    juce::MemoryBlock plain;

    try
    {
        plain = unwrapEnvelope(envelopeBytes);
    }
    catch (const PsarcException& e)
    {
        lastError = e.getError();
        if (lastError.entryHash.isEmpty())
            lastError.entryHash = entryHash;
        DBG("Arrangement envelope error: " << lastError.toString());
        result = Arrangement();
        return false;
    }

    return decode(plain, result);
}

//==============================================================================
juce::MemoryBlock ArrangementDecoder::unwrapEnvelope(const juce::MemoryBlock& envelopeBytes)
{
    if (envelopeBytes.getSize() < static_cast<size_t>(envelopeHeaderSize))
        throw PsarcException(PsarcError::Kind::CorruptEntry,
                             "envelope is shorter than its 24 byte header", 0);

    const auto* bytes = static_cast<const juce::uint8*>(envelopeBytes.getData());

    auto magic = juce::ByteOrder::littleEndianInt(bytes);
    if (magic != envelopeMagic)
        throw PsarcException(PsarcError::Kind::CorruptEntry,
                             "envelope magic is 0x" + juce::String::toHexString((int) magic), 0);

    auto flags = juce::ByteOrder::littleEndianInt(bytes + 4);
    const juce::uint8* iv = bytes + 8;

    auto decrypted = ArchiveCipher::applySngKeystream(bytes + envelopeHeaderSize,
                                                      envelopeBytes.getSize() - envelopeHeaderSize,
                                                      iv);

    if ((flags & envelopeCompressedFlag) == 0)
        return decrypted;

    if (decrypted.getSize() < 4)
        throw PsarcException(PsarcError::Kind::CorruptEntry, "compressed envelope has no size prefix",
                             envelopeHeaderSize);

    auto plainSize = juce::ByteOrder::littleEndianInt(decrypted.getData());

    // Hinter dem zlib-Stream kann noch eine Signatur folgen, daher nur bis plainSize lesen
    juce::MemoryInputStream compressed(static_cast<const char*>(decrypted.getData()) + 4,
                                       decrypted.getSize() - 4, false);
    juce::GZIPDecompressorInputStream zlib(&compressed, false,
                                           juce::GZIPDecompressorInputStream::zlibFormat);

    juce::MemoryBlock plain(plainSize, false);
    int total = 0;

    while (total < static_cast<int>(plainSize))
    {
        auto got = zlib.read(static_cast<char*>(plain.getData()) + total,
                             static_cast<int>(plainSize) - total);
        if (got <= 0)
            break;
        total += got;
    }

    if (total != static_cast<int>(plainSize))
        throw PsarcException(PsarcError::Kind::CorruptEntry,
                             "envelope inflated to " + juce::String(total) + " bytes, expected "
                                 + juce::String((juce::int64) plainSize),
                             envelopeHeaderSize + 4);

    return plain;
}

bool ArrangementDecoder::isEnvelopePath(const juce::String& logicalPath)
{
    auto path = logicalPath.toLowerCase();
    return path.startsWith("songs/bin/") && path.endsWith(".sng");
}

//==============================================================================
// Sections
//==============================================================================
void ArrangementDecoder::readBeats(Arrangement& result)
{
    auto count = readCount(4 + 2 + 2 + 4 + 4);
    result.beats.ensureStorageAllocated(count);

    for (int i = 0; i < count; ++i)
    {
        auto offset = inputStream->getPosition();

        Beat beat;
        beat.time = readF32();
        beat.measureNumber = readI16();
        readI16();                      // Beat im Takt
        readI32();                      // Phrase iteration
        auto mask = readI32();
        beat.isDownbeat = (mask & 0x01) != 0;

        if (! result.beats.isEmpty() && beat.time <= result.beats.getLast().time)
        {
            throw PsarcException(PsarcError::Kind::UnorderedBeatData,
                                 "beat " + juce::String(i) + " at " + juce::String(beat.time, 3)
                                     + "s does not follow " + juce::String(result.beats.getLast().time, 3) + "s",
                                 offset, entryHash);
        }

        result.beats.add(beat);
    }
}

void ArrangementDecoder::readPhrases()
{
    auto count = readCount(4 + 4 + 4 + 32);
    rawPhrases.reserve(static_cast<size_t>(count));

    for (int i = 0; i < count; ++i)
    {
        RawPhrase phrase;
        skip(4);                        // solo, disparity, ignore, padding
        phrase.maxDifficulty = readI32();
        readI32();                      // iteration links
        phrase.name = readFixedString(32);
        rawPhrases.push_back(phrase);
    }
}

void ArrangementDecoder::readChordTemplates(Arrangement& result)
{
    auto count = readCount(4 + 6 + 6 + 6 * 4 + 32);
    result.chordTemplates.ensureStorageAllocated(count);

    for (int i = 0; i < count; ++i)
    {
        ChordTemplate chord;
        readU32();                      // Maske (arpeggio, nop)

        for (auto& fret : chord.frets)
        {
            auto raw = readU8();
            fret = raw == 0xFF ? -1 : static_cast<int>(static_cast<juce::int8>(raw));
        }

        for (auto& finger : chord.fingers)
        {
            auto raw = readU8();
            finger = raw == 0xFF ? -1 : static_cast<int>(static_cast<juce::int8>(raw));
        }

        skip(6 * 4);                    // MIDI-Noten
        chord.name = readFixedString(32);
        result.chordTemplates.add(chord);
    }
}

void ArrangementDecoder::readChordNotes()
{
    constexpr int bendDataSize = bendSlots * bendValueSize + 4;
    auto count = readCount(6 * 4 + 6 * bendDataSize + 6 + 6 + 6 * 2);
    rawChordNotes.reserve(static_cast<size_t>(count));

    for (int i = 0; i < count; ++i)
    {
        RawChordNotes info;

        for (auto& mask : info.masks)
            mask = readU32();

        for (auto& maxBend : info.maxBend)
        {
            float steps[bendSlots];
            for (auto& step : steps)
            {
                readF32();              // time
                step = readF32();
                skip(4);
            }

            auto used = readI32();
            if (used < 0 || used > bendSlots)
                fail(PsarcError::Kind::CorruptEntry, "chord bend count " + juce::String(used) + " out of range");

            maxBend = 0.0f;
            for (int b = 0; b < used; ++b)
                maxBend = juce::jmax(maxBend, steps[b]);
        }

        for (auto& slide : info.slideTo)
            slide = readI8();

        skip(6);                        // unpitched slides
        skip(6 * 2);                    // vibrato

        rawChordNotes.push_back(info);
    }
}

void ArrangementDecoder::readVocals()
{
    auto count = readCount(vocalSize);
    skip(static_cast<juce::int64>(count) * vocalSize);

    // Symboltabellen gibt es nur in Vocal-Arrangements
    if (count > 0)
    {
        skip(static_cast<juce::int64>(readCount(symbolHeaderSize)) * symbolHeaderSize);
        skip(static_cast<juce::int64>(readCount(symbolTextureSize)) * symbolTextureSize);
        skip(static_cast<juce::int64>(readCount(symbolDefinitionSize)) * symbolDefinitionSize);
    }
}

void ArrangementDecoder::readPhraseIterations(Arrangement& result)
{
    auto count = readCount(4 + 4 + 4 + 3 * 4);
    result.phrases.ensureStorageAllocated(count);

    for (int i = 0; i < count; ++i)
    {
        auto phraseId = readI32();
        Phrase phrase;
        phrase.startTime = readF32();
        phrase.endTime = readF32();
        skip(3 * 4);                    // easy/medium/hard

        if (phraseId < 0 || phraseId >= static_cast<int>(rawPhrases.size()))
            fail(PsarcError::Kind::CorruptEntry,
                 "phrase iteration " + juce::String(i) + " references phrase " + juce::String(phraseId));

        phrase.name = rawPhrases[static_cast<size_t>(phraseId)].name;
        phrase.maxDifficulty = rawPhrases[static_cast<size_t>(phraseId)].maxDifficulty;

        if (! result.phrases.isEmpty() && phrase.startTime < result.phrases.getLast().startTime)
            fail(PsarcError::Kind::CorruptEntry,
                 "phrase iteration " + juce::String(i) + " starts before its predecessor");

        if (! result.phrases.isEmpty() && phrase.startTime < result.phrases.getLast().endTime)
            DBG("Arrangement: phrase iteration " << i << " at " << phrase.startTime
                << "s overlaps the previous one ending at " << result.phrases.getLast().endTime << "s");

        result.phrases.add(phrase);
    }
}

void ArrangementDecoder::skipPhraseExtraInfo()
{
    skip(static_cast<juce::int64>(readCount(phraseExtraInfoSize)) * phraseExtraInfoSize);
}

void ArrangementDecoder::skipLinkedDifficulties()
{
    auto count = readCount(8);
    for (int i = 0; i < count; ++i)
    {
        readI32();                      // level break
        skip(static_cast<juce::int64>(readCount(4)) * 4);
    }
}

void ArrangementDecoder::skipTimedNames()
{
    skip(static_cast<juce::int64>(readCount(timedNameSize)) * timedNameSize);
}

void ArrangementDecoder::skipTimedIds()
{
    skip(static_cast<juce::int64>(readCount(timedIdSize)) * timedIdSize);
}

void ArrangementDecoder::readSections(Arrangement& result)
{
    auto count = readCount(32 + 4 * 5 + 36);
    result.sections.ensureStorageAllocated(count);

    for (int i = 0; i < count; ++i)
    {
        Section section;
        section.name = readFixedString(32);
        section.number = readI32();
        section.startTime = readF32();
        section.endTime = readF32();
        skip(4 + 4 + 36);               // phrase iteration range, string bytes

        if (! result.sections.isEmpty() && section.startTime < result.sections.getLast().startTime)
            fail(PsarcError::Kind::CorruptEntry,
                 "section " + juce::String(i) + " starts before its predecessor");

        if (! result.sections.isEmpty() && section.startTime < result.sections.getLast().endTime)
            DBG("Arrangement: section " << section.name << " at " << section.startTime
                << "s overlaps the previous one ending at " << result.sections.getLast().endTime << "s");

        result.sections.add(section);
    }
}

void ArrangementDecoder::readLevels()
{
    auto count = readCount(4 * 9);
    rawLevels.resize(static_cast<size_t>(count));

    for (auto& level : rawLevels)
    {
        level.difficulty = readI32();

        skip(static_cast<juce::int64>(readCount(anchorSize)) * anchorSize);
        skip(static_cast<juce::int64>(readCount(anchorExtensionSize)) * anchorExtensionSize);
        skip(static_cast<juce::int64>(readCount(fingerprintSize)) * fingerprintSize);   // handshapes
        skip(static_cast<juce::int64>(readCount(fingerprintSize)) * fingerprintSize);   // arpeggios

        auto noteCount = readCount(noteFixedSize);
        level.notes.reserve(static_cast<size_t>(noteCount));
        for (int n = 0; n < noteCount; ++n)
            level.notes.push_back(readNote());

        skip(static_cast<juce::int64>(readCount(4)) * 4);  // average notes per phrase
        skip(static_cast<juce::int64>(readCount(4)) * 4);  // notes in iteration
        skip(static_cast<juce::int64>(readCount(4)) * 4);  // notes in iteration (ohne ignore)
    }
}

ArrangementDecoder::RawNote ArrangementDecoder::readNote()
{
    RawNote note;
    note.mask = readU32();
    readU32();                          // flags
    readU32();                          // hash
    note.time = readF32();
    note.string = readI8();
    note.fret = readI8();
    skip(2);                            // anchor fret, anchor width
    note.chordId = readI32();
    note.chordNotesId = readI32();
    skip(4 + 4);                        // phrase, phrase iteration
    skip(2 * 2);                        // fingerprints
    readI16();                          // next iteration note
    readI16();                          // previous iteration note
    note.parentPrev = readI16();
    note.slideTo = readI8();
    skip(1 + 1 + 1 + 1 + 1 + 1);        // unpitched slide, left hand, tap, pick direction, slap, pluck
    readI16();                          // vibrato
    note.sustain = readF32();
    note.maxBend = readF32();

    auto bendCount = readCount(bendValueSize);
    skip(static_cast<juce::int64>(bendCount) * bendValueSize);

    return note;
}

void ArrangementDecoder::readMetadata(Arrangement& result)
{
    for (int i = 0; i < 4; ++i)
        readF64();                      // score values

    skip(4 + 4);                        // first beat length, start time

    auto capo = readI8();
    result.capoFret = capo > 0 ? capo : 0;

    readFixedString(32);                // last conversion date
    readI16();                          // part
    result.songLength = readF32();

    auto stringCount = readCount(2);
    result.stringCount = stringCount > 0 ? stringCount : 6;

    for (int i = 0; i < stringCount; ++i)
        result.tuning.add(readI16());

    skip(4 + 4);                        // first note time (2x)
    readI32();                          // max difficulty
}

//==============================================================================
// Model building
//==============================================================================
void ArrangementDecoder::buildLevels(Arrangement& result)
{
    result.difficultyLevels.ensureStorageAllocated(static_cast<int>(rawLevels.size()));

    for (size_t i = 0; i < rawLevels.size(); ++i)
    {
        if (rawLevels[i].difficulty != static_cast<int>(i))
            fail(PsarcError::Kind::CorruptEntry,
                 "level " + juce::String((int) i) + " declares difficulty "
                     + juce::String(rawLevels[i].difficulty));

        buildLevel(rawLevels[i], static_cast<int>(i), result);
    }
}

void ArrangementDecoder::buildLevel(const RawLevel& raw, int levelIndex, Arrangement& result)
{
    DifficultyLevel level;
    level.levelIndex = levelIndex;

    const auto where = "level " + juce::String(levelIndex) + " note ";

    // Index der ersten NoteEvent pro Rohnote (Akkorde werden aufgelöst)
    std::vector<int> firstEvent(raw.notes.size(), -1);

    for (size_t i = 0; i < raw.notes.size(); ++i)
    {
        const auto& note = raw.notes[i];
        firstEvent[i] = level.notes.size();

        if (! level.notes.isEmpty() && note.time < level.notes.getLast().startTime)
            throw PsarcException(PsarcError::Kind::InvalidNoteLink,
                                 where + juce::String((int) i) + " out of order: " + juce::String(note.time, 3)
                                     + "s precedes " + juce::String(level.notes.getLast().startTime, 3) + "s",
                                 -1, entryHash);

        if (note.string < 0)
        {
            // Akkord: eine NoteEvent pro gegriffener Saite
            if (note.chordId < 0 || note.chordId >= result.chordTemplates.size())
                fail(PsarcError::Kind::CorruptEntry,
                     where + juce::String((int) i) + " references chord " + juce::String(note.chordId));

            const auto& chord = result.chordTemplates.getReference(note.chordId);
            const RawChordNotes* chordNotes = nullptr;

            if (note.chordNotesId >= 0 && note.chordNotesId < static_cast<int>(rawChordNotes.size()))
                chordNotes = &rawChordNotes[static_cast<size_t>(note.chordNotesId)];

            for (int s = 0; s < 6; ++s)
            {
                if (chord.frets[(size_t) s] < 0)
                    continue;

                if (s >= result.stringCount)
                    throw PsarcException(PsarcError::Kind::NoteOutOfRange,
                                         "chord " + chord.name.quoted() + " uses string " + juce::String(s)
                                             + " of a " + juce::String(result.stringCount) + " string arrangement",
                                         -1, entryHash);

                NoteEvent event;
                event.startTime = note.time;
                event.sustain = juce::jmax(0.0f, note.sustain);
                event.string = s;
                event.fret = chord.frets[(size_t) s];
                event.techniques = note.mask;
                event.chordId = note.chordId;

                if (chordNotes != nullptr)
                {
                    event.techniques |= chordNotes->masks[(size_t) s];
                    event.slideTo = chordNotes->slideTo[(size_t) s];
                    event.bendMax = chordNotes->maxBend[(size_t) s];
                }

                level.notes.add(event);
            }

            continue;
        }

        if (note.string >= result.stringCount || note.fret < 0)
            throw PsarcException(PsarcError::Kind::NoteOutOfRange,
                                 where + juce::String((int) i) + " string " + juce::String(note.string)
                                     + " fret " + juce::String(note.fret) + " outside a "
                                     + juce::String(result.stringCount) + " string arrangement",
                                 -1, entryHash);

        NoteEvent event;
        event.startTime = note.time;
        event.sustain = juce::jmax(0.0f, note.sustain);
        event.string = note.string;
        event.fret = note.fret;
        event.techniques = note.mask;
        event.slideTo = note.slideTo;
        event.bendMax = note.maxBend;
        level.notes.add(event);
    }

    // Links: das Kind verweist über parentPrev auf die vorherige Note
    for (size_t i = 0; i < raw.notes.size(); ++i)
    {
        const auto& child = raw.notes[i];

        if ((child.mask & NoteTechnique::linkedFromPrev) == 0 || child.parentPrev < 0)
            continue;

        auto parentIndex = static_cast<size_t>(child.parentPrev);
        auto linkError = [&] (const juce::String& reason)
        {
            throw PsarcException(PsarcError::Kind::InvalidNoteLink,
                                 where + juce::String(child.parentPrev) + " -> " + juce::String((int) i) + ": " + reason,
                                 -1, entryHash);
        };

        if (parentIndex >= i)
            linkError("link does not point forward");

        const auto& parent = raw.notes[parentIndex];

        // Akkord-Links werden nicht aufgelöst
        if (parent.string < 0 || child.string < 0)
            continue;

        if (parent.string != child.string)
            linkError("strings differ (" + juce::String(parent.string) + " vs " + juce::String(child.string) + ")");

        // Ziel darf erst nach dem Ausklingen der Quelle beginnen
        auto sourceEnd = parent.time + juce::jmax(0.0f, parent.sustain);

        if (child.time < sourceEnd - linkTolerance)
            linkError("target at " + juce::String(child.time, 3) + "s starts before the source ends at "
                      + juce::String(sourceEnd, 3) + "s");

        level.notes.getReference(firstEvent[parentIndex]).linkedNext = firstEvent[i];
    }

    result.difficultyLevels.add(level);
}

//==============================================================================
// Low-level reading
//==============================================================================
int ArrangementDecoder::readCount(int recordSize)
{
    auto offset = inputStream->getPosition();
    auto count = readI32();

    if (count < 0 || static_cast<juce::int64>(count) * recordSize > inputStream->getNumBytesRemaining())
        throw PsarcException(PsarcError::Kind::CorruptEntry,
                             "record count " + juce::String(count) + " exceeds remaining data",
                             offset, entryHash);

    return count;
}

void ArrangementDecoder::ensureAvailable(juce::int64 numBytes)
{
    if (numBytes < 0 || inputStream->getNumBytesRemaining() < numBytes)
        fail(PsarcError::Kind::CorruptEntry,
             "read of " + juce::String(numBytes) + " bytes past end of data");
}

juce::uint8 ArrangementDecoder::readU8()
{
    ensureAvailable(1);
    return static_cast<juce::uint8>(inputStream->readByte());
}

juce::int8 ArrangementDecoder::readI8()
{
    ensureAvailable(1);
    return static_cast<juce::int8>(inputStream->readByte());
}

juce::int16 ArrangementDecoder::readI16()
{
    ensureAvailable(2);
    return inputStream->readShort();
}

juce::int32 ArrangementDecoder::readI32()
{
    ensureAvailable(4);
    return inputStream->readInt();
}

juce::uint32 ArrangementDecoder::readU32()
{
    ensureAvailable(4);
    return static_cast<juce::uint32>(inputStream->readInt());
}

float ArrangementDecoder::readF32()
{
    ensureAvailable(4);
    return inputStream->readFloat();
}

double ArrangementDecoder::readF64()
{
    ensureAvailable(8);
    return inputStream->readDouble();
}

juce::String ArrangementDecoder::readFixedString(int size)
{
    ensureAvailable(size);

    juce::HeapBlock<char> buffer(static_cast<size_t>(size) + 1, true);
    inputStream->read(buffer.get(), size);

    // Nullterminiert, Rest ist Padding
    return juce::String::fromUTF8(buffer.get());
}

void ArrangementDecoder::skip(juce::int64 numBytes)
{
    ensureAvailable(numBytes);
    inputStream->skipNextBytes(numBytes);
}

void ArrangementDecoder::fail(PsarcError::Kind kind, const juce::String& message)
{
    throw PsarcException(kind, message,
                         inputStream != nullptr ? inputStream->getPosition() : -1,
                         entryHash);
}
