/*
  ==============================================================================

    TestSngBuilder.cpp

  ==============================================================================
*/

#include "TestSngBuilder.h"
#include "TestArchiveBuilder.h"
#include "../Source/ArchiveCipher.h"
#include "../Source/ArrangementDecoder.h"

namespace
{
    void writeFixedString(juce::MemoryOutputStream& out, const juce::String& text, int size)
    {
        juce::HeapBlock<char> buffer(static_cast<size_t>(size), true);
        text.copyToUTF8(buffer.get(), static_cast<size_t>(size));
        out.write(buffer.get(), static_cast<size_t>(size));
    }

    void writeZeros(juce::MemoryOutputStream& out, int numBytes)
    {
        out.writeRepeatedByte(0, static_cast<size_t>(numBytes));
    }

    void writeNote(juce::MemoryOutputStream& out, const TestSng::Note& note)
    {
        out.writeInt(static_cast<int>(note.mask));
        out.writeInt(0);                        // flags
        out.writeInt(0);                        // hash
        out.writeFloat(note.time);
        out.writeByte(static_cast<char>(note.string));
        out.writeByte(static_cast<char>(note.fret));
        out.writeByte(0);                       // anchor fret
        out.writeByte(4);                       // anchor width
        out.writeInt(note.chordId);
        out.writeInt(-1);                       // chord notes
        out.writeInt(0);                        // phrase
        out.writeInt(0);                        // phrase iteration
        out.writeShort(-1);
        out.writeShort(-1);                     // fingerprints
        out.writeShort(-1);                     // next iteration note
        out.writeShort(-1);                     // previous iteration note
        out.writeShort(static_cast<short>(note.parentPrev));
        out.writeByte(static_cast<char>(note.slideTo));
        out.writeByte(-1);                      // unpitched slide
        out.writeByte(-1);                      // left hand
        out.writeByte(0);                       // tap
        out.writeByte(0);                       // pick direction
        out.writeByte(-1);                      // slap
        out.writeByte(-1);                      // pluck
        out.writeShort(0);                      // vibrato
        out.writeFloat(note.sustain);
        out.writeFloat(0.0f);                   // max bend
        out.writeInt(0);                        // bend values
    }
}

//==============================================================================
TestSng TestSng::makeSimple(float length)
{
    TestSng sng;
    sng.songLength = length;

    for (int i = 0; i * 0.5f < length; ++i)
        sng.beats.push_back({ i * 0.5f, i % 4 == 0 ? i / 4 : -1 });

    sng.phrases.push_back({ "riff", 0 });
    sng.iterations.push_back({ 0, 0.0f, length });
    sng.sections.push_back({ "verse", 1, 0.0f, length });
    sng.levels.push_back({ 0, {} });
    return sng;
}

//==============================================================================
juce::MemoryBlock TestSng::write() const
{
    juce::MemoryOutputStream out;

    out.writeInt(static_cast<int>(beats.size()));
    for (const auto& beat : beats)
    {
        out.writeFloat(beat.time);
        out.writeShort(static_cast<short>(beat.measure));
        out.writeShort(0);
        out.writeInt(0);
        out.writeInt(beat.measure >= 0 ? 0x01 : 0x00);
    }

    out.writeInt(static_cast<int>(phrases.size()));
    for (const auto& phrase : phrases)
    {
        writeZeros(out, 4);
        out.writeInt(phrase.maxDifficulty);
        out.writeInt(1);
        writeFixedString(out, phrase.name, 32);
    }

    out.writeInt(static_cast<int>(chords.size()));
    for (const auto& chord : chords)
    {
        out.writeInt(0);
        for (auto fret : chord.frets)
            out.writeByte(static_cast<char>(fret < 0 ? 0xFF : fret));
        for (auto fret : chord.frets)
            out.writeByte(static_cast<char>(fret < 0 ? 0xFF : 1));
        writeZeros(out, 6 * 4);
        writeFixedString(out, chord.name, 32);
    }

    out.writeInt(0);                            // chord notes
    out.writeInt(0);                            // vocals

    out.writeInt(static_cast<int>(iterations.size()));
    for (const auto& iteration : iterations)
    {
        out.writeInt(iteration.phraseId);
        out.writeFloat(iteration.start);
        out.writeFloat(iteration.end);
        writeZeros(out, 3 * 4);
    }

    out.writeInt(0);                            // phrase extra info
    out.writeInt(0);                            // linked difficulties
    out.writeInt(0);                            // actions
    out.writeInt(0);                            // events
    out.writeInt(0);                            // tones
    out.writeInt(0);                            // dna

    out.writeInt(static_cast<int>(sections.size()));
    for (const auto& section : sections)
    {
        writeFixedString(out, section.name, 32);
        out.writeInt(section.number);
        out.writeFloat(section.start);
        out.writeFloat(section.end);
        out.writeInt(0);
        out.writeInt(0);
        writeZeros(out, 36);
    }

    out.writeInt(static_cast<int>(levels.size()));
    for (const auto& level : levels)
    {
        out.writeInt(level.difficulty);
        out.writeInt(0);                        // anchors
        out.writeInt(0);                        // anchor extensions
        out.writeInt(0);                        // handshapes
        out.writeInt(0);                        // arpeggios

        out.writeInt(static_cast<int>(level.notes.size()));
        for (const auto& note : level.notes)
            writeNote(out, note);

        out.writeInt(0);
        out.writeInt(0);
        out.writeInt(0);
    }

    for (int i = 0; i < 4; ++i)
        out.writeDouble(0.0);
    out.writeFloat(0.5f);                       // first beat length
    out.writeFloat(0.0f);                       // start time
    out.writeByte(static_cast<char>(capo));
    writeFixedString(out, "6-11-14 12:00", 32);
    out.writeShort(1);
    out.writeFloat(songLength);

    out.writeInt(static_cast<int>(tuning.size()));
    for (auto offset : tuning)
        out.writeShort(static_cast<short>(offset));

    out.writeFloat(0.0f);
    out.writeFloat(0.0f);
    out.writeInt(static_cast<int>(levels.size()) - 1);

    return out.getMemoryBlock();
}

juce::MemoryBlock TestSng::wrapInEnvelope(const juce::MemoryBlock& plain, bool compress)
{
    juce::MemoryBlock payload;

    if (compress)
    {
        juce::MemoryOutputStream sized;
        sized.writeInt(static_cast<int>(plain.getSize()));
        sized << zlibCompress(plain.getData(), plain.getSize());
        payload = sized.getMemoryBlock();
    }
    else
    {
        payload = plain;
    }

    juce::uint8 iv[ArchiveCipher::ivSize];
    for (int i = 0; i < ArchiveCipher::ivSize; ++i)
        iv[i] = static_cast<juce::uint8>(0x30 + i);

    juce::MemoryOutputStream envelope;
    envelope.writeInt(static_cast<int>(ArrangementDecoder::envelopeMagic));
    envelope.writeInt(compress ? static_cast<int>(ArrangementDecoder::envelopeCompressedFlag) : 0);
    envelope.write(iv, sizeof(iv));
    envelope << ArchiveCipher::applySngKeystream(payload.getData(), payload.getSize(), iv);

    return envelope.getMemoryBlock();
}
