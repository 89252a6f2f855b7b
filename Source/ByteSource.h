/*
  ==============================================================================

    ByteSource.h

    Seekable, read-only byte sources over archive data.
    All archive decoding goes through this interface so that the same code
    path works for files on disk and for archives held in memory.

  ==============================================================================
*/

#pragma once

#include <juce_core/juce_core.h>

//==============================================================================
class ByteSource
{
public:
    virtual ~ByteSource() = default;

    /** Total number of bytes available. */
    virtual juce::int64 getSize() const = 0;

    /** Reads up to numBytes starting at offset.
        Returns the number of bytes actually copied into dest.
        Implementations must be safe to call from several threads.
    */
    virtual size_t readAt(juce::int64 offset, void* dest, size_t numBytes) = 0;

    /** Reads exactly numBytes or throws a TruncatedArchive PsarcException. */
    void readExactly(juce::int64 offset, void* dest, size_t numBytes);

    /** Convenience wrapper returning a freshly allocated block. */
    juce::MemoryBlock readBlock(juce::int64 offset, size_t numBytes);
};

//==============================================================================
class MemoryByteSource : public ByteSource
{
public:
    explicit MemoryByteSource(juce::MemoryBlock data);
    MemoryByteSource(const void* data, size_t numBytes);

    juce::int64 getSize() const override { return static_cast<juce::int64>(data.getSize()); }
    size_t readAt(juce::int64 offset, void* dest, size_t numBytes) override;

    const juce::MemoryBlock& getData() const { return data; }

private:
    juce::MemoryBlock data;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(MemoryByteSource)
};

//==============================================================================
class FileByteSource : public ByteSource
{
public:
    explicit FileByteSource(const juce::File& file);

    bool openedOk() const { return stream != nullptr && stream->openedOk(); }
    const juce::File& getFile() const { return file; }

    juce::int64 getSize() const override;
    size_t readAt(juce::int64 offset, void* dest, size_t numBytes) override;

private:
    juce::File file;
    std::unique_ptr<juce::FileInputStream> stream;
    juce::CriticalSection streamLock;   // FileInputStream hat nur eine Leseposition

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(FileByteSource)
};
