/*
  ==============================================================================

    ByteSource.cpp

  ==============================================================================
*/

#include "ByteSource.h"
#include "PsarcError.h"

//==============================================================================
void ByteSource::readExactly(juce::int64 offset, void* dest, size_t numBytes)
{
    if (numBytes == 0)
        return;

    if (offset < 0 || offset + static_cast<juce::int64>(numBytes) > getSize())
    {
        throw PsarcException(PsarcError::Kind::TruncatedArchive,
                             "read of " + juce::String(static_cast<juce::int64>(numBytes))
                                 + " bytes exceeds source size " + juce::String(getSize()),
                             offset);
    }

    auto bytesRead = readAt(offset, dest, numBytes);

    if (bytesRead != numBytes)
    {
        throw PsarcException(PsarcError::Kind::TruncatedArchive,
                             "short read: got " + juce::String(static_cast<juce::int64>(bytesRead))
                                 + " of " + juce::String(static_cast<juce::int64>(numBytes)) + " bytes",
                             offset);
    }
}

juce::MemoryBlock ByteSource::readBlock(juce::int64 offset, size_t numBytes)
{
    juce::MemoryBlock block(numBytes, false);
    readExactly(offset, block.getData(), numBytes);
    return block;
}

//==============================================================================
MemoryByteSource::MemoryByteSource(juce::MemoryBlock d)
    : data(std::move(d))
{
}

MemoryByteSource::MemoryByteSource(const void* source, size_t numBytes)
    : data(source, numBytes)
{
}

size_t MemoryByteSource::readAt(juce::int64 offset, void* dest, size_t numBytes)
{
    auto size = static_cast<juce::int64>(data.getSize());
    if (offset < 0 || offset >= size)
        return 0;

    auto available = static_cast<size_t>(size - offset);
    auto toCopy = juce::jmin(available, numBytes);
    std::memcpy(dest, static_cast<const char*>(data.getData()) + offset, toCopy);
    return toCopy;
}

//==============================================================================
FileByteSource::FileByteSource(const juce::File& f)
    : file(f)
{
    if (file.existsAsFile())
        stream = file.createInputStream();

    if (! openedOk())
        DBG("FileByteSource: could not open " << file.getFullPathName());
}

juce::int64 FileByteSource::getSize() const
{
    return openedOk() ? stream->getTotalLength() : 0;
}

size_t FileByteSource::readAt(juce::int64 offset, void* dest, size_t numBytes)
{
    if (! openedOk() || offset < 0)
        return 0;

    const juce::ScopedLock sl(streamLock);

    if (! stream->setPosition(offset))
        return 0;

    auto bytesRead = stream->read(dest, numBytes);
    return bytesRead > 0 ? static_cast<size_t>(bytesRead) : 0;
}
