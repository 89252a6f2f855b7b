/*
  ==============================================================================

    ArchiveCipher.h

    AES helpers for the two encrypted regions of a Rocksmith archive:
    - the table of contents (AES-256-CFB128, fixed key and IV)
    - arrangement (.sng) envelopes (AES-256-CTR, fixed key, IV per file)

    Uses OpenSSL's EVP interface (libcrypto).

  ==============================================================================
*/

#pragma once

#include <juce_core/juce_core.h>

class ArchiveCipher
{
public:
    static constexpr int ivSize = 16;

    /** Decrypts an encrypted TOC region. Throws DecryptionFailed on cipher errors. */
    static juce::MemoryBlock decryptToc(const void* data, size_t numBytes);

    /** Inverse of decryptToc, used when writing archives. */
    static juce::MemoryBlock encryptToc(const void* data, size_t numBytes);

    /** CTR mode is symmetric: the same call encrypts and decrypts a .sng payload. */
    static juce::MemoryBlock applySngKeystream(const void* data, size_t numBytes,
                                               const juce::uint8* iv);

private:
    ArchiveCipher() = delete;
};
