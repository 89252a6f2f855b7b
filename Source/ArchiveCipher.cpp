/*
  ==============================================================================

    ArchiveCipher.cpp

  ==============================================================================
*/

#include "ArchiveCipher.h"
#include "PsarcError.h"

#include <openssl/evp.h>
#include <array>

namespace
{
    const std::array<unsigned char, 32> tocKey = {
        0xC5, 0x3D, 0xB2, 0x38, 0x70, 0xA1, 0xA2, 0xF7, 0x1C, 0xAE, 0x64, 0x06, 0x1F, 0xDD, 0x0E, 0x11,
        0x57, 0x30, 0x9D, 0xC8, 0x52, 0x04, 0xD4, 0xC5, 0xBF, 0xDF, 0x25, 0x09, 0x0D, 0xF2, 0x57, 0x2C };

    const std::array<unsigned char, 16> tocIv = {
        0xE9, 0x15, 0xAA, 0x01, 0x8F, 0xEF, 0x71, 0xFC, 0x50, 0x81, 0x32, 0xE4, 0xBB, 0x4C, 0xEB, 0x42 };

    const std::array<unsigned char, 32> sngKey = {
        0xCB, 0x64, 0x8D, 0xF3, 0xD1, 0x2A, 0x16, 0xBF, 0x71, 0x70, 0x14, 0x14, 0xE6, 0x96, 0x19, 0xEC,
        0x17, 0x1C, 0xCA, 0x5D, 0x2A, 0x14, 0x2E, 0x3E, 0x59, 0xDE, 0x7A, 0xDD, 0xA1, 0x8A, 0x3A, 0x30 };

    // Owns an EVP context for the duration of one call
    struct CipherContext
    {
        CipherContext() : ctx(EVP_CIPHER_CTX_new()) {}
        ~CipherContext() { if (ctx != nullptr) EVP_CIPHER_CTX_free(ctx); }

        EVP_CIPHER_CTX* ctx;

        JUCE_DECLARE_NON_COPYABLE(CipherContext)
    };

    juce::MemoryBlock runCipher(const EVP_CIPHER* cipher, const unsigned char* key,
                                const unsigned char* iv, bool encrypt,
                                const void* data, size_t numBytes)
    {
        if (numBytes == 0)
            return {};

        // Stream modes: output length equals input length, no padding
        juce::MemoryBlock output(numBytes, true);

        CipherContext context;
        if (context.ctx == nullptr)
            throw PsarcException(PsarcError::Kind::DecryptionFailed, "could not allocate cipher context");

        if (EVP_CipherInit_ex(context.ctx, cipher, nullptr, key, iv, encrypt ? 1 : 0) != 1)
            throw PsarcException(PsarcError::Kind::DecryptionFailed, "cipher initialisation failed");

        EVP_CIPHER_CTX_set_padding(context.ctx, 0);

        int written = 0;
        if (EVP_CipherUpdate(context.ctx,
                             static_cast<unsigned char*>(output.getData()), &written,
                             static_cast<const unsigned char*>(data),
                             static_cast<int>(numBytes)) != 1)
        {
            throw PsarcException(PsarcError::Kind::DecryptionFailed, "cipher update failed");
        }

        int finalBytes = 0;
        if (EVP_CipherFinal_ex(context.ctx,
                               static_cast<unsigned char*>(output.getData()) + written,
                               &finalBytes) != 1)
        {
            throw PsarcException(PsarcError::Kind::DecryptionFailed, "cipher finalisation failed");
        }

        if (static_cast<size_t>(written + finalBytes) != numBytes)
            throw PsarcException(PsarcError::Kind::DecryptionFailed, "cipher produced unexpected length");

        return output;
    }
}

//==============================================================================
juce::MemoryBlock ArchiveCipher::decryptToc(const void* data, size_t numBytes)
{
    return runCipher(EVP_aes_256_cfb128(), tocKey.data(), tocIv.data(), false, data, numBytes);
}

juce::MemoryBlock ArchiveCipher::encryptToc(const void* data, size_t numBytes)
{
    return runCipher(EVP_aes_256_cfb128(), tocKey.data(), tocIv.data(), true, data, numBytes);
}

juce::MemoryBlock ArchiveCipher::applySngKeystream(const void* data, size_t numBytes,
                                                   const juce::uint8* iv)
{
    return runCipher(EVP_aes_256_ctr(), sngKey.data(), iv, true, data, numBytes);
}
