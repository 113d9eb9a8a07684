/*
 * mediafetch/src/downloader/stream_decryptor.cpp
 *
 * IStreamDecryptor over OpenSSL EVP (AES-128/192/256, CTR and CBC).
 *
 * AesCtrStream: the whole assembled stream is one CTR keystream. A chunk at plaintext offset o
 * starts at block o/16 and discards o%16 keystream bytes, so decrypting chunk by chunk is
 * bit-exact with decrypting the stream in one pass.
 *
 * CBC schemes treat each chunk as an independent message without padding removal.
 */

#include <mediafetch/downloader/downloader.hpp>

#include <openssl/evp.h>

#include <array>
#include <cstdint>
#include <memory>
#include <string>

namespace mediafetch::downloader {

namespace {

constexpr std::size_t kAesBlock = 16;

struct EvpCipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const noexcept { EVP_CIPHER_CTX_free(ctx); }
};
using EvpCipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, EvpCipherCtxDeleter>;

using Block = std::array<unsigned char, kAesBlock>;

Error decryptError(const std::string& what, const ChunkDescriptor& chunk) {
    return Error{ErrorCode::DecryptionFailure,
                 "Chunk " + std::to_string(chunk.index) + ": " + what};
}

const EVP_CIPHER* ctrCipher(std::size_t keyLen) {
    switch (keyLen) {
        case 16:
            return EVP_aes_128_ctr();
        case 24:
            return EVP_aes_192_ctr();
        case 32:
            return EVP_aes_256_ctr();
        default:
            return nullptr;
    }
}

const EVP_CIPHER* cbcCipher(std::size_t keyLen) {
    switch (keyLen) {
        case 16:
            return EVP_aes_128_cbc();
        case 24:
            return EVP_aes_192_cbc();
        case 32:
            return EVP_aes_256_cbc();
        default:
            return nullptr;
    }
}

// Big-endian 128-bit add of `blocks` to the counter block.
void advanceCounter(Block& counter, std::uint64_t blocks) {
    unsigned carry = 0;
    for (int i = static_cast<int>(kAesBlock) - 1; i >= 0; --i) {
        unsigned add = static_cast<unsigned>(blocks & 0xFF) + carry;
        blocks >>= 8;
        unsigned sum = counter[static_cast<std::size_t>(i)] + add;
        counter[static_cast<std::size_t>(i)] = static_cast<unsigned char>(sum & 0xFF);
        carry = sum >> 8;
        if (blocks == 0 && carry == 0)
            break;
    }
}

Result<ByteVector> runCipher(const EVP_CIPHER* cipher, const ByteVector& key, const Block& iv,
                             bool padding, std::size_t discard, ByteSpan input,
                             const ChunkDescriptor& chunk) {
    EvpCipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx)
        return decryptError("EVP_CIPHER_CTX_new failed", chunk);

    if (EVP_DecryptInit_ex(ctx.get(), cipher, nullptr,
                           reinterpret_cast<const unsigned char*>(key.data()), iv.data()) != 1) {
        return decryptError("EVP_DecryptInit_ex failed", chunk);
    }
    EVP_CIPHER_CTX_set_padding(ctx.get(), padding ? 1 : 0);

    if (discard > 0) {
        Block zeros{};
        Block sink{};
        int n = 0;
        if (EVP_DecryptUpdate(ctx.get(), sink.data(), &n, zeros.data(),
                              static_cast<int>(discard)) != 1) {
            return decryptError("keystream skip failed", chunk);
        }
    }

    ByteVector out(input.size() + kAesBlock);
    int outLen = 0;
    if (!input.empty() &&
        EVP_DecryptUpdate(ctx.get(), reinterpret_cast<unsigned char*>(out.data()), &outLen,
                          reinterpret_cast<const unsigned char*>(input.data()),
                          static_cast<int>(input.size())) != 1) {
        return decryptError("EVP_DecryptUpdate failed", chunk);
    }
    int finalLen = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), reinterpret_cast<unsigned char*>(out.data()) + outLen,
                            &finalLen) != 1) {
        return decryptError("EVP_DecryptFinal_ex failed", chunk);
    }
    out.resize(static_cast<std::size_t>(outLen + finalLen));
    return out;
}

class OpenSslStreamDecryptor final : public IStreamDecryptor {
public:
    Result<ByteVector> decrypt(ByteSpan ciphertext, const KeyMaterial& keys,
                               const ChunkDescriptor& chunk) const override {
        switch (keys.scheme) {
            case CipherScheme::None:
                return ByteVector(ciphertext.begin(), ciphertext.end());
            case CipherScheme::AesCtrStream:
                return decryptCtr(ciphertext, keys, chunk);
            case CipherScheme::AesCbcSharedIv:
            case CipherScheme::AesCbcIndexIv:
                return decryptCbc(ciphertext, keys, chunk);
        }
        return decryptError("unknown cipher scheme", chunk);
    }

private:
    static Result<ByteVector> decryptCtr(ByteSpan ciphertext, const KeyMaterial& keys,
                                         const ChunkDescriptor& chunk) {
        const EVP_CIPHER* cipher = ctrCipher(keys.key.size());
        if (!cipher) {
            return decryptError("invalid AES key length " + std::to_string(keys.key.size()),
                                chunk);
        }
        Block counter{};
        if (keys.iv.size() == 8 || keys.iv.size() == kAesBlock) {
            for (std::size_t i = 0; i < keys.iv.size(); ++i)
                counter[i] = static_cast<unsigned char>(keys.iv[i]);
        } else {
            return decryptError("CTR nonce must be 8 or 16 bytes, got " +
                                    std::to_string(keys.iv.size()),
                                chunk);
        }
        advanceCounter(counter, chunk.range.offset / kAesBlock);
        const auto discard = static_cast<std::size_t>(chunk.range.offset % kAesBlock);
        return runCipher(cipher, keys.key, counter, false, discard, ciphertext, chunk);
    }

    static Result<ByteVector> decryptCbc(ByteSpan ciphertext, const KeyMaterial& keys,
                                         const ChunkDescriptor& chunk) {
        const EVP_CIPHER* cipher = cbcCipher(keys.key.size());
        if (!cipher) {
            return decryptError("invalid AES key length " + std::to_string(keys.key.size()),
                                chunk);
        }
        if (ciphertext.size() % kAesBlock != 0) {
            return decryptError("CBC ciphertext of " + std::to_string(ciphertext.size()) +
                                    " bytes is not a multiple of the block size",
                                chunk);
        }
        Block iv{};
        if (keys.scheme == CipherScheme::AesCbcSharedIv) {
            if (keys.iv.size() != kAesBlock) {
                return decryptError("CBC IV must be 16 bytes, got " +
                                        std::to_string(keys.iv.size()),
                                    chunk);
            }
            for (std::size_t i = 0; i < kAesBlock; ++i)
                iv[i] = static_cast<unsigned char>(keys.iv[i]);
        } else {
            advanceCounter(iv, chunk.index);
        }
        return runCipher(cipher, keys.key, iv, false, 0, ciphertext, chunk);
    }
};

} // namespace

std::unique_ptr<IStreamDecryptor> makeOpenSslStreamDecryptor() {
    return std::make_unique<OpenSslStreamDecryptor>();
}

} // namespace mediafetch::downloader
