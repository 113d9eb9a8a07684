// Chunk-wise decryption must be bit-exact with one-pass decryption of the whole stream.

#include <catch2/catch_test_macros.hpp>

#include <mediafetch/core/hex.h>
#include <mediafetch/downloader/downloader.hpp>

#include <openssl/evp.h>

#include "../../support/fake_collaborators.hpp"

#include <array>
#include <memory>
#include <string>
#include <vector>

using namespace mediafetch;
using namespace mediafetch::downloader;
using mediafetch::test_support::bytesOf;
using mediafetch::test_support::stringOf;

namespace {

struct CtxFree {
    void operator()(EVP_CIPHER_CTX* c) const { EVP_CIPHER_CTX_free(c); }
};

ByteVector hexBytes(const std::string& hex) {
    return fromHex(hex).value();
}

// One-shot encryption with padding disabled (test oracle).
ByteVector encrypt(const EVP_CIPHER* cipher, const ByteVector& key, const ByteVector& iv,
                   const ByteVector& plain) {
    std::unique_ptr<EVP_CIPHER_CTX, CtxFree> ctx(EVP_CIPHER_CTX_new());
    REQUIRE(ctx);
    REQUIRE(EVP_EncryptInit_ex(ctx.get(), cipher, nullptr,
                               reinterpret_cast<const unsigned char*>(key.data()),
                               reinterpret_cast<const unsigned char*>(iv.data())) == 1);
    EVP_CIPHER_CTX_set_padding(ctx.get(), 0);
    ByteVector out(plain.size() + 16);
    int n = 0;
    REQUIRE(EVP_EncryptUpdate(ctx.get(), reinterpret_cast<unsigned char*>(out.data()), &n,
                              reinterpret_cast<const unsigned char*>(plain.data()),
                              static_cast<int>(plain.size())) == 1);
    int fin = 0;
    REQUIRE(EVP_EncryptFinal_ex(ctx.get(), reinterpret_cast<unsigned char*>(out.data()) + n,
                                &fin) == 1);
    out.resize(static_cast<std::size_t>(n + fin));
    return out;
}

ChunkDescriptor chunk(std::uint32_t index, std::uint64_t offset, std::uint64_t length) {
    ChunkDescriptor c;
    c.index = index;
    c.range = {offset, length};
    c.locator.url = "mem://" + std::to_string(index);
    return c;
}

ByteSpan slice(const ByteVector& v, std::uint64_t offset, std::uint64_t length) {
    return ByteSpan(v.data() + offset, static_cast<std::size_t>(length));
}

std::string makePlaintext(std::size_t n) {
    std::string s;
    s.reserve(n);
    for (std::size_t i = 0; i < n; ++i)
        s.push_back(static_cast<char>('a' + (i * 7) % 26));
    return s;
}

const ByteVector kKey128 = hexBytes("000102030405060708090a0b0c0d0e0f");

} // namespace

TEST_CASE("Scheme None passes bytes through", "[downloader][decrypt]") {
    auto dec = makeOpenSslStreamDecryptor();
    auto data = bytesOf("plain bytes");
    auto r = dec->decrypt(data, KeyMaterial{}, chunk(0, 0, data.size()));
    REQUIRE(r);
    CHECK(r.value() == data);
}

TEST_CASE("AES-CTR chunks at unaligned offsets match whole-stream decryption",
          "[downloader][decrypt]") {
    auto dec = makeOpenSslStreamDecryptor();
    const auto plain = bytesOf(makePlaintext(100));

    SECTION("16-byte initial counter block") {
        const auto iv = hexBytes("f0f1f2f3f4f5f6f7f8f9fafbfcfdfeff");
        const auto cipher = encrypt(EVP_aes_128_ctr(), kKey128, iv, plain);
        KeyMaterial keys{CipherScheme::AesCtrStream, kKey128, iv};

        // Boundaries deliberately off the 16-byte grid
        const std::vector<std::pair<std::uint64_t, std::uint64_t>> parts = {
            {0, 5}, {5, 16}, {21, 19}, {40, 33}, {73, 27}};
        ByteVector assembled;
        for (std::size_t i = 0; i < parts.size(); ++i) {
            auto [off, len] = parts[i];
            auto r = dec->decrypt(slice(cipher, off, len), keys,
                                  chunk(static_cast<std::uint32_t>(i), off, len));
            REQUIRE(r);
            assembled.insert(assembled.end(), r.value().begin(), r.value().end());
        }
        CHECK(assembled == plain);
    }

    SECTION("8-byte nonce with zero block counter") {
        const auto nonce = hexBytes("0102030405060708");
        ByteVector fullIv = nonce;
        fullIv.resize(16, std::byte{0});
        const auto cipher = encrypt(EVP_aes_128_ctr(), kKey128, fullIv, plain);
        KeyMaterial keys{CipherScheme::AesCtrStream, kKey128, nonce};

        auto r = dec->decrypt(slice(cipher, 48, 52), keys, chunk(1, 48, 52));
        REQUIRE(r);
        CHECK(r.value() == ByteVector(plain.begin() + 48, plain.end()));
    }

    SECTION("counter carry across the low 64 bits") {
        const auto iv = hexBytes("00000000000000ffffffffffffffffff");
        const auto cipher = encrypt(EVP_aes_128_ctr(), kKey128, iv, plain);
        KeyMaterial keys{CipherScheme::AesCtrStream, kKey128, iv};

        auto r = dec->decrypt(slice(cipher, 37, 40), keys, chunk(2, 37, 40));
        REQUIRE(r);
        CHECK(r.value() == ByteVector(plain.begin() + 37, plain.begin() + 77));
    }
}

TEST_CASE("AES-CBC with a shared IV decrypts each chunk independently", "[downloader][decrypt]") {
    auto dec = makeOpenSslStreamDecryptor();
    const auto iv = hexBytes("101112131415161718191a1b1c1d1e1f");
    const auto first = bytesOf(makePlaintext(32));
    const auto second = bytesOf(makePlaintext(48));
    KeyMaterial keys{CipherScheme::AesCbcSharedIv, kKey128, iv};

    auto r0 = dec->decrypt(encrypt(EVP_aes_128_cbc(), kKey128, iv, first), keys, chunk(0, 0, 32));
    auto r1 =
        dec->decrypt(encrypt(EVP_aes_128_cbc(), kKey128, iv, second), keys, chunk(1, 32, 48));
    REQUIRE(r0);
    REQUIRE(r1);
    CHECK(r0.value() == first);
    CHECK(r1.value() == second);
}

TEST_CASE("AES-CBC with index IVs uses the chunk index as IV", "[downloader][decrypt]") {
    auto dec = makeOpenSslStreamDecryptor();
    const auto plain = bytesOf(makePlaintext(16));
    ByteVector iv(16, std::byte{0});
    iv[15] = std::byte{5};
    const auto cipher = encrypt(EVP_aes_128_cbc(), kKey128, iv, plain);
    KeyMaterial keys{CipherScheme::AesCbcIndexIv, kKey128, {}};

    auto r = dec->decrypt(cipher, keys, chunk(5, 80, 16));
    REQUIRE(r);
    CHECK(r.value() == plain);

    auto wrongIndex = dec->decrypt(cipher, keys, chunk(4, 64, 16));
    REQUIRE(wrongIndex);
    CHECK(wrongIndex.value() != plain);
}

TEST_CASE("Decryption rejects malformed input", "[downloader][decrypt]") {
    auto dec = makeOpenSslStreamDecryptor();
    const auto iv = hexBytes("101112131415161718191a1b1c1d1e1f");

    SECTION("CBC ciphertext not a multiple of the block size") {
        KeyMaterial keys{CipherScheme::AesCbcSharedIv, kKey128, iv};
        auto r = dec->decrypt(bytesOf(makePlaintext(17)), keys, chunk(2, 0, 17));
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::DecryptionFailure);
        CHECK(r.error().message.find("Chunk 2") != std::string::npos);
    }

    SECTION("bad key length") {
        KeyMaterial keys{CipherScheme::AesCtrStream, hexBytes("0011"), iv};
        auto r = dec->decrypt(bytesOf("abc"), keys, chunk(0, 0, 3));
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::DecryptionFailure);
    }

    SECTION("bad CTR nonce length") {
        KeyMaterial keys{CipherScheme::AesCtrStream, kKey128, hexBytes("0011")};
        auto r = dec->decrypt(bytesOf("abc"), keys, chunk(0, 0, 3));
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::DecryptionFailure);
    }
}

TEST_CASE("SHA-256 verifier produces lower-case hex and resets", "[downloader][integrity]") {
    auto v = makeSha256Verifier();
    REQUIRE(v->update(bytesOf("a")));
    REQUIRE(v->update(bytesOf("bc")));
    auto digest = v->finalize();
    REQUIRE(digest);
    CHECK(digest.value() == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    // Reusable after finalize
    auto empty = v->finalize();
    REQUIRE(empty);
    CHECK(empty.value() == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_CASE("Cipher scheme names round trip", "[downloader][decrypt]") {
    for (auto s : {CipherScheme::None, CipherScheme::AesCtrStream, CipherScheme::AesCbcSharedIv,
                   CipherScheme::AesCbcIndexIv}) {
        auto parsed = cipherSchemeFromString(cipherSchemeToString(s));
        REQUIRE(parsed.has_value());
        CHECK(*parsed == s);
    }
    CHECK_FALSE(cipherSchemeFromString("rot13").has_value());
}
