/*
 * mediafetch/src/downloader/integrity_verifier.cpp
 *
 * SHA-256 IIntegrityVerifier via OpenSSL EVP.
 * - update() feeds byte spans to the active digest context.
 * - finalize() returns the lower-case hex digest and re-initializes for reuse.
 *
 * Dependencies:
 * - OpenSSL::Crypto
 */

#include <mediafetch/core/hex.h>
#include <mediafetch/downloader/downloader.hpp>

#include <openssl/evp.h>

#include <array>
#include <cstddef>
#include <memory>
#include <string>

namespace mediafetch::downloader {

namespace {

// Simple RAII wrapper for EVP_MD_CTX
struct EvpMdCtx {
    EVP_MD_CTX* ctx{nullptr};
    EvpMdCtx() : ctx(EVP_MD_CTX_new()) {}
    ~EvpMdCtx() {
        if (ctx)
            EVP_MD_CTX_free(ctx);
    }
    EvpMdCtx(const EvpMdCtx&) = delete;
    EvpMdCtx& operator=(const EvpMdCtx&) = delete;
    EvpMdCtx(EvpMdCtx&& other) noexcept : ctx(other.ctx) { other.ctx = nullptr; }
    EvpMdCtx& operator=(EvpMdCtx&& other) noexcept {
        if (this != &other) {
            if (ctx)
                EVP_MD_CTX_free(ctx);
            ctx = other.ctx;
            other.ctx = nullptr;
        }
        return *this;
    }
    explicit operator bool() const noexcept { return ctx != nullptr; }
};

class OpenSslSha256Verifier final : public IIntegrityVerifier {
public:
    OpenSslSha256Verifier() { reset(); }
    ~OpenSslSha256Verifier() override = default;

    void reset() override {
        _ctx = EvpMdCtx{};
        _ready = _ctx && EVP_DigestInit_ex(_ctx.ctx, EVP_sha256(), nullptr) == 1;
    }

    Result<void> update(ByteSpan data) override {
        if (!_ready)
            return Error{ErrorCode::Unknown, "SHA-256 context not initialized"};
        if (data.empty())
            return {};
        if (EVP_DigestUpdate(_ctx.ctx, data.data(), data.size()) != 1)
            return Error{ErrorCode::Unknown, "EVP_DigestUpdate failed"};
        return {};
    }

    Result<std::string> finalize() override {
        if (!_ready)
            return Error{ErrorCode::Unknown, "SHA-256 context not initialized"};

        std::array<unsigned char, EVP_MAX_MD_SIZE> md_buf{};
        unsigned md_len = 0;
        const bool ok = EVP_DigestFinal_ex(_ctx.ctx, md_buf.data(), &md_len) == 1;

        // Prepare for potential reuse
        reset();
        if (!ok)
            return Error{ErrorCode::Unknown, "EVP_DigestFinal_ex failed"};
        return toHexLower(md_buf.data(), md_len);
    }

private:
    EvpMdCtx _ctx{};
    bool _ready{false};
};

} // namespace

std::unique_ptr<IIntegrityVerifier> makeSha256Verifier() {
    return std::make_unique<OpenSslSha256Verifier>();
}

} // namespace mediafetch::downloader
