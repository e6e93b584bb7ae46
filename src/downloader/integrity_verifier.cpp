/*
 * kfetch/src/downloader/integrity_verifier.cpp
 *
 * Streaming SHA-256 via OpenSSL EVP.
 *
 * Kemono-style file paths are named by the SHA-256 of their content, so the
 * transfer worker can verify a download end-to-end whenever the path carries a
 * digest. One verifier instance per transfer; instances are not thread-safe.
 */

#include <kfetch/downloader/downloader.hpp>

#include <openssl/evp.h>

#include <array>
#include <cstddef>
#include <memory>
#include <string>

namespace kfetch::downloader {

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
    explicit operator bool() const noexcept { return ctx != nullptr; }
};

inline std::string to_hex_lower(const unsigned char* bytes, std::size_t len) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        unsigned v = bytes[i];
        out[2 * i + 0] = kHex[(v >> 4) & 0xF];
        out[2 * i + 1] = kHex[(v >> 0) & 0xF];
    }
    return out;
}

class OpenSslSha256Verifier final : public IIntegrityVerifier {
public:
    OpenSslSha256Verifier() { reset(); }

    void reset() override {
        _ready = _ctx && EVP_DigestInit_ex(_ctx.ctx, EVP_sha256(), nullptr) == 1;
    }

    void update(std::span<const std::byte> data) override {
        if (!_ready || data.empty())
            return;
        if (EVP_DigestUpdate(_ctx.ctx, data.data(), data.size()) != 1)
            _ready = false;
    }

    // An empty hex string means the digest could not be computed
    Checksum finalize() override {
        Checksum out;
        if (!_ready)
            return out;

        std::array<unsigned char, EVP_MAX_MD_SIZE> md_buf{};
        unsigned md_len = 0;
        if (EVP_DigestFinal_ex(_ctx.ctx, md_buf.data(), &md_len) == 1) {
            out.hex = to_hex_lower(md_buf.data(), md_len);
        }
        reset();
        return out;
    }

private:
    EvpMdCtx _ctx{};
    bool _ready{false};
};

} // namespace

std::unique_ptr<IIntegrityVerifier> makeIntegrityVerifierSha256() {
    return std::make_unique<OpenSslSha256Verifier>();
}

} // namespace kfetch::downloader
