#include "crypto/sha256.hpp"

#include "copy/copy_options.hpp"
#include "io/file_reader.hpp"

#include <openssl/evp.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <vector>

namespace treecopy {

namespace {

constexpr std::size_t kDigestSize = 32;

std::string HexEncode(std::span<const std::uint8_t> bytes) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out(bytes.size() * 2, '0');
    for (size_t i = 0; i < bytes.size(); ++i) {
        out[i * 2] = kHex[bytes[i] >> 4];
        out[i * 2 + 1] = kHex[bytes[i] & 0xF];
    }
    return out;
}

struct EvpCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

} // namespace

struct Sha256Hasher::Impl {
    std::unique_ptr<EVP_MD_CTX, EvpCtxDeleter> ctx;
    // Cleared by a failed OpenSSL call or by FinalHex().
    bool usable = false;
};

Sha256Hasher::Sha256Hasher() : impl_(std::make_unique<Impl>()) {
    impl_->ctx.reset(EVP_MD_CTX_new());
    impl_->usable = impl_->ctx && EVP_DigestInit_ex(impl_->ctx.get(), EVP_sha256(), nullptr) == 1;
}

Sha256Hasher::Sha256Hasher(Sha256Hasher&&) noexcept = default;
Sha256Hasher& Sha256Hasher::operator=(Sha256Hasher&&) noexcept = default;
Sha256Hasher::~Sha256Hasher() = default;

void Sha256Hasher::Update(std::span<const std::uint8_t> data) {
    if (!impl_ || !impl_->usable || data.empty()) return;
    if (EVP_DigestUpdate(impl_->ctx.get(), data.data(), data.size()) != 1) {
        impl_->usable = false;
    }
}

std::string Sha256Hasher::FinalHex() {
    if (!impl_ || !impl_->usable) return {};
    impl_->usable = false;

    std::array<std::uint8_t, kDigestSize> digest{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(impl_->ctx.get(), digest.data(), &len) != 1 || len != digest.size()) {
        return {};
    }
    return HexEncode(digest);
}

std::string Sha256Hex(std::span<const std::uint8_t> data) {
    Sha256Hasher hasher;
    hasher.Update(data);
    return hasher.FinalHex();
}

std::string Sha256Hex(IReader& reader) {
    Sha256Hasher hasher;
    std::vector<std::uint8_t> buf(kDefaultChunkSize);
    for (;;) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n < 0) return {};
        if (n == 0) break;
        hasher.Update(std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n)));
    }
    return hasher.FinalHex();
}

Result Sha256HexFile(const std::string& path, std::string& out_hex) {
    FileReader reader;
    auto r = FileReader::Open(path, reader);
    if (!r.ok) return r;

    errno = 0;
    out_hex = Sha256Hex(reader);
    if (out_hex.empty()) {
        const int e = errno != 0 ? errno : EIO;
        return Result::IoError(e, path, "sha256 failed: " + path + " (" + std::strerror(e) + ")");
    }
    return Result::Ok();
}

} // namespace treecopy
