#include "altb/tag_resolver.hpp"

#include <fstream>

#include <openssl/evp.h>

namespace altb {

// ============================================================================
// SHA-256 Implementation (using OpenSSL 3.0+ EVP API)
// ============================================================================

namespace {

// RAII wrapper for EVP_MD_CTX
class EvpMdCtx {
public:
    EvpMdCtx() : ctx_(EVP_MD_CTX_new()) {}
    ~EvpMdCtx() { if (ctx_) EVP_MD_CTX_free(ctx_); }

    EvpMdCtx(const EvpMdCtx&) = delete;
    EvpMdCtx& operator=(const EvpMdCtx&) = delete;

    EVP_MD_CTX* get() { return ctx_; }
    explicit operator bool() const { return ctx_ != nullptr; }

private:
    EVP_MD_CTX* ctx_;
};

std::string bytes_to_hex(const unsigned char* data, size_t len) {
    static const char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        result.push_back(hex_chars[(data[i] >> 4) & 0x0F]);
        result.push_back(hex_chars[data[i] & 0x0F]);
    }
    return result;
}

Result<std::string> digest_failure(const std::string& step) {
    return Result<std::string>::err(Error(ErrorCode::IO_ERROR, step + " failed"));
}

} // namespace

Result<std::string> fingerprint_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Result<std::string>::err(Error(ErrorCode::SOURCE_NOT_FOUND,
                                              "failed to open file: " + path));
    }

    EvpMdCtx ctx;
    if (!ctx) return digest_failure("EVP_MD_CTX_new");

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return digest_failure("EVP_DigestInit_ex");
    }

    char buffer[8192];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        if (EVP_DigestUpdate(ctx.get(), buffer, static_cast<size_t>(file.gcount())) != 1) {
            return digest_failure("EVP_DigestUpdate");
        }
    }
    if (file.bad()) {
        return Result<std::string>::err(Error(ErrorCode::IO_ERROR, "failed to read file: " + path));
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    if (EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1) {
        return digest_failure("EVP_DigestFinal_ex");
    }

    return Result<std::string>::ok(kFingerprintPrefix + bytes_to_hex(hash, hash_len));
}

std::string tag_from_fingerprint(const std::string& fingerprint) {
    std::string hex = fingerprint;
    std::string prefix = kFingerprintPrefix;
    if (hex.rfind(prefix, 0) == 0) {
        hex = hex.substr(prefix.size());
    }
    return hex.substr(0, kDerivedTagLength);
}

} // namespace altb
