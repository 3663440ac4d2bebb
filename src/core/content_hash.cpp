// content_hash.cpp - SHA-256 content hashing (OpenSSL EVP)
// Part of ignite_build - Ignite Build Orchestrator

#include "core/content_hash.hpp"
#include "core/errors.hpp"

#include <openssl/evp.h>

#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>

namespace ignite::build {

namespace {

struct DigestContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

DigestContext new_sha256_context() {
    DigestContext ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw IgniteError("OpenSSL: cannot initialise SHA-256 context");
    }
    return ctx;
}

std::string finish_hex(EVP_MD_CTX* ctx) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx, digest, &length) != 1) {
        throw IgniteError("OpenSSL: SHA-256 finalisation failed");
    }

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(digest[i]);
    }
    return oss.str();
}

} // namespace

std::string sha256_hex(const std::string& bytes) {
    DigestContext ctx = new_sha256_context();
    if (EVP_DigestUpdate(ctx.get(), bytes.data(), bytes.size()) != 1) {
        throw IgniteError("OpenSSL: SHA-256 update failed");
    }
    return finish_hex(ctx.get());
}

std::string sha256_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FilesystemError("Cannot open for hashing: " + path.string());
    }

    DigestContext ctx = new_sha256_context();
    char buffer[8192];

    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        if (EVP_DigestUpdate(ctx.get(), buffer, static_cast<size_t>(file.gcount())) != 1) {
            throw IgniteError("OpenSSL: SHA-256 update failed");
        }
    }

    if (file.bad()) {
        throw FilesystemError("Read error while hashing: " + path.string());
    }

    return finish_hex(ctx.get());
}

} // namespace ignite::build
