#ifndef IGNITE_BUILD_CONTENT_HASH_HPP
#define IGNITE_BUILD_CONTENT_HASH_HPP

// content_hash.hpp - SHA-256 content hashing (OpenSSL EVP)
// Part of ignite_build - Ignite Build Orchestrator

#include <filesystem>
#include <string>

namespace ignite::build {

namespace fs = std::filesystem;

// SHA-256 digests are rendered as 64 lowercase hex characters
constexpr size_t SHA256_HEX_LENGTH = 64;

std::string sha256_hex(const std::string& bytes);

// Streams the file in 8 KiB chunks.
// @throws FilesystemError if the file cannot be opened or read
std::string sha256_file(const fs::path& path);

} // namespace ignite::build

#endif // IGNITE_BUILD_CONTENT_HASH_HPP
