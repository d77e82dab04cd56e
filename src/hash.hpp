#pragma once

#include <filesystem>
#include <string>
#include <string_view>

// Calculates the SHA256 hash of a file as lower-case hex.
// Throws PipkinException if the file cannot be opened.
std::string calculate_sha256(const std::filesystem::path& file_path);

// Raw 32-byte SHA256 digest of a buffer.
std::string sha256_digest(std::string_view data);

// RECORD style hash: "sha256=" followed by the urlsafe base64 digest without padding.
// Throws MalformedMetadata if the digest cannot be computed.
std::string record_hash(std::string_view data);

std::string base64_encode(std::string_view data);
// Throws PipkinException on invalid input.
std::string base64_decode(std::string_view data);
