#pragma once

#include <cstddef>
#include <string>

namespace practicedb::storage::crypto {

inline constexpr std::size_t kKeySize = 32;
inline constexpr std::size_t kIvSize  = 12;
inline constexpr std::size_t kTagSize = 16;

std::string RandomBytes(std::size_t n);

std::string Base64Encode(const std::string& bytes);
// Throws std::invalid_argument on malformed input.
std::string Base64Decode(const std::string& text);

/*
  AES-256-GCM with a fresh random IV per call.

  Sealed layout: iv (12) | ciphertext | tag (16).
  Open throws std::runtime_error when the tag does not verify.
*/
std::string Seal(const std::string& key, const std::string& plaintext);
std::string Open(const std::string& key, const std::string& sealed);

} // namespace practicedb::storage::crypto
