#include "cipher.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <memory>
#include <stdexcept>

namespace practicedb::storage::crypto {

namespace {

using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

CipherCtx NewContext() {
  CipherCtx ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
  if (!ctx) throw std::runtime_error("crypto: EVP_CIPHER_CTX_new failed");
  return ctx;
}

void CheckKey(const std::string& key) {
  if (key.size() != kKeySize) {
    throw std::invalid_argument("crypto: key must be " + std::to_string(kKeySize) + " bytes");
  }
}

unsigned char* Bytes(std::string& s) {
  return reinterpret_cast<unsigned char*>(s.data());
}

const unsigned char* Bytes(const std::string& s) {
  return reinterpret_cast<const unsigned char*>(s.data());
}

} // namespace

std::string RandomBytes(std::size_t n) {
  std::string out(n, '\0');
  if (RAND_bytes(Bytes(out), static_cast<int>(n)) != 1) {
    throw std::runtime_error("crypto: RAND_bytes failed");
  }
  return out;
}

std::string Base64Encode(const std::string& bytes) {
  std::string out(4 * ((bytes.size() + 2) / 3) + 1, '\0');
  const int   n = EVP_EncodeBlock(Bytes(out), Bytes(bytes), static_cast<int>(bytes.size()));
  out.resize(static_cast<std::size_t>(n));
  return out;
}

std::string Base64Decode(const std::string& text) {
  if (text.size() % 4 != 0) throw std::invalid_argument("crypto: malformed base64");

  std::string out(3 * (text.size() / 4) + 1, '\0');
  const int   n = EVP_DecodeBlock(Bytes(out), Bytes(text), static_cast<int>(text.size()));
  if (n < 0) throw std::invalid_argument("crypto: malformed base64");

  // EVP_DecodeBlock counts the padding as zero bytes.
  std::size_t padding = 0;
  if (!text.empty() && text.back() == '=') ++padding;
  if (text.size() > 1 && text[text.size() - 2] == '=') ++padding;
  out.resize(static_cast<std::size_t>(n) - padding);
  return out;
}

std::string Seal(const std::string& key, const std::string& plaintext) {
  CheckKey(key);
  const std::string iv  = RandomBytes(kIvSize);
  auto              ctx = NewContext();

  if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kIvSize), nullptr) != 1 ||
      EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, Bytes(key), Bytes(iv)) != 1) {
    throw std::runtime_error("crypto: encrypt init failed");
  }

  std::string out = iv;
  out.resize(kIvSize + plaintext.size() + kTagSize);
  unsigned char* cipher = Bytes(out) + kIvSize;

  int len = 0;
  if (EVP_EncryptUpdate(ctx.get(), cipher, &len, Bytes(plaintext), static_cast<int>(plaintext.size())) != 1) {
    throw std::runtime_error("crypto: encrypt failed");
  }
  int total = len;
  if (EVP_EncryptFinal_ex(ctx.get(), cipher + total, &len) != 1) {
    throw std::runtime_error("crypto: encrypt final failed");
  }
  total += len;

  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(kTagSize), cipher + total) != 1) {
    throw std::runtime_error("crypto: reading GCM tag failed");
  }
  out.resize(kIvSize + static_cast<std::size_t>(total) + kTagSize);
  return out;
}

std::string Open(const std::string& key, const std::string& sealed) {
  CheckKey(key);
  if (sealed.size() < kIvSize + kTagSize) throw std::runtime_error("crypto: sealed value too short");

  const std::string iv         = sealed.substr(0, kIvSize);
  const std::string ciphertext = sealed.substr(kIvSize, sealed.size() - kIvSize - kTagSize);
  std::string       tag        = sealed.substr(sealed.size() - kTagSize);

  auto ctx = NewContext();
  if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kIvSize), nullptr) != 1 ||
      EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, Bytes(key), Bytes(iv)) != 1) {
    throw std::runtime_error("crypto: decrypt init failed");
  }

  std::string plaintext(ciphertext.size() + kTagSize, '\0');
  int         len = 0;
  if (EVP_DecryptUpdate(ctx.get(), Bytes(plaintext), &len, Bytes(ciphertext), static_cast<int>(ciphertext.size())) != 1) {
    throw std::runtime_error("crypto: decrypt failed");
  }
  int total = len;

  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(kTagSize), Bytes(tag)) != 1) {
    throw std::runtime_error("crypto: setting GCM tag failed");
  }
  if (EVP_DecryptFinal_ex(ctx.get(), Bytes(plaintext) + total, &len) != 1) {
    throw std::runtime_error("crypto: authentication failed");
  }
  total += len;

  plaintext.resize(static_cast<std::size_t>(total));
  return plaintext;
}

} // namespace practicedb::storage::crypto
