#include "internal/util/fingerprint.hpp"

#include <openssl/evp.h>
#include <openssl/sha.h>

#include <cstdint>
#include <stdexcept>

namespace colguard::util {

namespace {

std::string ToHex(const unsigned char* digest, std::size_t len) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string result(len * 2, '\0');
  for (std::size_t i = 0; i < len; ++i) {
    result[i * 2]     = kHex[digest[i] >> 4];
    result[i * 2 + 1] = kHex[digest[i] & 0x0F];
  }
  return result;
}

} // namespace

Fingerprinter::Fingerprinter() : ctx_(EVP_MD_CTX_new()) {
  if (ctx_ == nullptr) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }
  if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
    EVP_MD_CTX_free(ctx_);
    ctx_ = nullptr;
    throw std::runtime_error("EVP_DigestInit_ex failed");
  }
}

Fingerprinter::~Fingerprinter() {
  if (ctx_) EVP_MD_CTX_free(ctx_);
}

void Fingerprinter::Update(const void* data, std::size_t size) {
  if (finalized_) {
    throw std::logic_error("fingerprint already finalized");
  }
  if (EVP_DigestUpdate(ctx_, data, size) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }
}

Fingerprinter& Fingerprinter::Add(std::string_view field) {
  // fixed little-endian length prefix
  unsigned char prefix[8];
  std::uint64_t len = field.size();
  for (int i = 0; i < 8; ++i) {
    prefix[i] = static_cast<unsigned char>((len >> (8 * i)) & 0xFF);
  }
  Update(prefix, sizeof(prefix));
  Update(field.data(), field.size());
  return *this;
}

std::string Fingerprinter::HexDigest() {
  if (finalized_) {
    throw std::logic_error("fingerprint already finalized");
  }
  unsigned char digest[SHA256_DIGEST_LENGTH];
  unsigned int  len = 0;
  if (EVP_DigestFinal_ex(ctx_, digest, &len) != 1) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
  finalized_ = true;
  return ToHex(digest, len);
}

std::string Sha256Hex(std::string_view data) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  unsigned int  len = 0;

  EVP_MD_CTX* ctx = EVP_MD_CTX_new();
  if (ctx == nullptr) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }
  const bool ok = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1 && EVP_DigestUpdate(ctx, data.data(), data.size()) == 1 &&
                  EVP_DigestFinal_ex(ctx, digest, &len) == 1;
  EVP_MD_CTX_free(ctx);
  if (!ok) {
    throw std::runtime_error("sha256 digest failed");
  }
  return ToHex(digest, len);
}

} // namespace colguard::util
