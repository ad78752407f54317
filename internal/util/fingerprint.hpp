#pragma once

#include <cstddef>
#include <string>
#include <string_view>

typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace colguard::util {

/*
  Incremental SHA-256 over a sequence of fields.

  Every field is length-prefixed, so ("ab","c") and ("a","bc") hash
  differently. Digest is rendered as 64 lowercase hex characters.
*/
class Fingerprinter {
 public:
  Fingerprinter();
  ~Fingerprinter();

  Fingerprinter(const Fingerprinter&)            = delete;
  Fingerprinter& operator=(const Fingerprinter&) = delete;

  Fingerprinter& Add(std::string_view field);

  // Finalizes; further Add() calls throw.
  std::string HexDigest();

 private:
  void Update(const void* data, std::size_t size);

  EVP_MD_CTX* ctx_       = nullptr;
  bool        finalized_ = false;
};

std::string Sha256Hex(std::string_view data);

} // namespace colguard::util
