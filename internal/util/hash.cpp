#include "hash.hpp"

#include <openssl/evp.h>

#include <memory>
#include <stdexcept>

namespace localdeck::util {

std::string Sha256Hex(const uint8_t* data, std::size_t size) {
  const EVP_MD* md = EVP_sha256();
  if (md == nullptr) {
    throw std::runtime_error("EVP_sha256 unavailable");
  }

  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> context(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!context) {
    throw std::runtime_error("failed to allocate EVP_MD_CTX");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int  hash_length = 0;

  if (EVP_DigestInit_ex(context.get(), md, nullptr) != 1 || EVP_DigestUpdate(context.get(), data, size) != 1 ||
      EVP_DigestFinal_ex(context.get(), hash, &hash_length) != 1) {
    throw std::runtime_error("failed to compute SHA-256 digest");
  }

  static constexpr char kHex[] = "0123456789abcdef";
  std::string           out;
  out.reserve(hash_length * 2);
  for (unsigned int i = 0; i < hash_length; ++i) {
    out.push_back(kHex[(hash[i] >> 4) & 0x0F]);
    out.push_back(kHex[hash[i] & 0x0F]);
  }
  return out;
}

bool IsSha256Hex(std::string_view value) {
  if (value.size() != kSha256HexLength) {
    return false;
  }
  for (char c : value) {
    const bool digit = c >= '0' && c <= '9';
    const bool lower = c >= 'a' && c <= 'f';
    if (!digit && !lower) {
      return false;
    }
  }
  return true;
}

} // namespace localdeck::util
