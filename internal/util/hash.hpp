#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace localdeck::util {

constexpr std::size_t kSha256HexLength = 64;

// Lowercase hex SHA-256 of the given bytes.
std::string Sha256Hex(const uint8_t* data, std::size_t size);

inline std::string Sha256Hex(std::string_view bytes) {
  return Sha256Hex(reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size());
}

bool IsSha256Hex(std::string_view value);

} // namespace localdeck::util
