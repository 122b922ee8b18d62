#pragma once

#include <filesystem>
#include <string>

#include "internal/util/errors.hpp"
#include "internal/util/hash.hpp"

namespace localdeck::storage::common {

inline void ValidateContentRef(const std::string& content_ref) {
  if (!localdeck::util::IsSha256Hex(content_ref)) {
    throw localdeck::util::NotFound("content ref is malformed: '" + content_ref + "'");
  }
}

// objects/<first two hex chars>/<content_ref>
inline std::filesystem::path ContentPath(const std::filesystem::path& objects_root, const std::string& content_ref) {
  ValidateContentRef(content_ref);
  return objects_root / content_ref.substr(0, 2) / content_ref;
}

} // namespace localdeck::storage::common
