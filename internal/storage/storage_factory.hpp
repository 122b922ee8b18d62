#pragma once

#include "config/config.pb.h"
#include "content_store.hpp"

namespace localdeck::storage {

/*
  Builds the content store selected by configuration.

  content.disk → DiskContentStore rooted at root_path
  content.ram  → RamContentStore
  unset        → DiskContentStore under /tmp/localdeck/content
*/
class StorageFactory {
 public:
  static ContentStorePtr Build(const localdeck::runtime::config::ContentConfig& cfg);
};

} // namespace localdeck::storage
