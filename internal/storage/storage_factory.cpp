#include "storage_factory.hpp"

#include <filesystem>

#include "disk/disk_content_store.hpp"
#include "ram/ram_content_store.hpp"

namespace localdeck::storage {

ContentStorePtr StorageFactory::Build(const localdeck::runtime::config::ContentConfig& cfg) {
  if (cfg.has_ram()) {
    return std::make_shared<RamContentStore>();
  }

  std::filesystem::path disk_root =
      cfg.disk().root_path().empty() ? std::filesystem::path{"/tmp/localdeck/content"} : std::filesystem::path{cfg.disk().root_path()};
  return std::make_shared<DiskContentStore>(std::move(disk_root), cfg.disk().fsync());
}

} // namespace localdeck::storage
