#pragma once

#include <atomic>
#include <filesystem>

#include "internal/storage/content_store.hpp"

namespace localdeck::storage {

/*
  Durable content storage using Arrow IO.

  Layout under root:
    objects/<hh>/<sha256>   published payloads
    tmp/                    in-progress writes, swept on open

  Properties:
    - atomic publish (write tmp → flush → rename)
    - optional fsync of the payload and of its directory entry
    - concurrent Put of the same bytes converges on one entry
*/
class DiskContentStore final : public ContentStore {
 public:
  DiskContentStore(std::filesystem::path root, bool fsync);

  std::string Put(const std::shared_ptr<arrow::Buffer>& bytes) override;

  std::shared_ptr<arrow::Buffer> Read(const std::string& content_ref) override;

  std::shared_ptr<arrow::io::RandomAccessFile> Open(const std::string& content_ref) override;

  bool Exists(const std::string& content_ref) override;

  ContentEntry Stat(const std::string& content_ref) override;

  std::vector<ContentEntry> List() override;

 private:
  std::filesystem::path PublishedPath(const std::string& content_ref) const;
  std::filesystem::path TempPath(const std::string& content_ref);

  // Removes abandoned partial writes left by a crash.
  void RecoverTempFiles();

  std::filesystem::path root_;
  std::filesystem::path objects_root_;
  std::filesystem::path tmp_root_;
  bool                  fsync_;

  std::atomic<uint64_t> tmp_sequence_{0};
};

} // namespace localdeck::storage
