#pragma once

#include <shared_mutex>
#include <unordered_map>

#include <arrow/buffer.h>

#include "internal/storage/content_store.hpp"

namespace localdeck::storage {

/*
  RAM content storage.

  Backed by Arrow buffers stored in-memory.
  Provides zero-copy reads to callers. Nothing survives a restart.

  Thread safety:
    - shared reads
    - exclusive writes
*/
class RamContentStore final : public ContentStore {
 public:
  RamContentStore()           = default;
  ~RamContentStore() override = default;

  std::string Put(const std::shared_ptr<arrow::Buffer>& bytes) override;

  std::shared_ptr<arrow::Buffer> Read(const std::string& content_ref) override;

  std::shared_ptr<arrow::io::RandomAccessFile> Open(const std::string& content_ref) override;

  bool Exists(const std::string& content_ref) override;

  ContentEntry Stat(const std::string& content_ref) override;

  std::vector<ContentEntry> List() override;

 private:
  mutable std::shared_mutex                                       mutex_;
  std::unordered_map<std::string, std::shared_ptr<arrow::Buffer>> buffers_;
};

} // namespace localdeck::storage
