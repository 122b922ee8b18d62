#pragma once

#include <arrow/buffer.h>
#include <arrow/io/interfaces.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace localdeck::storage {

/*
  One stored audio payload.

  content_ref is the lowercase hex SHA-256 of the bytes, so equal payloads
  always share one entry.
*/
struct ContentEntry {
  std::string content_ref;
  uint64_t    byte_size = 0;
  std::string format;
};

/*
  Content-addressed audio storage.

  Every payload is represented as an Arrow Buffer.

  Guarantees for ALL implementations:
    - Put is idempotent: identical bytes yield the identical reference
    - a published entry is immutable
    - partial writes are never visible under the final reference
    - Read/Open/Stat throw util::NotFound for unknown or malformed references
    - I/O failures throw util::StorageError

  Implementations:
    DISK → Arrow file IO, write-temp-then-rename
    RAM  → in-memory Arrow buffers (tests, ephemeral decks)
*/
class ContentStore {
 public:
  virtual ~ContentStore() = default;

  virtual std::string Put(const std::shared_ptr<arrow::Buffer>& bytes) = 0;

  // Whole payload.
  virtual std::shared_ptr<arrow::Buffer> Read(const std::string& content_ref) = 0;

  // Random-access stream over a published payload, used by playback.
  virtual std::shared_ptr<arrow::io::RandomAccessFile> Open(const std::string& content_ref) = 0;

  virtual bool Exists(const std::string& content_ref) = 0;

  virtual ContentEntry Stat(const std::string& content_ref) = 0;

  virtual std::vector<ContentEntry> List() = 0;
};

using ContentStorePtr = std::shared_ptr<ContentStore>;

} // namespace localdeck::storage
