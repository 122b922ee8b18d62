#include "ram_content_store.hpp"

#include <arrow/io/memory.h>

#include <mutex>

#include "internal/storage/common/audio_format.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hash.hpp"

namespace localdeck::storage {

namespace {

ContentEntry MakeEntry(const std::string& content_ref, const arrow::Buffer& buffer) {
  ContentEntry entry;
  entry.content_ref = content_ref;
  entry.byte_size   = static_cast<uint64_t>(buffer.size());
  entry.format      = common::SniffAudioFormat(buffer.data(), static_cast<std::size_t>(buffer.size()));
  return entry;
}

} // namespace

std::string RamContentStore::Put(const std::shared_ptr<arrow::Buffer>& bytes) {
  auto content_ref = localdeck::util::Sha256Hex(bytes->data(), static_cast<std::size_t>(bytes->size()));

  std::unique_lock lock(mutex_);
  buffers_.try_emplace(content_ref, bytes);
  return content_ref;
}

/*
  Zero-copy read.
*/
std::shared_ptr<arrow::Buffer> RamContentStore::Read(const std::string& content_ref) {
  std::shared_lock lock(mutex_);

  auto it = buffers_.find(content_ref);
  if (it == buffers_.end()) throw localdeck::util::NotFound("content not found: " + content_ref);

  return it->second;
}

std::shared_ptr<arrow::io::RandomAccessFile> RamContentStore::Open(const std::string& content_ref) {
  return std::make_shared<arrow::io::BufferReader>(Read(content_ref));
}

bool RamContentStore::Exists(const std::string& content_ref) {
  std::shared_lock lock(mutex_);
  return buffers_.contains(content_ref);
}

ContentEntry RamContentStore::Stat(const std::string& content_ref) {
  return MakeEntry(content_ref, *Read(content_ref));
}

std::vector<ContentEntry> RamContentStore::List() {
  std::shared_lock lock(mutex_);

  std::vector<ContentEntry> entries;
  entries.reserve(buffers_.size());
  for (const auto& [content_ref, buffer] : buffers_) {
    entries.push_back(MakeEntry(content_ref, *buffer));
  }
  return entries;
}

} // namespace localdeck::storage
