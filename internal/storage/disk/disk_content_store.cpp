#include "disk_content_store.hpp"

#include <arrow/io/file.h>
#include <fcntl.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/audio_format.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hash.hpp"

namespace localdeck::storage {

using namespace localdeck::storage::common;

namespace {

std::string NotFoundMessage(const std::string& content_ref) {
  return "content not found: " + content_ref;
}

// Makes a rename or a new entry in `dir` durable.
void SyncDirectory(const std::filesystem::path& dir) {
  const int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (fd < 0) {
    throw localdeck::util::StorageError("open " + dir.string() + ": " + std::strerror(errno));
  }
  const int rc  = ::fsync(fd);
  const int err = errno;
  ::close(fd);
  if (rc != 0) {
    throw localdeck::util::StorageError("fsync " + dir.string() + ": " + std::strerror(err));
  }
}

} // namespace

DiskContentStore::DiskContentStore(std::filesystem::path root, bool fsync)
    : root_(std::move(root)), objects_root_(root_ / "objects"), tmp_root_(root_ / "tmp"), fsync_(fsync) {
  std::error_code ec;
  std::filesystem::create_directories(objects_root_, ec);
  if (!ec) {
    std::filesystem::create_directories(tmp_root_, ec);
  }
  if (ec) {
    throw localdeck::util::StorageError("content store: cannot create " + root_.string() + ": " + ec.message());
  }

  RecoverTempFiles();
}

std::filesystem::path DiskContentStore::PublishedPath(const std::string& content_ref) const {
  return ContentPath(objects_root_, content_ref);
}

std::filesystem::path DiskContentStore::TempPath(const std::string& content_ref) {
  return tmp_root_ / (content_ref + "." + std::to_string(::getpid()) + "." + std::to_string(tmp_sequence_.fetch_add(1)) + ".part");
}

void DiskContentStore::RecoverTempFiles() {
  std::error_code ec;
  int64_t         removed = 0;
  for (const auto& entry : std::filesystem::directory_iterator(tmp_root_, ec)) {
    std::error_code remove_ec;
    if (std::filesystem::remove(entry.path(), remove_ec)) {
      ++removed;
    } else if (remove_ec) {
      LOCALDECK_LOG_WARN("content store: cannot remove stale temp file", {localdeck::observability::StringField("path", entry.path().string()),
                                                                          localdeck::observability::StringField("error", remove_ec.message())});
    }
  }
  if (ec) {
    throw localdeck::util::StorageError("content store: cannot scan " + tmp_root_.string() + ": " + ec.message());
  }
  if (removed > 0) {
    LOCALDECK_LOG_WARN("content store: removed abandoned partial writes", {localdeck::observability::IntField("count", removed)});
  }
}

/*
  Atomic publish:
      write tmp → flush (+fsync) → rename (+fsync of the directories)
*/
std::string DiskContentStore::Put(const std::shared_ptr<arrow::Buffer>& bytes) {
  const auto content_ref = localdeck::util::Sha256Hex(bytes->data(), static_cast<std::size_t>(bytes->size()));
  const auto final_path  = PublishedPath(content_ref);

  std::error_code ec;
  if (std::filesystem::exists(final_path, ec)) {
    return content_ref;
  }

  const auto tmp_path = TempPath(content_ref);
  try {
    {
      auto out = Unwrap(arrow::io::FileOutputStream::Open(tmp_path.string()));
      Unwrap(out->Write(bytes->data(), bytes->size()));
      Unwrap(out->Flush());
      if (fsync_ && ::fsync(out->file_descriptor()) != 0) {
        throw localdeck::util::StorageError(std::string("fsync failed: ") + std::strerror(errno));
      }
      Unwrap(out->Close());
    }

    const bool new_shard = std::filesystem::create_directories(final_path.parent_path());
    std::filesystem::rename(tmp_path, final_path);
    if (fsync_) {
      SyncDirectory(final_path.parent_path());
      if (new_shard) SyncDirectory(objects_root_);
    }
  } catch (const std::exception& e) {
    std::error_code remove_ec;
    std::filesystem::remove(tmp_path, remove_ec);
    throw localdeck::util::StorageError("content put " + content_ref + ": " + e.what());
  }

  return content_ref;
}

std::shared_ptr<arrow::Buffer> DiskContentStore::Read(const std::string& content_ref) {
  return ReadAll(Open(content_ref));
}

std::shared_ptr<arrow::io::RandomAccessFile> DiskContentStore::Open(const std::string& content_ref) {
  const auto path = PublishedPath(content_ref);

  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    throw localdeck::util::NotFound(NotFoundMessage(content_ref));
  }

  return Unwrap(arrow::io::ReadableFile::Open(path.string()));
}

bool DiskContentStore::Exists(const std::string& content_ref) {
  if (!localdeck::util::IsSha256Hex(content_ref)) {
    return false;
  }
  std::error_code ec;
  return std::filesystem::is_regular_file(PublishedPath(content_ref), ec);
}

ContentEntry DiskContentStore::Stat(const std::string& content_ref) {
  auto file = Open(content_ref);

  ContentEntry entry;
  entry.content_ref = content_ref;
  entry.byte_size   = static_cast<uint64_t>(Unwrap(file->GetSize()));

  std::array<uint8_t, kFormatProbeBytes> probe{};
  const auto                             read = Unwrap(file->ReadAt(0, static_cast<int64_t>(probe.size()), probe.data()));
  entry.format                                = SniffAudioFormat(probe.data(), static_cast<std::size_t>(read));
  Unwrap(file->Close());
  return entry;
}

std::vector<ContentEntry> DiskContentStore::List() {
  std::vector<ContentEntry> entries;

  std::error_code ec;
  for (const auto& entry : std::filesystem::recursive_directory_iterator(objects_root_, ec)) {
    if (!entry.is_regular_file()) {
      continue;
    }
    const auto name = entry.path().filename().string();
    if (!localdeck::util::IsSha256Hex(name)) {
      continue;
    }
    entries.push_back(Stat(name));
  }
  if (ec) {
    throw localdeck::util::StorageError("content store: cannot list " + objects_root_.string() + ": " + ec.message());
  }
  return entries;
}

} // namespace localdeck::storage
