#pragma once

#include <arrow/buffer.h>
#include <arrow/io/interfaces.h>
#include <arrow/result.h>
#include <arrow/status.h>

#include <memory>

#include "internal/util/errors.hpp"

namespace localdeck::storage::common {

/*
  Helper: unwrap Arrow Result<T> or throw util::StorageError
*/
template <typename T>
T Unwrap(const arrow::Result<T>& result) {
  if (!result.ok()) throw localdeck::util::StorageError(result.status().ToString());
  return *result;
}

inline void Unwrap(const arrow::Status& status) {
  if (!status.ok()) throw localdeck::util::StorageError(status.ToString());
}

/*
  Read entire file into buffer
*/
inline std::shared_ptr<arrow::Buffer> ReadAll(const std::shared_ptr<arrow::io::RandomAccessFile>& file) {
  auto size = Unwrap(file->GetSize());
  return Unwrap(file->ReadAt(0, size));
}

} // namespace localdeck::storage::common
