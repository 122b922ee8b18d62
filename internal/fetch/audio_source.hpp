#pragma once

#include <arrow/buffer.h>

#include <memory>

#include "source_ref.hpp"

namespace localdeck::fetch {

/*
  External audio retrieval.

  Retrieve blocks until the whole payload is available and throws
  util::SourceUnavailable when the source cannot deliver it.
*/
class AudioSource {
 public:
  virtual ~AudioSource() = default;

  virtual std::shared_ptr<arrow::Buffer> Retrieve(const SourceRef& source) = 0;
};

} // namespace localdeck::fetch
