#pragma once

#include <arrow/io/interfaces.h>

#include <functional>
#include <memory>

#include "internal/storage/content_store.hpp"

namespace localdeck::playback {

/*
  Physical audio output.

  One stream at a time. on_finished fires from a sink-owned thread when
  the stream ends on its own; it never fires for a stream halted by Stop.
*/
class AudioSink {
 public:
  using FinishedCallback = std::function<void()>;

  virtual ~AudioSink() = default;

  // Returns once output has begun. Throws if the output cannot be opened.
  virtual void Start(std::shared_ptr<arrow::io::RandomAccessFile> stream, const localdeck::storage::ContentEntry& entry,
                     FinishedCallback on_finished) = 0;

  // Blocks until output has halted. No-op when nothing is playing.
  virtual void Stop() = 0;
};

} // namespace localdeck::playback
