#pragma once

#include <atomic>
#include <filesystem>
#include <string>
#include <vector>

#include "audio_source.hpp"

namespace localdeck::fetch {

struct YtDlpOptions {
  // empty: rely on PATH
  std::string              executable;
  std::string              audio_format{"m4a"};
  std::vector<std::string> extra_args;
  // scratch space for downloads; each retrieval gets its own subdirectory
  std::filesystem::path work_dir;
};

/*
  Retrieves audio by running yt-dlp as a child process.

  yt-dlp extracts the best audio stream into a private scratch directory;
  the produced file is read back into a buffer and the directory removed.
  A non-zero exit is reported as util::SourceUnavailable carrying the
  tool's ERROR lines.
*/
class YtDlpAudioSource final : public AudioSource {
 public:
  explicit YtDlpAudioSource(YtDlpOptions options);

  std::shared_ptr<arrow::Buffer> Retrieve(const SourceRef& source) override;

  // Command line for one retrieval, shell-quoted.
  std::string BuildCommand(const SourceRef& source, const std::filesystem::path& output_dir) const;

 private:
  YtDlpOptions          options_;
  std::atomic<uint64_t> sequence_{0};
};

// Single-quotes `arg` for /bin/sh.
std::string ShellQuote(const std::string& arg);

} // namespace localdeck::fetch
