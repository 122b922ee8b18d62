#include "ytdlp_audio_source.hpp"

#include <arrow/io/file.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cstdio>
#include <sstream>
#include <system_error>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"

namespace localdeck::fetch {

using localdeck::observability::IntField;
using localdeck::observability::StringField;

namespace {

constexpr int kCommandNotFound = 127;

class ScopedDirectory {
 public:
  explicit ScopedDirectory(std::filesystem::path path) : path_(std::move(path)) {
    std::filesystem::create_directories(path_);
  }

  ~ScopedDirectory() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  ScopedDirectory(const ScopedDirectory&)            = delete;
  ScopedDirectory& operator=(const ScopedDirectory&) = delete;

  const std::filesystem::path& Path() const {
    return path_;
  }

 private:
  std::filesystem::path path_;
};

std::string Trim(const std::string& s) {
  const auto begin = s.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) return {};
  const auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(begin, end - begin + 1);
}

// yt-dlp may leave the pre-conversion download next to the extracted
// audio; prefer the file in the requested format, then the first by name.
std::filesystem::path PickOutput(const std::filesystem::path& dir, const std::string& audio_format) {
  std::vector<std::filesystem::path> candidates;
  std::error_code                    ec;
  for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
    if (entry.is_regular_file() && entry.path().extension() != ".part") {
      candidates.push_back(entry.path());
    }
  }
  std::sort(candidates.begin(), candidates.end());

  const auto wanted = "." + audio_format;
  for (const auto& path : candidates) {
    if (path.extension() == wanted) return path;
  }
  return candidates.empty() ? std::filesystem::path{} : candidates.front();
}

} // namespace

std::string ShellQuote(const std::string& arg) {
  std::string out = "'";
  for (char c : arg) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out.push_back(c);
    }
  }
  out.push_back('\'');
  return out;
}

YtDlpAudioSource::YtDlpAudioSource(YtDlpOptions options) : options_(std::move(options)) {
  if (options_.executable.empty()) options_.executable = "yt-dlp";
  if (options_.audio_format.empty()) options_.audio_format = "m4a";
  if (options_.work_dir.empty()) options_.work_dir = std::filesystem::temp_directory_path() / "localdeck-fetch";
}

std::string YtDlpAudioSource::BuildCommand(const SourceRef& source, const std::filesystem::path& output_dir) const {
  std::ostringstream cmd;
  cmd << ShellQuote(options_.executable) << " --no-playlist --no-progress --no-mtime -f bestaudio -x --audio-format "
      << ShellQuote(options_.audio_format) << " -o " << ShellQuote((output_dir / "audio.%(ext)s").string());
  for (const auto& arg : options_.extra_args) {
    cmd << ' ' << ShellQuote(arg);
  }
  cmd << " -- " << ShellQuote(source.FetchUrl()) << " 2>&1";
  return cmd.str();
}

std::shared_ptr<arrow::Buffer> YtDlpAudioSource::Retrieve(const SourceRef& source) {
  std::unique_ptr<ScopedDirectory> scratch;
  try {
    scratch = std::make_unique<ScopedDirectory>(options_.work_dir /
                                                (source.id + "-" + std::to_string(::getpid()) + "-" + std::to_string(sequence_.fetch_add(1))));
  } catch (const std::filesystem::filesystem_error& e) {
    throw localdeck::util::StorageError(std::string("fetch scratch directory: ") + e.what());
  }

  const auto command = BuildCommand(source, scratch->Path());
  LOCALDECK_LOG_INFO("running yt-dlp", {StringField("source", source.Key()), StringField("url", source.FetchUrl())});

  FILE* pipe = popen(command.c_str(), "r");
  if (!pipe) {
    throw localdeck::util::SourceUnavailable("failed to start yt-dlp for " + source.Key());
  }

  std::string errors;
  char        buffer[512];
  while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
    const auto line = Trim(buffer);
    if (line.rfind("ERROR", 0) == 0) {
      if (!errors.empty()) errors += "; ";
      errors += line;
    }
  }

  const int status    = pclose(pipe);
  const int exit_code = status == -1 ? -1 : (WIFEXITED(status) ? WEXITSTATUS(status) : -1);
  if (exit_code == kCommandNotFound) {
    throw localdeck::util::SourceUnavailable("yt-dlp not found: " + options_.executable);
  }
  if (exit_code != 0) {
    LOCALDECK_LOG_WARN("yt-dlp failed", {StringField("source", source.Key()), IntField("exit_code", exit_code), StringField("errors", errors)});
    throw localdeck::util::SourceUnavailable("yt-dlp failed for " + source.Key() + " (exit " + std::to_string(exit_code) +
                                             ")" + (errors.empty() ? "" : ": " + errors));
  }

  const auto produced = PickOutput(scratch->Path(), options_.audio_format);
  if (produced.empty()) {
    throw localdeck::util::SourceUnavailable("yt-dlp produced no audio for " + source.Key());
  }

  auto file  = localdeck::storage::common::Unwrap(arrow::io::ReadableFile::Open(produced.string()));
  auto bytes = localdeck::storage::common::ReadAll(file);
  localdeck::storage::common::Unwrap(file->Close());
  return bytes;
}

} // namespace localdeck::fetch
