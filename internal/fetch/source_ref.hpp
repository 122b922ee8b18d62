#pragma once

#include <string>
#include <string_view>

namespace localdeck::fetch {

/*
  Canonical identity of a fallback source.

  Every spelling of the same video (bare id, youtu.be link, watch URL,
  shorts/embed link, tracking parameters) normalizes to one key, so
  fetch deduplication works across cards printed at different times.
*/
struct SourceRef {
  std::string provider;
  std::string id;

  // "<provider>:<id>", used as the dedup key and stored on the track record.
  std::string Key() const;

  // URL handed to the retrieval tool.
  std::string FetchUrl() const;

  bool operator==(const SourceRef&) const = default;
};

// Throws util::UnsupportedSource when the hint names no supported source.
SourceRef ParseSourceRef(std::string_view raw);

bool IsVideoIdChar(char c);

} // namespace localdeck::fetch
