#include "source_ref.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

#include "internal/util/errors.hpp"

namespace localdeck::fetch {

namespace {

constexpr std::string_view kYoutube       = "youtube";
constexpr std::size_t      kVideoIdLength = 11;

std::string_view Trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

bool StartsWith(std::string_view s, std::string_view prefix) {
  return s.substr(0, prefix.size()) == prefix;
}

// An id is exactly 11 id characters, optionally followed by query/fragment/path noise.
std::optional<std::string> TakeVideoId(std::string_view s) {
  if (s.size() < kVideoIdLength) return std::nullopt;
  if (!std::all_of(s.begin(), s.begin() + kVideoIdLength, IsVideoIdChar)) return std::nullopt;
  if (s.size() > kVideoIdLength) {
    const char next = s[kVideoIdLength];
    if (next != '?' && next != '&' && next != '#' && next != '/') return std::nullopt;
  }
  return std::string(s.substr(0, kVideoIdLength));
}

// Looks for v=<id> among '&'-separated parameters.
std::optional<std::string> VideoIdFromQuery(std::string_view query) {
  if (StartsWith(query, "?")) query.remove_prefix(1);
  const auto fragment = query.find('#');
  if (fragment != std::string_view::npos) query = query.substr(0, fragment);

  while (!query.empty()) {
    const auto amp   = query.find('&');
    const auto param = query.substr(0, amp);
    if (StartsWith(param, "v=")) {
      return TakeVideoId(param.substr(2));
    }
    if (amp == std::string_view::npos) break;
    query.remove_prefix(amp + 1);
  }
  return std::nullopt;
}

std::string Lower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

SourceRef Youtube(std::string id) {
  return SourceRef{std::string(kYoutube), std::move(id)};
}

} // namespace

bool IsVideoIdChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_';
}

std::string SourceRef::Key() const {
  return provider + ":" + id;
}

std::string SourceRef::FetchUrl() const {
  return "https://www.youtube.com/watch?v=" + id;
}

SourceRef ParseSourceRef(std::string_view raw) {
  const auto hint = Trim(raw);
  if (hint.empty()) {
    throw localdeck::util::UnsupportedSource("source hint is empty");
  }

  if (auto id = TakeVideoId(hint)) {
    return Youtube(std::move(*id));
  }

  auto rest = hint;
  for (std::string_view scheme : {"https://", "http://"}) {
    if (StartsWith(Lower(rest.substr(0, scheme.size())), scheme)) {
      rest.remove_prefix(scheme.size());
      break;
    }
  }

  // host-less fragments: "v=<id>", "?v=<id>", "watch?v=<id>"
  if (StartsWith(rest, "v=") || StartsWith(rest, "?")) {
    if (auto id = VideoIdFromQuery(rest)) return Youtube(std::move(*id));
  }
  if (StartsWith(rest, "watch?")) {
    if (auto id = VideoIdFromQuery(rest.substr(5))) return Youtube(std::move(*id));
  }

  const auto slash = rest.find('/');
  auto       host  = Lower(rest.substr(0, slash));
  const auto path  = slash == std::string_view::npos ? std::string_view{} : rest.substr(slash + 1);

  for (std::string_view prefix : {"www.", "m.", "music."}) {
    if (StartsWith(host, prefix)) {
      host.erase(0, prefix.size());
      break;
    }
  }

  if (host == "youtu.be") {
    if (auto id = TakeVideoId(path)) return Youtube(std::move(*id));
  } else if (host == "youtube.com" || host == "youtube-nocookie.com") {
    if (StartsWith(path, "watch")) {
      const auto query = path.find('?');
      if (query != std::string_view::npos) {
        if (auto id = VideoIdFromQuery(path.substr(query))) return Youtube(std::move(*id));
      }
    }
    for (std::string_view prefix : {"shorts/", "embed/", "live/", "v/"}) {
      if (StartsWith(path, prefix)) {
        if (auto id = TakeVideoId(path.substr(prefix.size()))) return Youtube(std::move(*id));
      }
    }
  }

  throw localdeck::util::UnsupportedSource("unsupported source hint: '" + std::string(hint) + "'");
}

} // namespace localdeck::fetch
