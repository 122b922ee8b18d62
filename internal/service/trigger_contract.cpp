#include "trigger_contract.hpp"

#include "internal/util/errors.hpp"

namespace localdeck::service {

namespace {

bool IsUnreserved(unsigned char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '.' || c == '_' || c == '~';
}

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

std::string PercentEncode(std::string_view value) {
  static constexpr char kHex[] = "0123456789ABCDEF";
  std::string           out;
  out.reserve(value.size());
  for (char ch : value) {
    const auto c = static_cast<unsigned char>(ch);
    if (IsUnreserved(c)) {
      out.push_back(ch);
    } else {
      out.push_back('%');
      out.push_back(kHex[c >> 4]);
      out.push_back(kHex[c & 0x0F]);
    }
  }
  return out;
}

std::string PercentDecode(std::string_view value) {
  std::string out;
  out.reserve(value.size());
  for (size_t i = 0; i < value.size(); ++i) {
    const char c = value[i];
    if (c == '+') {
      out.push_back(' ');
    } else if (c == '%') {
      if (i + 2 >= value.size()) {
        throw localdeck::util::InvalidArgument("truncated percent escape in query");
      }
      const int hi = HexValue(value[i + 1]);
      const int lo = HexValue(value[i + 2]);
      if (hi < 0 || lo < 0) {
        throw localdeck::util::InvalidArgument("malformed percent escape in query");
      }
      out.push_back(static_cast<char>((hi << 4) | lo));
      i += 2;
    } else {
      out.push_back(c);
    }
  }
  return out;
}

std::string BuildPlayUrl(std::string_view base_url, std::string_view card_id, const std::optional<std::string>& source_hint) {
  if (card_id.empty()) {
    throw localdeck::util::InvalidArgument("card_id is required");
  }

  while (!base_url.empty() && base_url.back() == '/') {
    base_url.remove_suffix(1);
  }

  std::string url(base_url);
  url += "/play?h=";
  url += PercentEncode(card_id);
  if (source_hint) {
    url += "&y=";
    url += PercentEncode(*source_hint);
  }
  return url;
}

PlayQuery ParsePlayQuery(std::string_view query) {
  if (!query.empty() && query.front() == '?') {
    query.remove_prefix(1);
  }

  std::optional<std::string> card_id;
  PlayQuery                  parsed;

  while (!query.empty()) {
    const auto amp  = query.find('&');
    const auto pair = query.substr(0, amp);
    query           = amp == std::string_view::npos ? std::string_view{} : query.substr(amp + 1);
    if (pair.empty()) continue;

    const auto eq    = pair.find('=');
    const auto key   = PercentDecode(pair.substr(0, eq));
    const auto value = eq == std::string_view::npos ? std::string{} : PercentDecode(pair.substr(eq + 1));

    // first occurrence wins
    if (key == "h" && !card_id) {
      card_id = value;
    } else if (key == "y" && !parsed.source_hint) {
      parsed.source_hint = value;
    }
  }

  if (!card_id || card_id->empty()) {
    throw localdeck::util::InvalidArgument("missing card id (h)");
  }
  parsed.card_id = std::move(*card_id);
  return parsed;
}

int HttpStatusFor(const std::exception& e) {
  using namespace localdeck::util;

  if (dynamic_cast<const UnknownCard*>(&e)) {
    return 404;
  }
  if (dynamic_cast<const UnsupportedSource*>(&e)) {
    return 422;
  }
  if (dynamic_cast<const SourceUnavailable*>(&e)) {
    return 502;
  }
  if (dynamic_cast<const StorageError*>(&e)) {
    return 507;
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return 410;
  }
  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return 400;
  }
  if (dynamic_cast<const Cancelled*>(&e)) {
    return 499;
  }
  return 500;
}

} // namespace localdeck::service
