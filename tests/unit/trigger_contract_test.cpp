#include <cassert>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#include "internal/service/trigger_contract.hpp"
#include "internal/util/errors.hpp"

namespace {

using localdeck::service::BuildPlayUrl;
using localdeck::service::HttpStatusFor;
using localdeck::service::ParsePlayQuery;

template <typename Fn>
bool RejectsAsInvalid(Fn&& fn) {
  try {
    fn();
  } catch (const localdeck::util::InvalidArgument&) {
    return true;
  }
  return false;
}

void TestBuildPlayUrl() {
  assert(BuildPlayUrl("http://deck.local:8080", "A1", std::string("dQw4w9WgXcQ")) == "http://deck.local:8080/play?h=A1&y=dQw4w9WgXcQ");
  assert(BuildPlayUrl("http://deck.local:8080//", "A1", std::nullopt) == "http://deck.local:8080/play?h=A1");
  assert(BuildPlayUrl("http://deck.local", "card 7", std::string("")) == "http://deck.local/play?h=card%207&y=");
  assert(BuildPlayUrl("http://deck.local", "A1", std::string("https://youtu.be/dQw4w9WgXcQ?si=x")) ==
         "http://deck.local/play?h=A1&y=https%3A%2F%2Fyoutu.be%2FdQw4w9WgXcQ%3Fsi%3Dx");

  assert(RejectsAsInvalid([] { BuildPlayUrl("http://deck.local", "", std::nullopt); }));
}

void TestParsePlayQuery() {
  auto parsed = ParsePlayQuery("?h=A1&y=dQw4w9WgXcQ");
  assert(parsed.card_id == "A1");
  assert(parsed.source_hint == std::optional<std::string>("dQw4w9WgXcQ"));

  parsed = ParsePlayQuery("h=B2");
  assert(parsed.card_id == "B2");
  assert(!parsed.source_hint.has_value());

  // first occurrence wins, unknown parameters and empty pairs are ignored
  parsed = ParsePlayQuery("utm_source=nfc&&h=C3&h=D4&y=&y=zzzzzzzzzzz");
  assert(parsed.card_id == "C3");
  assert(parsed.source_hint == std::optional<std::string>(""));

  parsed = ParsePlayQuery("h=a+b%2Fc&y=https%3A%2F%2Fyoutu.be%2FdQw4w9WgXcQ");
  assert(parsed.card_id == "a b/c");
  assert(parsed.source_hint == std::optional<std::string>("https://youtu.be/dQw4w9WgXcQ"));
}

void TestParseRejectsBadQueries() {
  assert(RejectsAsInvalid([] { ParsePlayQuery(""); }));
  assert(RejectsAsInvalid([] { ParsePlayQuery("y=dQw4w9WgXcQ"); }));
  assert(RejectsAsInvalid([] { ParsePlayQuery("h=&y=dQw4w9WgXcQ"); }));
  assert(RejectsAsInvalid([] { ParsePlayQuery("h"); }));
  assert(RejectsAsInvalid([] { ParsePlayQuery("h=A1%4"); }));
  assert(RejectsAsInvalid([] { ParsePlayQuery("h=A1%zz"); }));
}

void TestBuiltUrlParsesBack() {
  const std::string card = "shelf/3 #12";
  const std::string hint = "https://www.youtube.com/watch?v=dQw4w9WgXcQ&t=1";

  const auto url    = BuildPlayUrl("https://deck.example", card, hint);
  const auto parsed = ParsePlayQuery(url.substr(url.find('?')));
  assert(parsed.card_id == card);
  assert(parsed.source_hint == std::optional<std::string>(hint));
}

void TestHttpStatusMapping() {
  using namespace localdeck::util;

  assert(HttpStatusFor(UnknownCard("B2")) == 404);
  assert(HttpStatusFor(UnsupportedSource("vimeo")) == 422);
  assert(HttpStatusFor(SourceUnavailable("removed")) == 502);
  assert(HttpStatusFor(StorageError("disk full")) == 507);
  assert(HttpStatusFor(NotFound("gone")) == 410);
  assert(HttpStatusFor(InvalidArgument("missing h")) == 400);
  assert(HttpStatusFor(Cancelled("client left")) == 499);
  assert(HttpStatusFor(std::runtime_error("boom")) == 500);
}

} // namespace

int main() {
  TestBuildPlayUrl();
  TestParsePlayQuery();
  TestParseRejectsBadQueries();
  TestBuiltUrlParsesBack();
  TestHttpStatusMapping();

  std::cout << "localdeck_unit_trigger_contract: pass\n";
  return 0;
}
