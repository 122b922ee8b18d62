#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include "internal/factory.hpp"
#include "internal/service/deck_service.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/test_fakes.hpp"

namespace {

using namespace localdeck::deck::v1;
using localdeck::testing::FakeAudioSink;
using localdeck::testing::FakeAudioSource;

localdeck::runtime::config::RuntimeConfig MemoryConfig() {
  localdeck::runtime::config::RuntimeConfig config;
  config.mutable_database()->mutable_memory();
  config.mutable_content()->mutable_ram();
  config.mutable_public_endpoint()->set_base_url("http://deck.local:8080/");
  return config;
}

struct Deck {
  explicit Deck(const localdeck::runtime::config::RuntimeConfig& config)
      : source(std::make_shared<FakeAudioSource>()),
        sink(std::make_shared<FakeAudioSink>()),
        app(localdeck::factory::Build(config, localdeck::factory::Overrides{source, sink})) {
  }

  localdeck::service::DeckService& service() {
    return *app.deck_service;
  }

  std::shared_ptr<FakeAudioSource> source;
  std::shared_ptr<FakeAudioSink>   sink;
  localdeck::factory::Application  app;
};

PlayRequest Tap(const std::string& card_id, const std::optional<std::string>& hint = std::nullopt) {
  PlayRequest req;
  req.set_card_id(card_id);
  if (hint) req.set_source_hint(*hint);
  return req;
}

void TestFirstTapFetchesAndPlays() {
  Deck deck(MemoryConfig());

  const auto first = deck.service().Play(Tap("A1", std::string("dQw4w9WgXcQ")));
  assert(first.path() == RESOLUTION_PATH_FALLBACK);
  assert(first.content().format() == "mp3");
  assert(first.content().byte_size() == localdeck::testing::Mp3Bytes("dQw4w9WgXcQ").size());
  assert(first.content().ref_count() == 1);
  assert(deck.sink->Started().size() == 1);
  assert(deck.sink->Started().front() == first.content().content_ref());

  const auto status = deck.service().GetDeckStatus().status();
  assert(status.state() == DECK_STATE_PLAYING);
  assert(status.card_id() == "A1");
  assert(status.content_ref() == first.content().content_ref());

  const auto again = deck.service().Play(Tap("A1"));
  assert(again.path() == RESOLUTION_PATH_FAST);
  assert(again.content().content_ref() == first.content().content_ref());
  assert(deck.source->Calls() == 1);
  assert(!deck.sink->Overlapped());

  deck.service().Stop();
  assert(deck.service().GetDeckStatus().status().state() == DECK_STATE_IDLE);
}

void TestUnknownCardIsReported() {
  Deck deck(MemoryConfig());

  bool threw = false;
  try {
    deck.service().Play(Tap("B2"));
  } catch (const localdeck::util::UnknownCard&) {
    threw = true;
  }
  assert(threw);
  assert(deck.sink->Started().empty());
  assert(deck.service().GetDeckStatus().status().state() == DECK_STATE_IDLE);
}

void TestCardsSharingSourceShareContent() {
  Deck deck(MemoryConfig());
  deck.source->Hold();

  auto d4 = std::async(std::launch::async, [&] { return deck.service().Play(Tap("D4", std::string("https://youtu.be/dQw4w9WgXcQ"))); });
  auto e5 = std::async(std::launch::async, [&] { return deck.service().Play(Tap("E5", std::string("dQw4w9WgXcQ"))); });

  assert(deck.source->WaitForCalls(1));
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  deck.source->Release();

  const auto d = d4.get();
  const auto e = e5.get();
  assert(d.content().content_ref() == e.content().content_ref());
  assert(deck.source->Calls() == 1);
  assert(!deck.sink->Overlapped());

  LookupCardRequest lookup;
  lookup.set_card_id("D4");
  assert(deck.service().LookupCard(lookup).content().ref_count() == 2);
}

void TestLookupAndListCards() {
  Deck deck(MemoryConfig());

  LookupCardRequest missing;
  missing.set_card_id("Z9");
  const auto none = deck.service().LookupCard(missing);
  assert(!none.present());
  assert(!none.has_track());

  const auto played = deck.service().Play(Tap("A1", std::string("https://www.youtube.com/watch?v=dQw4w9WgXcQ")));
  deck.service().Play(Tap("F6", std::string("ffffffffff6")));

  LookupCardRequest known;
  known.set_card_id("A1");
  const auto found = deck.service().LookupCard(known);
  assert(found.present());
  assert(found.track().card_id() == "A1");
  assert(found.track().source_ref() == "youtube:dQw4w9WgXcQ");
  assert(found.track().content_ref() == played.content().content_ref());
  assert(found.track().has_created_at());
  assert(found.content().byte_size() == played.content().byte_size());

  const auto listed = deck.service().ListCards(ListCardsRequest{});
  assert(listed.tracks_size() == 2);
  assert(listed.unavailable_count() == 0);
  assert(listed.tracks(0).available());

  bool threw = false;
  try {
    deck.service().LookupCard(LookupCardRequest{});
  } catch (const localdeck::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

std::filesystem::path WriteFile(const std::filesystem::path& path, const std::string& bytes) {
  std::ofstream out(path, std::ios::binary);
  out << bytes;
  return path;
}

template <typename Fn>
bool RejectsAsInvalid(Fn&& fn) {
  try {
    fn();
  } catch (const localdeck::util::InvalidArgument&) {
    return true;
  }
  return false;
}

ImportFileRequest Import(const std::string& card_id, const std::filesystem::path& path) {
  ImportFileRequest req;
  req.set_card_id(card_id);
  req.set_path(path.string());
  return req;
}

void TestImportedFilePlaysWithoutFetch() {
  const auto root = localdeck::testing::FreshDir("deck_service_import");
  const auto song = WriteFile(root / "song.mp3", localdeck::testing::Mp3Bytes("local recording"));
  Deck       deck(MemoryConfig());

  const auto imported = deck.service().ImportFile(Import("G7", song));
  assert(imported.track().card_id() == "G7");
  assert(imported.track().source_ref().empty());
  assert(imported.track().available());
  assert(imported.content().format() == "mp3");
  assert(imported.content().mime_type() == "audio/mpeg");
  assert(imported.content().byte_size() == localdeck::testing::Mp3Bytes("local recording").size());
  assert(imported.content().ref_count() == 1);

  const auto played = deck.service().Play(Tap("G7"));
  assert(played.path() == RESOLUTION_PATH_FAST);
  assert(played.content().content_ref() == imported.content().content_ref());
  assert(deck.source->Calls() == 0);

  // same bytes under another card share one stored copy
  const auto again = deck.service().ImportFile(Import("H8", song));
  assert(again.content().content_ref() == imported.content().content_ref());
  assert(again.content().ref_count() == 2);
}

void TestImportRejectsBadInput() {
  const auto root = localdeck::testing::FreshDir("deck_service_import_bad");
  const auto text = WriteFile(root / "notes.txt", "just some words, not audio");
  Deck       deck(MemoryConfig());

  assert(RejectsAsInvalid([&] { deck.service().ImportFile(Import("G7", root / "missing.mp3")); }));
  assert(RejectsAsInvalid([&] { deck.service().ImportFile(Import("G7", text)); }));
  assert(RejectsAsInvalid([&] { deck.service().ImportFile(Import("", text)); }));
  assert(RejectsAsInvalid([&] { deck.service().ImportFile(Import("G7", "")); }));

  LookupCardRequest lookup;
  lookup.set_card_id("G7");
  assert(!deck.service().LookupCard(lookup).has_track());
}

void TestListReportsMissingContent() {
  const auto root = localdeck::testing::FreshDir("deck_service_unavailable");

  localdeck::runtime::config::RuntimeConfig config;
  config.mutable_database()->mutable_memory();
  config.mutable_content()->mutable_disk()->set_root_path((root / "content").string());
  Deck deck(config);

  deck.service().ImportFile(Import("A1", WriteFile(root / "a.mp3", localdeck::testing::Mp3Bytes("a"))));
  const auto lost = deck.service().ImportFile(Import("B2", WriteFile(root / "b.mp3", localdeck::testing::Mp3Bytes("b"))));

  const auto ref = lost.content().content_ref();
  assert(std::filesystem::remove(root / "content" / "objects" / ref.substr(0, 2) / ref));

  const auto listed = deck.service().ListCards(ListCardsRequest{});
  assert(listed.tracks_size() == 1);
  assert(listed.tracks(0).card_id() == "A1");
  assert(listed.unavailable_count() == 1);

  ListCardsRequest all;
  all.set_include_unavailable(true);
  const auto everything = deck.service().ListCards(all);
  assert(everything.tracks_size() == 2);
  assert(everything.unavailable_count() == 1);
  for (const auto& track : everything.tracks()) {
    assert(track.available() == (track.card_id() == "A1"));
  }

  LookupCardRequest lookup;
  lookup.set_card_id("B2");
  const auto found = deck.service().LookupCard(lookup);
  assert(found.has_track());
  assert(!found.track().available());
  assert(!found.present());
}

void TestPlayUrlUsesPublicEndpoint() {
  Deck deck(MemoryConfig());

  GetPlayUrlRequest req;
  req.set_card_id("A1");
  req.set_source_hint("dQw4w9WgXcQ");
  assert(deck.service().GetPlayUrl(req).url() == "http://deck.local:8080/play?h=A1&y=dQw4w9WgXcQ");

  req.clear_source_hint();
  assert(deck.service().GetPlayUrl(req).url() == "http://deck.local:8080/play?h=A1");
}

void TestMappingsSurviveRestart() {
  const auto root = localdeck::testing::FreshDir("deck_service_restart");

  localdeck::runtime::config::RuntimeConfig config;
  config.mutable_database()->mutable_sqlite()->set_path((root / "localdeck.db").string());
  config.mutable_database()->mutable_sqlite()->set_wal_mode(true);
  config.mutable_content()->mutable_disk()->set_root_path((root / "content").string());

  std::string content_ref;
  {
    Deck first(config);
    content_ref = first.service().Play(Tap("A1", std::string("dQw4w9WgXcQ"))).content().content_ref();
    first.app.Shutdown();
  }

  Deck second(config);
  const auto replay = second.service().Play(Tap("A1"));
  assert(replay.path() == RESOLUTION_PATH_FAST);
  assert(replay.content().content_ref() == content_ref);
  assert(second.source->Calls() == 0);
}

} // namespace

int main() {
  TestFirstTapFetchesAndPlays();
  TestUnknownCardIsReported();
  TestCardsSharingSourceShareContent();
  TestLookupAndListCards();
  TestImportedFilePlaysWithoutFetch();
  TestImportRejectsBadInput();
  TestListReportsMissingContent();
  TestPlayUrlUsesPublicEndpoint();
  TestMappingsSurviveRestart();

  std::cout << "localdeck_unit_deck_service: pass\n";
  return 0;
}
