#include <cassert>
#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "internal/core/resolution_engine.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/fetch/fallback_fetcher.hpp"
#include "internal/fetch/fetch_worker.hpp"
#include "internal/registry/touch_scheduler.hpp"
#include "internal/registry/touch_worker.hpp"
#include "internal/registry/track_registry.hpp"
#include "internal/storage/ram/ram_content_store.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/test_fakes.hpp"

namespace {

using localdeck::core::ResolutionEngine;
using localdeck::deck::v1::RESOLUTION_PATH_FALLBACK;
using localdeck::deck::v1::RESOLUTION_PATH_FAST;
using localdeck::testing::FakeAudioSource;

struct Deck {
  Deck()
      : source(std::make_shared<FakeAudioSource>()),
        store(std::make_shared<localdeck::storage::RamContentStore>()),
        registry(std::make_shared<localdeck::registry::TrackRegistry>(std::make_shared<localdeck::db::memory::MemoryRepository>())),
        scheduler(std::make_shared<localdeck::fetch::FetchScheduler>()),
        fetcher(std::make_shared<localdeck::fetch::FallbackFetcher>(source, store, scheduler, std::chrono::seconds(30))),
        touches(std::make_shared<localdeck::registry::TouchScheduler>()),
        fetch_worker(scheduler, fetcher, 2),
        touch_worker(touches, registry),
        engine(registry, store, fetcher, touches) {
    fetch_worker.Start();
    touch_worker.Start();
  }

  ~Deck() {
    source->Release();
    fetch_worker.Stop();
    touch_worker.Stop();
  }

  std::shared_ptr<FakeAudioSource>                     source;
  std::shared_ptr<localdeck::storage::RamContentStore> store;
  std::shared_ptr<localdeck::registry::TrackRegistry>  registry;
  std::shared_ptr<localdeck::fetch::FetchScheduler>    scheduler;
  std::shared_ptr<localdeck::fetch::FallbackFetcher>   fetcher;
  std::shared_ptr<localdeck::registry::TouchScheduler> touches;
  localdeck::fetch::FetchWorker                        fetch_worker;
  localdeck::registry::TouchWorker                     touch_worker;
  ResolutionEngine                                     engine;
};

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestFirstTapFetchesThenFastPath() {
  Deck deck;

  const auto first = deck.engine.Resolve("A1", std::string("dQw4w9WgXcQ"));
  assert(first.path == RESOLUTION_PATH_FALLBACK);
  assert(deck.source->Calls() == 1);
  assert(deck.store->Exists(first.content_ref));

  auto record = deck.registry->Lookup("A1");
  assert(record.has_value());
  assert(record->content_ref == first.content_ref);
  assert(record->source_ref == std::optional<std::string>("youtube:dQw4w9WgXcQ"));

  const auto second = deck.engine.Resolve("A1", std::nullopt);
  assert(second.path == RESOLUTION_PATH_FAST);
  assert(second.content_ref == first.content_ref);
  assert(deck.source->Calls() == 1);

  // a stale hint on a known card is ignored
  const auto third = deck.engine.Resolve("A1", std::string("zzzzzzzzzzz"));
  assert(third.path == RESOLUTION_PATH_FAST);
  assert(third.content_ref == first.content_ref);
  assert(deck.source->Calls() == 1);
}

void TestUnknownCardWithoutHint() {
  Deck deck;

  assert(Throws<localdeck::util::UnknownCard>([&] { deck.engine.Resolve("B2", std::nullopt); }));
  assert(Throws<localdeck::util::UnknownCard>([&] { deck.engine.Resolve("B2", std::string("")); }));
  assert(!deck.registry->Lookup("B2").has_value());
  assert(deck.source->Calls() == 0);
}

void TestDriftWithoutHintIsUnknownCard() {
  Deck deck;
  deck.registry->Upsert("C3", "deadbeef", std::nullopt);

  assert(Throws<localdeck::util::UnknownCard>([&] { deck.engine.Resolve("C3", std::nullopt); }));
  assert(deck.registry->Lookup("C3")->content_ref == "deadbeef");
  assert(deck.source->Calls() == 0);
}

void TestDriftWithHintRefetches() {
  Deck deck;
  deck.registry->Upsert("C3", "deadbeef", std::nullopt);

  const auto resolved = deck.engine.Resolve("C3", std::string("https://youtu.be/c3c3c3c3c3c"));
  assert(resolved.path == RESOLUTION_PATH_FALLBACK);
  assert(resolved.content_ref != "deadbeef");
  assert(deck.source->Calls() == 1);
  assert(deck.registry->Lookup("C3")->content_ref == resolved.content_ref);
}

void TestCardsSharingSourceShareOneFetch() {
  Deck deck;
  deck.source->Hold();

  auto d4 = std::async(std::launch::async, [&] { return deck.engine.Resolve("D4", std::string("dQw4w9WgXcQ")); });
  auto e5 = std::async(std::launch::async,
                       [&] { return deck.engine.Resolve("E5", std::string("https://www.youtube.com/watch?v=dQw4w9WgXcQ&t=1")); });

  assert(deck.source->WaitForCalls(1));
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  deck.source->Release();

  const auto d = d4.get();
  const auto e = e5.get();
  assert(d.content_ref == e.content_ref);
  assert(deck.source->Calls() == 1);
  assert(deck.registry->ReferenceCount(d.content_ref) == 2);
  assert(deck.registry->Lookup("D4")->source_ref == deck.registry->Lookup("E5")->source_ref);
}

void TestConcurrentTapsOfNewCardShareOneFetch() {
  Deck deck;
  deck.source->Hold();

  std::vector<std::future<localdeck::core::Resolution>> taps;
  for (int i = 0; i < 16; ++i) {
    taps.push_back(std::async(std::launch::async, [&] { return deck.engine.Resolve("N1", std::string("dQw4w9WgXcQ")); }));
  }

  assert(deck.source->WaitForCalls(1));
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  deck.source->Release();

  std::set<std::string> refs;
  std::size_t           fetched = 0;
  for (auto& tap : taps) {
    const auto resolved = tap.get();
    refs.insert(resolved.content_ref);
    if (resolved.path == RESOLUTION_PATH_FALLBACK) ++fetched;
  }

  assert(deck.source->Calls() == 1);
  assert(refs.size() == 1);
  assert(fetched >= 1);

  const auto record = deck.registry->Lookup("N1");
  assert(record.has_value());
  assert(record->content_ref == *refs.begin());
  assert(record->source_ref == std::optional<std::string>("youtube:dQw4w9WgXcQ"));
  assert(deck.registry->ReferenceCount(*refs.begin()) == 1);
}

void TestFetchFailureLeavesRegistryUntouched() {
  Deck deck;
  deck.source->FailWith(std::make_exception_ptr(localdeck::util::SourceUnavailable("video removed")));

  assert(Throws<localdeck::util::SourceUnavailable>([&] { deck.engine.Resolve("F6", std::string("ffffffffff1")); }));
  assert(Throws<localdeck::util::UnsupportedSource>([&] { deck.engine.Resolve("G7", std::string("https://vimeo.com/1")); }));
  assert(!deck.registry->Lookup("F6").has_value());
  assert(!deck.registry->Lookup("G7").has_value());
  assert(deck.registry->List().empty());
}

void TestEmptyCardIsRejected() {
  Deck deck;
  assert(Throws<localdeck::util::InvalidArgument>([&] { deck.engine.Resolve("", std::string("dQw4w9WgXcQ")); }));
  assert(deck.source->Calls() == 0);
}

void TestResolveSchedulesTouch() {
  Deck deck;

  deck.engine.Resolve("H8", std::string("hhhhhhhhhhh"));
  deck.engine.Resolve("H8", std::nullopt);

  // stopping drains the queue
  deck.touch_worker.Stop();
  assert(deck.touches->Depth() == 0);
  assert(deck.registry->Lookup("H8")->last_played_at_ms > 0);
}

} // namespace

int main() {
  TestFirstTapFetchesThenFastPath();
  TestUnknownCardWithoutHint();
  TestDriftWithoutHintIsUnknownCard();
  TestDriftWithHintRefetches();
  TestCardsSharingSourceShareOneFetch();
  TestConcurrentTapsOfNewCardShareOneFetch();
  TestFetchFailureLeavesRegistryUntouched();
  TestEmptyCardIsRejected();
  TestResolveSchedulesTouch();

  std::cout << "localdeck_unit_resolution_engine: pass\n";
  return 0;
}
