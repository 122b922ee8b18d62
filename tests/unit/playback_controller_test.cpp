#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/playback/playback_controller.hpp"
#include "internal/storage/ram/ram_content_store.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/test_fakes.hpp"

namespace {

using localdeck::deck::v1::DECK_STATE_IDLE;
using localdeck::deck::v1::DECK_STATE_PLAYING;
using localdeck::playback::PlaybackController;
using localdeck::testing::FakeAudioSink;
using localdeck::testing::MakeBuffer;
using localdeck::testing::Mp3Bytes;

// Finishes every stream before Start returns.
class InstantSink final : public localdeck::playback::AudioSink {
 public:
  void Start(std::shared_ptr<arrow::io::RandomAccessFile>, const localdeck::storage::ContentEntry&, FinishedCallback on_finished) override {
    on_finished();
  }
  void Stop() override {
  }
};

struct Fixture {
  Fixture() : store(std::make_shared<localdeck::storage::RamContentStore>()), sink(std::make_shared<FakeAudioSink>()), controller(store, sink) {
    first  = store->Put(MakeBuffer(Mp3Bytes("first")));
    second = store->Put(MakeBuffer(Mp3Bytes("second")));
  }

  std::shared_ptr<localdeck::storage::RamContentStore> store;
  std::shared_ptr<FakeAudioSink>                       sink;
  PlaybackController                                   controller;
  std::string                                          first;
  std::string                                          second;
};

void TestStartReportsPlaying() {
  Fixture f;

  const auto entry = f.controller.Start(f.first, "A1");
  assert(entry.content_ref == f.first);
  assert(entry.format == "mp3");

  const auto status = f.controller.Status();
  assert(status.state() == DECK_STATE_PLAYING);
  assert(status.content_ref() == f.first);
  assert(status.card_id() == "A1");
  assert(status.has_started_at());
  assert(status.started_at().seconds() > 0);
  assert(f.sink->Active());
}

void TestStartWhilePlayingSwitchesWithoutOverlap() {
  Fixture f;

  f.controller.Start(f.first, "A1");
  f.controller.Start(f.second, "B2");

  assert(!f.sink->Overlapped());
  assert(f.sink->Stops() == 1);
  assert(f.sink->Started().size() == 2);
  assert(f.controller.Status().content_ref() == f.second);
  assert(f.controller.Status().card_id() == "B2");
}

void TestNaturalEndReturnsToIdle() {
  Fixture f;

  f.controller.Start(f.first, "A1");
  f.sink->Finish();

  const auto status = f.controller.Status();
  assert(status.state() == DECK_STATE_IDLE);
  assert(status.content_ref().empty());
  assert(!status.has_started_at());
}

void TestLateCompletionOfReplacedStreamIsIgnored() {
  Fixture f;

  f.controller.Start(f.first, "A1");
  auto stale = f.sink->TakeCallback();
  assert(stale);

  f.controller.Start(f.second, "B2");
  stale();

  const auto status = f.controller.Status();
  assert(status.state() == DECK_STATE_PLAYING);
  assert(status.content_ref() == f.second);
}

void TestMissingContentLeavesIdle() {
  Fixture f;

  f.controller.Start(f.first, "A1");

  bool threw = false;
  try {
    f.controller.Start(std::string(64, 'a'), "Z9");
  } catch (const localdeck::util::NotFound&) {
    threw = true;
  }
  assert(threw);
  assert(f.controller.Status().state() == DECK_STATE_IDLE);
  assert(!f.sink->Active());
}

void TestSinkFailureLeavesIdle() {
  Fixture f;
  f.sink->FailNextStart();

  bool threw = false;
  try {
    f.controller.Start(f.first, "A1");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
  assert(f.controller.Status().state() == DECK_STATE_IDLE);

  // the deck recovers on the next tap
  f.controller.Start(f.first, "A1");
  assert(f.controller.Status().state() == DECK_STATE_PLAYING);
}

void TestStopIsIdempotent() {
  Fixture f;

  f.controller.Stop();
  f.controller.Start(f.first, "A1");
  f.controller.Stop();
  f.controller.Stop();

  assert(f.sink->Stops() == 1);
  assert(f.controller.Status().state() == DECK_STATE_IDLE);
}

void TestStreamFinishingDuringStartStaysIdle() {
  auto store = std::make_shared<localdeck::storage::RamContentStore>();
  auto ref   = store->Put(MakeBuffer(Mp3Bytes("blip")));

  PlaybackController controller(store, std::make_shared<InstantSink>());
  controller.Start(ref, "C3");
  assert(controller.Status().state() == DECK_STATE_IDLE);
}

} // namespace

int main() {
  TestStartReportsPlaying();
  TestStartWhilePlayingSwitchesWithoutOverlap();
  TestNaturalEndReturnsToIdle();
  TestLateCompletionOfReplacedStreamIsIgnored();
  TestMissingContentLeavesIdle();
  TestSinkFailureLeavesIdle();
  TestStopIsIdempotent();
  TestStreamFinishingDuringStartStaysIdle();

  std::cout << "localdeck_unit_playback_controller: pass\n";
  return 0;
}
