#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "audio_sink.hpp"
#include "internal/storage/content_store.hpp"
#include "internal/util/time.hpp"
#include "localdeck/deck/v1/types.pb.h"

namespace localdeck::playback {

/*
  Drives the single physical output.

    Idle ──Start──▶ Playing ──Stop──▶ Stopping ──▶ Idle
                       │
                       └── natural end ──▶ Idle

  Start while Playing stops the current stream first (tap-to-switch, no
  queue), so two streams never overlap. Every finished stream carries a
  generation; a late completion from a replaced stream is ignored.
*/
class PlaybackController {
 public:
  PlaybackController(localdeck::storage::ContentStorePtr store, std::shared_ptr<AudioSink> sink);
  ~PlaybackController();

  PlaybackController(const PlaybackController&)            = delete;
  PlaybackController& operator=(const PlaybackController&) = delete;

  // Returns once output began. util::NotFound or a sink failure leaves the deck Idle.
  localdeck::storage::ContentEntry Start(const std::string& content_ref, const std::string& card_id = {});

  // Idempotent.
  void Stop();

  localdeck::deck::v1::DeckStatus Status() const;

 private:
  void StopActive();
  void OnFinished(uint64_t generation);

  localdeck::storage::ContentStorePtr store_;
  std::shared_ptr<AudioSink>          sink_;

  // Serializes Start/Stop, held across sink calls.
  std::mutex control_mutex_;

  // Guards the state below; never held across sink calls.
  mutable std::mutex             mutex_;
  localdeck::deck::v1::DeckState state_ = localdeck::deck::v1::DECK_STATE_IDLE;
  std::string                    content_ref_;
  std::string                    card_id_;
  localdeck::util::TimePoint     started_at_{};
  uint64_t                       generation_          = 0;
  uint64_t                       finished_generation_ = 0;
};

} // namespace localdeck::playback
