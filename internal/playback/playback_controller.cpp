#include "playback_controller.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace localdeck::playback {

using localdeck::deck::v1::DECK_STATE_IDLE;
using localdeck::deck::v1::DECK_STATE_PLAYING;
using localdeck::deck::v1::DECK_STATE_STOPPING;
using localdeck::observability::IntField;
using localdeck::observability::StringField;

PlaybackController::PlaybackController(localdeck::storage::ContentStorePtr store, std::shared_ptr<AudioSink> sink)
    : store_(std::move(store)), sink_(std::move(sink)) {
  if (!store_ || !sink_) {
    throw std::invalid_argument("playback controller requires a content store and a sink");
  }
}

PlaybackController::~PlaybackController() {
  Stop();
}

localdeck::storage::ContentEntry PlaybackController::Start(const std::string& content_ref, const std::string& card_id) {
  std::lock_guard control(control_mutex_);

  StopActive();

  auto stream = store_->Open(content_ref);
  auto entry  = store_->Stat(content_ref);

  uint64_t generation = 0;
  {
    std::lock_guard lock(mutex_);
    generation = ++generation_;
  }

  sink_->Start(std::move(stream), entry, [this, generation] { OnFinished(generation); });

  std::lock_guard lock(mutex_);
  // a very short stream may already have finished
  if (finished_generation_ == generation) {
    return entry;
  }
  state_       = DECK_STATE_PLAYING;
  content_ref_ = content_ref;
  card_id_     = card_id;
  started_at_  = localdeck::util::Now();

  LOCALDECK_LOG_INFO("playback started", {StringField("card_id", card_id), StringField("content_ref", content_ref),
                                          IntField("generation", static_cast<int64_t>(generation))});
  return entry;
}

void PlaybackController::Stop() {
  std::lock_guard control(control_mutex_);
  StopActive();
}

void PlaybackController::StopActive() {
  bool was_playing = false;
  {
    std::lock_guard lock(mutex_);
    was_playing = state_ == DECK_STATE_PLAYING;
    if (was_playing) state_ = DECK_STATE_STOPPING;
  }

  // also joins the threads of a stream that ended on its own
  sink_->Stop();

  std::lock_guard lock(mutex_);
  if (was_playing) {
    LOCALDECK_LOG_INFO("playback stopped", {StringField("card_id", card_id_), StringField("content_ref", content_ref_)});
  }
  state_ = DECK_STATE_IDLE;
  content_ref_.clear();
  card_id_.clear();
  started_at_ = {};
}

void PlaybackController::OnFinished(uint64_t generation) {
  std::lock_guard lock(mutex_);
  finished_generation_ = generation;
  if (generation != generation_ || state_ != DECK_STATE_PLAYING) {
    return;
  }
  LOCALDECK_LOG_INFO("playback finished", {StringField("card_id", card_id_), StringField("content_ref", content_ref_)});
  state_ = DECK_STATE_IDLE;
  content_ref_.clear();
  card_id_.clear();
  started_at_ = {};
}

localdeck::deck::v1::DeckStatus PlaybackController::Status() const {
  localdeck::deck::v1::DeckStatus status;
  std::lock_guard                 lock(mutex_);
  status.set_state(state_);
  if (state_ != DECK_STATE_IDLE) {
    status.set_content_ref(content_ref_);
    status.set_card_id(card_id_);
    *status.mutable_started_at() = localdeck::util::ToProto(started_at_);
  }
  return status;
}

} // namespace localdeck::playback
