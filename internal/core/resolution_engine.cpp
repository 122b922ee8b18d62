#include "resolution_engine.hpp"

#include <stdexcept>

#include "internal/fetch/fallback_fetcher.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/registry/touch_scheduler.hpp"
#include "internal/registry/track_registry.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace localdeck::core {

using localdeck::deck::v1::RESOLUTION_PATH_FALLBACK;
using localdeck::deck::v1::RESOLUTION_PATH_FAST;
using localdeck::observability::StringField;

ResolutionEngine::ResolutionEngine(std::shared_ptr<localdeck::registry::TrackRegistry> registry, localdeck::storage::ContentStorePtr store,
                                   std::shared_ptr<localdeck::fetch::FallbackFetcher>   fetcher,
                                   std::shared_ptr<localdeck::registry::TouchScheduler> touches)
    : registry_(std::move(registry)), store_(std::move(store)), fetcher_(std::move(fetcher)), touches_(std::move(touches)) {
  if (!registry_ || !store_ || !fetcher_) {
    throw std::invalid_argument("resolution engine requires a registry, a content store and a fetcher");
  }
}

Resolution ResolutionEngine::Resolve(const std::string& card_id, const std::optional<std::string>& source_hint,
                                     const localdeck::fetch::CancellationToken* cancel) {
  if (card_id.empty()) {
    throw localdeck::util::InvalidArgument("card_id is required");
  }

  localdeck::observability::SpanScope span("localdeck.resolve");
  span.SetAttribute("card_id", card_id);

  if (auto record = registry_->Lookup(card_id)) {
    if (!record->content_ref.empty() && store_->Exists(record->content_ref)) {
      span.SetAttribute("path", std::string_view("fast"));
      localdeck::observability::Metrics::Instance().RecordResolve("fast");
      ScheduleTouch(card_id);
      return Resolution{record->content_ref, RESOLUTION_PATH_FAST};
    }
    LOCALDECK_LOG_WARN("registry references missing content", {StringField("card_id", card_id), StringField("content_ref", record->content_ref)});
    span.AddEvent("drift");
  }

  if (!source_hint || source_hint->empty()) {
    throw localdeck::util::UnknownCard("no content for card " + card_id + " and no fallback source");
  }

  auto fetched = fetcher_->Fetch(*source_hint, cancel);
  registry_->Upsert(card_id, fetched.content_ref, fetched.source.Key());

  span.SetAttribute("path", std::string_view("fallback"));
  localdeck::observability::Metrics::Instance().RecordResolve("fallback");
  LOCALDECK_LOG_INFO("card resolved from fallback",
                     {StringField("card_id", card_id), StringField("source", fetched.source.Key()), StringField("content_ref", fetched.content_ref)});

  ScheduleTouch(card_id);
  return Resolution{fetched.content_ref, RESOLUTION_PATH_FALLBACK};
}

void ResolutionEngine::ScheduleTouch(const std::string& card_id) {
  if (!touches_) return;
  if (!touches_->Enqueue(localdeck::registry::TouchTask{card_id, localdeck::util::NowMillis()})) {
    LOCALDECK_LOG_WARN("touch dropped, scheduler stopped", {StringField("card_id", card_id)});
  }
}

} // namespace localdeck::core
