#pragma once

#include <memory>
#include <optional>
#include <string>

#include "internal/fetch/cancellation.hpp"
#include "internal/storage/content_store.hpp"
#include "localdeck/deck/v1/types.pb.h"

namespace localdeck::fetch {
class FallbackFetcher;
}
namespace localdeck::registry {
class TrackRegistry;
class TouchScheduler;
} // namespace localdeck::registry

namespace localdeck::core {

struct Resolution {
  std::string                         content_ref;
  localdeck::deck::v1::ResolutionPath path = localdeck::deck::v1::RESOLUTION_PATH_UNSPECIFIED;
};

/*
  Turns a card tap into playable content.

    1. registry hit whose content is still stored → fast path, no fetch
    2. miss, or a mapping whose content vanished (drift) → fallback hint
       required, otherwise util::UnknownCard
    3. fetch through the FallbackFetcher, then record the mapping

  Fetch errors propagate unchanged and leave the registry untouched. The
  only failure recovered here is drift.
*/
class ResolutionEngine {
 public:
  ResolutionEngine(std::shared_ptr<localdeck::registry::TrackRegistry> registry, localdeck::storage::ContentStorePtr store,
                   std::shared_ptr<localdeck::fetch::FallbackFetcher> fetcher, std::shared_ptr<localdeck::registry::TouchScheduler> touches);

  Resolution Resolve(const std::string& card_id, const std::optional<std::string>& source_hint,
                     const localdeck::fetch::CancellationToken* cancel = nullptr);

 private:
  void ScheduleTouch(const std::string& card_id);

  std::shared_ptr<localdeck::registry::TrackRegistry>  registry_;
  localdeck::storage::ContentStorePtr                  store_;
  std::shared_ptr<localdeck::fetch::FallbackFetcher>   fetcher_;
  std::shared_ptr<localdeck::registry::TouchScheduler> touches_;
};

} // namespace localdeck::core
