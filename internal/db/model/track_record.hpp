#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace localdeck::db::model {

/*
  One card → audio binding.

  card_id is the opaque identifier printed on (or written to) the card.
  content_ref is empty when no audio has been stored for the card yet.
*/
struct TrackRecord {
  std::string                card_id;
  std::string                content_ref;
  std::optional<std::string> source_ref;
  uint64_t                   created_at_ms     = 0;
  uint64_t                   updated_at_ms     = 0;
  uint64_t                   last_played_at_ms = 0;
};

} // namespace localdeck::db::model
