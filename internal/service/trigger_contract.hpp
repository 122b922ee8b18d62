#pragma once

#include <exception>
#include <optional>
#include <string>
#include <string_view>

namespace localdeck::service {

/*
  The card trigger contract: GET <base>/play?h=<card_id>[&y=<source_hint>]

  These helpers are shared by the URL printed on cards/tags and by the
  front end that serves the endpoint.
*/

struct PlayQuery {
  std::string                card_id;
  std::optional<std::string> source_hint;
};

// Trailing '/' on the base is dropped. A present but empty hint is kept as "&y=".
std::string BuildPlayUrl(std::string_view base_url, std::string_view card_id, const std::optional<std::string>& source_hint);

// Accepts the raw query with or without a leading '?'. Throws util::InvalidArgument
// when h is missing/empty or an escape is malformed. Unknown parameters are ignored.
PlayQuery ParsePlayQuery(std::string_view query);

// HTTP status the endpoint answers with for a failed play.
int HttpStatusFor(const std::exception& e);

std::string PercentEncode(std::string_view value);
std::string PercentDecode(std::string_view value);

} // namespace localdeck::service
