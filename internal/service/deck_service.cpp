#include "deck_service.hpp"

#include <arrow/io/file.h>

#include <chrono>
#include <optional>
#include <type_traits>

#include "internal/core/resolution_engine.hpp"
#include "internal/db/model/track_record.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/playback/playback_controller.hpp"
#include "internal/registry/track_registry.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/audio_format.hpp"
#include "internal/storage/content_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "trigger_contract.hpp"

namespace localdeck::service {

using namespace localdeck::deck::v1;
using localdeck::observability::IntField;
using localdeck::observability::StringField;

namespace {

Track ToTrack(const localdeck::db::model::TrackRecord& record, bool available) {
  Track track;
  track.set_card_id(record.card_id);
  track.set_content_ref(record.content_ref);
  track.set_source_ref(record.source_ref.value_or(""));
  *track.mutable_created_at() = localdeck::util::MillisToProto(record.created_at_ms);
  *track.mutable_updated_at() = localdeck::util::MillisToProto(record.updated_at_ms);
  if (record.last_played_at_ms != 0) {
    *track.mutable_last_played_at() = localdeck::util::MillisToProto(record.last_played_at_ms);
  }
  track.set_available(available);
  return track;
}

Content ToContent(const localdeck::storage::ContentEntry& entry, uint64_t ref_count) {
  Content content;
  content.set_content_ref(entry.content_ref);
  content.set_byte_size(entry.byte_size);
  content.set_format(entry.format);
  content.set_ref_count(ref_count);
  content.set_mime_type(localdeck::storage::common::MimeTypeForFormat(entry.format));
  return content;
}

void RequireCardId(const std::string& card_id) {
  if (card_id.empty()) {
    throw localdeck::util::InvalidArgument("card_id is required");
  }
}

template <typename Fn>
auto ObserveRpc(std::string_view route, const std::string* card_id, Fn&& fn) {
  localdeck::observability::SpanScope span(route);
  if (card_id) {
    span.SetAttribute("card.id", *card_id);
  }

  const auto started_at = std::chrono::steady_clock::now();
  const auto finish     = [&](bool success) {
    localdeck::observability::Metrics::Instance().RecordRequest(route, success);
    localdeck::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      finish(true);
      return;
    } else {
      auto result = fn();
      finish(true);
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    LOCALDECK_LOG_ERROR("RPC failed", {StringField("route", route), StringField("error", ex.what()), StringField("card_id", card_id ? *card_id : "")});
    finish(false);
    throw;
  }
}

} // namespace

DeckService::DeckService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

PlayResponse DeckService::Play(const PlayRequest& req, const localdeck::fetch::CancellationToken* cancel) {
  return ObserveRpc("DeckService.Play", &req.card_id(), [&] {
    RequireCardId(req.card_id());

    std::optional<std::string> hint;
    if (req.has_source_hint()) hint = req.source_hint();

    const auto resolution = ctx_.resolver->Resolve(req.card_id(), hint, cancel);
    const auto entry      = ctx_.playback->Start(resolution.content_ref, req.card_id());

    PlayResponse resp;
    *resp.mutable_content() = ToContent(entry, ctx_.registry->ReferenceCount(entry.content_ref));
    resp.set_path(resolution.path);
    LOCALDECK_LOG_INFO("play", {StringField("card_id", req.card_id()), StringField("content_ref", entry.content_ref),
                                StringField("path", ResolutionPath_Name(resolution.path))});
    return resp;
  });
}

void DeckService::Stop() {
  ObserveRpc("DeckService.Stop", nullptr, [&] { ctx_.playback->Stop(); });
}

GetDeckStatusResponse DeckService::GetDeckStatus() {
  return ObserveRpc("DeckService.GetDeckStatus", nullptr, [&] {
    GetDeckStatusResponse resp;
    *resp.mutable_status() = ctx_.playback->Status();
    return resp;
  });
}

LookupCardResponse DeckService::LookupCard(const LookupCardRequest& req) {
  return ObserveRpc("DeckService.LookupCard", &req.card_id(), [&] {
    RequireCardId(req.card_id());

    LookupCardResponse resp;
    auto               record = ctx_.registry->Lookup(req.card_id());
    if (!record) {
      resp.set_present(false);
      return resp;
    }

    const bool available  = !record->content_ref.empty() && ctx_.store->Exists(record->content_ref);
    *resp.mutable_track() = ToTrack(*record, available);
    if (available) {
      *resp.mutable_content() = ToContent(ctx_.store->Stat(record->content_ref), ctx_.registry->ReferenceCount(record->content_ref));
    }
    resp.set_present(available);
    return resp;
  });
}

ListCardsResponse DeckService::ListCards(const ListCardsRequest& req) {
  return ObserveRpc("DeckService.ListCards", nullptr, [&] {
    ListCardsResponse resp;
    uint64_t          unavailable = 0;
    for (const auto& record : ctx_.registry->List()) {
      const bool available = !record.content_ref.empty() && ctx_.store->Exists(record.content_ref);
      if (!available) {
        ++unavailable;
        if (!req.include_unavailable()) continue;
      }
      *resp.add_tracks() = ToTrack(record, available);
    }
    resp.set_unavailable_count(unavailable);
    if (unavailable > 0) {
      LOCALDECK_LOG_WARN("cards with missing content", {IntField("count", static_cast<int64_t>(unavailable))});
    }
    return resp;
  });
}

ImportFileResponse DeckService::ImportFile(const ImportFileRequest& req) {
  return ObserveRpc("DeckService.ImportFile", &req.card_id(), [&] {
    RequireCardId(req.card_id());
    if (req.path().empty()) {
      throw localdeck::util::InvalidArgument("path is required");
    }

    auto opened = arrow::io::ReadableFile::Open(req.path());
    if (!opened.ok()) {
      throw localdeck::util::InvalidArgument("cannot open " + req.path() + ": " + opened.status().ToString());
    }
    auto file  = *opened;
    auto bytes = localdeck::storage::common::ReadAll(file);
    localdeck::storage::common::Unwrap(file->Close());

    const auto format = localdeck::storage::common::SniffAudioFormat(bytes->data(), static_cast<std::size_t>(bytes->size()));
    if (format == "unknown") {
      throw localdeck::util::InvalidArgument("not an audio file: " + req.path());
    }

    const auto content_ref = ctx_.store->Put(bytes);
    const auto record      = ctx_.registry->Upsert(req.card_id(), content_ref, std::nullopt);

    ImportFileResponse resp;
    *resp.mutable_track()   = ToTrack(record, true);
    *resp.mutable_content() = ToContent(ctx_.store->Stat(content_ref), ctx_.registry->ReferenceCount(content_ref));
    LOCALDECK_LOG_INFO("imported file", {StringField("card_id", req.card_id()), StringField("content_ref", content_ref),
                                         StringField("path", req.path()), StringField("format", format)});
    return resp;
  });
}

GetPlayUrlResponse DeckService::GetPlayUrl(const GetPlayUrlRequest& req) {
  return ObserveRpc("DeckService.GetPlayUrl", &req.card_id(), [&] {
    RequireCardId(req.card_id());
    if (ctx_.public_base_url.empty()) {
      throw localdeck::util::InvalidState("public_endpoint.base_url is not configured");
    }

    std::optional<std::string> hint;
    if (req.has_source_hint()) hint = req.source_hint();

    GetPlayUrlResponse resp;
    resp.set_url(BuildPlayUrl(ctx_.public_base_url, req.card_id(), hint));
    return resp;
  });
}

} // namespace localdeck::service
