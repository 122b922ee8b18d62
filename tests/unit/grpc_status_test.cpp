#include <cassert>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include <grpcpp/grpcpp.h>

#include "internal/factory.hpp"
#include "internal/grpc/deck_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/util/errors.hpp"
#include "localdeck/v1.hpp"
#include "tests/support/test_fakes.hpp"

namespace {

using localdeck::deck::v1::PlayRequest;
using localdeck::deck::v1::PlayResponse;

struct ServerHarness {
  ServerHarness()
      : source(std::make_shared<localdeck::testing::FakeAudioSource>()), sink(std::make_shared<localdeck::testing::FakeAudioSink>()) {
    localdeck::runtime::config::RuntimeConfig config;
    config.mutable_database()->mutable_memory();
    config.mutable_content()->mutable_ram();
    config.mutable_fetch()->mutable_failure_cooldown()->set_seconds(30);

    app    = localdeck::factory::Build(config, localdeck::factory::Overrides{source, sink});
    server = std::make_unique<localdeck::grpc::DeckServer>(app.deck_service);
  }

  std::shared_ptr<localdeck::testing::FakeAudioSource> source;
  std::shared_ptr<localdeck::testing::FakeAudioSink>  sink;
  localdeck::factory::Application                     app;
  std::unique_ptr<localdeck::grpc::DeckServer>        server;
};

::grpc::StatusCode PlayStatus(ServerHarness& h, const std::string& card_id, const std::optional<std::string>& hint) {
  PlayRequest req;
  req.set_card_id(card_id);
  if (hint) req.set_source_hint(*hint);
  PlayResponse          resp;
  ::grpc::ServerContext ctx;
  return h.server->Play(&ctx, &req, &resp).error_code();
}

void TestExceptionMapping() {
  using localdeck::grpc::ToStatus;
  using namespace localdeck::util;

  assert(ToStatus(UnknownCard("B2")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(UnsupportedSource("vimeo")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(InvalidArgument("empty")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(SourceUnavailable("removed")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(StorageError("disk full")).error_code() == ::grpc::StatusCode::DATA_LOSS);
  assert(ToStatus(NotFound("gone")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(InvalidState("no base url")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(Cancelled("client left")).error_code() == ::grpc::StatusCode::CANCELLED);
  assert(ToStatus(std::runtime_error("boom")).error_code() == ::grpc::StatusCode::INTERNAL);

  assert(ToStatus(UnknownCard("card B2")).error_message() == "card B2");
}

void TestPlayUnknownCardReturnsNotFound() {
  ServerHarness h;
  assert(PlayStatus(h, "B2", std::nullopt) == ::grpc::StatusCode::NOT_FOUND);
  assert(h.source->Calls() == 0);
}

void TestPlayWithoutCardReturnsInvalidArgument() {
  ServerHarness h;
  assert(PlayStatus(h, "", std::string("dQw4w9WgXcQ")) == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestPlayUnsupportedHintReturnsInvalidArgument() {
  ServerHarness h;
  assert(PlayStatus(h, "A1", std::string("https://vimeo.com/76979871")) == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestPlayUnavailableSourceReturnsUnavailable() {
  ServerHarness h;
  h.source->FailWith(std::make_exception_ptr(localdeck::util::SourceUnavailable("video removed")));
  assert(PlayStatus(h, "A1", std::string("dQw4w9WgXcQ")) == ::grpc::StatusCode::UNAVAILABLE);
}

void TestPlaySinkFailureReturnsInternal() {
  ServerHarness h;
  h.sink->FailNextStart();
  assert(PlayStatus(h, "A1", std::string("dQw4w9WgXcQ")) == ::grpc::StatusCode::INTERNAL);

  // the mapping was still recorded, so the retry takes the fast path
  PlayRequest req;
  req.set_card_id("A1");
  PlayResponse          resp;
  ::grpc::ServerContext ctx;
  assert(h.server->Play(&ctx, &req, &resp).ok());
  assert(resp.path() == localdeck::deck::v1::RESOLUTION_PATH_FAST);
}

void TestGetPlayUrlWithoutBaseReturnsFailedPrecondition() {
  ServerHarness h;

  localdeck::deck::v1::GetPlayUrlRequest req;
  req.set_card_id("A1");
  localdeck::deck::v1::GetPlayUrlResponse resp;
  ::grpc::ServerContext                   ctx;
  assert(h.server->GetPlayUrl(&ctx, &req, &resp).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

void TestImportAndListThroughServer() {
  ServerHarness h;
  const auto    root = localdeck::testing::FreshDir("grpc_import");

  localdeck::deck::v1::ImportFileRequest missing;
  missing.set_card_id("G7");
  missing.set_path((root / "missing.mp3").string());
  localdeck::deck::v1::ImportFileResponse missing_resp;
  ::grpc::ServerContext                   missing_ctx;
  assert(h.server->ImportFile(&missing_ctx, &missing, &missing_resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  const auto song = root / "song.mp3";
  {
    std::ofstream out(song, std::ios::binary);
    out << localdeck::testing::Mp3Bytes("through grpc");
  }
  localdeck::deck::v1::ImportFileRequest req;
  req.set_card_id("G7");
  req.set_path(song.string());
  localdeck::deck::v1::ImportFileResponse resp;
  ::grpc::ServerContext                   import_ctx;
  assert(h.server->ImportFile(&import_ctx, &req, &resp).ok());
  assert(resp.content().mime_type() == "audio/mpeg");

  localdeck::deck::v1::ListCardsRequest  list;
  localdeck::deck::v1::ListCardsResponse listed;
  ::grpc::ServerContext                  list_ctx;
  assert(h.server->ListCards(&list_ctx, &list, &listed).ok());
  assert(listed.tracks_size() == 1);
  assert(listed.tracks(0).card_id() == "G7");
}

void TestPlayAndStatusSucceed() {
  ServerHarness h;

  PlayRequest req;
  req.set_card_id("A1");
  req.set_source_hint("dQw4w9WgXcQ");
  PlayResponse          resp;
  ::grpc::ServerContext play_ctx;
  assert(h.server->Play(&play_ctx, &req, &resp).ok());
  assert(resp.path() == localdeck::deck::v1::RESOLUTION_PATH_FALLBACK);
  assert(resp.content().ref_count() == 1);

  google::protobuf::Empty                    empty;
  localdeck::deck::v1::GetDeckStatusResponse status;
  ::grpc::ServerContext                      status_ctx;
  assert(h.server->GetDeckStatus(&status_ctx, &empty, &status).ok());
  assert(status.status().state() == localdeck::deck::v1::DECK_STATE_PLAYING);

  google::protobuf::Empty stop_resp;
  ::grpc::ServerContext   stop_ctx;
  assert(h.server->Stop(&stop_ctx, &empty, &stop_resp).ok());
}

} // namespace

int main() {
  TestExceptionMapping();
  TestPlayUnknownCardReturnsNotFound();
  TestPlayWithoutCardReturnsInvalidArgument();
  TestPlayUnsupportedHintReturnsInvalidArgument();
  TestPlayUnavailableSourceReturnsUnavailable();
  TestPlaySinkFailureReturnsInternal();
  TestGetPlayUrlWithoutBaseReturnsFailedPrecondition();
  TestImportAndListThroughServer();
  TestPlayAndStatusSucceed();

  std::cout << "localdeck_unit_grpc_status: pass\n";
  return 0;
}
