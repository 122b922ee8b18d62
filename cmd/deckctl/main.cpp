#include <grpcpp/grpcpp.h>

#include <iostream>
#include <memory>
#include <string>

#include "localdeck/v1.hpp"

using namespace localdeck::deck::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  deckctl <addr> play <card_id> [source_hint]\n"
            << "  deckctl <addr> stop\n"
            << "  deckctl <addr> status\n"
            << "  deckctl <addr> lookup <card_id>\n"
            << "  deckctl <addr> list [--show-unavailable]\n"
            << "  deckctl <addr> import <card_id> <file>\n"
            << "  deckctl <addr> url <card_id> [source_hint]\n";
}

static int Fail(const grpc::Status& status) {
  std::cerr << "error (" << static_cast<int>(status.error_code()) << "): " << status.error_message() << "\n";
  return 2;
}

static std::string PathName(ResolutionPath path) {
  switch (path) {
    case RESOLUTION_PATH_FAST:
      return "fast";
    case RESOLUTION_PATH_FALLBACK:
      return "fallback";
    default:
      return "unknown";
  }
}

static std::string StateName(DeckState state) {
  switch (state) {
    case DECK_STATE_IDLE:
      return "idle";
    case DECK_STATE_PLAYING:
      return "playing";
    case DECK_STATE_STOPPING:
      return "stopping";
    default:
      return "unknown";
  }
}

static void PrintTrack(const Track& track) {
  std::cout << "card_id=" << track.card_id() << "\n";
  std::cout << "content_ref=" << track.content_ref() << "\n";
  if (!track.source_ref().empty()) {
    std::cout << "source_ref=" << track.source_ref() << "\n";
  }
  if (!track.available()) {
    std::cout << "available=false\n";
  }
  if (track.has_last_played_at()) {
    std::cout << "last_played_at=" << track.last_played_at().seconds() << "\n";
  }
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = DeckService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "play") {
    if (argc < 4) return 1;

    PlayRequest req;
    req.set_card_id(argv[3]);
    if (argc >= 5) req.set_source_hint(argv[4]);

    PlayResponse resp;
    auto         status = stub->Play(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "content_ref=" << resp.content().content_ref() << "\n";
    std::cout << "format=" << resp.content().format() << "\n";
    std::cout << "bytes=" << resp.content().byte_size() << "\n";
    std::cout << "path=" << PathName(resp.path()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "stop") {
    google::protobuf::Empty req;
    google::protobuf::Empty resp;
    auto                    status = stub->Stop(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "stopped\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "status") {
    google::protobuf::Empty req;
    GetDeckStatusResponse   resp;
    auto                    status = stub->GetDeckStatus(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "state=" << StateName(resp.status().state()) << "\n";
    if (!resp.status().content_ref().empty()) {
      std::cout << "card_id=" << resp.status().card_id() << "\n";
      std::cout << "content_ref=" << resp.status().content_ref() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "lookup") {
    if (argc < 4) return 1;

    LookupCardRequest req;
    req.set_card_id(argv[3]);

    LookupCardResponse resp;
    auto               status = stub->LookupCard(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    if (!resp.has_track()) {
      std::cout << "unmapped\n";
      return 0;
    }
    PrintTrack(resp.track());
    std::cout << "present=" << (resp.present() ? "true" : "false") << "\n";
    if (resp.present()) {
      std::cout << "format=" << resp.content().format() << "\n";
      std::cout << "bytes=" << resp.content().byte_size() << "\n";
      std::cout << "ref_count=" << resp.content().ref_count() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "list") {
    ListCardsRequest req;
    req.set_include_unavailable(argc >= 4 && std::string(argv[3]) == "--show-unavailable");

    ListCardsResponse resp;
    auto              status = stub->ListCards(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& track : resp.tracks()) {
      std::cout << track.card_id() << " " << track.content_ref() << " " << track.source_ref();
      if (!track.available()) std::cout << " [unavailable]";
      std::cout << "\n";
    }
    if (resp.unavailable_count() > 0) {
      std::cout << resp.unavailable_count() << " card(s) point at missing content\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "import") {
    if (argc < 5) return 1;

    ImportFileRequest req;
    req.set_card_id(argv[3]);
    req.set_path(argv[4]);

    ImportFileResponse resp;
    auto               status = stub->ImportFile(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintTrack(resp.track());
    std::cout << "format=" << resp.content().format() << "\n";
    std::cout << "bytes=" << resp.content().byte_size() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "url") {
    if (argc < 4) return 1;

    GetPlayUrlRequest req;
    req.set_card_id(argv[3]);
    if (argc >= 5) req.set_source_hint(argv[4]);

    GetPlayUrlResponse resp;
    auto               status = stub->GetPlayUrl(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << resp.url() << "\n";
    return 0;
  }

  Usage();
  return 1;
}
