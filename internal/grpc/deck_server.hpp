#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/deck_service.hpp"
#include "localdeck/v1.hpp"

namespace localdeck::grpc {

class DeckServer final : public localdeck::deck::v1::DeckService::Service {
 public:
  explicit DeckServer(std::shared_ptr<localdeck::service::DeckService> svc);

  ::grpc::Status Play(::grpc::ServerContext*, const localdeck::deck::v1::PlayRequest*, localdeck::deck::v1::PlayResponse*) override;

  ::grpc::Status Stop(::grpc::ServerContext*, const google::protobuf::Empty*, google::protobuf::Empty*) override;

  ::grpc::Status GetDeckStatus(::grpc::ServerContext*, const google::protobuf::Empty*, localdeck::deck::v1::GetDeckStatusResponse*) override;

  ::grpc::Status LookupCard(::grpc::ServerContext*, const localdeck::deck::v1::LookupCardRequest*,
                            localdeck::deck::v1::LookupCardResponse*) override;

  ::grpc::Status ListCards(::grpc::ServerContext*, const localdeck::deck::v1::ListCardsRequest*, localdeck::deck::v1::ListCardsResponse*) override;

  ::grpc::Status ImportFile(::grpc::ServerContext*, const localdeck::deck::v1::ImportFileRequest*,
                            localdeck::deck::v1::ImportFileResponse*) override;

  ::grpc::Status GetPlayUrl(::grpc::ServerContext*, const localdeck::deck::v1::GetPlayUrlRequest*,
                            localdeck::deck::v1::GetPlayUrlResponse*) override;

 private:
  std::shared_ptr<localdeck::service::DeckService> service_;
};

} // namespace localdeck::grpc
