#include "deck_server.hpp"

#include "grpc_error.hpp"
#include "internal/fetch/cancellation.hpp"

namespace localdeck::grpc {

using namespace localdeck::deck::v1;

DeckServer::DeckServer(std::shared_ptr<localdeck::service::DeckService> svc) : service_(std::move(svc)) {
}

::grpc::Status DeckServer::Play(::grpc::ServerContext* context, const PlayRequest* req, PlayResponse* resp) {
  try {
    // a disconnected client stops waiting; the shared fetch carries on
    localdeck::fetch::CancellationToken cancel([context] { return context->IsCancelled(); });
    *resp = service_->Play(*req, &cancel);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DeckServer::Stop(::grpc::ServerContext*, const google::protobuf::Empty*, google::protobuf::Empty*) {
  try {
    service_->Stop();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DeckServer::GetDeckStatus(::grpc::ServerContext*, const google::protobuf::Empty*, GetDeckStatusResponse* resp) {
  try {
    *resp = service_->GetDeckStatus();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DeckServer::LookupCard(::grpc::ServerContext*, const LookupCardRequest* req, LookupCardResponse* resp) {
  try {
    *resp = service_->LookupCard(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DeckServer::ListCards(::grpc::ServerContext*, const ListCardsRequest* req, ListCardsResponse* resp) {
  try {
    *resp = service_->ListCards(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DeckServer::ImportFile(::grpc::ServerContext*, const ImportFileRequest* req, ImportFileResponse* resp) {
  try {
    *resp = service_->ImportFile(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DeckServer::GetPlayUrl(::grpc::ServerContext*, const GetPlayUrlRequest* req, GetPlayUrlResponse* resp) {
  try {
    *resp = service_->GetPlayUrl(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace localdeck::grpc
