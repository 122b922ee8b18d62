#pragma once

#include "internal/fetch/cancellation.hpp"
#include "localdeck/v1.hpp"
#include "service_context.hpp"

namespace localdeck::service {

/*
  Transport-independent deck operations. Errors are thrown as the
  util exception kinds; adapters translate them.
*/
class DeckService {
 public:
  explicit DeckService(ServiceContext ctx);

  // Resolves the card, then starts playback of the result.
  localdeck::deck::v1::PlayResponse Play(const localdeck::deck::v1::PlayRequest& req, const localdeck::fetch::CancellationToken* cancel = nullptr);

  void Stop();

  localdeck::deck::v1::GetDeckStatusResponse GetDeckStatus();

  localdeck::deck::v1::LookupCardResponse LookupCard(const localdeck::deck::v1::LookupCardRequest& req);

  // Cards whose content is missing are counted, and listed only on request.
  localdeck::deck::v1::ListCardsResponse ListCards(const localdeck::deck::v1::ListCardsRequest& req);

  // Stores a local audio file and maps the card to it.
  localdeck::deck::v1::ImportFileResponse ImportFile(const localdeck::deck::v1::ImportFileRequest& req);

  localdeck::deck::v1::GetPlayUrlResponse GetPlayUrl(const localdeck::deck::v1::GetPlayUrlRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace localdeck::service
