#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace localdeck::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

MemoryTransaction& MemoryRepository::TX(Transaction& t) {
  return static_cast<MemoryTransaction&>(t);
}

std::optional<model::TrackRecord> MemoryRepository::GetTrack(Transaction& t, const std::string& card_id) {
  const auto& tracks = TX(t).View().tracks;
  auto        it     = tracks.find(card_id);
  if (it == tracks.end()) return std::nullopt;
  return it->second;
}

std::vector<model::TrackRecord> MemoryRepository::ListTracks(Transaction& t) {
  std::vector<model::TrackRecord> out;
  for (const auto& [card_id, record] : TX(t).View().tracks) {
    out.push_back(record);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.card_id < b.card_id; });
  return out;
}

Result MemoryRepository::UpsertTrack(Transaction& t, const model::TrackRecord& r) {
  if (r.card_id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "card_id must not be empty");

  auto& tracks = TX(t).Mutable().tracks;
  auto  it     = tracks.find(r.card_id);
  if (it == tracks.end()) {
    tracks.emplace(r.card_id, r);
    return Result::Ok();
  }

  it->second.content_ref   = r.content_ref;
  it->second.source_ref    = r.source_ref;
  it->second.updated_at_ms = r.updated_at_ms;
  return Result::Ok();
}

Result MemoryRepository::TouchTrack(Transaction& t, const std::string& card_id, uint64_t played_at_ms) {
  auto& tracks = TX(t).Mutable().tracks;
  auto  it     = tracks.find(card_id);
  if (it == tracks.end()) return Result::Err(ErrorCode::NotFound, "track not found");

  it->second.last_played_at_ms = played_at_ms;
  return Result::Ok();
}

uint64_t MemoryRepository::CountTracksByContent(Transaction& t, const std::string& content_ref) {
  const auto& tracks = TX(t).View().tracks;
  return static_cast<uint64_t>(
      std::count_if(tracks.begin(), tracks.end(), [&](const auto& entry) { return !content_ref.empty() && entry.second.content_ref == content_ref; }));
}

} // namespace localdeck::db::memory
