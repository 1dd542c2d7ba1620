#include "peer_registry.hpp"

#include <mutex>

PeerRegistry::PeerRegistry(std::string local_peer_id, std::shared_ptr<Logger> logger)
  : local_peer_id_(std::move(local_peer_id)),
    logger_(std::move(logger)) {}

PeerRegistry::UpsertResult PeerRegistry::upsert(const PeerRecord& record) {
  UpsertResult result;
  if(record.id.empty() || record.id == local_peer_id_) {
    return result;
  }
  {
    std::unique_lock lock(m_);
    auto it = peers_.find(record.id);
    if(it == peers_.end()) {
      peers_.emplace(record.id, record);
      result.outcome = Outcome::Inserted;
    } else {
      result.previous = it->second;
      it->second = record;
      result.outcome = Outcome::Replaced;
    }
  }
  if(result.outcome == Outcome::Inserted) {
    log_to(logger_.get(), LogChannel::Debug, "Registered peer {} ({}) @ {}", record.id, record.name, record.ip);
  }
  return result;
}

bool PeerRegistry::insert_if_absent(const PeerRecord& record) {
  if(record.id.empty() || record.id == local_peer_id_) return false;
  bool inserted = false;
  {
    std::unique_lock lock(m_);
    inserted = peers_.emplace(record.id, record).second;
  }
  if(inserted) {
    log_to(logger_.get(), LogChannel::Debug, "Registered peer {} ({}) @ {}", record.id, record.name, record.ip);
  }
  return inserted;
}

std::optional<PeerRecord> PeerRegistry::find(const std::string& peer_id) const {
  std::shared_lock lock(m_);
  auto it = peers_.find(peer_id);
  if(it == peers_.end()) return std::nullopt;
  return it->second;
}

bool PeerRegistry::contains(const std::string& peer_id) const {
  std::shared_lock lock(m_);
  return peers_.count(peer_id) > 0;
}

std::vector<PeerRecord> PeerRegistry::snapshot() const {
  std::shared_lock lock(m_);
  std::vector<PeerRecord> out;
  out.reserve(peers_.size());
  for(const auto& kv : peers_) out.push_back(kv.second);
  return out;
}

std::size_t PeerRegistry::size() const {
  std::shared_lock lock(m_);
  return peers_.size();
}
