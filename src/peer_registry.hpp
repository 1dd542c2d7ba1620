#pragma once
#include <cstddef>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "log.hpp"
#include "protocol.hpp"

// Known remote peers keyed by id. Records are replaced, never removed, and
// the local device id is never stored.
class PeerRegistry {
public:
  enum class Outcome { Rejected, Inserted, Replaced };

  struct UpsertResult {
    Outcome outcome = Outcome::Rejected;
    std::optional<PeerRecord> previous;
  };

  PeerRegistry(std::string local_peer_id, std::shared_ptr<Logger> logger = nullptr);

  // Insert or replace in one write-locked step, returning what was there before.
  UpsertResult upsert(const PeerRecord& record);

  // Inserts only when no record with that id exists yet.
  bool insert_if_absent(const PeerRecord& record);

  std::optional<PeerRecord> find(const std::string& peer_id) const;
  bool contains(const std::string& peer_id) const;
  std::vector<PeerRecord> snapshot() const;
  std::size_t size() const;

  const std::string& local_peer_id() const { return local_peer_id_; }

private:
  const std::string local_peer_id_;
  mutable std::shared_mutex m_;
  std::unordered_map<std::string, PeerRecord> peers_;
  std::shared_ptr<Logger> logger_;
};
