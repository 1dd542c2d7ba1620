#pragma once
#include <memory>
#include <shared_mutex>
#include <string>

#include "log.hpp"
#include "protocol.hpp"

struct Identity {
  std::string device_id;
  std::string device_name;
  std::string local_ip;
};

struct GrabState {
  bool is_holding = false;
  std::string held_file;
};

// Process identity plus the mutable "holding a file" flag. The identity is
// fixed at construction; the grab state changes only through set_grab and
// clear_grab, which always update both fields under one write lock.
class IdentityState {
public:
  struct Snapshot {
    Identity identity;
    GrabState grab;
  };

  IdentityState(Identity identity, std::shared_ptr<Logger> logger = nullptr);

  // Fills in missing fields: random UUID, host name, first LAN IPv4 address.
  static Identity resolve_identity(const std::string& device_id,
                                   const std::string& device_name,
                                   const std::string& local_ip);

  const Identity& identity() const { return identity_; }
  const std::string& device_id() const { return identity_.device_id; }

  // An empty filename releases the grab, keeping is_holding == !held_file.empty().
  void set_grab(const std::string& filename);
  void clear_grab();

  GrabState grab_state() const;
  Snapshot snapshot() const;
  WirePacket make_packet() const;

private:
  const Identity identity_;
  mutable std::shared_mutex grab_mutex_;
  GrabState grab_;
  std::shared_ptr<Logger> logger_;
};
