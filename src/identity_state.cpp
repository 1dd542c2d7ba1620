#include "identity_state.hpp"

#include <mutex>

#include "utils.hpp"

IdentityState::IdentityState(Identity identity, std::shared_ptr<Logger> logger)
  : identity_(std::move(identity)),
    logger_(std::move(logger)) {}

Identity IdentityState::resolve_identity(const std::string& device_id,
                                         const std::string& device_name,
                                         const std::string& local_ip) {
  Identity out;
  out.device_id = device_id.empty() ? random_uuid_v4() : device_id;
  out.device_name = device_name;
  if(out.device_name.empty()) out.device_name = host_name();
  if(out.device_name.empty()) out.device_name = "Unknown";
  out.local_ip = local_ip.empty() ? detect_local_ipv4() : local_ip;
  return out;
}

void IdentityState::set_grab(const std::string& filename) {
  if(filename.empty()) {
    clear_grab();
    return;
  }
  {
    std::unique_lock lock(grab_mutex_);
    grab_.is_holding = true;
    grab_.held_file = filename;
  }
  log_to(logger_.get(), LogChannel::Info, "Now holding: {}", filename);
}

void IdentityState::clear_grab() {
  {
    std::unique_lock lock(grab_mutex_);
    grab_.is_holding = false;
    grab_.held_file.clear();
  }
  log_to(logger_.get(), LogChannel::Info, "Released held file");
}

GrabState IdentityState::grab_state() const {
  std::shared_lock lock(grab_mutex_);
  return grab_;
}

IdentityState::Snapshot IdentityState::snapshot() const {
  Snapshot s;
  s.identity = identity_;
  s.grab = grab_state();
  return s;
}

WirePacket IdentityState::make_packet() const {
  auto s = snapshot();
  WirePacket packet;
  packet.id = s.identity.device_id;
  packet.ip = s.identity.local_ip;
  packet.name = s.identity.device_name;
  packet.is_holding = s.grab.is_holding;
  packet.held_file = s.grab.held_file;
  return packet;
}
