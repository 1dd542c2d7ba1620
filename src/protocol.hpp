#pragma once
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

using json = nlohmann::json;

// protocol.hpp
inline constexpr uint16_t kDiscoveryPort = 9988;
inline constexpr int kBeaconIntervalMs = 1000;
inline constexpr const char* kBroadcastAddress = "255.255.255.255";
inline constexpr const char* kMulticastGroup = "224.0.0.251";
inline constexpr std::size_t kMaxDatagramSize = 4096;

// One beacon, as it travels in a single UDP datagram.
struct WirePacket {
  std::string id;
  std::string ip;
  std::string name;
  bool is_holding = false;
  std::string held_file;
};

struct PeerRecord {
  std::string id;
  std::string ip;
  std::string name;
  bool is_holding = false;
  std::string held_file;
  bool manual = false;      // created by a manual connect, not by a beacon

  bool same_grab_state(const PeerRecord& other) const {
    return is_holding == other.is_holding && held_file == other.held_file;
  }
  bool operator==(const PeerRecord& other) const {
    return id == other.id && ip == other.ip && name == other.name &&
           is_holding == other.is_holding && held_file == other.held_file &&
           manual == other.manual;
  }
};

enum class PeerEventKind { PeerDiscovered, GrabUpdate };

struct PeerEvent {
  PeerEventKind kind = PeerEventKind::PeerDiscovered;
  PeerRecord record;
};

// "peer-discovered" / "grab-update"
const char* event_name(PeerEventKind kind);
// "PEER_FOUND" / "GRAB_UPDATE", the console line tags
const char* event_tag(PeerEventKind kind);

std::string encode_packet(const WirePacket& packet);

// Empty on invalid UTF-8, malformed JSON or a schema mismatch. Never throws.
std::optional<WirePacket> decode_packet(std::string_view datagram);

bool is_valid_utf8(std::string_view text);

PeerRecord record_from_packet(const WirePacket& packet);
json make_peer_json(const PeerRecord& record);
