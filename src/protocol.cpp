#include "protocol.hpp"

const char* event_name(PeerEventKind kind) {
  switch(kind) {
    case PeerEventKind::PeerDiscovered: return "peer-discovered";
    case PeerEventKind::GrabUpdate: return "grab-update";
  }
  return "unknown";
}

const char* event_tag(PeerEventKind kind) {
  switch(kind) {
    case PeerEventKind::PeerDiscovered: return "PEER_FOUND";
    case PeerEventKind::GrabUpdate: return "GRAB_UPDATE";
  }
  return "UNKNOWN";
}

std::string encode_packet(const WirePacket& packet) {
  json j;
  j["id"] = packet.id;
  j["ip"] = packet.ip;
  j["name"] = packet.name;
  j["isHolding"] = packet.is_holding;
  j["heldFile"] = packet.held_file;
  return j.dump();
}

bool is_valid_utf8(std::string_view text) {
  std::size_t i = 0;
  while(i < text.size()) {
    auto c = static_cast<unsigned char>(text[i]);
    std::size_t extra = 0;
    uint32_t cp = 0;
    if(c < 0x80) { ++i; continue; }
    else if((c & 0xE0) == 0xC0) { extra = 1; cp = c & 0x1F; }
    else if((c & 0xF0) == 0xE0) { extra = 2; cp = c & 0x0F; }
    else if((c & 0xF8) == 0xF0) { extra = 3; cp = c & 0x07; }
    else return false;
    if(i + extra >= text.size()) return false;
    for(std::size_t k = 1; k <= extra; ++k) {
      auto cc = static_cast<unsigned char>(text[i + k]);
      if((cc & 0xC0) != 0x80) return false;
      cp = (cp << 6) | (cc & 0x3F);
    }
    // overlong forms, surrogates and values past U+10FFFF
    if((extra == 1 && cp < 0x80) || (extra == 2 && cp < 0x800) ||
       (extra == 3 && cp < 0x10000) || cp > 0x10FFFF ||
       (cp >= 0xD800 && cp <= 0xDFFF)) {
      return false;
    }
    i += extra + 1;
  }
  return true;
}

std::optional<WirePacket> decode_packet(std::string_view datagram) {
  if(!is_valid_utf8(datagram)) return std::nullopt;
  json j = json::parse(datagram.begin(), datagram.end(), nullptr, false);
  if(j.is_discarded() || !j.is_object()) return std::nullopt;

  auto required_string = [&](const char* key, std::string& out) {
    auto it = j.find(key);
    if(it == j.end() || !it->is_string()) return false;
    out = it->get<std::string>();
    return true;
  };

  WirePacket packet;
  if(!required_string("id", packet.id) ||
     !required_string("ip", packet.ip) ||
     !required_string("name", packet.name)) {
    return std::nullopt;
  }
  if(packet.id.empty()) return std::nullopt;

  if(auto it = j.find("isHolding"); it != j.end()) {
    if(!it->is_boolean()) return std::nullopt;
    packet.is_holding = it->get<bool>();
  }
  if(auto it = j.find("heldFile"); it != j.end()) {
    if(!it->is_string()) return std::nullopt;
    packet.held_file = it->get<std::string>();
  }
  return packet;
}

PeerRecord record_from_packet(const WirePacket& packet) {
  PeerRecord record;
  record.id = packet.id;
  record.ip = packet.ip;
  record.name = packet.name;
  record.is_holding = packet.is_holding;
  record.held_file = packet.held_file;
  return record;
}

json make_peer_json(const PeerRecord& record) {
  json j;
  j["id"] = record.id;
  j["ip"] = record.ip;
  j["name"] = record.name;
  j["isHolding"] = record.is_holding;
  j["heldFile"] = record.held_file;
  if(record.manual) j["manual"] = true;
  return j;
}
