#pragma once
#include <asio.hpp>

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

#include "event_dispatcher.hpp"
#include "log.hpp"
#include "peer_registry.hpp"
#include "protocol.hpp"

// Receives beacons on the discovery port, one datagram at a time, keeps the
// peer registry current and publishes peer-discovered / grab-update events.
class DiscoveryListener {
public:
  struct Options {
    std::string listen_ip = "0.0.0.0";
    uint16_t port = kDiscoveryPort;          // 0 picks an ephemeral port
    std::string multicast_group = kMulticastGroup;  // empty skips the join
  };

  DiscoveryListener(std::string local_device_id,
                    std::shared_ptr<PeerRegistry> registry,
                    std::shared_ptr<EventDispatcher> dispatcher,
                    Options options,
                    std::shared_ptr<Logger> logger = nullptr);
  ~DiscoveryListener();

  DiscoveryListener(const DiscoveryListener&) = delete;
  DiscoveryListener& operator=(const DiscoveryListener&) = delete;

  // False when the port cannot be bound; only this component stops.
  bool start();
  void stop();
  bool running() const { return running_.load(); }
  uint16_t local_port() const { return local_port_.load(); }

  // Decode, filter, update the registry and classify one datagram.
  // Returns the event that was published, if any.
  std::optional<PeerEventKind> process_datagram(std::string_view datagram);

  std::size_t datagrams_received() const { return received_.load(); }
  std::size_t datagrams_dropped() const { return dropped_.load(); }

private:
  using udp = asio::ip::udp;

  void do_receive();

  std::string local_device_id_;
  std::shared_ptr<PeerRegistry> registry_;
  std::shared_ptr<EventDispatcher> dispatcher_;
  Options options_;
  std::shared_ptr<Logger> logger_;

  asio::io_context io_;
  std::unique_ptr<udp::socket> socket_;
  udp::endpoint sender_;
  std::array<char, kMaxDatagramSize> buffer_{};
  std::thread io_thread_;
  std::atomic<bool> running_{false};
  std::atomic<uint16_t> local_port_{0};
  std::atomic<std::size_t> received_{0};
  std::atomic<std::size_t> dropped_{0};
};
