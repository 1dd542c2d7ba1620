#pragma once
#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "identity_state.hpp"
#include "log.hpp"
#include "protocol.hpp"

// Periodically sends the current identity and grab state, once to the
// broadcast address and once to the multicast group.
class BeaconBroadcaster {
public:
  struct Options {
    uint16_t port = kDiscoveryPort;
    std::string broadcast_address = kBroadcastAddress;   // empty disables
    std::string multicast_group = kMulticastGroup;       // empty disables
    std::chrono::milliseconds interval{kBeaconIntervalMs};
  };

  BeaconBroadcaster(std::shared_ptr<IdentityState> identity,
                    Options options,
                    std::shared_ptr<Logger> logger = nullptr);
  ~BeaconBroadcaster();

  BeaconBroadcaster(const BeaconBroadcaster&) = delete;
  BeaconBroadcaster& operator=(const BeaconBroadcaster&) = delete;

  // Opens the socket and starts ticking. False when the socket cannot be
  // opened or bound; the failure is logged and nothing else is affected.
  bool start();
  void stop();
  bool running() const { return running_.load(); }

  // Number of ticks, each of which sends to every configured destination.
  std::size_t beacons_sent() const { return beacons_sent_.load(); }
  const std::vector<asio::ip::udp::endpoint>& destinations() const { return destinations_; }

private:
  using udp = asio::ip::udp;

  bool resolve_destinations();
  void schedule_tick();
  void send_beacon();

  std::shared_ptr<IdentityState> identity_;
  Options options_;
  std::shared_ptr<Logger> logger_;

  asio::io_context io_;
  std::unique_ptr<udp::socket> socket_;
  std::unique_ptr<asio::steady_timer> timer_;
  std::vector<udp::endpoint> destinations_;
  std::thread io_thread_;
  std::atomic<bool> running_{false};
  std::atomic<std::size_t> beacons_sent_{0};
};
