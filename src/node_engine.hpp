#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "downloader.hpp"
#include "event_dispatcher.hpp"
#include "identity_state.hpp"
#include "log.hpp"
#include "protocol.hpp"

class BeaconBroadcaster;
class DiscoveryListener;
class FileServer;
class PeerRegistry;
class SettingsManager;

// Owns one node: identity, registry, dispatcher, broadcaster, listener and
// file server, configured from SettingsManager. A component that fails to
// start is logged and left stopped; the rest keep running.
class NodeEngine {
public:
  struct Options {
    std::filesystem::path workspace_root = std::filesystem::current_path();
  };

  NodeEngine(std::shared_ptr<SettingsManager> settings, Options options);
  explicit NodeEngine(std::shared_ptr<SettingsManager> settings = nullptr);
  ~NodeEngine();

  NodeEngine(const NodeEngine&) = delete;
  NodeEngine& operator=(const NodeEngine&) = delete;

  // Throws std::runtime_error when the settings cannot describe a node
  // (bad addresses, out of range ports).
  void start();
  void stop();
  bool started() const { return started_; }

  void set_grab(const std::string& filename);
  void clear_grab();
  // Registers a peer by address without waiting for its beacon.
  bool manual_connect(const std::string& ip);
  // Throws DownloadError.
  DownloadResult download_file(const std::string& url, const std::filesystem::path& dest_path) const;

  Identity device_info() const;
  GrabState grab_state() const;
  std::vector<PeerRecord> peers() const;
  std::vector<std::string> shared_files() const;
  std::filesystem::path shared_dir() const;

  PeerEventHandle subscribe(EventDispatcher::Subscriber subscriber);
  void unsubscribe(PeerEventHandle handle);

  struct Stats {
    std::size_t known_peers = 0;
    std::size_t beacons_sent = 0;
    std::size_t datagrams_received = 0;
    std::size_t datagrams_dropped = 0;
    std::size_t events_delivered = 0;
    bool beacon_running = false;
    bool listener_running = false;
    bool server_running = false;
  };
  Stats stats() const;

  uint16_t http_port() const;
  uint16_t discovery_port() const;

  std::shared_ptr<SettingsManager> settings() const { return settings_; }
  std::shared_ptr<Logger> logger() const { return logger_; }

private:
  uint16_t port_setting(const std::string& key) const;
  std::filesystem::path resolve_shared_dir() const;

  Options options_;
  std::shared_ptr<SettingsManager> settings_;
  std::shared_ptr<Logger> logger_;

  std::shared_ptr<IdentityState> identity_;
  std::shared_ptr<PeerRegistry> registry_;
  std::shared_ptr<EventDispatcher> dispatcher_;
  std::unique_ptr<BeaconBroadcaster> broadcaster_;
  std::unique_ptr<DiscoveryListener> listener_;
  std::unique_ptr<FileServer> server_;
  std::chrono::milliseconds download_timeout_{kDefaultDownloadTimeout};
  bool started_ = false;
};
