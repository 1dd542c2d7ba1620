#include "node_engine.hpp"

#include <asio.hpp>

#include <stdexcept>

#include "beacon_broadcaster.hpp"
#include "discovery_listener.hpp"
#include "file_server.hpp"
#include "peer_registry.hpp"
#include "settings_manager.hpp"

NodeEngine::NodeEngine(std::shared_ptr<SettingsManager> settings, Options options)
  : options_(std::move(options)),
    settings_(settings ? std::move(settings) : std::make_shared<SettingsManager>()),
    logger_(std::make_shared<Logger>("node")) {
  if(options_.workspace_root.empty()) {
    options_.workspace_root = std::filesystem::current_path();
  }
}

NodeEngine::NodeEngine(std::shared_ptr<SettingsManager> settings)
  : NodeEngine(std::move(settings), Options{}) {}

NodeEngine::~NodeEngine() {
  stop();
}

uint16_t NodeEngine::port_setting(const std::string& key) const {
  int value = settings_->get<int>(key);
  if(value < 0 || value > 65535) {
    logger_->error("Invalid {} '{}'", key, value);
    throw std::runtime_error("Invalid " + key);
  }
  return static_cast<uint16_t>(value);
}

std::filesystem::path NodeEngine::resolve_shared_dir() const {
  std::filesystem::path dir = settings_->get<std::string>("shared_dir");
  if(dir.empty()) dir = "shared";
  if(dir.is_relative()) dir = options_.workspace_root / dir;
  return dir;
}

void NodeEngine::start() {
  if(started_) return;

  auto identity = IdentityState::resolve_identity(settings_->get<std::string>("device_id"),
                                                  settings_->get<std::string>("device_name"),
                                                  settings_->get<std::string>("local_ip"));
  logger_->set_name(identity.device_name);

  const uint16_t discovery_port = port_setting("discovery_port");
  const uint16_t http_port = port_setting("http_port");

  std::error_code ec;
  for(const char* key : {"listen_ip", "http_bind_ip"}) {
    auto value = settings_->get<std::string>(key);
    asio::ip::make_address(value, ec);
    if(ec) {
      logger_->error("Invalid {} '{}': {}", key, value, ec.message());
      throw std::runtime_error(std::string("Invalid ") + key);
    }
  }
  download_timeout_ = std::chrono::milliseconds(settings_->get<int>("download_timeout_ms"));

  identity_ = std::make_shared<IdentityState>(identity, logger_);
  registry_ = std::make_shared<PeerRegistry>(identity.device_id, logger_);
  dispatcher_ = std::make_shared<EventDispatcher>(logger_);
  dispatcher_->start();
  started_ = true;

  logger_->info("Device {} ({}) at {}", identity.device_name, identity.device_id, identity.local_ip);

  if(settings_->get<bool>("enable_listener")) {
    DiscoveryListener::Options listen_options;
    listen_options.listen_ip = settings_->get<std::string>("listen_ip");
    listen_options.port = discovery_port;
    listen_options.multicast_group = settings_->get<std::string>("multicast_group");
    listener_ = std::make_unique<DiscoveryListener>(identity.device_id, registry_, dispatcher_,
                                                    listen_options, logger_);
    if(!listener_->start()) {
      logger_->error("Discovery listener disabled; peers will not be discovered");
    }
  }

  if(settings_->get<bool>("enable_beacon")) {
    BeaconBroadcaster::Options beacon_options;
    beacon_options.port = discovery_port;
    beacon_options.broadcast_address = settings_->get<std::string>("broadcast_address");
    beacon_options.multicast_group = settings_->get<std::string>("multicast_group");
    beacon_options.interval = std::chrono::milliseconds(settings_->get<int>("beacon_interval_ms"));
    broadcaster_ = std::make_unique<BeaconBroadcaster>(identity_, beacon_options, logger_);
    if(!broadcaster_->start()) {
      logger_->error("Beacon broadcaster disabled; this device will not be announced");
    }
  }

  if(settings_->get<bool>("enable_server")) {
    FileServer::Options server_options;
    server_options.bind_ip = settings_->get<std::string>("http_bind_ip");
    server_options.port = http_port;
    server_options.shared_dir = resolve_shared_dir();
    server_options.threads = static_cast<std::size_t>(settings_->get<int>("http_threads"));
    server_options.max_body_bytes = static_cast<std::size_t>(settings_->get<int>("max_upload_bytes"));
    server_ = std::make_unique<FileServer>(server_options, logger_);
    if(!server_->start()) {
      logger_->error("File server disabled; files cannot be pulled from this device");
    }
  }
}

void NodeEngine::stop() {
  if(!started_) return;
  started_ = false;

  if(broadcaster_) broadcaster_->stop();
  if(listener_) listener_->stop();
  if(server_) server_->stop();
  if(dispatcher_) dispatcher_->stop();
  broadcaster_.reset();
  listener_.reset();
  server_.reset();
}

void NodeEngine::set_grab(const std::string& filename) {
  if(!identity_) throw std::logic_error("node not started");
  identity_->set_grab(filename);
}

void NodeEngine::clear_grab() {
  if(!identity_) throw std::logic_error("node not started");
  identity_->clear_grab();
}

bool NodeEngine::manual_connect(const std::string& ip) {
  if(!registry_) throw std::logic_error("node not started");
  std::error_code ec;
  auto address = asio::ip::make_address(ip, ec);
  if(ec) {
    logger_->warn("Manual connect rejected, '{}' is not an IP address", ip);
    return false;
  }

  PeerRecord record;
  record.ip = address.to_string();
  record.id = "manual-" + record.ip;
  record.name = record.ip;
  record.manual = true;
  if(!registry_->insert_if_absent(record)) {
    logger_->info("Manual peer {} already known", record.ip);
    return false;
  }
  logger_->info("Manually added peer {}", record.ip);
  dispatcher_->publish(PeerEvent{PeerEventKind::PeerDiscovered, record});
  return true;
}

DownloadResult NodeEngine::download_file(const std::string& url, const std::filesystem::path& dest_path) const {
  Downloader downloader(download_timeout_, logger_);
  return downloader.fetch(url, dest_path);
}

Identity NodeEngine::device_info() const {
  if(!identity_) throw std::logic_error("node not started");
  return identity_->identity();
}

GrabState NodeEngine::grab_state() const {
  if(!identity_) throw std::logic_error("node not started");
  return identity_->grab_state();
}

std::vector<PeerRecord> NodeEngine::peers() const {
  if(!registry_) return {};
  return registry_->snapshot();
}

std::filesystem::path NodeEngine::shared_dir() const {
  if(server_) return server_->shared_dir();
  return resolve_shared_dir();
}

std::vector<std::string> NodeEngine::shared_files() const {
  if(server_) return server_->list_files();
  FileServer::Options options;
  options.shared_dir = resolve_shared_dir();
  return FileServer(options, logger_).list_files();
}

PeerEventHandle NodeEngine::subscribe(EventDispatcher::Subscriber subscriber) {
  if(!dispatcher_) throw std::logic_error("node not started");
  return dispatcher_->subscribe(std::move(subscriber));
}

void NodeEngine::unsubscribe(PeerEventHandle handle) {
  if(dispatcher_) dispatcher_->unsubscribe(handle);
}

NodeEngine::Stats NodeEngine::stats() const {
  Stats s;
  if(registry_) s.known_peers = registry_->size();
  if(dispatcher_) s.events_delivered = dispatcher_->delivered();
  if(broadcaster_) {
    s.beacons_sent = broadcaster_->beacons_sent();
    s.beacon_running = broadcaster_->running();
  }
  if(listener_) {
    s.datagrams_received = listener_->datagrams_received();
    s.datagrams_dropped = listener_->datagrams_dropped();
    s.listener_running = listener_->running();
  }
  if(server_) s.server_running = server_->running();
  return s;
}

uint16_t NodeEngine::http_port() const {
  return server_ ? server_->port() : 0;
}

uint16_t NodeEngine::discovery_port() const {
  return listener_ ? listener_->local_port() : 0;
}
