#include "discovery_listener.hpp"

DiscoveryListener::DiscoveryListener(std::string local_device_id,
                                     std::shared_ptr<PeerRegistry> registry,
                                     std::shared_ptr<EventDispatcher> dispatcher,
                                     Options options,
                                     std::shared_ptr<Logger> logger)
  : local_device_id_(std::move(local_device_id)),
    registry_(std::move(registry)),
    dispatcher_(std::move(dispatcher)),
    options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("discovery")) {}

DiscoveryListener::~DiscoveryListener() {
  stop();
}

bool DiscoveryListener::start() {
  if(running_.load()) return true;

  std::error_code ec;
  auto address = asio::ip::make_address(options_.listen_ip, ec);
  if(ec) {
    logger_->error("Invalid listen_ip '{}': {}", options_.listen_ip, ec.message());
    return false;
  }

  auto socket = std::make_unique<udp::socket>(io_);
  udp::endpoint endpoint(address, options_.port);
  socket->open(endpoint.protocol(), ec);
  if(!ec) socket->set_option(asio::socket_base::reuse_address(true), ec);
  if(!ec) socket->bind(endpoint, ec);
  if(ec) {
    logger_->error("Failed to bind listener on port {}: {}", options_.port, ec.message());
    logger_->error("This may be due to a firewall or another process using the port.");
    return false;
  }

  if(!options_.multicast_group.empty()) {
    std::error_code join_ec;
    auto group = asio::ip::make_address(options_.multicast_group, join_ec);
    if(!join_ec) {
      socket->set_option(asio::ip::multicast::join_group(group), join_ec);
    }
    if(join_ec) {
      logger_->warn("Could not join multicast group {}: {} (broadcast beacons still arrive)",
                    options_.multicast_group, join_ec.message());
    }
  }

  local_port_ = socket->local_endpoint().port();
  socket_ = std::move(socket);
  running_ = true;
  logger_->info("Listener started on port {}", local_port_.load());

  do_receive();
  io_thread_ = std::thread([this](){ io_.run(); });
  return true;
}

void DiscoveryListener::do_receive() {
  if(!socket_) return;
  socket_->async_receive_from(asio::buffer(buffer_), sender_,
    [this](const std::error_code& ec, std::size_t bytes){
      if(!running_) return;
      if(ec) {
        if(ec == asio::error::operation_aborted) return;
        logger_->warn("Receive error: {}", ec.message());
      } else {
        process_datagram(std::string_view(buffer_.data(), bytes));
      }
      do_receive();
    });
}

std::optional<PeerEventKind> DiscoveryListener::process_datagram(std::string_view datagram) {
  received_.fetch_add(1);

  auto packet = decode_packet(datagram);
  if(!packet) {
    dropped_.fetch_add(1);
    return std::nullopt;
  }
  if(packet->id == local_device_id_) {
    return std::nullopt;
  }

  PeerRecord record = record_from_packet(*packet);
  auto result = registry_->upsert(record);

  std::optional<PeerEventKind> kind;
  if(result.outcome == PeerRegistry::Outcome::Inserted) {
    kind = PeerEventKind::PeerDiscovered;
    logger_->info("New peer: {} at {}", record.name, record.ip);
  } else if(result.outcome == PeerRegistry::Outcome::Replaced &&
            result.previous && !result.previous->same_grab_state(record)) {
    kind = PeerEventKind::GrabUpdate;
    logger_->info("Grab update from {}: holding={} file='{}'",
                  record.name, record.is_holding, record.held_file);
  }

  if(kind && dispatcher_) {
    dispatcher_->publish(PeerEvent{*kind, std::move(record)});
  }
  return kind;
}

void DiscoveryListener::stop() {
  if(!running_.exchange(false)) return;

  io_.stop();
  if(io_thread_.joinable()) {
    io_thread_.join();
  }
  std::error_code ec;
  if(socket_) socket_->close(ec);
  socket_.reset();
  io_.restart();
  logger_->info("Listener stopped ({} datagrams, {} dropped)", received_.load(), dropped_.load());
}
