#include "beacon_broadcaster.hpp"

BeaconBroadcaster::BeaconBroadcaster(std::shared_ptr<IdentityState> identity,
                                     Options options,
                                     std::shared_ptr<Logger> logger)
  : identity_(std::move(identity)),
    options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("beacon")) {
  if(options_.interval.count() <= 0) {
    options_.interval = std::chrono::milliseconds(kBeaconIntervalMs);
  }
}

BeaconBroadcaster::~BeaconBroadcaster() {
  stop();
}

bool BeaconBroadcaster::resolve_destinations() {
  destinations_.clear();
  for(const auto* address : {&options_.broadcast_address, &options_.multicast_group}) {
    if(address->empty()) continue;
    std::error_code ec;
    auto ip = asio::ip::make_address(*address, ec);
    if(ec) {
      logger_->error("Invalid beacon destination '{}': {}", *address, ec.message());
      return false;
    }
    destinations_.emplace_back(ip, options_.port);
  }
  if(destinations_.empty()) {
    logger_->warn("Beacon has no destinations; broadcast and multicast are both disabled");
  }
  return true;
}

bool BeaconBroadcaster::start() {
  if(running_.load()) return true;
  if(!resolve_destinations()) return false;

  auto socket = std::make_unique<udp::socket>(io_);
  std::error_code ec;
  socket->open(udp::v4(), ec);
  if(!ec) socket->set_option(asio::socket_base::broadcast(true), ec);
  if(!ec) socket->bind(udp::endpoint(asio::ip::address_v4::any(), 0), ec);
  if(ec) {
    logger_->error("Failed to bind beacon socket: {}", ec.message());
    return false;
  }
  socket_ = std::move(socket);
  timer_ = std::make_unique<asio::steady_timer>(io_);
  running_ = true;

  logger_->info("Beacon started, broadcasting every {}ms to port {}",
                options_.interval.count(), options_.port);

  asio::post(io_, [this](){
    send_beacon();
    schedule_tick();
  });
  io_thread_ = std::thread([this](){ io_.run(); });
  return true;
}

void BeaconBroadcaster::schedule_tick() {
  if(!timer_ || !running_) return;
  timer_->expires_after(options_.interval);
  timer_->async_wait([this](const std::error_code& ec){
    if(ec || !running_) return;
    send_beacon();
    schedule_tick();
  });
}

void BeaconBroadcaster::send_beacon() {
  if(!socket_) return;
  const std::string payload = encode_packet(identity_->make_packet());
  for(const auto& destination : destinations_) {
    std::error_code ec;
    socket_->send_to(asio::buffer(payload), destination, 0, ec);
    if(ec) {
      // the next tick carries the full state again
      logger_->debug("Beacon send to {} failed: {}", destination.address().to_string(), ec.message());
    }
  }
  beacons_sent_.fetch_add(1);
}

void BeaconBroadcaster::stop() {
  if(!running_.exchange(false)) return;

  io_.stop();
  if(io_thread_.joinable()) {
    io_thread_.join();
  }
  std::error_code ec;
  if(timer_) timer_->cancel();
  if(socket_) socket_->close(ec);
  timer_.reset();
  socket_.reset();
  io_.restart();
  logger_->info("Beacon stopped after {} ticks", beacons_sent_.load());
}
