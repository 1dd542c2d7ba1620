#include "event_dispatcher.hpp"

#include <exception>
#include <utility>
#include <vector>

EventDispatcher::EventDispatcher(std::shared_ptr<Logger> logger)
  : logger_(std::move(logger)) {}

EventDispatcher::~EventDispatcher() {
  stop();
}

void EventDispatcher::start() {
  if(running_.exchange(true)) return;
  thread_ = std::thread([this](){ run(); });
}

void EventDispatcher::stop() {
  if(!running_.exchange(false)) return;
  queue_cv_.notify_all();
  if(thread_.joinable()) thread_.join();
}

void EventDispatcher::publish(PeerEvent event) {
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    queue_.push_back(std::move(event));
  }
  queue_cv_.notify_one();
}

PeerEventHandle EventDispatcher::subscribe(Subscriber subscriber) {
  if(!subscriber) return 0;
  std::lock_guard<std::mutex> lock(subscriber_mutex_);
  auto handle = next_handle_++;
  subscribers_.emplace(handle, std::move(subscriber));
  return handle;
}

void EventDispatcher::unsubscribe(PeerEventHandle handle) {
  {
    std::lock_guard<std::mutex> lock(subscriber_mutex_);
    subscribers_.erase(handle);
  }
  // wait out a delivery that copied the subscriber before the erase
  if(std::this_thread::get_id() != delivery_thread_.load()) {
    std::lock_guard<std::mutex> wait(delivery_mutex_);
  }
}

std::size_t EventDispatcher::pending() const {
  std::lock_guard<std::mutex> lock(queue_mutex_);
  return queue_.size();
}

void EventDispatcher::run() {
  delivery_thread_ = std::this_thread::get_id();
  for(;;) {
    PeerEvent event;
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      queue_cv_.wait(lock, [this]{ return !queue_.empty() || !running_.load(); });
      if(queue_.empty()) return; // stopped and drained
      event = std::move(queue_.front());
      queue_.pop_front();
    }
    deliver(event);
  }
}

void EventDispatcher::deliver(const PeerEvent& event) {
  std::lock_guard<std::mutex> delivering(delivery_mutex_);
  std::vector<std::pair<PeerEventHandle, Subscriber>> targets;
  {
    std::lock_guard<std::mutex> lock(subscriber_mutex_);
    targets.reserve(subscribers_.size());
    for(const auto& kv : subscribers_) targets.push_back(kv);
  }
  for(auto& [handle, subscriber] : targets) {
    {
      // an earlier subscriber may have unsubscribed this one
      std::lock_guard<std::mutex> lock(subscriber_mutex_);
      if(subscribers_.count(handle) == 0) continue;
    }
    try {
      subscriber(event);
    } catch(const std::exception& e) {
      log_to(logger_.get(), LogChannel::Error, "{} subscriber failed for {}: {}",
                event_name(event.kind), event.record.id, e.what());
    }
  }
  delivered_.fetch_add(1);
}
