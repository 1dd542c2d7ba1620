#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>

#include "log.hpp"
#include "protocol.hpp"

using PeerEventHandle = std::size_t;

// Hands peer events from the discovery listener to subscribers on a thread
// of its own, so a slow subscriber never holds up datagram reception.
class EventDispatcher {
public:
  using Subscriber = std::function<void(const PeerEvent&)>;

  explicit EventDispatcher(std::shared_ptr<Logger> logger = nullptr);
  ~EventDispatcher();

  EventDispatcher(const EventDispatcher&) = delete;
  EventDispatcher& operator=(const EventDispatcher&) = delete;

  void start();
  // Delivers whatever is still queued, then joins the delivery thread.
  void stop();
  bool running() const { return running_.load(); }

  // Never blocks on subscribers; only takes the queue lock.
  void publish(PeerEvent event);

  PeerEventHandle subscribe(Subscriber subscriber);
  // Once this returns the subscriber is not running and will not run again,
  // so whatever it captured may be destroyed. Safe to call from inside a
  // subscriber.
  void unsubscribe(PeerEventHandle handle);

  std::size_t pending() const;
  std::size_t delivered() const { return delivered_.load(); }

private:
  void run();
  void deliver(const PeerEvent& event);

  std::shared_ptr<Logger> logger_;
  mutable std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
  std::deque<PeerEvent> queue_;
  std::atomic<bool> running_{false};
  std::thread thread_;

  std::mutex delivery_mutex_;   // held while subscribers run
  std::atomic<std::thread::id> delivery_thread_{};

  std::mutex subscriber_mutex_;
  std::unordered_map<PeerEventHandle, Subscriber> subscribers_;
  PeerEventHandle next_handle_ = 1;
  std::atomic<std::size_t> delivered_{0};
};
