#pragma once

#include <atomic>
#include <cstddef>
#include <istream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "event_dispatcher.hpp"
#include "log.hpp"

class NodeEngine;

// Line protocol between the node and the UI layer driving it. Commands come
// in one per line; replies, peer events and download results go out as
// tagged lines on stdout, warnings on stderr.
class CommandConsole {
public:
  CommandConsole(NodeEngine& engine, std::shared_ptr<Logger> logger = nullptr);
  ~CommandConsole();

  CommandConsole(const CommandConsole&) = delete;
  CommandConsole& operator=(const CommandConsole&) = delete;

  // Starts printing peer events. The engine must already be started.
  void attach();
  // Stops printing events and waits for running downloads.
  void stop();

  // Reads commands until QUIT or end of input.
  void run(std::istream& input);

  // Handles one line. Returns false for QUIT.
  bool execute_command(const std::string& line);

  void print_help() const;

  // Download workers that have not been joined yet.
  std::size_t active_downloads() const;

private:
  void on_peer_event(const PeerEvent& event);
  void start_download(const std::string& url, const std::string& dest);
  void reap_downloads(bool wait_all);

  NodeEngine& engine_;
  std::shared_ptr<Logger> logger_;
  PeerEventHandle subscription_ = 0;

  struct DownloadWorker {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };
  mutable std::mutex downloads_mutex_;
  std::vector<DownloadWorker> downloads_;
};
