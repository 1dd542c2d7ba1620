#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "log.hpp"

namespace httplib {
class Server;
struct Request;
struct Response;
}

inline constexpr uint16_t kDefaultHttpPort = 8080;
inline constexpr const char* kPlaceholderFileName = "demo.txt";
inline constexpr const char* kPlaceholderContent =
  "Hello from handoff!\nThis is a demo file for testing peer-to-peer transfer.\n";
inline constexpr const char* kHealthBody = "handoff server OK";

// HTTP endpoints over the shared directory:
//   GET  /file/{name}   raw bytes, 404 when absent
//   GET  /files         JSON array of file names
//   POST /upload        multipart/form-data, one file per part with a filename
//   GET  /health        constant liveness text
class FileServer {
public:
  struct Options {
    std::string bind_ip = "0.0.0.0";
    uint16_t port = kDefaultHttpPort;   // 0 picks an ephemeral port
    std::filesystem::path shared_dir = "shared";
    std::size_t threads = 2;
    std::size_t max_body_bytes = 512u * 1024u * 1024u;
  };

  explicit FileServer(Options options, std::shared_ptr<Logger> logger = nullptr);
  ~FileServer();

  FileServer(const FileServer&) = delete;
  FileServer& operator=(const FileServer&) = delete;

  // Prepares the shared directory, binds and starts serving. False on a
  // bind failure; other components keep running.
  bool start();
  void stop();
  bool running() const { return running_.load(); }
  uint16_t port() const { return port_.load(); }

  const std::filesystem::path& shared_dir() const { return options_.shared_dir; }

  // Creates the directory tree and seeds the placeholder file if missing.
  bool prepare_shared_dir() const;

  // Regular files directly under the shared directory. Throws
  // std::filesystem::filesystem_error when the directory cannot be read.
  std::vector<std::string> list_files() const;

  // Route handlers. They take no socket, so tests call them directly.
  void serve_file(const std::string& name, httplib::Response& res) const;
  void list_shared(httplib::Response& res) const;
  void accept_upload(const httplib::Request& req, httplib::Response& res) const;

private:
  void install_routes();

  Options options_;
  std::shared_ptr<Logger> logger_;
  std::unique_ptr<httplib::Server> server_;
  std::thread listen_thread_;
  std::atomic<bool> running_{false};
  std::atomic<bool> listen_done_{false};
  std::atomic<uint16_t> port_{0};
};
