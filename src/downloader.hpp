#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>

#include "log.hpp"

inline constexpr std::chrono::milliseconds kDefaultDownloadTimeout{30000};

class DownloadError : public std::runtime_error {
public:
  enum class Kind { InvalidUrl, Network, Timeout, HttpStatus, Protocol, Write };

  DownloadError(Kind kind, const std::string& message, int http_status = 0)
    : std::runtime_error(message), kind_(kind), http_status_(http_status) {}

  Kind kind() const { return kind_; }
  // Only set for Kind::HttpStatus.
  int http_status() const { return http_status_; }

private:
  Kind kind_;
  int http_status_;
};

const char* download_error_kind_name(DownloadError::Kind kind);

struct ParsedUrl {
  std::string host;
  uint16_t port = 80;
  std::string target = "/";
};

// Accepts http://host[:port][/path], with IPv6 hosts in brackets;
// throws DownloadError(InvalidUrl).
ParsedUrl parse_http_url(const std::string& url);

struct DownloadResult {
  std::uint64_t bytes = 0;
  std::string sha256;
};

// Pulls one file over HTTP and writes it to disk. Every failure is thrown
// as DownloadError; nothing is written unless the full body arrived.
class Downloader {
public:
  explicit Downloader(std::chrono::milliseconds timeout = kDefaultDownloadTimeout,
                      std::shared_ptr<Logger> logger = nullptr);

  DownloadResult fetch(const std::string& url, const std::filesystem::path& dest_path) const;

  // Body of a successful (2xx) GET.
  std::string get(const std::string& url) const;

  std::chrono::milliseconds timeout() const { return timeout_; }

private:
  std::chrono::milliseconds timeout_;
  std::shared_ptr<Logger> logger_;
};
