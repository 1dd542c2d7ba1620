#include "downloader.hpp"

#include <httplib.h>

#include <charconv>
#include <exception>

#include "utils.hpp"

namespace {

// The client reports a read timeout as a plain read error, so the elapsed
// time decides between Timeout and Network.
constexpr std::chrono::milliseconds kTimeoutSlack{20};

uint16_t parse_port(const std::string& text, const std::string& url) {
  unsigned value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if(text.empty() || ec != std::errc() || ptr != text.data() + text.size() ||
     value == 0 || value > 65535) {
    throw DownloadError(DownloadError::Kind::InvalidUrl, "invalid port in '" + url + "'");
  }
  return static_cast<uint16_t>(value);
}

std::string request_body(const std::string& url, std::chrono::milliseconds timeout) {
  auto parsed = parse_http_url(url);

  httplib::Client client(parsed.host, parsed.port);
  client.set_keep_alive(false);
  client.set_connection_timeout(timeout);
  client.set_read_timeout(timeout);
  client.set_write_timeout(timeout);

  auto begin = std::chrono::steady_clock::now();
  auto res = client.Get(parsed.target);
  if(!res) {
    auto elapsed = std::chrono::steady_clock::now() - begin;
    if(elapsed + kTimeoutSlack >= timeout) {
      throw DownloadError(DownloadError::Kind::Timeout,
                          "timed out after " + std::to_string(timeout.count()) + "ms fetching " + url);
    }
    throw DownloadError(DownloadError::Kind::Network,
                        "HTTP request to " + parsed.host + " failed: " + httplib::to_string(res.error()));
  }
  if(res->status < 200 || res->status > 299) {
    throw DownloadError(DownloadError::Kind::HttpStatus,
                        "HTTP error: " + std::to_string(res->status) + " " + res->reason,
                        res->status);
  }
  return std::move(res->body);
}

} // namespace

const char* download_error_kind_name(DownloadError::Kind kind) {
  switch(kind) {
    case DownloadError::Kind::InvalidUrl: return "invalid-url";
    case DownloadError::Kind::Network: return "network";
    case DownloadError::Kind::Timeout: return "timeout";
    case DownloadError::Kind::HttpStatus: return "http-status";
    case DownloadError::Kind::Protocol: return "protocol";
    case DownloadError::Kind::Write: return "write";
  }
  return "unknown";
}

ParsedUrl parse_http_url(const std::string& url) {
  const std::string scheme = "http://";
  if(url.compare(0, scheme.size(), scheme) != 0) {
    throw DownloadError(DownloadError::Kind::InvalidUrl, "only http:// URLs are supported: '" + url + "'");
  }
  ParsedUrl out;
  auto rest = url.substr(scheme.size());
  auto slash = rest.find('/');
  auto authority = rest.substr(0, slash);
  if(slash != std::string::npos) out.target = rest.substr(slash);

  if(!authority.empty() && authority.front() == '[') {
    // [v6-literal] or [v6-literal]:port
    auto close = authority.find(']');
    if(close == std::string::npos) {
      throw DownloadError(DownloadError::Kind::InvalidUrl, "unterminated IPv6 address in '" + url + "'");
    }
    auto tail = authority.substr(close + 1);
    if(!tail.empty()) {
      if(tail.front() != ':') {
        throw DownloadError(DownloadError::Kind::InvalidUrl, "junk after IPv6 address in '" + url + "'");
      }
      out.port = parse_port(tail.substr(1), url);
    }
    out.host = authority.substr(1, close - 1);
  } else {
    auto colon = authority.rfind(':');
    if(colon != std::string::npos) {
      out.port = parse_port(authority.substr(colon + 1), url);
      authority = authority.substr(0, colon);
    }
    out.host = authority;
  }
  if(out.host.empty()) {
    throw DownloadError(DownloadError::Kind::InvalidUrl, "missing host in '" + url + "'");
  }
  return out;
}

Downloader::Downloader(std::chrono::milliseconds timeout, std::shared_ptr<Logger> logger)
  : timeout_(timeout.count() > 0 ? timeout : kDefaultDownloadTimeout),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("download")) {}

std::string Downloader::get(const std::string& url) const {
  try {
    return request_body(url, timeout_);
  } catch(const DownloadError&) {
    throw;
  } catch(const std::exception& e) {
    throw DownloadError(DownloadError::Kind::Protocol, std::string("bad response from ") + url + ": " + e.what());
  }
}

DownloadResult Downloader::fetch(const std::string& url, const std::filesystem::path& dest_path) const {
  logger_->info("Downloading {} -> {}", url, dest_path.string());
  auto body = get(url);

  try {
    write_file_bytes(dest_path, body);
  } catch(const std::runtime_error& e) {
    throw DownloadError(DownloadError::Kind::Write, std::string("Failed to write file: ") + e.what());
  }

  DownloadResult result;
  result.bytes = body.size();
  result.sha256 = sha256_hex(body);
  logger_->info("Download complete: {} ({} bytes, sha256 {})", dest_path.string(), result.bytes, result.sha256);
  return result;
}
