#include "downloader.hpp"
#include "file_server.hpp"
#include "test_runner_utils.hpp"
#include "utils.hpp"

#include <asio.hpp>
#include <httplib.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <memory>
#include <thread>
#include <vector>

using handoff::test::TestCase;
using handoff::test::TestContext;
using handoff::test::require;

namespace {

using namespace std::chrono_literals;
namespace fs = std::filesystem;

// A started FileServer on an ephemeral loopback port over a scratch directory.
struct ServerFixture {
  fs::path root;
  std::shared_ptr<Logger> logger = std::make_shared<Logger>("server");
  std::unique_ptr<FileServer> server;

  ServerFixture(TestContext& ctx, const std::string& name, std::size_t max_body = 1024 * 1024) {
    root = handoff::test::scratch_workspace(name);
    ctx.logs.attach(logger);
    FileServer::Options options;
    options.bind_ip = "127.0.0.1";
    options.port = 0;
    options.shared_dir = root / "shared";
    options.max_body_bytes = max_body;
    server = std::make_unique<FileServer>(options, logger);
    if(!server->start()) throw std::runtime_error("file server did not start");
  }
  ~ServerFixture() {
    server->stop();
    handoff::test::remove_workspace(root);
  }

  uint16_t port() const { return server->port(); }
  std::string url(const std::string& target) const {
    return "http://127.0.0.1:" + std::to_string(port()) + target;
  }
};

std::string binary_payload(std::size_t size) {
  std::string bytes(size, '\0');
  for(std::size_t i = 0; i < size; ++i) bytes[i] = static_cast<char>((i * 31 + 7) & 0xFF);
  return bytes;
}

bool test_routes_without_network(TestContext& ctx) {
  auto root = handoff::test::scratch_workspace("routes");
  auto logger = std::make_shared<Logger>("server");
  ctx.logs.attach(logger);
  FileServer::Options options;
  options.shared_dir = root / "shared";
  FileServer server(options, logger);
  require(server.prepare_shared_dir(), "shared dir prepared");
  require(fs::exists(root / "shared" / kPlaceholderFileName), "placeholder seeded");

  auto serve = [&](const std::string& name){
    httplib::Response res;
    server.serve_file(name, res);
    return res;
  };
  require(serve("..").status == 400, "dot-dot rejected");
  require(serve("a/b").status == 400, "slash rejected");
  require(serve("").status == 400, "empty name rejected");
  require(serve("missing.bin").status == 404, "missing file");
  auto demo = serve(kPlaceholderFileName);
  require(demo.status == 200 && demo.body == kPlaceholderContent, "placeholder bytes");
  require(demo.get_header_value("Content-Disposition") ==
          std::string("attachment; filename=\"") + kPlaceholderFileName + "\"", "attachment header");

  httplib::Response listed;
  server.list_shared(listed);
  require(listed.status == 200 && nlohmann::json::parse(listed.body) == nlohmann::json::array({kPlaceholderFileName}),
          "listing holds the placeholder");

  httplib::Request plain;
  plain.method = "POST";
  plain.path = "/upload";
  plain.headers.emplace("Content-Type", "text/plain");
  httplib::Response rejected;
  server.accept_upload(plain, rejected);
  require(rejected.status == 400, "upload needs multipart");

  httplib::Request upload;
  upload.method = "POST";
  upload.path = "/upload";
  upload.headers.emplace("Content-Type", "multipart/form-data; boundary=xyz");
  httplib::MultipartFormData note;
  note.name = "note";
  note.content = "not a file";
  upload.files.emplace(note.name, note);
  httplib::MultipartFormData file;
  file.name = "file";
  file.filename = "x.txt";
  file.content = "line one\r\nline two";
  upload.files.emplace(file.name, file);
  httplib::Response stored;
  server.accept_upload(upload, stored);
  require(stored.status == 200, "upload stored");
  require(nlohmann::json::parse(stored.body) == nlohmann::json::array({"x.txt"}), "only file parts stored");
  require(read_file_bytes(root / "shared" / "x.txt") == "line one\r\nline two", "bytes on disk");
  require(!fs::exists(root / "shared" / "note"), "plain field ignored");
  handoff::test::remove_workspace(root);
  return true;
}

bool test_health(TestContext& ctx) {
  ServerFixture fx(ctx, "health");
  auto r = handoff::test::http_get(fx.port(), "/health");
  require(r.status == 200, "status 200");
  require(r.body == kHealthBody, "health text");

  require(handoff::test::http_get(fx.port(), "/nowhere").status == 404, "unknown route");
  require(handoff::test::http_get(fx.port(), "/upload").status == 405, "upload wants POST");
  httplib::Client client("127.0.0.1", fx.port());
  auto posted = client.Post("/health", "x", "text/plain");
  require(posted && posted->status == 405, "health wants GET");
  require(handoff::test::http_get(fx.port(), "/file/a%2Fb").status == 400, "encoded slash rejected");
  return true;
}

bool test_get_file_is_byte_identical(TestContext& ctx) {
  ServerFixture fx(ctx, "get_file");
  auto bytes = binary_payload(200 * 1024);
  write_file_bytes(fx.root / "shared" / "blob.bin", bytes);

  auto r = handoff::test::http_get(fx.port(), "/file/blob.bin");
  require(r.status == 200, "status 200");
  require(r.body == bytes, "body matches file bytes");
  require(r.content_type == "application/octet-stream", "octet-stream");

  write_file_bytes(fx.root / "shared" / "a b.txt", "spaced");
  auto spaced = handoff::test::http_get(fx.port(), "/file/a%20b.txt");
  require(spaced.status == 200 && spaced.body == "spaced", "percent-decoded name served");

  auto missing = handoff::test::http_get(fx.port(), "/file/nope.txt");
  require(missing.status == 404, "absent file is 404");
  return ctx.logs.wait_for_substring("Serving file: blob.bin", 1s);
}

bool test_upload_then_list_and_get(TestContext& ctx) {
  ServerFixture fx(ctx, "upload");
  auto bytes = binary_payload(4096);
  auto up = handoff::test::http_upload(fx.port(), "x.txt", bytes);
  require(up.status == 200, "upload accepted: " + up.body);
  auto stored = nlohmann::json::parse(up.body);
  require(stored == nlohmann::json::array({"x.txt"}), "upload reports stored names");

  auto list = handoff::test::http_get(fx.port(), "/files");
  require(list.status == 200, "list status");
  auto names = nlohmann::json::parse(list.body);
  require(names.is_array(), "list is an array");
  bool found = false;
  for(const auto& n : names) found = found || n == "x.txt";
  require(found, "uploaded file listed");

  auto get = handoff::test::http_get(fx.port(), "/file/x.txt");
  require(get.status == 200 && get.body == bytes, "uploaded bytes served back");
  return true;
}

bool test_upload_limits(TestContext& ctx) {
  ServerFixture fx(ctx, "limits", 1024);
  const std::string body(4096, 'z');
  int status = handoff::test::raw_http_status(fx.port(),
    "POST /upload HTTP/1.1\r\n"
    "Host: 127.0.0.1\r\n"
    "Content-Type: multipart/form-data; boundary=b\r\n"
    "Content-Length: " + std::to_string(body.size()) + "\r\n"
    "Connection: close\r\n\r\n" + body);
  require(status == 413, "body over the limit is 413, got " + std::to_string(status));
  require(!fs::exists(fx.root / "shared" / "big.bin"), "nothing stored");

  auto after = handoff::test::http_get(fx.port(), "/health");
  require(after.status == 200, "server still healthy");
  return true;
}

bool test_url_parsing(TestContext&) {
  auto u = parse_http_url("http://192.168.1.5:8080/file/a.txt");
  require(u.host == "192.168.1.5" && u.port == 8080 && u.target == "/file/a.txt", "full url");
  auto d = parse_http_url("http://example");
  require(d.port == 80 && d.target == "/", "defaults");
  auto v6 = parse_http_url("http://[::1]:8080/file/x");
  require(v6.host == "::1" && v6.port == 8080 && v6.target == "/file/x", "bracketed IPv6 with port");
  auto v6_default = parse_http_url("http://[fe80::1]/");
  require(v6_default.host == "fe80::1" && v6_default.port == 80, "bracketed IPv6 without port");

  for(const auto& bad : {"https://x/y", "ftp://x", "http://", "http://h:0/", "http://h:99999/", "http://h:abc/",
                         "http://[::1/", "http://[::1]x/", "http://[]:80/"}) {
    bool threw = false;
    try {
      parse_http_url(bad);
    } catch(const DownloadError& e) {
      threw = e.kind() == DownloadError::Kind::InvalidUrl;
    }
    require(threw, std::string("rejected url ") + bad);
  }
  return true;
}

bool test_download_success(TestContext& ctx) {
  ServerFixture fx(ctx, "download");
  auto bytes = binary_payload(64 * 1024);
  write_file_bytes(fx.root / "shared" / "photo.jpg", bytes);

  Downloader downloader(5s, fx.logger);
  auto dest = fx.root / "out" / "photo.jpg";
  auto result = downloader.fetch(fx.url("/file/photo.jpg"), dest);
  require(result.bytes == bytes.size(), "byte count");
  require(result.sha256 == sha256_hex(bytes), "digest");
  require(read_file_bytes(dest) == bytes, "file on disk matches");
  return ctx.logs.wait_for_substring("Download complete", 1s);
}

bool test_download_http_error(TestContext& ctx) {
  ServerFixture fx(ctx, "download_404");
  Downloader downloader(5s, fx.logger);
  auto dest = fx.root / "out" / "missing.bin";
  try {
    downloader.fetch(fx.url("/file/missing.bin"), dest);
  } catch(const DownloadError& e) {
    require(e.kind() == DownloadError::Kind::HttpStatus, "kind");
    require(e.http_status() == 404, "status carried");
    require(!fs::exists(dest), "nothing written");
    return true;
  }
  return false;
}

bool test_download_connection_refused(TestContext&) {
  // grab a free port, then close it so nothing listens there
  uint16_t port = 0;
  {
    asio::io_context io;
    asio::ip::tcp::acceptor acceptor(io, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
    port = acceptor.local_endpoint().port();
  }
  Downloader downloader(2s);
  try {
    downloader.fetch("http://127.0.0.1:" + std::to_string(port) + "/file/a", fs::temp_directory_path() / "handoff_refused");
  } catch(const DownloadError& e) {
    return e.kind() == DownloadError::Kind::Network;
  }
  return false;
}

bool test_download_timeout(TestContext&) {
  // accepts the connection and never answers
  asio::io_context io;
  asio::ip::tcp::acceptor acceptor(io, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
  asio::ip::tcp::socket held(io);
  std::thread silent([&]{
    std::error_code ec;
    acceptor.accept(held, ec);
  });

  Downloader downloader(300ms);
  auto begin = std::chrono::steady_clock::now();
  bool timed_out = false;
  try {
    downloader.get("http://127.0.0.1:" + std::to_string(acceptor.local_endpoint().port()) + "/file/slow");
  } catch(const DownloadError& e) {
    timed_out = e.kind() == DownloadError::Kind::Timeout;
  }
  auto elapsed = std::chrono::steady_clock::now() - begin;
  silent.join();
  std::error_code ec;
  held.close(ec);
  require(timed_out, "timeout reported");
  require(elapsed < 3s, "bounded by the configured timeout");
  return true;
}

bool test_download_truncated_body(TestContext&) {
  handoff::test::CannedHttpServer server(
    "HTTP/1.0 200 OK\r\nContent-Length: 100\r\n\r\nonly a few bytes");

  auto dest = fs::temp_directory_path() / "handoff_truncated.bin";
  std::error_code ec;
  fs::remove(dest, ec);
  Downloader downloader(2s);
  bool failed = false;
  try {
    downloader.fetch(server.url("/x"), dest);
  } catch(const DownloadError& e) {
    failed = e.kind() == DownloadError::Kind::Network;
  }
  require(failed, "short body is an error");
  require(!fs::exists(dest), "partial body never written");
  return true;
}

bool test_download_rejects_oversized_chunk(TestContext&) {
  // a chunk size that wraps any naive offset arithmetic
  handoff::test::CannedHttpServer server(
    "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\nConnection: close\r\n\r\n"
    "FFFFFFFFFFFFFFFF\r\nabc");

  auto dest = fs::temp_directory_path() / "handoff_oversized_chunk.bin";
  std::error_code ec;
  fs::remove(dest, ec);
  Downloader downloader(2s);
  bool failed = false;
  try {
    downloader.fetch(server.url("/x"), dest);
  } catch(const DownloadError& e) {
    failed = e.kind() != DownloadError::Kind::Timeout;
  }
  require(failed, "bad chunk header is a DownloadError");
  require(!fs::exists(dest), "nothing written");
  return true;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"routes_without_network", test_routes_without_network},
    {"health", test_health},
    {"get_file_is_byte_identical", test_get_file_is_byte_identical},
    {"upload_then_list_and_get", test_upload_then_list_and_get},
    {"upload_limits", test_upload_limits},
    {"url_parsing", test_url_parsing},
    {"download_success", test_download_success},
    {"download_http_error", test_download_http_error},
    {"download_connection_refused", test_download_connection_refused},
    {"download_timeout", test_download_timeout},
    {"download_truncated_body", test_download_truncated_body},
    {"download_rejects_oversized_chunk", test_download_rejects_oversized_chunk},
  };
  return handoff::test::run_tests("transfer", std::move(tests), argc, argv);
}
