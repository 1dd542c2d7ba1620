#include "file_server.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <system_error>

#include "utils.hpp"

namespace fs = std::filesystem;

namespace {

constexpr const char* kFileRoute = R"(/file/(.*))";

bool is_servable_name(const std::string& name) {
  if(name.empty() || name == "." || name == "..") return false;
  return name.find('/') == std::string::npos && name.find('\0') == std::string::npos;
}

void reply_text(httplib::Response& res, int status, const std::string& text) {
  res.status = status;
  res.set_content(text, "text/plain");
}

httplib::Server::Handler method_not_allowed(const char* allowed) {
  return [allowed](const httplib::Request&, httplib::Response& res){
    res.set_header("Allow", allowed);
    reply_text(res, 405, std::string("use ") + allowed);
  };
}

} // namespace

FileServer::FileServer(Options options, std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("server")) {
  if(options_.threads == 0) options_.threads = 1;
}

FileServer::~FileServer() {
  stop();
}

bool FileServer::prepare_shared_dir() const {
  std::error_code ec;
  fs::create_directories(options_.shared_dir, ec);
  if(ec) {
    logger_->error("Failed to create shared dir {}: {}", options_.shared_dir.string(), ec.message());
    return false;
  }

  auto placeholder = options_.shared_dir / kPlaceholderFileName;
  if(fs::exists(placeholder, ec)) return true;
  try {
    write_file_bytes(placeholder, kPlaceholderContent);
    logger_->info("Created {} in shared folder", kPlaceholderFileName);
  } catch(const std::runtime_error& e) {
    logger_->error("Failed to create {}: {}", kPlaceholderFileName, e.what());
    return false;
  }
  return true;
}

void FileServer::install_routes() {
  server_->Get("/health", [](const httplib::Request&, httplib::Response& res){
    reply_text(res, 200, kHealthBody);
  });
  server_->Get("/files", [this](const httplib::Request&, httplib::Response& res){
    list_shared(res);
  });
  // the path is percent-decoded before it is matched
  server_->Get(kFileRoute, [this](const httplib::Request& req, httplib::Response& res){
    serve_file(req.matches[1].str(), res);
  });
  server_->Post("/upload", [this](const httplib::Request& req, httplib::Response& res){
    accept_upload(req, res);
  });

  for(const char* pattern : {"/health", "/files", kFileRoute}) {
    server_->Post(pattern, method_not_allowed("GET"));
    server_->Put(pattern, method_not_allowed("GET"));
    server_->Patch(pattern, method_not_allowed("GET"));
    server_->Delete(pattern, method_not_allowed("GET"));
  }
  server_->Get("/upload", method_not_allowed("POST"));
  server_->Put("/upload", method_not_allowed("POST"));
  server_->Patch("/upload", method_not_allowed("POST"));
  server_->Delete("/upload", method_not_allowed("POST"));

  server_->set_error_handler([](const httplib::Request& req, httplib::Response& res){
    if(res.status == 404 && res.body.empty()) {
      res.set_content("no route for " + req.path, "text/plain");
    }
  });
  server_->set_logger([this](const httplib::Request& req, const httplib::Response& res){
    logger_->debug("{} {} {} -> {}", req.remote_addr, req.method, req.path, res.status);
  });
}

bool FileServer::start() {
  if(running_.load()) return true;

  prepare_shared_dir();
  logger_->info("Shared directory: {}", fs::absolute(options_.shared_dir).string());

  server_ = std::make_unique<httplib::Server>();
  const std::size_t threads = options_.threads;
  server_->new_task_queue = [threads]{ return new httplib::ThreadPool(threads); };
  server_->set_payload_max_length(options_.max_body_bytes);
  install_routes();

  int bound = -1;
  if(options_.port == 0) {
    bound = server_->bind_to_any_port(options_.bind_ip);
  } else if(server_->bind_to_port(options_.bind_ip, options_.port)) {
    bound = options_.port;
  }
  if(bound <= 0) {
    logger_->error("Failed to bind HTTP server to {}:{}", options_.bind_ip, options_.port);
    server_.reset();
    return false;
  }
  port_ = static_cast<uint16_t>(bound);

  listen_done_ = false;
  listen_thread_ = std::thread([this](){
    if(!server_->listen_after_bind()) {
      logger_->error("HTTP server on port {} stopped accepting", port_.load());
    }
    listen_done_ = true;
  });
  // Server::stop() is a no-op until the accept loop is up
  while(!server_->is_running() && !listen_done_.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  if(listen_done_.load()) {
    listen_thread_.join();
    server_.reset();
    return false;
  }

  running_ = true;
  logger_->info("Starting HTTP server on port {}", port_.load());
  return true;
}

void FileServer::stop() {
  if(!running_.exchange(false)) return;

  server_->stop();
  if(listen_thread_.joinable()) {
    listen_thread_.join();
  }
  server_.reset();
  logger_->info("HTTP server stopped");
}

std::vector<std::string> FileServer::list_files() const {
  std::vector<std::string> names;
  for(const auto& entry : fs::directory_iterator(options_.shared_dir)) {
    std::error_code ec;
    if(entry.is_regular_file(ec)) {
      names.push_back(entry.path().filename().string());
    }
  }
  return names;
}

void FileServer::serve_file(const std::string& name, httplib::Response& res) const {
  if(!is_servable_name(name)) {
    reply_text(res, 400, "Invalid filename");
    return;
  }

  auto file_path = options_.shared_dir / name;
  std::error_code ec;
  if(!fs::is_regular_file(file_path, ec)) {
    reply_text(res, 404, "File not found: " + name);
    return;
  }

  std::string bytes;
  try {
    bytes = read_file_bytes(file_path);
  } catch(const std::runtime_error& e) {
    logger_->error("Failed to read file {}: {}", name, e.what());
    reply_text(res, 500, "Failed to read file: " + name);
    return;
  }
  logger_->info("Serving file: {} ({} bytes)", name, bytes.size());
  res.status = 200;
  res.set_header("Content-Disposition", "attachment; filename=\"" + name + "\"");
  res.set_content(std::move(bytes), "application/octet-stream");
}

void FileServer::list_shared(httplib::Response& res) const {
  try {
    nlohmann::json names = list_files();
    res.status = 200;
    res.set_content(names.dump(), "application/json");
  } catch(const fs::filesystem_error& e) {
    logger_->error("Failed to list {}: {}", options_.shared_dir.string(), e.what());
    reply_text(res, 500, "Failed to list shared directory");
  }
}

void FileServer::accept_upload(const httplib::Request& req, httplib::Response& res) const {
  if(!req.is_multipart_form_data()) {
    reply_text(res, 400, "expected multipart/form-data with a boundary");
    return;
  }

  nlohmann::json stored = nlohmann::json::array();
  for(const auto& entry : req.files) {
    const auto& part = entry.second;
    if(part.filename.empty()) continue;
    // The client-supplied name is used as given, parent segments included.
    auto target = options_.shared_dir / fs::path(part.filename).relative_path();
    try {
      write_file_bytes(target, part.content);
    } catch(const std::runtime_error& e) {
      logger_->error("Upload of {} failed: {}", part.filename, e.what());
      reply_text(res, 500, "Failed to store " + part.filename + ": " + e.what());
      return;
    }
    logger_->info("Received upload: {} ({} bytes)", part.filename, part.content.size());
    stored.push_back(part.filename);
  }
  res.status = 200;
  res.set_content(stored.dump(), "application/json");
}
