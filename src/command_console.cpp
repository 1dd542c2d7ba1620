#include "command_console.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <exception>
#include <filesystem>
#include <sstream>

#include "downloader.hpp"
#include "node_engine.hpp"
#include "protocol.hpp"

namespace {

void trim(std::string& s) {
  auto not_space = [](unsigned char c){ return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
}

std::string upper(std::string s) {
  for(auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return s;
}

} // namespace

CommandConsole::CommandConsole(NodeEngine& engine, std::shared_ptr<Logger> logger)
  : engine_(engine),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("console")) {}

CommandConsole::~CommandConsole() {
  stop();
}

void CommandConsole::attach() {
  if(subscription_ != 0) return;
  subscription_ = engine_.subscribe([this](const PeerEvent& event){ on_peer_event(event); });
}

void CommandConsole::stop() {
  if(subscription_ != 0) {
    engine_.unsubscribe(subscription_);
    subscription_ = 0;
  }
  reap_downloads(true);
}

void CommandConsole::on_peer_event(const PeerEvent& event) {
  logger_->print("[{}] {}", event_tag(event.kind), make_peer_json(event.record).dump());
}

void CommandConsole::run(std::istream& input) {
  std::string line;
  while(std::getline(input, line)) {
    if(!execute_command(line)) break;
  }
}

bool CommandConsole::execute_command(const std::string& raw_line) {
  std::string line = raw_line;
  trim(line);
  if(line.empty()) return true;
  reap_downloads(false);

  std::istringstream iss(line);
  std::string cmd;
  iss >> cmd;
  cmd = upper(cmd);
  std::string args;
  std::getline(iss, args);
  trim(args);

  if(cmd == "GRAB") {
    if(args.empty()) {
      logger_->print_err("[WARN] GRAB needs a filename");
      return true;
    }
    engine_.set_grab(args);
    logger_->print("[CMD] Grab started: {}", args);
  } else if(cmd == "RELEASE") {
    engine_.clear_grab();
    logger_->print("[CMD] Grab released");
  } else if(cmd == "DOWNLOAD") {
    std::istringstream parts(args);
    std::string url;
    std::string dest;
    parts >> url;
    std::getline(parts, dest);
    trim(dest);
    if(url.empty() || dest.empty()) {
      logger_->print_err("[WARN] usage: DOWNLOAD <url> <dest>");
      return true;
    }
    start_download(url, dest);
  } else if(cmd == "CONNECT") {
    if(args.empty()) {
      logger_->print_err("[WARN] CONNECT needs an IP address");
      return true;
    }
    if(engine_.manual_connect(args)) {
      logger_->print("[CMD] Connected to {}", args);
    } else {
      logger_->print_err("[WARN] Not connected to {}", args);
    }
  } else if(cmd == "GET_IP") {
    logger_->print("[LOCAL_IP] {}", engine_.device_info().local_ip);
  } else if(cmd == "INFO") {
    auto identity = engine_.device_info();
    json info = {{"id", identity.device_id}, {"name", identity.device_name}, {"ip", identity.local_ip}};
    logger_->print("[DEVICE_INFO] {}", info.dump());
  } else if(cmd == "LIST_FILES") {
    try {
      for(const auto& name : engine_.shared_files()) {
        logger_->print("[FILE] {}", name);
      }
    } catch(const std::filesystem::filesystem_error& e) {
      logger_->print_err("[WARN] Cannot list shared files: {}", e.what());
    }
  } else if(cmd == "PEERS") {
    for(const auto& peer : engine_.peers()) {
      logger_->print("[PEER] {}", make_peer_json(peer).dump());
    }
  } else if(cmd == "HELP") {
    print_help();
  } else if(cmd == "QUIT" || cmd == "EXIT") {
    logger_->print("[CMD] Quitting");
    return false;
  } else {
    logger_->print_err("[WARN] Unknown command: {}", cmd);
  }
  return true;
}

void CommandConsole::print_help() const {
  logger_->print("Commands:");
  logger_->print("  GRAB <filename>        announce that <filename> is held");
  logger_->print("  RELEASE                stop holding");
  logger_->print("  DOWNLOAD <url> <dest>  fetch a file in the background");
  logger_->print("  CONNECT <ip>           add a peer by address");
  logger_->print("  GET_IP                 print the announced address");
  logger_->print("  INFO                   print id, name and address");
  logger_->print("  LIST_FILES             list the shared directory");
  logger_->print("  PEERS                  list known peers");
  logger_->print("  HELP                   this text");
  logger_->print("  QUIT                   shut down");
}

void CommandConsole::start_download(const std::string& url, const std::string& dest) {
  auto done = std::make_shared<std::atomic<bool>>(false);
  std::thread worker([this, url, dest, done](){
    try {
      auto result = engine_.download_file(url, dest);
      logger_->info("Downloaded {} bytes to {}", result.bytes, dest);
      logger_->print("[DOWNLOAD_COMPLETE] {}", dest);
    } catch(const DownloadError& e) {
      logger_->print("[DOWNLOAD_FAILED] {} {}", dest, e.what());
    } catch(const std::exception& e) {
      // nothing may escape the worker thread
      logger_->error("Download of {} failed unexpectedly: {}", url, e.what());
      logger_->print("[DOWNLOAD_FAILED] {} {}", dest, e.what());
    }
    done->store(true);
  });
  std::lock_guard<std::mutex> lock(downloads_mutex_);
  downloads_.push_back(DownloadWorker{std::move(worker), std::move(done)});
}

void CommandConsole::reap_downloads(bool wait_all) {
  std::vector<DownloadWorker> finished;
  {
    std::lock_guard<std::mutex> lock(downloads_mutex_);
    for(auto it = downloads_.begin(); it != downloads_.end();) {
      if(wait_all || it->done->load()) {
        finished.push_back(std::move(*it));
        it = downloads_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for(auto& worker : finished) {
    if(worker.thread.joinable()) worker.thread.join();
  }
}

std::size_t CommandConsole::active_downloads() const {
  std::lock_guard<std::mutex> lock(downloads_mutex_);
  return downloads_.size();
}
