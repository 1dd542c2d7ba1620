#include "command_line_parser.hpp"
#include "discovery_listener.hpp"
#include "event_dispatcher.hpp"
#include "identity_state.hpp"
#include "peer_registry.hpp"
#include "protocol.hpp"
#include "settings_manager.hpp"
#include "test_runner_utils.hpp"
#include "utils.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <mutex>
#include <regex>
#include <stdexcept>
#include <thread>
#include <vector>

using handoff::test::TestCase;
using handoff::test::TestContext;
using handoff::test::require;

namespace {

using namespace std::chrono_literals;

std::string packet_json(const std::string& id,
                        const std::string& name,
                        bool holding,
                        const std::string& held_file,
                        const std::string& ip = "192.168.1.20") {
  WirePacket p;
  p.id = id;
  p.ip = ip;
  p.name = name;
  p.is_holding = holding;
  p.held_file = held_file;
  return encode_packet(p);
}

// Collects dispatched events in arrival order.
struct EventSink {
  std::mutex m;
  std::vector<PeerEvent> events;

  EventDispatcher::Subscriber subscriber() {
    return [this](const PeerEvent& e){
      std::lock_guard<std::mutex> lock(m);
      events.push_back(e);
    };
  }
  std::size_t size() {
    std::lock_guard<std::mutex> lock(m);
    return events.size();
  }
  PeerEvent at(std::size_t i) {
    std::lock_guard<std::mutex> lock(m);
    return events.at(i);
  }
};

bool test_packet_encoding(TestContext&) {
  auto text = packet_json("A", "Phone", true, "photo.jpg");
  auto j = json::parse(text);
  require(j.size() == 5, "five fields");
  require(j.at("id") == "A" && j.at("name") == "Phone", "identity fields");
  require(j.at("isHolding") == true && j.at("heldFile") == "photo.jpg", "grab fields");

  auto decoded = decode_packet(text);
  require(decoded.has_value(), "own encoding decodes");
  require(decoded->held_file == "photo.jpg" && decoded->is_holding, "grab state survives");
  return true;
}

bool test_packet_rejects_malformed(TestContext&) {
  const std::vector<std::string> bad = {
    "",
    "not json",
    "[1,2,3]",
    R"({"ip":"1.2.3.4","name":"x"})",
    R"({"id":"","ip":"1.2.3.4","name":"x"})",
    R"({"id":7,"ip":"1.2.3.4","name":"x"})",
    R"({"id":"a","ip":"1.2.3.4"})",
    R"({"id":"a","ip":"1.2.3.4","name":"x","isHolding":"yes"})",
    R"({"id":"a","ip":"1.2.3.4","name":"x","heldFile":3})",
    std::string("{\"id\":\"a\xff\",\"ip\":\"1\",\"name\":\"x\"}"),
  };
  for(const auto& datagram : bad) {
    require(!decode_packet(datagram).has_value(), "rejected: " + datagram);
  }

  auto minimal = decode_packet(R"({"id":"a","ip":"1.2.3.4","name":"x","extra":1})");
  require(minimal.has_value(), "optional fields may be absent");
  require(!minimal->is_holding && minimal->held_file.empty(), "absent grab fields default to idle");
  return true;
}

bool test_utf8_validation(TestContext&) {
  require(is_valid_utf8("plain"), "ascii");
  require(is_valid_utf8("caf\xc3\xa9"), "two byte sequence");
  require(is_valid_utf8("\xf0\x9f\x93\xb7"), "four byte sequence");
  require(!is_valid_utf8("\xc3"), "truncated sequence");
  require(!is_valid_utf8("\xc0\xaf"), "overlong encoding");
  require(!is_valid_utf8("\xed\xa0\x80"), "surrogate");
  return true;
}

bool test_identity_resolution(TestContext&) {
  auto explicit_identity = IdentityState::resolve_identity("fixed", "Laptop", "10.0.0.5");
  require(explicit_identity.device_id == "fixed", "explicit id kept");
  require(explicit_identity.device_name == "Laptop", "explicit name kept");
  require(explicit_identity.local_ip == "10.0.0.5", "explicit ip kept");

  auto generated = IdentityState::resolve_identity("", "", "");
  std::regex uuid("^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");
  require(std::regex_match(generated.device_id, uuid), "generated id is a v4 uuid: " + generated.device_id);
  require(!generated.device_name.empty(), "a name is always present");
  require(!generated.local_ip.empty(), "an address is always present");
  require(generated.device_id != IdentityState::resolve_identity("", "", "").device_id, "ids differ per call");
  return true;
}

bool test_grab_state_invariant(TestContext& ctx) {
  auto logger = std::make_shared<Logger>("identity");
  ctx.logs.attach(logger);
  IdentityState state({"self", "Desk", "10.0.0.2"}, logger);

  require(!state.grab_state().is_holding, "starts idle");
  state.set_grab("report.pdf");
  auto grab = state.grab_state();
  require(grab.is_holding && grab.held_file == "report.pdf", "holding after set");

  auto packet = state.make_packet();
  require(packet.id == "self" && packet.is_holding && packet.held_file == "report.pdf", "packet mirrors state");

  state.set_grab("");
  grab = state.grab_state();
  require(!grab.is_holding && grab.held_file.empty(), "empty filename releases");

  state.set_grab("a.txt");
  state.clear_grab();
  grab = state.grab_state();
  require(!grab.is_holding && grab.held_file.empty(), "clear releases");

  // readers never see one field updated without the other
  std::atomic<bool> stop{false};
  std::atomic<bool> torn{false};
  std::thread writer([&]{
    for(int i = 0; i < 2000; ++i) {
      if(i % 2) state.set_grab("f" + std::to_string(i)); else state.clear_grab();
    }
    stop = true;
  });
  while(!stop) {
    auto g = state.grab_state();
    if(g.is_holding == g.held_file.empty()) torn = true;
  }
  writer.join();
  require(!torn, "grab fields always consistent");
  return ctx.logs.wait_for_substring("Now holding: report.pdf", 1s);
}

bool test_registry_upsert(TestContext&) {
  PeerRegistry registry("self");
  PeerRecord self;
  self.id = "self";
  require(registry.upsert(self).outcome == PeerRegistry::Outcome::Rejected, "self rejected");
  PeerRecord empty;
  require(registry.upsert(empty).outcome == PeerRegistry::Outcome::Rejected, "empty id rejected");

  PeerRecord a;
  a.id = "A";
  a.name = "Phone";
  a.ip = "192.168.1.20";
  auto first = registry.upsert(a);
  require(first.outcome == PeerRegistry::Outcome::Inserted && !first.previous, "inserted");

  PeerRecord a2 = a;
  a2.is_holding = true;
  a2.held_file = "photo.jpg";
  auto second = registry.upsert(a2);
  require(second.outcome == PeerRegistry::Outcome::Replaced, "replaced");
  require(second.previous && *second.previous == a, "previous record returned");
  require(registry.find("A") == a2, "latest record stored");

  PeerRecord manual;
  manual.id = "manual-10.0.0.9";
  manual.manual = true;
  require(registry.insert_if_absent(manual), "manual insert");
  require(!registry.insert_if_absent(manual), "second manual insert is a no-op");
  require(registry.size() == 2 && !registry.contains("self"), "self never stored");
  return true;
}

bool test_listener_classification(TestContext& ctx) {
  auto logger = std::make_shared<Logger>("discovery");
  ctx.logs.attach(logger);
  auto registry = std::make_shared<PeerRegistry>("self", logger);
  auto dispatcher = std::make_shared<EventDispatcher>(logger);
  EventSink sink;
  dispatcher->subscribe(sink.subscriber());
  dispatcher->start();

  DiscoveryListener listener("self", registry, dispatcher, DiscoveryListener::Options{}, logger);

  auto holding = packet_json("A", "Phone", true, "photo.jpg");
  auto released = packet_json("A", "Phone", false, "");

  require(listener.process_datagram(holding) == PeerEventKind::PeerDiscovered, "new peer");
  require(!listener.process_datagram(holding).has_value(), "identical packet is silent");
  require(listener.process_datagram(released) == PeerEventKind::GrabUpdate, "release is a grab update");
  require(!listener.process_datagram(released).has_value(), "identical release is silent");
  require(!listener.process_datagram(packet_json("self", "Me", true, "x")).has_value(), "self ignored");
  require(!listener.process_datagram("{garbage").has_value(), "garbage ignored");

  // only a name or ip change is not a grab update
  require(!listener.process_datagram(packet_json("A", "Phone 2", false, "", "192.168.1.21")).has_value(),
          "rename is silent");
  require(registry->find("A")->name == "Phone 2", "rename still stored");

  require(handoff::test::wait_for_condition([&]{ return sink.size() == 2; }, 2s), "two events delivered");
  dispatcher->stop();

  auto discovered = sink.at(0);
  require(discovered.kind == PeerEventKind::PeerDiscovered, "first event kind");
  require(discovered.record.is_holding && discovered.record.held_file == "photo.jpg", "first event payload");
  auto update = sink.at(1);
  require(update.kind == PeerEventKind::GrabUpdate && !update.record.is_holding, "second event payload");

  require(!registry->contains("self"), "self never stored");
  require(listener.datagrams_received() == 7 && listener.datagrams_dropped() == 1, "counters");
  return true;
}

bool test_listener_socket_roundtrip(TestContext& ctx) {
  auto logger = std::make_shared<Logger>("discovery");
  ctx.logs.attach(logger);
  auto registry = std::make_shared<PeerRegistry>("self", logger);
  auto dispatcher = std::make_shared<EventDispatcher>(logger);
  EventSink sink;
  dispatcher->subscribe(sink.subscriber());
  dispatcher->start();

  DiscoveryListener::Options options;
  options.listen_ip = "127.0.0.1";
  options.port = 0;
  options.multicast_group = "";
  DiscoveryListener listener("self", registry, dispatcher, options, logger);
  require(listener.start(), "listener binds");
  require(listener.local_port() != 0, "ephemeral port recorded");

  asio::io_context io;
  asio::ip::udp::socket sender(io, asio::ip::udp::endpoint(asio::ip::udp::v4(), 0));
  asio::ip::udp::endpoint target(asio::ip::make_address("127.0.0.1"), listener.local_port());
  auto datagram = packet_json("B", "Tablet", false, "");
  sender.send_to(asio::buffer(datagram), target);

  bool seen = handoff::test::wait_for_condition([&]{ return sink.size() == 1; }, 2s);
  listener.stop();
  dispatcher->stop();
  require(seen, "event from a real datagram");
  require(registry->find("B").has_value(), "record stored");
  return ctx.logs.wait_for_substring("New peer: Tablet", 1s);
}

bool test_dispatcher_isolates_subscribers(TestContext& ctx) {
  auto logger = std::make_shared<Logger>("events");
  ctx.logs.attach(logger);
  EventDispatcher dispatcher(logger);
  EventSink sink;
  dispatcher.subscribe([](const PeerEvent&){ throw std::runtime_error("subscriber broke"); });
  auto handle = dispatcher.subscribe(sink.subscriber());
  dispatcher.start();

  PeerEvent e;
  e.record.id = "A";
  dispatcher.publish(e);
  dispatcher.publish(e);
  require(handoff::test::wait_for_condition([&]{ return sink.size() == 2; }, 2s), "delivered despite throwing peer");

  dispatcher.unsubscribe(handle);
  dispatcher.publish(e);
  dispatcher.stop();
  require(sink.size() == 2, "unsubscribed sink not called");
  require(dispatcher.delivered() == 3 && dispatcher.pending() == 0, "queue drained on stop");
  return ctx.logs.wait_for_substring("subscriber broke", 1s);
}

bool test_dispatcher_does_not_block_publisher(TestContext&) {
  EventDispatcher dispatcher;
  std::atomic<bool> release{false};
  dispatcher.subscribe([&](const PeerEvent&){
    while(!release) std::this_thread::sleep_for(5ms);
  });
  dispatcher.start();

  auto begin = std::chrono::steady_clock::now();
  for(int i = 0; i < 50; ++i) dispatcher.publish(PeerEvent{});
  auto elapsed = std::chrono::steady_clock::now() - begin;
  release = true;
  dispatcher.stop();
  require(elapsed < 500ms, "publish returns while a subscriber is busy");
  require(dispatcher.delivered() == 50, "all events delivered");
  return true;
}

bool test_dispatcher_unsubscribe_waits_for_delivery(TestContext&) {
  EventDispatcher dispatcher;
  std::atomic<bool> entered{false};
  std::atomic<bool> finished{false};
  std::atomic<int> calls{0};
  auto handle = dispatcher.subscribe([&](const PeerEvent&){
    calls++;
    entered = true;
    std::this_thread::sleep_for(200ms);
    finished = true;
  });
  dispatcher.start();

  dispatcher.publish(PeerEvent{});
  require(handoff::test::wait_for_condition([&]{ return entered.load(); }, 2s), "subscriber running");
  dispatcher.unsubscribe(handle);
  require(finished.load(), "unsubscribe returned only after the running call ended");

  dispatcher.publish(PeerEvent{});
  dispatcher.stop();
  require(calls.load() == 1, "no call after unsubscribe");

  // removing itself from inside a callback does not deadlock
  EventDispatcher self_removing;
  std::atomic<int> self_calls{0};
  PeerEventHandle own = 0;
  own = self_removing.subscribe([&](const PeerEvent&){
    self_calls++;
    self_removing.unsubscribe(own);
  });
  self_removing.start();
  self_removing.publish(PeerEvent{});
  self_removing.publish(PeerEvent{});
  self_removing.stop();
  require(self_calls.load() == 1, "self-removal takes effect for the next event");
  return true;
}

bool test_settings_defaults_and_ranges(TestContext&) {
  SettingsManager settings;
  require(settings.get<int>("discovery_port") == 9988, "discovery port default");
  require(settings.get<int>("http_port") == 8080, "http port default");
  require(settings.get<int>("beacon_interval_ms") == 1000, "beacon interval default");
  require(settings.get<std::string>("multicast_group") == "224.0.0.251", "multicast default");
  require(settings.get<int>("download_timeout_ms") == 30000, "download timeout default");

  std::string error;
  require(!settings.set_from_string("http_port", "70000", error), "port above range");
  require(!settings.set_from_string("http_port", "80x", error), "trailing characters");
  require(!settings.set_from_string("beacon_interval_ms", "0", error), "interval below range");
  require(!settings.set_from_string("no_such_key", "1", error), "unknown key");
  require(settings.set_from_string("port", "9090", error), "alias accepted: " + error);
  require(settings.get<int>("http_port") == 9090, "alias wrote the canonical key");
  return true;
}

bool test_settings_persistence(TestContext&) {
  auto root = handoff::test::scratch_workspace("settings");
  auto path = root / ".config" / "settings.json";

  SettingsManager first;
  first.set_settings_path(path);
  std::string error;
  require(first.set_from_string("device_name", "Den PC", error), "set name");
  require(first.set_from_string("help", "true", error), "set help");
  require(first.save(), "save");

  SettingsManager second;
  second.set_settings_path(path);
  require(second.load(), "load");
  require(second.get<std::string>("device_name") == "Den PC", "persistent key restored");
  require(!second.get<bool>("help"), "non-persistent key not restored");
  handoff::test::remove_workspace(root);
  return true;
}

bool test_command_line(TestContext&) {
  CommandLineParser parser;
  SettingsManager settings;
  parser.parse({"9000", "/tmp/share", "Kitchen", "--beacon_interval_ms", "250", "-v", "--mcast="}, settings);
  require(settings.get<int>("http_port") == 9000, "positional port");
  require(settings.get<std::string>("shared_dir") == "/tmp/share", "positional dir");
  require(settings.get<std::string>("device_name") == "Kitchen", "positional name");
  require(settings.get<int>("beacon_interval_ms") == 250, "long option");
  require(settings.get<bool>("verbose"), "bare bool flag");
  require(settings.get<std::string>("multicast_group").empty(), "key=value form");

  auto rejects = [&](std::vector<std::string> args){
    SettingsManager s;
    try {
      parser.parse(args, s);
    } catch(const CommandLineError&) {
      return true;
    }
    return false;
  };
  require(rejects({"--bogus", "1"}), "unknown option");
  require(rejects({"--http_port"}), "missing value");
  require(rejects({"--http_port", "abc"}), "bad value");
  require(rejects({"1", "2", "3", "4"}), "too many positionals");
  return true;
}

bool test_sha256_helpers(TestContext&) {
  require(sha256_hex("") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855", "empty digest");
  require(sha256_hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad", "abc digest");
  return true;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"packet_encoding", test_packet_encoding},
    {"packet_rejects_malformed", test_packet_rejects_malformed},
    {"utf8_validation", test_utf8_validation},
    {"identity_resolution", test_identity_resolution},
    {"grab_state_invariant", test_grab_state_invariant},
    {"registry_upsert", test_registry_upsert},
    {"listener_classification", test_listener_classification},
    {"listener_socket_roundtrip", test_listener_socket_roundtrip},
    {"dispatcher_isolates_subscribers", test_dispatcher_isolates_subscribers},
    {"dispatcher_does_not_block_publisher", test_dispatcher_does_not_block_publisher},
    {"dispatcher_unsubscribe_waits_for_delivery", test_dispatcher_unsubscribe_waits_for_delivery},
    {"settings_defaults_and_ranges", test_settings_defaults_and_ranges},
    {"settings_persistence", test_settings_persistence},
    {"command_line", test_command_line},
    {"sha256_helpers", test_sha256_helpers},
  };
  return handoff::test::run_tests("core", std::move(tests), argc, argv);
}
