#include <cpptrace/cpptrace.hpp>

#include <filesystem>
#include <iostream>

#include "command_console.hpp"
#include "command_line_parser.hpp"
#include "log.hpp"
#include "node_engine.hpp"
#include "settings_manager.hpp"

int main(int argc, char** argv){
  try {
    NodeEngine::Options options;
    options.workspace_root = std::filesystem::current_path();

    auto settings = std::make_shared<SettingsManager>();
    settings->set_settings_path(options.workspace_root / ".config" / "settings.json");
    settings->load();

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "handoff");
    try {
      parser.parse(argc, argv, *settings);
    } catch(const CommandLineError& e) {
      init(false);
      Logger("handoff-main").print_err("{}", e.what());
      parser.usage();
      return 1;
    }
    if(settings->help_requested()) {
      parser.usage();
      return 0;
    }

    init(settings->get<bool>("verbose"), settings->get<std::string>("log_file"));
    NodeEngine engine(settings, options);
    auto logger = engine.logger();
    if(settings->get<bool>("verbose")) {
      logger->debug("Verbose logging enabled");
    }

    if(settings->save_requested()) {
      if(!settings->save()) {
        logger->error("Unable to persist settings to {}", settings->settings_path().string());
      }
    }

    engine.start();
    auto identity = engine.device_info();
    logger->print("[DEVICE_INFO] {}", json{{"id", identity.device_id},
                                           {"name", identity.device_name},
                                           {"ip", identity.local_ip}}.dump());

    CommandConsole console(engine);
    console.attach();
    console.run(std::cin);
    console.stop();
    engine.stop();

    return 0;
  } catch(std::exception& e) {
    init(false);
    Logger logger("handoff-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
