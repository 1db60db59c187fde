// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "application.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <iostream> // Keep for CLI output and early errors before logger initialized

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options]\n"
      << "\n"
      << "Options:\n"
      << "  --config=<path>      JSON mediator configuration file\n"
      << "  --publish=<mode>     Publish strategy: parallel (default) or sequential\n"
      << "  --threads=<n>        Dispatch worker threads (0 = hardware concurrency)\n"
      << "  --failures=<n>       Simulated inventory outages before success (default: 1)\n"
      << "  --list-handlers      Print registered handlers as JSON and exit\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>   Set global log level (trace,debug,info,warn,error,critical)\n"
      << "                       Default: info\n"
      << "  --debug=<component>  Enable trace logging for specific component(s)\n"
      << "                       Components: dispatch, pipeline, registry, publish, app, all\n"
      << "                       Can be comma-separated: --debug=pipeline,publish\n"
      << "  --logfile=<path>     Log to a rotating file instead of the console\n"
      << "\n"
      << "Other:\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n"
      << std::endl;
}

int main(int argc, char *argv[]) {
  try {
    courier::app::AppConfig config;
    std::string log_level = "info";
    std::string log_file;
    std::vector<std::string> debug_components;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << courier::GetFullVersionString() << std::endl;
        std::cout << courier::GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.find("--config=") == 0) {
        config.config_file = arg.substr(9);
      } else if (arg.find("--publish=") == 0) {
        auto strategy = courier::dispatch::ParsePublishStrategy(arg.substr(10));
        if (!strategy) {
          std::cerr << "Error: Invalid publish strategy: " << arg.substr(10) << std::endl;
          std::cerr << "Use parallel or sequential" << std::endl;
          return 1;
        }
        config.publish_strategy = *strategy;
      } else if (arg.find("--threads=") == 0) {
        auto threads = courier::util::SafeParseSize(arg.substr(10), 256);
        if (!threads) {
          std::cerr << "Error: Invalid thread count: " << arg.substr(10) << std::endl;
          std::cerr << "Thread count must be a number between 0 and 256" << std::endl;
          return 1;
        }
        config.worker_threads = *threads;
      } else if (arg.find("--failures=") == 0) {
        auto failures = courier::util::SafeParseInt(arg.substr(11), 0, 100);
        if (!failures) {
          std::cerr << "Error: Invalid failure count: " << arg.substr(11) << std::endl;
          return 1;
        }
        config.inventory_failures = *failures;
      } else if (arg == "--list-handlers") {
        config.list_handlers = true;
      } else if (arg.find("--loglevel=") == 0) {
        log_level = arg.substr(11);
        if (!courier::util::IsValidLogLevel(log_level)) {
          std::cerr << "Error: Invalid log level: " << log_level << std::endl;
          return 1;
        }
        config.log_level = log_level;
      } else if (arg.find("--debug=") == 0) {
        auto components = courier::util::SplitList(arg.substr(8));
        debug_components.insert(debug_components.end(), components.begin(), components.end());
      } else if (arg.find("--logfile=") == 0) {
        log_file = arg.substr(10);
      } else {
        std::cerr << "Unknown option: " << arg << std::endl;
        print_usage(argv[0]);
        return 1;
      }
    }

    // Keep stdout clean for the JSON listing
    if (config.list_handlers && !config.log_level) {
      log_level = "warn";
      config.log_level = log_level;
    }

    courier::util::LogManager::Initialize(log_level, !log_file.empty(), log_file);

    int exit_code = 0;
    // Nested scope: the application (and its worker threads) must be gone
    // before LogManager::Shutdown()
    {
      courier::app::Application app(config);

      if (!app.initialize()) {
        LOG_ERROR("Failed to initialize application");
        courier::util::LogManager::Shutdown();
        return 1;
      }

      // After initialize(): the configured level has been applied by then
      for (const auto &component : debug_components) {
        if (component == "all") {
          courier::util::LogManager::SetLogLevel("trace");
        } else if (!courier::util::LogManager::SetComponentLevel(component, "trace")) {
          std::cerr << "WARNING: unknown log component: " << component << std::endl;
        }
      }

      exit_code = app.run();
    }

    courier::util::LogManager::Shutdown();
    return exit_code;

  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    courier::util::LogManager::Shutdown();
    return 1;
  }
}
