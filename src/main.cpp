#include "cli/cli.hpp"
#include "config/config_file.hpp"
#include "config/store_config.hpp"
#include "logger/logger.hpp"
#include "store/store_factory.hpp"
#include <iostream>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

struct ProgramOptions {
  guidstore::config::StoreConfig config;
  std::string config_file;
  std::vector<std::string> command;
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name
        << " (--archive <file> | --dir <root> | --config <json>) [options] [command args...]\n"
        << "Store selection:\n"
        << "  -a, --archive     Single compressed container file\n"
        << "  -d, --dir         Sharded directory root\n"
        << "  -c, --config      JSON configuration file (created with defaults when absent)\n"
        << "Options:\n"
        << "  -f, --flush       buffered | auto | interval\n"
        << "  -i, --interval    Flush interval in milliseconds\n"
        << "  -l, --log-level   trace | debug | info | warning | error | fatal\n"
        << "Commands:\n"
        << "  put <key> <json>, put-file <key> <file>, get <key>, cat <key>, exists <key>\n"
        << "  Without a command an interactive shell is started.\n"
        << "Example: " << program_name << " --dir ./data put 11111111-1111-1111-1111-111111111111 '{\"a\":1}'\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  const std::unordered_map<std::string, std::string> flag_map = {
    {"-a", "--archive"}, {"--archive", "--archive"},
    {"-d", "--dir"}, {"--dir", "--dir"},
    {"-c", "--config"}, {"--config", "--config"},
    {"-f", "--flush"}, {"--flush", "--flush"},
    {"-i", "--interval"}, {"--interval", "--interval"},
    {"-l", "--log-level"}, {"--log-level", "--log-level"}
  };

  ProgramOptions options;
  std::unordered_map<std::string, std::string> values;
  bool store_selected = false;

  int i = 1;
  for (; i < argc && std::string(argv[i]).rfind("-", 0) == 0; i += 2) {
    const std::string flag(argv[i]);
    auto it = flag_map.find(flag);
    if (it == flag_map.end()) {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }
    if (i + 1 >= argc) {
      std::cerr << "Error: Missing value for " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }
    const std::string& name = it->second;
    if (name == "--archive" || name == "--dir" || name == "--config") {
      if (store_selected) {
        std::cerr << "Error: Only one of --archive, --dir and --config may be given\n";
        print_usage(argv[0]);
        return options;
      }
      store_selected = true;
    }
    values[name] = argv[i + 1];
  }

  if (!store_selected) {
    std::cerr << "Error: A store is required\n";
    print_usage(argv[0]);
    return options;
  }

  try {
    if (values.count("--config")) {
      options.config_file = values["--config"];
      guidstore::config::ConfigFile<guidstore::config::StoreConfig> file(options.config_file);
      file.load();
      options.config = file.values();
    } else if (values.count("--archive")) {
      options.config.kind = guidstore::config::StoreKind::Archive;
      options.config.path = values["--archive"];
    } else {
      options.config.kind = guidstore::config::StoreKind::Sharded;
      options.config.path = values["--dir"];
    }

    if (values.count("--flush")) {
      options.config.flush_mode = guidstore::config::parse_flush_policy(values["--flush"]);
    }
    if (values.count("--interval")) {
      options.config.flush_interval_ms = std::stoull(values["--interval"]);
    }
    if (values.count("--log-level")) {
      options.config.log_level = values["--log-level"];
    }
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n';
    print_usage(argv[0]);
    return options;
  }

  for (; i < argc; ++i) {
    options.command.emplace_back(argv[i]);
  }

  options.valid = true;
  return options;
}

bool run_store(const ProgramOptions& options) {
  try {
    const auto level = guidstore::logging::parse_severity(options.config.log_level);
    if (options.config.log_file.empty()) {
      guidstore::logging::init_console_logging(level);
    } else {
      guidstore::logging::init_logging(options.config.log_file, level);
    }

    std::unique_ptr<guidstore::store::Store> store = guidstore::store::open_store(options.config);
    guidstore::cli::CLI cli(*store);

    bool success = true;
    if (options.command.empty()) {
      cli.run();
    } else {
      success = cli.execute(options.command);
    }

    store->dispose();
    return success;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  if (const auto options = parse_command_line(argc, argv); !options.valid) {
    return 1;
  } else if (!run_store(options)) {
    return 1;
  }
  return 0;
}
