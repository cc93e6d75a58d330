#include "cli/cli.hpp"
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include <boost/log/trivial.hpp>

namespace guidstore {
namespace cli {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(store::Store& store, std::ostream& output)
  : running_(false)
  , store_(store)
  , output_(output) {
  BOOST_LOG_TRIVIAL(info) << "CLI initialized";
}


//==============================================
// STARTUP
//==============================================

void CLI::run(std::istream& input) {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "Starting CLI loop";
  output_ << "guidstore> " << std::flush;

  while (running_ && std::getline(input, line)) {
    std::istringstream iss(line);
    std::vector<std::string> args;
    std::string word;

    // The JSON payload of put keeps its spaces
    if (iss >> word) {
      args.push_back(word);
      if (word == "put" && iss >> word) {
        args.push_back(word);
        std::string rest;
        std::getline(iss >> std::ws, rest);
        if (!rest.empty()) {
          args.push_back(rest);
        }
      } else {
        while (iss >> word) {
          args.push_back(word);
        }
      }
    }

    if (!args.empty() && args[0] == "quit") {
      running_ = false;
      continue;
    } else if (!args.empty()) {
      execute(args);
    }

    if (running_) {
      output_ << "guidstore> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI loop ended";
}

bool CLI::execute(const std::vector<std::string>& args) {
  if (args.empty()) {
    handle_help_command();
    return false;
  }

  const std::string& command = args[0];
  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << command << " with " << args.size() - 1 << " arguments";

  try {
    if (command == "put" && args.size() == 3) {
      return handle_put_command(args[1], args[2]);
    } else if (command == "put-file" && args.size() == 3) {
      return handle_put_file_command(args[1], args[2]);
    } else if (command == "get" && args.size() == 2) {
      return handle_get_command(args[1]);
    } else if (command == "cat" && args.size() == 2) {
      return handle_cat_command(args[1]);
    } else if (command == "exists" && args.size() == 2) {
      return handle_exists_command(args[1]);
    } else if (command == "flush" && args.size() == 1) {
      return handle_flush_command();
    } else if (command == "help") {
      handle_help_command();
      return true;
    }
  } catch (const std::exception& e) {
    log_and_display_error("Error running " + command, e.what());
    return false;
  }

  output_ << "Unknown command or invalid arguments" << std::endl;
  return false;
}


//==============================================
// COMMAND PROCESSING
//==============================================

bool CLI::handle_put_command(const std::string& key, const std::string& json_text) {
  nlohmann::json value;
  try {
    value = nlohmann::json::parse(json_text);
  } catch (const nlohmann::json::exception& e) {
    log_and_display_error("Invalid JSON value", e.what());
    return false;
  }

  store_.write_entry(store::parse_key(key), value);
  output_ << "Stored " << key << std::endl;
  return true;
}

bool CLI::handle_put_file_command(const std::string& key, const std::string& filename) {
  std::ifstream file(filename, std::ios::binary);
  if (!file) {
    output_ << "Error opening file: " << filename << std::endl;
    return false;
  }

  store_.write_entry(store::parse_key(key), file);
  output_ << "Stored " << filename << " as " << key << std::endl;
  return true;
}

bool CLI::handle_get_command(const std::string& key) {
  std::optional<nlohmann::json> value = store_.read_entry<nlohmann::json>(store::parse_key(key));
  if (!value) {
    output_ << "Key not found: " << key << std::endl;
    return false;
  }
  output_ << value->dump(2) << std::endl;
  return true;
}

bool CLI::handle_cat_command(const std::string& key) {
  std::unique_ptr<std::istream> stream = store_.read_file(store::parse_key(key));
  if (!stream) {
    output_ << "Key not found: " << key << std::endl;
    return false;
  }

  char buffer[4096];
  while (stream->read(buffer, sizeof(buffer)) || stream->gcount() > 0) {
    output_.write(buffer, stream->gcount());
  }
  output_.flush();
  return true;
}

bool CLI::handle_exists_command(const std::string& key) {
  bool found = store_.exists(store::parse_key(key));
  output_ << (found ? "true" : "false") << std::endl;
  return found;
}

bool CLI::handle_flush_command() {
  store_.flush();
  output_ << "Flushed" << std::endl;
  return true;
}

void CLI::handle_help_command() {
  output_ << "Available commands:" << std::endl;
  output_ << "  help                   Display this help message" << std::endl;
  output_ << "  put <key> <json>       Store a JSON value under <key>" << std::endl;
  output_ << "  put-file <key> <file>  Store the bytes of local <file> under <key>" << std::endl;
  output_ << "  get <key>              Print the JSON value stored under <key>" << std::endl;
  output_ << "  cat <key>              Print the raw bytes stored under <key>" << std::endl;
  output_ << "  exists <key>           Check whether <key> is stored" << std::endl;
  output_ << "  flush                  Push pending writes to disk" << std::endl;
  output_ << "  quit                   Exit the shell" << std::endl << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  output_ << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace guidstore
