#pragma once

#include <iostream>
#include <string>
#include <vector>
#include "store/store.hpp"

namespace guidstore {
namespace cli {

// Runs store commands, either one per invocation or from an interactive shell
class CLI {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    explicit CLI(store::Store& store, std::ostream& output = std::cout);


    // ---- STARTUP ----
    // Reads commands from input until "quit" or end of input
    void run(std::istream& input = std::cin);
    // Runs one command with its arguments, returns false on error or an absent key
    bool execute(const std::vector<std::string>& args);

private:
    // ---- PARAMETERS ----
    bool running_;
    store::Store& store_;
    std::ostream& output_;


    // ---- COMMAND PROCESSING ----
    bool handle_put_command(const std::string& key, const std::string& json_text);
    bool handle_put_file_command(const std::string& key, const std::string& filename);
    bool handle_get_command(const std::string& key);
    bool handle_cat_command(const std::string& key);
    bool handle_exists_command(const std::string& key);
    bool handle_flush_command();
    void handle_help_command();
    void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace guidstore
