#pragma once

#include <iostream>
#include <string>
#include "store/store.hpp"

namespace vault {
namespace cli {

// Interactive admin shell over a record store. Keys are typed as a/b/c.
class CLI {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    explicit CLI(store::Store& store, std::istream& in = std::cin, std::ostream& out = std::cout);


    // ---- STARTUP ----
    void run();

    // Runs a single command line, returns false once the shell should exit
    bool execute(const std::string& line);

private:
    // ---- PARAMETERS ----
    store::Store& store_;
    std::istream& in_;
    std::ostream& out_;
    bool running_;


    // ---- COMMAND PROCESSING ----
    void process_command(const std::string& command, const std::string& args);
    void handle_get_command(const std::string& key);
    void handle_put_command(const std::string& args);
    void handle_remove_command(const std::string& key);
    void handle_list_command(const std::string& prefix);
    void handle_migrate_command();
    void handle_locks_command();
    void handle_keygen_command();
    void handle_help_command();
    void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace vault
