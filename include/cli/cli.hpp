#pragma once

#include <string>
#include <vector>
#include "client/client.hpp"

namespace ftecho {
namespace cli {

// Runs one client command against a connected Client
class CLI {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    explicit CLI(client::Client& client);


    // ---- STARTUP ----
    // Returns the process exit status
    int run(const std::vector<std::string>& args);

    static void print_help();

private:
    // ---- PARAMETERS ----
    client::Client& client_;


    // ---- COMMAND PROCESSING ----
    int process_command(const std::string& command, const std::vector<std::string>& operands);
    int handle_list_command();
    int handle_get_command(const std::string& name, const std::string& destination);
    int handle_put_command(const std::string& path);
    int handle_resume_get_command(const std::string& name, const std::string& destination);
    int handle_resume_put_command(const std::string& path, const std::string& offset);
    int log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace ftecho
