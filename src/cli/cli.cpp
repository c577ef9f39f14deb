#include "cli/cli.hpp"
#include "config/server_config.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <boost/log/trivial.hpp>

namespace ftecho {
namespace cli {

//==============================================
// CONSTRUCTOR
//==============================================

CLI::CLI(client::Client& client)
  : client_(client) {
  BOOST_LOG_TRIVIAL(debug) << "CLI initialized";
}


//==============================================
// STARTUP
//==============================================

int CLI::run(const std::vector<std::string>& args) {
  if (args.empty()) {
    print_help();
    return 1;
  }

  std::vector<std::string> operands(args.begin() + 1, args.end());
  return process_command(args.front(), operands);
}

void CLI::print_help() {
  std::cout << "Commands:\n"
            << "  list                        List files on the server\n"
            << "  get <name> [dest]           Download a file (dest defaults to name)\n"
            << "  put <path>                  Upload a file under its base name\n"
            << "  resume-get <name> <dest>    Continue a download into an existing local file\n"
            << "  resume-put <path> <offset>  Continue an upload from the given offset\n";
}


//==============================================
// COMMAND PROCESSING
//==============================================

int CLI::process_command(const std::string& command, const std::vector<std::string>& operands) {
  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << command << " with " << operands.size() << " operands";

  try {
    if (command == "list" && operands.empty()) {
      return handle_list_command();
    }
    if (command == "get" && (operands.size() == 1 || operands.size() == 2)) {
      return handle_get_command(operands[0], operands.size() == 2 ? operands[1] : operands[0]);
    }
    if (command == "put" && operands.size() == 1) {
      return handle_put_command(operands[0]);
    }
    if (command == "resume-get" && operands.size() == 2) {
      return handle_resume_get_command(operands[0], operands[1]);
    }
    if (command == "resume-put" && operands.size() == 2) {
      return handle_resume_put_command(operands[0], operands[1]);
    }
  } catch (const std::exception& e) {
    return log_and_display_error("Command '" + command + "' failed", e.what());
  }

  std::cerr << "Invalid command: " << command << "\n";
  print_help();
  return 1;
}

int CLI::handle_list_command() {
  auto entries = client_.list_files();
  for (const auto& entry : entries) {
    std::cout << entry.name << "\t" << entry.size << "\n";
  }
  std::cout << entries.size() << " file(s)" << std::endl;
  return 0;
}

int CLI::handle_get_command(const std::string& name, const std::string& destination) {
  std::ofstream out(destination, std::ios::binary | std::ios::trunc);
  if (!out) {
    return log_and_display_error("Cannot open " + destination, "open failed");
  }
  auto result = client_.get_file(name, out);
  std::cout << "Downloaded " << name << " (" << result.bytes << " bytes), sha256 " << result.sha256 << std::endl;
  return 0;
}

int CLI::handle_put_command(const std::string& path) {
  std::filesystem::path source_path(path);
  std::ifstream source(source_path, std::ios::binary);
  if (!source) {
    return log_and_display_error("Cannot open " + path, "open failed");
  }
  std::uint64_t size = std::filesystem::file_size(source_path);
  std::string digest = client_.put_file(source_path.filename().string(), source, size);
  std::cout << "Uploaded " << source_path.filename().string() << " (" << size << " bytes), sha256 " << digest << std::endl;
  return 0;
}

int CLI::handle_resume_get_command(const std::string& name, const std::string& destination) {
  std::ifstream existing(destination, std::ios::binary);
  if (!existing) {
    return log_and_display_error("Cannot open " + destination, "nothing to resume");
  }
  std::ofstream out(destination, std::ios::binary | std::ios::app);
  if (!out) {
    return log_and_display_error("Cannot append to " + destination, "open failed");
  }
  auto result = client_.resume_get(name, existing, out);
  std::cout << "Resumed " << name << " (" << result.bytes << " bytes), sha256 " << result.sha256 << std::endl;
  return 0;
}

int CLI::handle_resume_put_command(const std::string& path, const std::string& offset) {
  std::uint64_t start = config::parse_unsigned(offset, std::numeric_limits<std::uint64_t>::max(), "offset");
  std::filesystem::path source_path(path);
  std::ifstream source(source_path, std::ios::binary);
  if (!source) {
    return log_and_display_error("Cannot open " + path, "open failed");
  }
  std::string digest = client_.resume_put(source_path.filename().string(), source, start);
  std::cout << "Resumed upload of " << source_path.filename().string() << " from " << start
            << ", sha256 " << digest << std::endl;
  return 0;
}

int CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  std::cerr << "Error: " << message << ": " << error << std::endl;
  return 1;
}

} // namespace cli
} // namespace ftecho
