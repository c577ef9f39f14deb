#include "cli/cli.hpp"
#include "client/client.hpp"
#include "config/server_config.hpp"
#include "logger/logger.hpp"
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

struct ProgramOptions {
  std::string host{"127.0.0.1"};
  uint16_t port{9000};
  std::vector<std::string> command;
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " [-h <host>] [-p <port>] <command> [operands]\n"
        << "  -h, --host    Server address (default 127.0.0.1)\n"
        << "  -p, --port    Server port (default 9000)\n"
        << "Example: " << program_name << " -h 127.0.0.1 -p 9000 put ./report.pdf\n";
  ftecho::cli::CLI::print_help();
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  ProgramOptions options;

  int i = 1;
  for (; i < argc; i += 2) {
    const std::string flag(argv[i]);
    if (flag.empty() || flag[0] != '-') {
      break;
    }
    if (i + 1 >= argc) {
      std::cerr << "Error: Missing value for " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }
    const std::string value(argv[i + 1]);

    if (flag == "-h" || flag == "--host") {
      options.host = value;
    } else if (flag == "-p" || flag == "--port") {
      try {
        options.port = static_cast<uint16_t>(ftecho::config::parse_unsigned(value, 65535, flag));
        if (options.port == 0) {
          throw std::invalid_argument("port 0");
        }
      } catch (const std::exception&) {
        std::cerr << "Error: Invalid port number\n";
        print_usage(argv[0]);
        return options;
      }
    } else {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }
  }

  options.command.assign(argv + i, argv + argc);
  if (options.command.empty()) {
    std::cerr << "Error: No command given\n";
    print_usage(argv[0]);
    return options;
  }

  options.valid = true;
  return options;
}

int main(int argc, char* argv[]) {
  const auto options = parse_command_line(argc, argv);
  if (!options.valid) {
    return 1;
  }

  ftecho::logging::init_logging(std::string(), boost::log::trivial::warning);

  try {
    ftecho::client::Client client;
    client.connect(options.host, options.port);
    ftecho::cli::CLI cli(client);
    int status = cli.run(options.command);
    client.quit();
    return status;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return 1;
  }
}
