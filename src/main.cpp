#include "config/server_config.hpp"
#include "logger/logger.hpp"
#include "network/listener.hpp"
#include "store/storage_manager.hpp"
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <iostream>
#include <limits>
#include <string>
#include <unordered_map>

struct ProgramOptions {
  ftecho::config::ServerConfig config;
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " [options]\n"
        << "Options:\n"
        << "  -a, --address       Listen address (default 0.0.0.0)\n"
        << "  -p, --port          Port number (default 9000)\n"
        << "  -d, --dir           Storage directory (default ./storage)\n"
        << "  -c, --chunk-size    Bytes per F frame sent (default 4096)\n"
        << "  -m, --max-frame     Largest accepted frame length (default 16777216)\n"
        << "  -t, --idle-timeout  Seconds before an idle connection is closed, 0 = never (default 300)\n"
        << "  -l, --log-file      Also log to this file\n"
        << "  -v, --log-level     trace|debug|info|warning|error|fatal (default info)\n"
        << "Example: " << program_name << " -p 9000 -d ./storage\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  enum class Flag { ADDRESS, PORT, DIR, CHUNK, MAX_FRAME, IDLE, LOG_FILE, LOG_LEVEL };
  const std::unordered_map<std::string, Flag> flag_map = {
    {"-a", Flag::ADDRESS}, {"--address", Flag::ADDRESS},
    {"-p", Flag::PORT}, {"--port", Flag::PORT},
    {"-d", Flag::DIR}, {"--dir", Flag::DIR},
    {"-c", Flag::CHUNK}, {"--chunk-size", Flag::CHUNK},
    {"-m", Flag::MAX_FRAME}, {"--max-frame", Flag::MAX_FRAME},
    {"-t", Flag::IDLE}, {"--idle-timeout", Flag::IDLE},
    {"-l", Flag::LOG_FILE}, {"--log-file", Flag::LOG_FILE},
    {"-v", Flag::LOG_LEVEL}, {"--log-level", Flag::LOG_LEVEL}
  };

  ProgramOptions options;
  auto& config = options.config;

  if (argc % 2 == 0) {
    std::cerr << "Error: Every option needs a value\n";
    print_usage(argv[0]);
    return options;
  }

  for (int i = 1; i < argc - 1; i += 2) {
    const std::string flag(argv[i]);
    const std::string value(argv[i + 1]);

    auto it = flag_map.find(flag);
    if (it == flag_map.end()) {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }

    try {
      switch (it->second) {
        case Flag::ADDRESS:   config.address = value; break;
        case Flag::PORT:
          config.port = static_cast<uint16_t>(ftecho::config::parse_unsigned(value, 65535, flag));
          break;
        case Flag::DIR:       config.storage_root = value; break;
        case Flag::CHUNK:
          config.chunk_size = static_cast<std::size_t>(
            ftecho::config::parse_unsigned(value, std::numeric_limits<uint32_t>::max(), flag));
          break;
        case Flag::MAX_FRAME:
          config.max_frame_length = static_cast<uint32_t>(
            ftecho::config::parse_unsigned(value, std::numeric_limits<uint32_t>::max(), flag));
          break;
        case Flag::IDLE:
          config.idle_timeout = std::chrono::seconds(
            ftecho::config::parse_unsigned(value, std::numeric_limits<uint32_t>::max(), flag));
          break;
        case Flag::LOG_FILE:  config.log_file = value; break;
        case Flag::LOG_LEVEL:
          if (!ftecho::logging::parse_severity(value, config.log_level)) {
            throw std::invalid_argument("log level");
          }
          break;
      }
    } catch (const std::exception& e) {
      std::cerr << "Error: Invalid value for " << flag << ": " << value << " (" << e.what() << ")\n";
      print_usage(argv[0]);
      return options;
    }
  }

  try {
    config.validate();
  } catch (const std::invalid_argument& e) {
    std::cerr << "Error: " << e.what() << '\n';
    print_usage(argv[0]);
    return options;
  }

  options.valid = true;
  return options;
}

bool run_server(const ftecho::config::ServerConfig& config) {
  try {
    ftecho::logging::init_logging(config.log_file, config.log_level);

    ftecho::store::StorageManager storage(config.storage_root);
    ftecho::network::Listener listener(config, storage);

    if (!listener.start_listener()) {
      std::cerr << "Error: Failed to listen on " << config.address << ":" << config.port << '\n';
      return false;
    }

    // Block until SIGINT or SIGTERM
    boost::asio::io_context signal_context;
    boost::asio::signal_set signals(signal_context, SIGINT, SIGTERM);
    signals.async_wait([](const boost::system::error_code& error, int signal_number) {
      if (!error) {
        BOOST_LOG_TRIVIAL(info) << "Server: Received signal " << signal_number << ", shutting down";
      }
    });
    signal_context.run();

    listener.shutdown();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Server failed: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  if (const auto options = parse_command_line(argc, argv); !options.valid) {
    return 1;
  } else if (!run_server(options.config)) {
    return 1;
  }
  return 0;
}
