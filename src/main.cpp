#include <csignal>
#include <iostream>
#include <string>
#include <unordered_set>
#include <boost/asio.hpp>
#include <boost/log/trivial.hpp>
#include "app/app_config.hpp"
#include "app/bootstrap.hpp"
#include "cli/cli.hpp"
#include "logger/logger.hpp"

using chunkvault::app::AppConfig;

struct ProgramOptions {
  AppConfig config;
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " [options]\n"
        << "Options:\n"
        << "  -m, --mode <serve|shell>     Run the HTTP server or the interactive shell (default serve)\n"
        << "  -h, --host <address>         HTTP listen address (default 127.0.0.1)\n"
        << "  -p, --port <port>            HTTP listen port (default 8080)\n"
        << "  --workers <n>                HTTP worker threads (default 4)\n"
        << "  --backend <memory|redis>     Storage backend (default memory)\n"
        << "  --redis-host <address>       Redis host (default 127.0.0.1)\n"
        << "  --redis-port <port>          Redis port (default 6379)\n"
        << "  --redis-db <n>               Redis database index (default 0)\n"
        << "  --redis-pool <n>             Redis connections (default 4)\n"
        << "  --chunk-size <bytes>         Upload chunk size (default 10000000)\n"
        << "  --parallel <n>               Parallel chunk operations (default 4)\n"
        << "  --max-chunk-size <bytes>     Largest accepted chunk size (default 536870912)\n"
        << "  --memory-threshold <ratio>   Abort uploads above this memory usage (default 0.9)\n"
        << "  --log-file <path>            Also log to a rotating file\n"
        << "  --log-level <level>          trace, debug, info, warning, error, fatal (default info)\n"
        << "Example: " << program_name << " -h 0.0.0.0 -p 8080 --backend redis\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  const std::unordered_set<std::string> known_flags = {
    "-m", "--mode", "-h", "--host", "-p", "--port", "--workers", "--backend",
    "--redis-host", "--redis-port", "--redis-db", "--redis-pool",
    "--chunk-size", "--parallel", "--max-chunk-size", "--memory-threshold",
    "--log-file", "--log-level"
  };

  ProgramOptions options;
  AppConfig& config = options.config;

  if (argc % 2 == 0) {
    std::cerr << "Error: Every option needs a value\n";
    print_usage(argv[0]);
    return options;
  }

  for (int i = 1; i < argc - 1; i += 2) {
    const std::string flag(argv[i]);
    const std::string value(argv[i + 1]);

    if (known_flags.count(flag) == 0) {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }

    try {
      if (flag == "-m" || flag == "--mode") {
        config.mode = chunkvault::app::parse_run_mode(value);
      } else if (flag == "-h" || flag == "--host") {
        config.http.address = value;
      } else if (flag == "-p" || flag == "--port") {
        config.http.port = static_cast<uint16_t>(std::stoi(value));
      } else if (flag == "--workers") {
        config.http.worker_threads = std::stoul(value);
      } else if (flag == "--backend") {
        config.backend = chunkvault::app::parse_backend_kind(value);
      } else if (flag == "--redis-host") {
        config.redis.host = value;
      } else if (flag == "--redis-port") {
        config.redis.port = static_cast<uint16_t>(std::stoi(value));
      } else if (flag == "--redis-db") {
        config.redis.db = std::stoi(value);
      } else if (flag == "--redis-pool") {
        config.redis.pool_size = std::stoul(value);
      } else if (flag == "--chunk-size") {
        config.http.upload_chunk_size = std::stoul(value);
      } else if (flag == "--parallel") {
        config.http.upload_parallelism = std::stoi(value);
        config.http.download_parallelism = config.http.upload_parallelism;
      } else if (flag == "--max-chunk-size") {
        config.storage.max_chunk_size = std::stoul(value);
      } else if (flag == "--memory-threshold") {
        config.storage.memory_pressure_threshold = std::stod(value);
      } else if (flag == "--log-file") {
        config.logging.log_file = value;
      } else if (flag == "--log-level") {
        config.logging.level = value;
      }
    } catch (const std::exception& e) {
      std::cerr << "Error: Invalid value for " << flag << ": " << value << " (" << e.what() << ")\n";
      print_usage(argv[0]);
      return options;
    }
  }

  try {
    chunkvault::app::validate_config(config);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n';
    print_usage(argv[0]);
    return options;
  }

  options.valid = true;
  return options;
}

bool run_server(chunkvault::app::Bootstrap& app) {
  if (!app.start()) {
    std::cerr << "Error: Failed to start HTTP server\n";
    return false;
  }

  std::cout << "Listening on " << app.get_config().http.address << ":"
            << app.get_http_server().local_port() << " (Ctrl+C to stop)" << std::endl;

  // Block until SIGINT or SIGTERM
  boost::asio::io_context signal_context;
  boost::asio::signal_set signals(signal_context, SIGINT, SIGTERM);
  signals.async_wait([](const boost::system::error_code&, int signal_number) {
    BOOST_LOG_TRIVIAL(info) << "Received signal " << signal_number << ", stopping";
  });
  signal_context.run();

  return app.shutdown();
}

bool run_shell(chunkvault::app::Bootstrap& app) {
  const auto& config = app.get_config();
  chunkvault::cli::CLI cli(app.get_file_storage(), config.http.upload_chunk_size, config.http.upload_parallelism);
  cli.run();
  return app.shutdown();
}

int main(int argc, char* argv[]) {
  const auto options = parse_command_line(argc, argv);
  if (!options.valid) {
    return 1;
  }

  try {
    chunkvault::logging::init_logging(options.config.logging);

    chunkvault::app::Bootstrap app(options.config);
    const bool ok = options.config.mode == chunkvault::app::RunMode::SHELL
      ? run_shell(app)
      : run_server(app);
    return ok ? 0 : 1;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(fatal) << "Fatal error: " << e.what();
    std::cerr << "Error: " << e.what() << '\n';
    return 1;
  }
}
