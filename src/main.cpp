#include "cli/cli.hpp"
#include "config/config.hpp"
#include "logger/logger.hpp"
#include "store/store.hpp"
#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <unordered_set>

struct ProgramOptions {
  std::string data_dir;
  std::optional<std::chrono::milliseconds> lock_timeout;
  std::optional<std::string> log_file;
  bool verbose{false};
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " -d <data-dir> [-t <timeout-ms>] [-l <log-file>] [-v]\n"
        << "Required arguments:\n"
        << "  -d, --data-dir  Root directory of the record store\n"
        << "Optional arguments:\n"
        << "  -t, --timeout   Lock timeout in milliseconds (default 30000)\n"
        << "  -l, --log-file  Also write logs to this file\n"
        << "  -v, --verbose   Log debug messages\n"
        << "Environment:\n"
        << "  " << vault::config::ENCRYPTION_KEY_ENV << "  Master key, records are encrypted when set\n"
        << "Example: " << program_name << " -d ./data -t 5000\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  const std::unordered_set<std::string> value_flags = {
    "-d", "--data-dir", "-t", "--timeout", "-l", "--log-file"
  };

  ProgramOptions options;

  for (int i = 1; i < argc; ++i) {
    const std::string flag(argv[i]);

    if (flag == "-v" || flag == "--verbose") {
      options.verbose = true;
      continue;
    }

    if (value_flags.count(flag) == 0) {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }
    if (i + 1 >= argc) {
      std::cerr << "Error: Missing value for " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }
    const std::string value(argv[++i]);

    if (flag == "-d" || flag == "--data-dir") {
      options.data_dir = value;
    } else if (flag == "-t" || flag == "--timeout") {
      try {
        long timeout = std::stol(value);
        if (timeout <= 0) {
          throw std::out_of_range("timeout must be positive");
        }
        options.lock_timeout = std::chrono::milliseconds(timeout);
      } catch (const std::exception&) {
        std::cerr << "Error: Invalid timeout: " << value << '\n';
        print_usage(argv[0]);
        return options;
      }
    } else if (flag == "-l" || flag == "--log-file") {
      options.log_file = value;
    }
  }

  if (options.data_dir.empty()) {
    std::cerr << "Error: A data directory is required\n";
    print_usage(argv[0]);
    return options;
  }

  options.valid = true;
  return options;
}

bool run_shell(const ProgramOptions& options) {
  try {
    vault::logger::LogOptions log_options;
    if (options.log_file) {
      log_options.log_file = *options.log_file;
    }
    log_options.min_level = options.verbose ? boost::log::trivial::debug : boost::log::trivial::warning;
    vault::logger::init_logging(log_options);

    auto config = vault::config::StoreConfig::from_environment(options.data_dir);
    if (options.lock_timeout) {
      config.lock_timeout = *options.lock_timeout;
    }

    vault::store::Store store(config);
    vault::cli::CLI cli(store);
    cli.run();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to start vault: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  if (const auto options = parse_command_line(argc, argv); !options.valid) {
    return 1;
  } else if (!run_shell(options)) {
    return 1;
  }
  return 0;
}
