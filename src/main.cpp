#include <filesystem>
#include <iostream>
#include <string>
#include <vector>
#include <boost/log/trivial.hpp>
#include "cli/cli.hpp"
#include "config/config.hpp"
#include "logger/logger.hpp"

#ifndef DISTORE_VERSION
#define DISTORE_VERSION "unknown"
#endif

struct ProgramOptions {
  std::filesystem::path config_directory;
  bool verbose{false};
  std::vector<std::string> command;
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " [--config-directory <dir>] [--verbose] <command> [args]\n"
        << "Options:\n"
        << "  --config-directory  Directory holding distore/distore.ini\n"
        << "  -v, --verbose       Write debug records to the log\n"
        << "Run '" << program_name << " help' for the list of commands\n";
}

// Leading options belong to the program, everything from the first
// non-option word on is the command
ProgramOptions parse_command_line(int argc, char* argv[]) {
  ProgramOptions options;
  int i = 1;

  for (; i < argc; ++i) {
    const std::string flag(argv[i]);
    if (flag.empty() || flag[0] != '-') {
      break;
    }

    if (flag == "-v" || flag == "--verbose") {
      options.verbose = true;
    } else if (flag == "--config-directory") {
      if (i + 1 >= argc) {
        std::cerr << "Error: Missing value for " << flag << '\n';
        print_usage(argv[0]);
        return options;
      }
      options.config_directory = argv[++i];
    } else if (flag.rfind("--config-directory=", 0) == 0) {
      options.config_directory = flag.substr(flag.find('=') + 1);
    } else {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }
  }

  for (; i < argc; ++i) {
    options.command.emplace_back(argv[i]);
  }

  if (options.command.empty()) {
    std::cerr << "Error: No command given\n";
    print_usage(argv[0]);
    return options;
  }

  options.valid = true;
  return options;
}

int run_command(const ProgramOptions& options) {
  try {
    distore::logging::init_logging(
      (distore::cli::CLI::cache_directory() / "distore.log").string(),
      options.verbose ? distore::logging::severity_level::debug : distore::logging::severity_level::info);

    const std::filesystem::path directory = options.config_directory.empty()
        ? distore::config::Config::default_directory() : options.config_directory;
    distore::config::Config config(distore::config::Config::file_in(directory));
    BOOST_LOG_TRIVIAL(info) << "Using config file " << config.path().string();

    distore::cli::CLI cli(config, DISTORE_VERSION);
    if (options.command.front() == "shell") {
      cli.run();
      return 0;
    }
    return cli.execute(options.command);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return 1;
  }
}

int main(int argc, char* argv[]) {
  const auto options = parse_command_line(argc, argv);
  if (!options.valid) {
    return 1;
  }
  return run_command(options);
}
