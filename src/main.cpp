#include "cli/cli.hpp"
#include "client/bee_client.hpp"
#include "logger/logger.hpp"
#include <iostream>
#include <stdexcept>
#include <string>
#include <unordered_set>

struct ProgramOptions {
  std::string url;
  blockstore::client::ClientOptions client;
  boost::log::trivial::severity_level log_level{boost::log::trivial::info};
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " -u <url> [-s <stamp>] [-r <level>] [-p true|false] [-l <level>]\n"
        << "Required arguments:\n"
        << "  -u, --url          Base URL of the Bee node\n"
        << "Optional arguments:\n"
        << "  -s, --stamp        Default postage batch id for uploads\n"
        << "  -r, --redundancy   Default redundancy level (0-4)\n"
        << "  -p, --pin          Pin every upload (true or false)\n"
        << "  -l, --log-level    trace, debug, info, warning, error or fatal\n"
        << "Example: " << program_name << " -u http://localhost:1633 -s <batch-id>\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  const std::unordered_set<std::string> flags = {
    "-u", "--url",
    "-s", "--stamp",
    "-r", "--redundancy",
    "-p", "--pin",
    "-l", "--log-level"
  };

  ProgramOptions options;

  if (argc % 2 == 0) {
    std::cerr << "Error: Every flag needs a value\n";
    print_usage(argv[0]);
    return options;
  }

  for (int i = 1; i < argc - 1; i += 2) {
    const std::string flag(argv[i]);
    const std::string value(argv[i + 1]);

    if (flags.count(flag) == 0) {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }

    if (flag == "-u" || flag == "--url") {
      options.url = value;
    } else if (flag == "-s" || flag == "--stamp") {
      options.client.stamp = value;
    } else if (flag == "-r" || flag == "--redundancy") {
      options.client.redundancy = value;
    } else if (flag == "-p" || flag == "--pin") {
      if (value != "true" && value != "false") {
        std::cerr << "Error: Pin must be true or false\n";
        print_usage(argv[0]);
        return options;
      }
      options.client.pin = value == "true";
    } else if (flag == "-l" || flag == "--log-level") {
      try {
        options.log_level = blockstore::logging::parse_log_level(value);
      } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << '\n';
        print_usage(argv[0]);
        return options;
      }
    }
  }

  if (options.url.empty()) {
    std::cerr << "Error: The node url is required\n";
    print_usage(argv[0]);
    return options;
  }

  options.valid = true;
  return options;
}

bool run_shell(const ProgramOptions& options) {
  try {
    blockstore::logging::init_logging("blockstore_shell", options.log_level);
    blockstore::client::BeeClient client(options.url, options.client);

    if (!client.check_connection()) {
      std::cerr << "Warning: " << options.url << " does not look like a Bee node\n";
    }

    blockstore::cli::CLI cli(client);
    cli.run();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to start shell: " << e.what() << '\n';
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
