#include <boost/asio.hpp>
#include <boost/log/trivial.hpp>
#include <csignal>
#include <iostream>
#include <string>
#include <unordered_set>
#include "logger/logger.hpp"
#include "network/gateway.hpp"
#include "store/store.hpp"

struct ProgramOptions {
  std::string dir;
  std::string log_file{"xs.log"};
  std::string log_level{"info"};
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " -d <dir> [-l <log file>] [-v <level>]\n"
        << "Required arguments:\n"
        << "  -d, --dir     Store directory\n"
        << "Optional arguments:\n"
        << "  -l, --log     Log file (default: xs.log)\n"
        << "  -v, --level   Log level: trace, debug, info, warning, error, fatal\n"
        << "Example: " << program_name << " -d ./store -l xs.log\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  const std::unordered_set<std::string> flags = {
    "-d", "--dir", "-l", "--log", "-v", "--level"
  };

  ProgramOptions options;

  if (argc % 2 == 0) {
    std::cerr << "Error: Missing value for " << argv[argc - 1] << '\n';
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

    if (flag == "-d" || flag == "--dir") {
      options.dir = value;
    } else if (flag == "-l" || flag == "--log") {
      options.log_file = value;
    } else {
      options.log_level = value;
    }
  }

  if (options.dir.empty()) {
    std::cerr << "Error: A store directory is required\n";
    print_usage(argv[0]);
    return options;
  }

  options.valid = true;
  return options;
}

bool run_server(const ProgramOptions& options) {
  try {
    xs::logger::init_logging(options.log_file, xs::logger::parse_severity(options.log_level));

    xs::store::Store store = xs::store::Store::spawn(options.dir);
    xs::network::Gateway gateway(store);

    if (!gateway.start()) {
      std::cerr << "Error: Failed to start gateway\n";
      return false;
    }
    std::cout << "Listening on " << gateway.socket_path().string() << std::endl;

    // Serve until interrupted
    boost::asio::io_context signals_context;
    boost::asio::signal_set signals(signals_context, SIGINT, SIGTERM);
    signals.async_wait([](const boost::system::error_code& error, int signal_number) {
      if (!error) {
        BOOST_LOG_TRIVIAL(info) << "Server: Received signal " << signal_number << ", shutting down";
      }
    });
    signals_context.run();

    gateway.shutdown();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to run server: " << e.what() << '\n';
    BOOST_LOG_TRIVIAL(fatal) << "Server: " << e.what();
    return false;
  }
}

int main(int argc, char* argv[]) {
  if (const auto options = parse_command_line(argc, argv); !options.valid) {
    return 1;
  } else if (!run_server(options)) {
    return 1;
  }
  return 0;
}
