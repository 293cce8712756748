#include "config.hpp"
#include "util/RESP.hpp"
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <vector>

namespace RedisLite {

static std::string trim(const std::string &s) {
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
    ++start;
  }
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
    --end;
  }
  return s.substr(start, end - start);
}

static int parse_port(const std::string &value) {
  long long port = 0;
  if (!parse_i64(value, port) || port < 0 || port > 65535) {
    throw std::invalid_argument("invalid port '" + value + "'");
  }
  return static_cast<int>(port);
}

static std::chrono::milliseconds parse_interval(const std::string &value) {
  long long ms = 0;
  if (!parse_i64(value, ms) || ms <= 0) {
    throw std::invalid_argument("invalid sweep interval '" + value + "'");
  }
  return std::chrono::milliseconds(ms);
}

void load_config_file(const std::string &path, Config &cfg) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::invalid_argument("cannot open config file '" + path + "'");
  }

  std::string line;
  int line_no = 0;
  while (std::getline(file, line)) {
    ++line_no;
    line = trim(line);
    if (line.empty() || line[0] == '#') {
      continue;
    }

    size_t eq = line.find('=');
    if (eq == std::string::npos) {
      throw std::invalid_argument(path + ":" + std::to_string(line_no) +
                                  ": expected key = value");
    }

    std::string key = trim(line.substr(0, eq));
    std::string value = trim(line.substr(eq + 1));

    if (key == "port") {
      cfg.port = parse_port(value);
    } else if (key == "bind") {
      cfg.host = value;
    } else if (key == "sweep_interval_ms") {
      cfg.sweep_interval = parse_interval(value);
    } else if (key == "log_level") {
      cfg.log_level = log::parse_level(value);
    } else {
      throw std::invalid_argument(path + ":" + std::to_string(line_no) +
                                  ": unknown key '" + key + "'");
    }
  }
}

Config parse_args(int argc, char **argv) {
  Config cfg;
  std::vector<std::string> args(argv + 1, argv + argc);

  auto value_of = [&args](size_t &i) -> const std::string & {
    if (i + 1 >= args.size()) {
      throw std::invalid_argument("missing value for " + args[i]);
    }
    return args[++i];
  };

  // config file first so that flags win regardless of order
  for (size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--config" || args[i] == "-c") {
      load_config_file(value_of(i), cfg);
    }
  }

  bool positional_port = false;
  for (size_t i = 0; i < args.size(); ++i) {
    const std::string &arg = args[i];

    if (arg == "--port" || arg == "-p") {
      cfg.port = parse_port(value_of(i));
    } else if (arg == "--bind" || arg == "-b") {
      cfg.host = value_of(i);
    } else if (arg == "--sweep-interval-ms") {
      cfg.sweep_interval = parse_interval(value_of(i));
    } else if (arg == "--log-level") {
      cfg.log_level = log::parse_level(value_of(i));
    } else if (arg == "--config" || arg == "-c") {
      ++i;
    } else if (arg == "--help" || arg == "-h") {
      cfg.show_help = true;
    } else if (!arg.empty() && arg[0] != '-' && !positional_port) {
      cfg.port = parse_port(arg);
      positional_port = true;
    } else {
      throw std::invalid_argument("unknown argument '" + arg + "'");
    }
  }

  return cfg;
}

std::string usage(const std::string &program) {
  return "usage: " + program +
         " [port] [--port N] [--bind HOST] [--sweep-interval-ms N]\n"
         "       [--log-level debug|info|warn|error] [--config FILE]\n";
}

} // namespace RedisLite
