#pragma once
#include "util/log.hpp"
#include <chrono>
#include <string>

namespace RedisLite {

struct Config {
  std::string host = "0.0.0.0";
  int port = 6379;
  std::chrono::milliseconds sweep_interval{1000};
  log::level log_level = log::level::INFO;
  bool show_help = false;
};

// Flags override values read from --config. Throws std::invalid_argument.
Config parse_args(int argc, char **argv);

// key = value lines, '#' comments. Throws std::invalid_argument.
void load_config_file(const std::string &path, Config &cfg);

std::string usage(const std::string &program);

} // namespace RedisLite
