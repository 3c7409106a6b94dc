#pragma once

#include <span>
#include <string>
#include <string_view>

#include "floodgate/server-config.hpp"

namespace floodgate {

// Result of the command line parsing of the floodgate executable.
struct CommandLineOptions {
  static constexpr std::string_view kDefaultListenAddress = "127.0.0.1:3000";

  ServerConfig config;

  // spdlog level name ("trace", "debug", "info", "warn", "error", "critical", "off").
  std::string logLevel{"info"};

  bool help{false};
};

// Parses the arguments (program name excluded) into options. The returned config is validated, unless help was
// requested.
// Throws std::invalid_argument with a human readable message for unknown options, missing or invalid values.
CommandLineOptions ParseCommandLine(std::span<const char* const> args);

// Usage text, programName being argv[0].
std::string CommandLineUsage(std::string_view programName);

}  // namespace floodgate
