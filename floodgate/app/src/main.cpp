#include <spdlog/common.h>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "floodgate/command-line.hpp"
#include "floodgate/log.hpp"
#include "floodgate/multi-server.hpp"
#include "floodgate/signal-handler.hpp"
#include "floodgate/startup-errors.hpp"

int main(int argc, char** argv) {
  using namespace floodgate;

  const std::string_view programName = argc > 0 ? argv[0] : "floodgate";
  const std::vector<const char*> args(argc > 0 ? argv + 1 : argv, argv + argc);
  CommandLineOptions options;
  try {
    options = ParseCommandLine(args);
  } catch (const std::invalid_argument& ex) {
    std::cerr << programName << ": " << ex.what() << "\n\n" << CommandLineUsage(programName);
    return EXIT_FAILURE;
  }
  if (options.help) {
    std::cout << CommandLineUsage(programName);
    return EXIT_SUCCESS;
  }

  log::set_level(log::level::from_str(options.logLevel));

  SignalHandler::Enable(options.config.drainTimeout);

  try {
    MultiServer server(options.config);

    server.run();

    const auto stats = server.stats();
    log::info("floodgate stopped");
    stats.total.for_each_field([](std::string_view name, uint64_t value) { log::info("  {}: {}", name, value); });
  } catch (const ListenerBindFailure& ex) {
    log::critical("Unable to bind {}: {}", ex.address(), ex.what());
    return EXIT_FAILURE;
  } catch (const TlsCredentialFailure& ex) {
    log::critical("Unable to load TLS credentials: {}", ex.what());
    return EXIT_FAILURE;
  } catch (const std::exception& ex) {
    log::critical("Fatal error: {}", ex.what());
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
