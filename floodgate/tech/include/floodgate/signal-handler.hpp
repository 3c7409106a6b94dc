#pragma once

#include <chrono>

namespace floodgate {

class SignalHandler {
 public:
  SignalHandler() noexcept = delete;

  // Installs handlers for SIGINT and SIGTERM requesting a graceful shutdown, and ignores SIGPIPE so that writes to a
  // peer that went away surface as EPIPE on the connection instead of killing the process.
  // maxDrainPeriod is the grace period granted to in-flight transfers once a termination signal is received.
  static void Enable(std::chrono::milliseconds maxDrainPeriod = std::chrono::milliseconds{5000});

  // Restores default signal dispositions.
  static void Disable();

  // Returns true if a termination signal was received.
  static bool IsStopRequested();

  static std::chrono::milliseconds GetMaxDrainPeriod();

  // Clears the stop request flag so that several servers can be run in sequence in the same process.
  static void ResetStopRequest();
};

}  // namespace floodgate
