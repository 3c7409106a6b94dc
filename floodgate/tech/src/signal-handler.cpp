#include "floodgate/signal-handler.hpp"

#include <chrono>
#include <csignal>

namespace {

volatile std::sig_atomic_t g_signalStatus{};
std::chrono::milliseconds g_maxDrainPeriod{5000};

}  // namespace

// Only async-signal-safe work is allowed here; the event loops poll IsStopRequested() and log the shutdown.
extern "C" void FloodgateSignalHandler(int sigNum) { g_signalStatus = sigNum; }

namespace floodgate {

void SignalHandler::Enable(std::chrono::milliseconds maxDrainPeriod) {
  g_maxDrainPeriod = maxDrainPeriod;
  std::signal(SIGINT, ::FloodgateSignalHandler);
  std::signal(SIGTERM, ::FloodgateSignalHandler);
  std::signal(SIGPIPE, SIG_IGN);
}

void SignalHandler::Disable() {
  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);
  std::signal(SIGPIPE, SIG_DFL);
}

bool SignalHandler::IsStopRequested() { return g_signalStatus != 0; }

std::chrono::milliseconds SignalHandler::GetMaxDrainPeriod() { return g_maxDrainPeriod; }

void SignalHandler::ResetStopRequest() { g_signalStatus = 0; }

}  // namespace floodgate
