#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#include "floodgate/multi-server.hpp"
#include "floodgate/server-config.hpp"
#include "floodgate/test-util.hpp"
#include "floodgate/transfer-record.hpp"
#include "floodgate/transfer-sink.hpp"

namespace floodgate::test {

// Thread safe sink keeping every finalized record in memory.
class RecordingSink : public TransferSink {
 public:
  void consume(const TransferRecord& record) override {
    std::scoped_lock lock(_mutex);
    _records.push_back(record);
  }

  [[nodiscard]] std::vector<TransferRecord> records() const {
    std::scoped_lock lock(_mutex);
    return _records;
  }

  [[nodiscard]] std::size_t size() const {
    std::scoped_lock lock(_mutex);
    return _records.size();
  }

  // Waits until at least nbRecords records have been received. Returns false on timeout.
  bool waitFor(std::size_t nbRecords, std::chrono::milliseconds timeout = 2000ms) const {
    return WaitFor([this, nbRecords] { return size() >= nbRecords; }, timeout);
  }

 private:
  mutable std::mutex _mutex;
  std::vector<TransferRecord> _records;
};

// Lightweight RAII test server harness.
//  * Binds every listener of the config (a loopback listener on an ephemeral port is added if there is none)
//  * Runs the event loops in background threads, with a short poll interval so that timeouts and stop requests are
//    processed promptly
//  * Records all finalized transfers in a RecordingSink
//  * Stops and joins automatically on destruction
struct TestServer {
  explicit TestServer(ServerConfig cfg, std::chrono::milliseconds pollPeriod = std::chrono::milliseconds{5})
      : sink(std::make_shared<RecordingSink>()), server(Prepare(std::move(cfg), pollPeriod), sink) {
    server.start();
  }

  TestServer(const TestServer&) = delete;
  TestServer(TestServer&&) noexcept = delete;
  TestServer& operator=(const TestServer&) = delete;
  TestServer& operator=(TestServer&&) noexcept = delete;

  ~TestServer() { stop(); }

  [[nodiscard]] uint16_t port() const { return server.port(); }

  // Safe to call multiple times.
  void stop() { server.stop(); }

  std::shared_ptr<RecordingSink> sink;
  MultiServer server;

 private:
  static ServerConfig Prepare(ServerConfig cfg, std::chrono::milliseconds pollPeriod) {
    if (cfg.listeners.empty()) {
      cfg.withListener("127.0.0.1:0");
    }
    cfg.withPollInterval(pollPeriod);
    return cfg;
  }
};

}  // namespace floodgate::test
