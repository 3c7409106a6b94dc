#pragma once

#include <memory>

#include "floodgate/index-renderer.hpp"
#include "floodgate/router.hpp"
#include "floodgate/server-config.hpp"
#include "floodgate/transfer-sink.hpp"

namespace floodgate {

// Read-only state shared by all the event loops serving one ServerConfig.
struct ServerResources {
  // Builds the router and the index renderer from config, and the access log if config.accessLogPath is set and no
  // sink is given. Throws std::invalid_argument for invalid index sizes, std::runtime_error if the index template or
  // the access log cannot be opened.
  static std::shared_ptr<const ServerResources> Build(const ServerConfig& config,
                                                      std::shared_ptr<TransferSink> transferSink = {});

  Router router;
  std::unique_ptr<IndexRenderer> indexRenderer;
  // May be null (access log disabled).
  std::shared_ptr<TransferSink> transferSink;
};

}  // namespace floodgate
