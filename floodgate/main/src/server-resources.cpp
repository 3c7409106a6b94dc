#include "floodgate/server-resources.hpp"

#include <memory>
#include <string_view>
#include <utility>

#include "floodgate/access-log.hpp"
#include "floodgate/index-renderer.hpp"
#include "floodgate/log.hpp"
#include "floodgate/router.hpp"
#include "floodgate/server-config.hpp"
#include "floodgate/transfer-sink.hpp"

namespace floodgate {

std::shared_ptr<const ServerResources> ServerResources::Build(const ServerConfig& config,
                                                              std::shared_ptr<TransferSink> transferSink) {
  std::unique_ptr<IndexRenderer> indexRenderer;
  if (config.indexTemplateFile.empty()) {
    indexRenderer = std::make_unique<HtmlIndexRenderer>(config.indexSizes, config.maxSize);
  } else {
    indexRenderer = std::make_unique<HtmlIndexRenderer>(
        HtmlIndexRenderer::FromFile(config.indexTemplateFile, config.indexSizes, config.maxSize));
    log::info("Index page template loaded from {}", config.indexTemplateFile);
  }

  if (!transferSink && !config.accessLogPath.empty()) {
    transferSink = std::make_shared<AccessLog>(config.accessLogPath);
    log::info("Access log written to {}", config.accessLogPath == AccessLog::kStandardOutput
                                              ? std::string_view("standard output")
                                              : std::string_view(config.accessLogPath));
  }

  return std::make_shared<const ServerResources>(
      ServerResources{Router(config.indexPaths, config.maxSize), std::move(indexRenderer), std::move(transferSink)});
}

}  // namespace floodgate
