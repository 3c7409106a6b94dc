#pragma once

#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace floodgate {

// All diagnostic logging goes through spdlog's default logger.
namespace log = spdlog;

}  // namespace floodgate
