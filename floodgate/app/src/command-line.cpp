#include "floodgate/command-line.hpp"

#include <spdlog/common.h>
#include <spdlog/fmt/fmt.h>

#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>
#include <vector>

#include "floodgate/listener-config.hpp"
#include "floodgate/server-config.hpp"
#include "floodgate/size-spec.hpp"
#include "floodgate/tls-config.hpp"

namespace floodgate {

namespace {

template <class Int>
Int ParseInteger(std::string_view option, std::string_view value) {
  Int result{};
  const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
  if (ec != std::errc{} || ptr != value.data() + value.size()) {
    throw std::invalid_argument(fmt::format("invalid value '{}' for {}, expected an integer", value, option));
  }
  return result;
}

// Byte count given as a size token without extension ("10GB", "64KiB", "1500").
uint64_t ParseByteCount(std::string_view option, std::string_view value) {
  std::string token(value);
  if (!token.empty() && token.back() >= '0' && token.back() <= '9') {
    token.push_back('B');
  }
  token.append(".bin");
  const auto parsed = ParseSizeToken(token, std::numeric_limits<uint64_t>::max());
  if (const auto* spec = std::get_if<SizeSpec>(&parsed)) {
    return spec->byteCount;
  }
  throw std::invalid_argument(fmt::format("invalid size '{}' for {}", value, option));
}

std::vector<std::string> SplitList(std::string_view value) {
  std::vector<std::string> items;
  while (!value.empty()) {
    const auto commaPos = value.find(',');
    const auto item = value.substr(0, commaPos);
    if (!item.empty()) {
      items.emplace_back(item);
    }
    if (commaPos == std::string_view::npos) {
      break;
    }
    value.remove_prefix(commaPos + 1);
  }
  return items;
}

bool IsValidLogLevel(std::string_view name) {
  return name == "off" || spdlog::level::from_str(std::string(name)) != spdlog::level::off;
}

}  // namespace

CommandLineOptions ParseCommandLine(std::span<const char* const> args) {
  CommandLineOptions options;
  ServerConfig& config = options.config;

  std::vector<std::string_view> plainAddresses;
  std::vector<std::string_view> optionalAddresses;
  std::vector<std::string_view> tlsAddresses;
  TLSConfig tlsConfig;

  for (std::size_t argPos = 0; argPos < args.size(); ++argPos) {
    const std::string_view arg(args[argPos]);
    const auto nextValue = [&args, &argPos, arg]() -> std::string_view {
      if (argPos + 1 >= args.size()) {
        throw std::invalid_argument(fmt::format("missing value for {}", arg));
      }
      return args[++argPos];
    };

    if (arg == "--help" || arg == "-h") {
      options.help = true;
      return options;
    }
    if (arg == "--listen" || arg == "-l") {
      plainAddresses.push_back(nextValue());
    } else if (arg == "--listen-optional") {
      optionalAddresses.push_back(nextValue());
    } else if (arg == "--listen-tls") {
      tlsAddresses.push_back(nextValue());
    } else if (arg == "--cert") {
      tlsConfig.withCertFile(nextValue());
    } else if (arg == "--key") {
      tlsConfig.withKeyFile(nextValue());
    } else if (arg == "--max-size") {
      config.withMaxSize(ParseByteCount(arg, nextValue()));
    } else if (arg == "--chunk-size") {
      config.withChunkSize(static_cast<std::size_t>(ParseByteCount(arg, nextValue())));
    } else if (arg == "--access-log") {
      config.withAccessLogPath(nextValue());
    } else if (arg == "--index-template") {
      config.withIndexTemplateFile(nextValue());
    } else if (arg == "--index-sizes") {
      config.withIndexSizes(SplitList(nextValue()));
    } else if (arg == "--threads") {
      config.withNbThreadsPerListener(ParseInteger<uint32_t>(arg, nextValue()));
    } else if (arg == "--xff") {
      config.withTrustForwardedHeaders();
    } else if (arg == "--log-level") {
      options.logLevel = nextValue();
      if (!IsValidLogLevel(options.logLevel)) {
        throw std::invalid_argument(fmt::format("unknown log level '{}'", options.logLevel));
      }
    } else if (arg == "--drain-timeout") {
      config.withDrainTimeout(std::chrono::milliseconds{ParseInteger<int64_t>(arg, nextValue())});
    } else {
      throw std::invalid_argument(fmt::format("unknown option '{}'", arg));
    }
  }

  if (!tlsAddresses.empty() && (tlsConfig.certFile().empty() || tlsConfig.keyFile().empty())) {
    throw std::invalid_argument("--listen-tls requires both --cert and --key");
  }
  if (tlsAddresses.empty() && (!tlsConfig.certFile().empty() || !tlsConfig.keyFile().empty())) {
    throw std::invalid_argument("--cert and --key are only meaningful with --listen-tls");
  }
  if (plainAddresses.empty() && optionalAddresses.empty() && tlsAddresses.empty()) {
    plainAddresses.push_back(CommandLineOptions::kDefaultListenAddress);
  }

  for (const auto address : plainAddresses) {
    config.withListener(address);
  }
  for (const auto address : tlsAddresses) {
    config.withTlsListener(address, tlsConfig);
  }
  for (const auto address : optionalAddresses) {
    config.withListener(ListenerConfig{std::string(address), false, {}, true});
  }

  config.validate();
  return options;
}

std::string CommandLineUsage(std::string_view programName) {
  return fmt::format(
      "Usage: {} [options]\n"
      "Serves pseudo random payloads of the size given by the request path (GET /10MB.bin, /2GiB.bin, ...).\n"
      "\n"
      "Options:\n"
      "  -l, --listen ADDR         Plaintext listener, repeatable (default: {})\n"
      "      --listen-optional ADDR\n"
      "                            Plaintext listener skipped with a warning if it cannot be bound\n"
      "      --listen-tls ADDR     TLS listener, repeatable (requires --cert and --key)\n"
      "      --cert FILE           TLS certificate file (PEM)\n"
      "      --key FILE            TLS private key file (PEM)\n"
      "      --max-size SIZE       Largest payload served (default: 10GiB)\n"
      "      --chunk-size SIZE     Size of generated chunks (default: 16KiB)\n"
      "      --access-log PATH     Access log file, '-' for standard output (default: disabled)\n"
      "      --index-template FILE HTML template of the index page\n"
      "      --index-sizes LIST    Comma separated sizes listed on the index page (default: 1MB,10MB,100MB,1GB,10GB)\n"
      "      --threads N           Event loop threads per listener (default: 1)\n"
      "      --xff                 Trust X-Forwarded-For / X-Real-IP / Forwarded for the client address\n"
      "      --log-level LEVEL     trace, debug, info, warn, error, critical or off (default: info)\n"
      "      --drain-timeout MS    Grace period given to running transfers on shutdown (default: 5000)\n"
      "  -h, --help                Show this help\n"
      "\n"
      "ADDR is 'port', ':port', 'host:port' or '[ipv6]:port'.\n",
      programName, CommandLineOptions::kDefaultListenAddress);
}

}  // namespace floodgate
