#include "floodgate/command-line.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <vector>

namespace floodgate {

namespace {

CommandLineOptions Parse(std::initializer_list<const char*> args) {
  const std::vector<const char*> argsVec(args);
  return ParseCommandLine(argsVec);
}

}  // namespace

TEST(CommandLineTest, Defaults) {
  const auto options = Parse({});

  EXPECT_FALSE(options.help);
  EXPECT_EQ(options.logLevel, "info");
  ASSERT_EQ(options.config.listeners.size(), 1U);
  EXPECT_EQ(options.config.listeners[0].address, CommandLineOptions::kDefaultListenAddress);
  EXPECT_FALSE(options.config.listeners[0].isTls);
  EXPECT_EQ(options.config.maxSize, ServerConfig::kDefaultMaxSize);
  EXPECT_EQ(options.config.chunkSize, ServerConfig::kDefaultChunkSize);
  EXPECT_TRUE(options.config.accessLogPath.empty());
}

TEST(CommandLineTest, Help) {
  EXPECT_TRUE(Parse({"--help"}).help);
  EXPECT_TRUE(Parse({"--listen", "8080", "-h", "--bogus"}).help);
  EXPECT_NE(CommandLineUsage("floodgate").find("--listen-tls"), std::string::npos);
}

TEST(CommandLineTest, AllOptions) {
  const auto options = Parse({"-l", "127.0.0.1:8080", "--listen", "[::1]:8080", "--listen-tls", "0.0.0.0:8443", "--cert",
                              "/etc/cert.pem", "--key", "/etc/key.pem", "--listen-optional", "10.1.2.3:80",
                              "--max-size", "2GiB", "--chunk-size", "64KiB", "--access-log", "-", "--index-template",
                              "/tmp/index.html", "--index-sizes", "1MB,,5GiB", "--threads", "4", "--xff",
                              "--log-level", "debug", "--drain-timeout", "1500"});

  const ServerConfig& config = options.config;
  ASSERT_EQ(config.listeners.size(), 4U);
  EXPECT_EQ(config.listeners[0].address, "127.0.0.1:8080");
  EXPECT_EQ(config.listeners[1].address, "[::1]:8080");
  EXPECT_EQ(config.listeners[2].address, "0.0.0.0:8443");
  EXPECT_TRUE(config.listeners[2].isTls);
  EXPECT_EQ(config.listeners[2].tlsConfig.certFile(), "/etc/cert.pem");
  EXPECT_EQ(config.listeners[2].tlsConfig.keyFile(), "/etc/key.pem");
  EXPECT_EQ(config.listeners[3].address, "10.1.2.3:80");
  EXPECT_TRUE(config.listeners[3].optional);
  EXPECT_FALSE(config.listeners[0].optional);

  EXPECT_EQ(config.maxSize, uint64_t{2} << 30);
  EXPECT_EQ(config.chunkSize, 64U << 10);
  EXPECT_EQ(config.accessLogPath, "-");
  EXPECT_EQ(config.indexTemplateFile, "/tmp/index.html");
  EXPECT_EQ(config.indexSizes, (std::vector<std::string>{"1MB", "5GiB"}));
  EXPECT_EQ(config.nbThreadsPerListener, 4U);
  EXPECT_TRUE(config.trustForwardedHeaders);
  EXPECT_EQ(options.logLevel, "debug");
  EXPECT_EQ(config.drainTimeout, std::chrono::milliseconds{1500});
}

TEST(CommandLineTest, PlainByteCounts) {
  const auto options = Parse({"--max-size", "1000000", "--chunk-size", "1.5K"});

  EXPECT_EQ(options.config.maxSize, 1000000U);
  EXPECT_EQ(options.config.chunkSize, 1500U);
}

TEST(CommandLineTest, Errors) {
  EXPECT_THROW(Parse({"--bogus"}), std::invalid_argument);
  EXPECT_THROW(Parse({"--listen"}), std::invalid_argument);
  EXPECT_THROW(Parse({"--threads", "four"}), std::invalid_argument);
  EXPECT_THROW(Parse({"--threads", "0"}), std::invalid_argument);
  EXPECT_THROW(Parse({"--max-size", "huge"}), std::invalid_argument);
  EXPECT_THROW(Parse({"--chunk-size", "1GB"}), std::invalid_argument);
  EXPECT_THROW(Parse({"--log-level", "verbose"}), std::invalid_argument);
  EXPECT_THROW(Parse({"--listen-tls", "8443"}), std::invalid_argument);
  EXPECT_THROW(Parse({"--listen-tls", "8443", "--cert", "cert.pem"}), std::invalid_argument);
  EXPECT_THROW(Parse({"--cert", "cert.pem", "--key", "key.pem"}), std::invalid_argument);
  EXPECT_THROW(Parse({"--drain-timeout", "-5"}), std::invalid_argument);
}

TEST(CommandLineTest, OffLogLevel) { EXPECT_EQ(Parse({"--log-level", "off"}).logLevel, "off"); }

}  // namespace floodgate
