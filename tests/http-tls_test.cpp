#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <utility>

#include "floodgate/http-constants.hpp"
#include "floodgate/http-status-code.hpp"
#include "floodgate/multi-server.hpp"
#include "floodgate/server-config.hpp"
#include "floodgate/startup-errors.hpp"
#include "floodgate/test-server.hpp"
#include "floodgate/test-temp-file.hpp"
#include "floodgate/test-tls-client.hpp"
#include "floodgate/test-tls-helper.hpp"
#include "floodgate/test-util.hpp"
#include "floodgate/tls-config.hpp"

namespace floodgate {

using namespace std::chrono_literals;

namespace {

TLSConfig EphemeralTlsConfig() {
  auto [certPem, keyPem] = test::MakeEphemeralCertKey();
  return TLSConfig{}.withCertPem(certPem).withKeyPem(keyPem);
}

}  // namespace

TEST(HttpTlsTest, StreamsOverTls) {
  test::TestServer ts(ServerConfig{}.withTlsListener("127.0.0.1:0", EphemeralTlsConfig()));
  ASSERT_TRUE(ts.server.listeners().front().isTls);

  test::TlsClient client(ts.port());
  ASSERT_TRUE(client.handshakeOk());
  const auto resp = test::parseResponseOrThrow(client.request("GET", "/3MiB.bin"));
  EXPECT_EQ(resp.statusCode, http::StatusCodeOK);
  EXPECT_EQ(resp.header(http::ContentLength), "3145728");
  EXPECT_EQ(resp.body.size(), 3145728U);

  ASSERT_TRUE(ts.sink->waitFor(1));
  const auto record = ts.sink->records().front();
  EXPECT_TRUE(record.completed);
  EXPECT_EQ(record.bytesWritten, 3145728U);
}

TEST(HttpTlsTest, HeadAndErrorsOverTls) {
  test::TestServer ts(ServerConfig{}.withTlsListener("127.0.0.1:0", EphemeralTlsConfig()));
  {
    test::TlsClient client(ts.port());
    ASSERT_TRUE(client.handshakeOk());
    const auto resp = test::parseResponseOrThrow(client.request("HEAD", "/1GB.bin"), true);
    EXPECT_EQ(resp.statusCode, http::StatusCodeOK);
    EXPECT_EQ(resp.header(http::ContentLength), "1000000000");
  }
  {
    test::TlsClient client(ts.port());
    ASSERT_TRUE(client.handshakeOk());
    const auto resp = test::parseResponseOrThrow(client.request("GET", "/12XB.bin"));
    EXPECT_EQ(resp.statusCode, http::StatusCodeBadRequest);
  }
  EXPECT_EQ(ts.server.stats().total.randomBytesGenerated, 0U);
}

TEST(HttpTlsTest, VersionBounds) {
  test::TestServer ts(ServerConfig{}.withTlsListener(
      "127.0.0.1:0", EphemeralTlsConfig().withTlsMinVersion(TLSConfig::kTls13).withTlsMaxVersion(TLSConfig::kTls13)));
  test::TlsClient client(ts.port());
  ASSERT_TRUE(client.handshakeOk());
  EXPECT_EQ(client.version(), "TLSv1.3");
}

TEST(HttpTlsTest, CredentialsFromFiles) {
  auto [certPem, keyPem] = test::MakeEphemeralCertKey();
  test::ScopedTempFile certFile(certPem);
  test::ScopedTempFile keyFile(keyPem);
  test::TestServer ts(ServerConfig{}.withTlsListener(
      "127.0.0.1:0", TLSConfig{}.withCertFile(certFile.path()).withKeyFile(keyFile.path())));
  test::TlsClient client(ts.port());
  ASSERT_TRUE(client.handshakeOk());
  EXPECT_EQ(test::parseResponseOrThrow(client.request("GET", "/10B.bin")).body.size(), 10U);
}

TEST(HttpTlsTest, InvalidCredentialsFailAtStartup) {
  EXPECT_THROW(MultiServer(ServerConfig{}.withTlsListener(
                   "127.0.0.1:0", TLSConfig{}.withCertPem("not a certificate").withKeyPem("not a key"))),
               TlsCredentialFailure);
  EXPECT_THROW(MultiServer(ServerConfig{}.withTlsListener(
                   "127.0.0.1:0", TLSConfig{}.withCertFile("/nonexistent/cert.pem").withKeyFile("/nonexistent/key.pem"))),
               TlsCredentialFailure);

  // Certificate and key of two different pairs.
  auto first = test::MakeEphemeralCertKey();
  auto second = test::MakeEphemeralCertKey();
  EXPECT_THROW(MultiServer(ServerConfig{}.withTlsListener(
                   "127.0.0.1:0", TLSConfig{}.withCertPem(first.first).withKeyPem(second.second))),
               TlsCredentialFailure);

  // Credential errors are fatal even for optional listeners.
  ListenerConfig optionalTls{"127.0.0.1:0", true, TLSConfig{}.withCertPem("bad").withKeyPem("bad"), true};
  EXPECT_THROW(MultiServer(ServerConfig{}.withListener("127.0.0.1:0").withListener(std::move(optionalTls))),
               TlsCredentialFailure);
}

TEST(HttpTlsTest, PlainTextClientOnTlsListener) {
  test::TestServer ts(ServerConfig{}.withTlsListener("127.0.0.1:0", EphemeralTlsConfig()));
  const std::string raw = test::sendAndCollect(ts.port(), test::buildRequest("GET", "/10B.bin"));
  EXPECT_EQ(raw.find("HTTP/1.1 200"), std::string::npos);
  EXPECT_EQ(ts.server.stats().total.requestsServed, 0U);

  // The listener is still serving TLS clients.
  test::TlsClient client(ts.port());
  EXPECT_TRUE(client.handshakeOk());
}

TEST(HttpTlsTest, HandshakeTimeout) {
  test::TestServer ts(ServerConfig{}.withTlsListener("127.0.0.1:0",
                                                     EphemeralTlsConfig().withTlsHandshakeTimeout(100ms)));
  test::ClientConnection silent(ts.port());
  EXPECT_TRUE(test::WaitForPeerClose(silent.fd(), 3s));
  EXPECT_EQ(ts.sink->size(), 0U);
}

TEST(HttpTlsTest, MixedPlainAndTlsListeners) {
  test::TestServer ts(
      ServerConfig{}.withListener("127.0.0.1:0").withTlsListener("127.0.0.1:0", EphemeralTlsConfig()));
  const auto& listeners = ts.server.listeners();
  ASSERT_EQ(listeners.size(), 2U);
  EXPECT_FALSE(listeners[0].isTls);
  EXPECT_TRUE(listeners[1].isTls);
  EXPECT_NE(listeners[0].port, listeners[1].port);

  const auto plain = test::request(listeners[0].port, "GET", "/1KB.bin");
  EXPECT_EQ(plain.body.size(), 1000U);

  test::TlsClient client(listeners[1].port);
  ASSERT_TRUE(client.handshakeOk());
  EXPECT_EQ(test::parseResponseOrThrow(client.request("GET", "/2KB.bin")).body.size(), 2000U);

  ASSERT_TRUE(ts.sink->waitFor(2));
  EXPECT_EQ(ts.server.stats().total.connectionsAccepted, 2U);
}

}  // namespace floodgate
