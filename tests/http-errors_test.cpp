#include <gtest/gtest.h>

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>

#include "floodgate/http-constants.hpp"
#include "floodgate/http-status-code.hpp"
#include "floodgate/server-config.hpp"
#include "floodgate/test-server.hpp"
#include "floodgate/test-util.hpp"

namespace floodgate {

using namespace std::chrono_literals;

class HttpErrorsTest : public ::testing::Test {
 protected:
  test::TestServer ts{ServerConfig{}};
};

TEST_F(HttpErrorsTest, RoutingErrors) {
  struct Case {
    std::string_view method;
    std::string_view target;
    http::StatusCode status;
    std::string_view body;
  };
  const Case cases[] = {
      {"GET", "/abc", http::StatusCodeNotFound, "Not Found\n"},
      {"GET", "/abc.bin", http::StatusCodeNotFound, "Not Found\n"},
      {"GET", "/files/10MB.bin", http::StatusCodeNotFound, "Not Found\n"},
      {"GET", "/10MB.bin/extra", http::StatusCodeNotFound, "Not Found\n"},
      {"GET", "/1MB.bin/", http::StatusCodeNotFound, "Not Found\n"},
      {"GET", "/10XB.bin", http::StatusCodeBadRequest, ""},
      {"GET", "/10MB", http::StatusCodeBadRequest, ""},
      {"GET", "/0MB.bin", http::StatusCodeBadRequest, "Requested size must be greater than zero\n"},
      {"GET", "/11GB.bin", http::StatusCodePayloadTooLarge,
       "Requested size exceeds the maximum of 10737418240 bytes\n"},
  };
  for (const auto& [method, target, status, body] : cases) {
    SCOPED_TRACE(target);
    const auto resp = test::request(ts.port(), method, target);
    EXPECT_EQ(resp.statusCode, status);
    EXPECT_EQ(resp.header(http::ContentType), http::ContentTypeTextPlain);
    EXPECT_EQ(resp.header(http::ContentLength), std::to_string(resp.body.size()));
    if (body.empty()) {
      EXPECT_TRUE(resp.body.starts_with("Malformed size: ")) << resp.body;
    } else {
      EXPECT_EQ(resp.body, body);
    }
  }

  ASSERT_TRUE(ts.sink->waitFor(std::size(cases)));
  for (const auto& record : ts.sink->records()) {
    EXPECT_TRUE(record.completed);
    EXPECT_EQ(record.requestedBytes, 0U);
    EXPECT_EQ(record.bytesWritten, record.contentLength);
  }
  EXPECT_EQ(ts.server.stats().total.randomBytesGenerated, 0U);
}

TEST_F(HttpErrorsTest, MethodNotAllowed) {
  for (std::string_view method : {"POST", "PUT", "DELETE", "OPTIONS"}) {
    SCOPED_TRACE(method);
    const auto resp = test::request(ts.port(), method, "/1MB.bin");
    EXPECT_EQ(resp.statusCode, http::StatusCodeMethodNotAllowed);
    EXPECT_EQ(resp.header(http::Allow), "GET, HEAD");
    EXPECT_FALSE(resp.body.empty());
  }
}

TEST_F(HttpErrorsTest, HeadErrorHasNoBody) {
  const std::string raw = test::sendAndCollect(ts.port(), test::buildRequest("HEAD", "/nothing-here"));
  const auto resp = test::parseResponseOrThrow(raw, true);
  EXPECT_EQ(resp.statusCode, http::StatusCodeNotFound);
  EXPECT_EQ(resp.header(http::ContentLength), "10");
  EXPECT_TRUE(test::noBodyAfterHead(raw));
}

TEST_F(HttpErrorsTest, RequestWithBodyClosesConnection) {
  test::ClientConnection cnx(ts.port());
  ASSERT_TRUE(test::sendAll(cnx.fd(), "POST /1MB.bin HTTP/1.1\r\nHost: x\r\nContent-Length: 5\r\n\r\nhello"));
  const auto resp = test::parseResponseOrThrow(test::recvUntilClosed(cnx.fd()));
  EXPECT_EQ(resp.statusCode, http::StatusCodeMethodNotAllowed);
  EXPECT_EQ(resp.header(http::Connection), "close");
}

TEST_F(HttpErrorsTest, MalformedRequests) {
  struct Case {
    std::string_view raw;
    http::StatusCode status;
  };
  const Case cases[] = {
      {"GARBAGE\r\n\r\n", http::StatusCodeBadRequest},
      {"GET 10MB.bin HTTP/1.1\r\n\r\n", http::StatusCodeBadRequest},
      {"GET /10MB.bin HTTP/1.1\r\nNo colon here\r\n\r\n", http::StatusCodeBadRequest},
      {"GET /10MB.bin HTTP/2.0\r\n\r\n", http::StatusCodeHTTPVersionNotSupported},
  };
  for (const auto& [raw, status] : cases) {
    SCOPED_TRACE(raw);
    const auto resp = test::parseResponseOrThrow(test::sendAndCollect(ts.port(), raw));
    EXPECT_EQ(resp.statusCode, status);
    EXPECT_EQ(resp.header(http::Connection), "close");
  }
  ASSERT_TRUE(ts.sink->waitFor(std::size(cases)));
  EXPECT_EQ(ts.server.stats().total.requestsServed, std::size(cases));
}

TEST(HttpErrorsConfigTest, HeadersTooLarge) {
  test::TestServer ts(ServerConfig{}.withMaxHeaderBytes(1024));
  const std::string bigHeader(2048, 'a');
  const std::string raw = test::sendAndCollect(
      ts.port(), test::buildRequest("GET", "/1MB.bin", "close", {{"X-Big", bigHeader}}));
  const auto resp = test::parseResponseOrThrow(raw);
  EXPECT_EQ(resp.statusCode, http::StatusCodeRequestHeaderFieldsTooLarge);
}

TEST(HttpErrorsConfigTest, HeaderReadTimeout) {
  test::TestServer ts(ServerConfig{}.withHeaderReadTimeout(100ms));
  test::ClientConnection cnx(ts.port());
  ASSERT_TRUE(test::sendAll(cnx.fd(), "GET /1MB.bin HTTP/1.1\r\nHost: x\r\n"));
  const auto resp = test::parseResponseOrThrow(test::recvUntilClosed(cnx.fd(), 3s));
  EXPECT_EQ(resp.statusCode, http::StatusCodeRequestTimeout);
  EXPECT_EQ(resp.header(http::Connection), "close");

  ASSERT_TRUE(ts.sink->waitFor(1));
  EXPECT_EQ(ts.sink->records().front().status, 408);
}

TEST(HttpErrorsConfigTest, IdleConnectionIsClosed) {
  test::TestServer ts(ServerConfig{}.withKeepAliveTimeout(100ms));
  test::ClientConnection cnx(ts.port());
  EXPECT_TRUE(test::WaitForPeerClose(cnx.fd(), 3s));
  // Nothing was requested, nothing is recorded.
  EXPECT_EQ(ts.sink->size(), 0U);
}

}  // namespace floodgate
