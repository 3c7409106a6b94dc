#include "floodgate/client-address.hpp"

#include <gtest/gtest.h>

#include <string>
#include <string_view>

#include "floodgate/http-request.hpp"

namespace floodgate {

namespace {

class ClientAddressTest : public ::testing::Test {
 protected:
  std::string_view resolve(std::string_view headers, bool trust = true) {
    raw = "GET / HTTP/1.1\r\n" + std::string(headers) + "\r\n";
    EXPECT_EQ(req.parse(raw, 8192).status, HttpRequest::ParseStatus::Ok);
    return ResolveClientAddress(req, "10.0.0.1", trust);
  }

  std::string raw;
  HttpRequest req;
};

}  // namespace

TEST_F(ClientAddressTest, PeerWhenNotTrusted) {
  EXPECT_EQ(resolve("X-Forwarded-For: 203.0.113.7\r\n", false), "10.0.0.1");
}

TEST_F(ClientAddressTest, PeerWithoutHeaders) { EXPECT_EQ(resolve(""), "10.0.0.1"); }

TEST_F(ClientAddressTest, XForwardedForFirstEntry) {
  EXPECT_EQ(resolve("X-Forwarded-For: 203.0.113.7, 198.51.100.2\r\n"), "203.0.113.7");
  EXPECT_EQ(resolve("x-forwarded-for:2001:db8::1\r\n"), "2001:db8::1");
}

TEST_F(ClientAddressTest, XRealIp) {
  EXPECT_EQ(resolve("X-Real-IP: 198.51.100.9\r\n"), "198.51.100.9");
  EXPECT_EQ(resolve("X-Real-IP: 198.51.100.9\r\nX-Forwarded-For: 203.0.113.7\r\n"), "203.0.113.7");
}

TEST_F(ClientAddressTest, Forwarded) {
  EXPECT_EQ(resolve("Forwarded: for=192.0.2.60;proto=http;by=203.0.113.43\r\n"), "192.0.2.60");
  EXPECT_EQ(resolve("Forwarded: proto=https; For=\"[2001:db8:cafe::17]:4711\"\r\n"), "2001:db8:cafe::17");
  EXPECT_EQ(resolve("Forwarded: for=\"192.0.2.43:47011\", for=198.51.100.17\r\n"), "192.0.2.43");
  EXPECT_EQ(resolve("Forwarded: proto=https\r\n"), "10.0.0.1");
}

TEST_F(ClientAddressTest, EmptyHeadersFallBack) { EXPECT_EQ(resolve("X-Forwarded-For: \r\nX-Real-IP:\r\n"), "10.0.0.1"); }

}  // namespace floodgate
