#pragma once

#include <string_view>

#include "floodgate/http-request.hpp"

namespace floodgate {

// Address of the client to record in the access log.
// When trustForwardedHeaders is set, proxies' headers take precedence over the socket peer, in this order:
//   X-Forwarded-For (first, i.e. original client, entry), X-Real-IP, Forwarded (first "for=" parameter).
// Returned view points either into the request or into peerAddress.
[[nodiscard]] std::string_view ResolveClientAddress(const HttpRequest& request, std::string_view peerAddress,
                                                    bool trustForwardedHeaders) noexcept;

}  // namespace floodgate
