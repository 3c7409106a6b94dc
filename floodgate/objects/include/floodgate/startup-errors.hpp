#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace floodgate {

// A listener could not be bound (address in use, permission denied, unresolvable host...).
class ListenerBindFailure : public std::system_error {
 public:
  ListenerBindFailure(std::error_code ec, std::string_view address);

  [[nodiscard]] const std::string& address() const noexcept { return _address; }

 private:
  std::string _address;
};

// The certificate or the private key of a TLS listener could not be loaded, or they do not match.
class TlsCredentialFailure : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

}  // namespace floodgate
