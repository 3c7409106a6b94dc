#include "floodgate/tls-config.hpp"

#include <stdexcept>
#include <string_view>

#include "floodgate/log.hpp"

namespace floodgate {

namespace {

void ValidateVersionBound(std::string_view bound, std::string_view which) {
  if (bound.empty() || bound == TLSConfig::kTls12 || bound == TLSConfig::kTls13) {
    return;
  }
  log::critical("Unsupported tls {} '{}', allowed: TLS1.2, TLS1.3", which, bound);
  throw std::invalid_argument("Unsupported tls version bound");
}

}  // namespace

void TLSConfig::validate() const {
  // We require a cert and a key supplied (either file or in-memory PEM)
  const bool hasCert = !_certFile.empty() || !_certPem.empty();
  const bool hasKey = !_keyFile.empty() || !_keyPem.empty();
  if (!hasCert) {
    throw std::invalid_argument("TLS configured: certificate missing");
  }
  if (!hasKey) {
    throw std::invalid_argument("TLS configured: private key missing");
  }
  ValidateVersionBound(_minVersion, "minVersion");
  ValidateVersionBound(_maxVersion, "maxVersion");
  if (_minVersion == kTls13 && _maxVersion == kTls12) {
    throw std::invalid_argument("tls minVersion is greater than maxVersion");
  }
  if (handshakeTimeout.count() < 0) {
    throw std::invalid_argument("TLS handshake timeout must be non-negative");
  }
}

}  // namespace floodgate
