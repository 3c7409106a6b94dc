#pragma once

#include <chrono>
#include <string>
#include <string_view>

namespace floodgate {

class TLSConfig {
 public:
  static constexpr std::string_view kTls12 = "TLS1.2";
  static constexpr std::string_view kTls13 = "TLS1.3";

  // Throws std::invalid_argument if the certificate or the key is missing, or if a protocol bound is not one of
  // "TLS1.2" / "TLS1.3".
  void validate() const;

  // PEM server certificate file (may contain chain)
  [[nodiscard]] const std::string& certFile() const noexcept { return _certFile; }

  // PEM private key file
  [[nodiscard]] const std::string& keyFile() const noexcept { return _keyFile; }

  // In-memory PEM certificate (used when both PEM strings are set, otherwise files are used)
  [[nodiscard]] const std::string& certPem() const noexcept { return _certPem; }

  // In-memory PEM private key
  [[nodiscard]] const std::string& keyPem() const noexcept { return _keyPem; }

  // Optional OpenSSL cipher list string (empty -> OpenSSL default)
  [[nodiscard]] const std::string& cipherList() const noexcept { return _cipherList; }

  // Empty means no bound.
  [[nodiscard]] const std::string& minVersion() const noexcept { return _minVersion; }
  [[nodiscard]] const std::string& maxVersion() const noexcept { return _maxVersion; }

  [[nodiscard]] bool hasPem() const noexcept { return !_certPem.empty() && !_keyPem.empty(); }

  TLSConfig& withCertFile(std::string_view certFile) {
    _certFile = certFile;
    return *this;
  }

  TLSConfig& withKeyFile(std::string_view keyFile) {
    _keyFile = keyFile;
    return *this;
  }

  TLSConfig& withCertPem(std::string_view certPem) {
    _certPem = certPem;
    return *this;
  }

  TLSConfig& withKeyPem(std::string_view keyPem) {
    _keyPem = keyPem;
    return *this;
  }

  TLSConfig& withCipherList(std::string_view cipherList) {
    _cipherList = cipherList;
    return *this;
  }

  TLSConfig& withTlsMinVersion(std::string_view ver) {
    _minVersion = ver;
    return *this;
  }

  TLSConfig& withTlsMaxVersion(std::string_view ver) {
    _maxVersion = ver;
    return *this;
  }

  TLSConfig& withTlsHandshakeTimeout(std::chrono::milliseconds timeout) {
    handshakeTimeout = timeout;
    return *this;
  }

  bool operator==(const TLSConfig&) const noexcept = default;

  // Maximum duration allowed for a TLS handshake to complete, measured from accept. 0 disables the check.
  std::chrono::milliseconds handshakeTimeout{std::chrono::seconds{10}};

 private:
  std::string _certFile;
  std::string _keyFile;
  std::string _certPem;
  std::string _keyPem;
  std::string _cipherList;
  std::string _minVersion;
  std::string _maxVersion;
};

}  // namespace floodgate
