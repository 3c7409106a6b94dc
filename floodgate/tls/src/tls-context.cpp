#include "floodgate/tls-context.hpp"

#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/ssl.h>
#include <openssl/tls1.h>
#include <openssl/x509.h>

#include <new>
#include <stdexcept>
#include <string>
#include <string_view>

#include "floodgate/log.hpp"
#include "floodgate/startup-errors.hpp"
#include "floodgate/tls-config.hpp"
#include "floodgate/tls-raii.hpp"

namespace floodgate {

namespace {

// Pops the OpenSSL error queue into a readable suffix.
std::string OpenSslErrors() {
  std::string ret;
  for (auto errVal = ::ERR_get_error(); errVal != 0; errVal = ::ERR_get_error()) {
    char errBuf[256];
    ::ERR_error_string_n(errVal, errBuf, sizeof(errBuf));
    ret.append(ret.empty() ? ": " : "; ");
    ret.append(errBuf);
  }
  return ret;
}

int ParseTlsVersion(std::string_view ver) {
  if (ver == TLSConfig::kTls12) {
    return TLS1_2_VERSION;
  }
  if (ver == TLSConfig::kTls13) {
    return TLS1_3_VERSION;
  }
  return 0;
}

void LoadCertificateAndKey(SSL_CTX* ctx, const TLSConfig& cfg) {
  if (cfg.hasPem()) {
    const auto& certPem = cfg.certPem();
    const auto& keyPem = cfg.keyPem();
    auto certX509 = ReadPemCertificate(certPem);
    if (!certX509) {
      throw TlsCredentialFailure("Unable to parse in-memory certificate" + OpenSslErrors());
    }
    auto pkey = ReadPemPrivateKey(keyPem);
    if (!pkey) {
      throw TlsCredentialFailure("Unable to parse in-memory private key" + OpenSslErrors());
    }
    if (::SSL_CTX_use_certificate(ctx, certX509.get()) != 1) {
      throw TlsCredentialFailure("Failed to use in-memory certificate" + OpenSslErrors());
    }
    if (::SSL_CTX_use_PrivateKey(ctx, pkey.get()) != 1) {
      throw TlsCredentialFailure("Failed to use in-memory private key" + OpenSslErrors());
    }
  } else {
    if (cfg.certFile().empty() || cfg.keyFile().empty()) {
      throw TlsCredentialFailure("Certificate or key file path missing");
    }
    // Full chain, so that intermediate certificates are sent as well.
    if (::SSL_CTX_use_certificate_chain_file(ctx, cfg.certFile().c_str()) != 1) {
      throw TlsCredentialFailure("Failed to load certificate " + cfg.certFile() + OpenSslErrors());
    }
    if (::SSL_CTX_use_PrivateKey_file(ctx, cfg.keyFile().c_str(), SSL_FILETYPE_PEM) != 1) {
      throw TlsCredentialFailure("Failed to load private key " + cfg.keyFile() + OpenSslErrors());
    }
  }

  if (::SSL_CTX_check_private_key(ctx) != 1) {
    throw TlsCredentialFailure("Private key does not match the certificate" + OpenSslErrors());
  }
}

void ConfigureContextOptions(SSL_CTX* ctx, const TLSConfig& cfg) {
  // Random payloads are incompressible. Compression would only burn CPU (and opens CRIME style attacks).
  ::SSL_CTX_set_options(ctx, SSL_OP_NO_COMPRESSION);
  ::SSL_CTX_set_mode(ctx, SSL_MODE_ENABLE_PARTIAL_WRITE | SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);
  if (!cfg.cipherList().empty() && ::SSL_CTX_set_cipher_list(ctx, cfg.cipherList().c_str()) != 1) {
    throw std::runtime_error("Failed to set cipher list" + OpenSslErrors());
  }
}

void ConfigureProtocolBounds(SSL_CTX* ctx, const TLSConfig& cfg) {
  if (!cfg.minVersion().empty()) {
    const int mv = ParseTlsVersion(cfg.minVersion());
    if (mv == 0 || ::SSL_CTX_set_min_proto_version(ctx, mv) != 1) {
      throw std::runtime_error("Failed to set minimum TLS version");
    }
  }
  if (!cfg.maxVersion().empty()) {
    const int Mv = ParseTlsVersion(cfg.maxVersion());
    if (Mv == 0 || ::SSL_CTX_set_max_proto_version(ctx, Mv) != 1) {
      throw std::runtime_error("Failed to set maximum TLS version");
    }
  }
}

}  // namespace

TlsContext::TlsContext(const TLSConfig& cfg) : _ctx(::SSL_CTX_new(TLS_server_method()), ::SSL_CTX_free) {
  if (!_ctx) {
    throw std::bad_alloc();
  }
  auto* ctx = _ctx.get();
  ConfigureContextOptions(ctx, cfg);
  ConfigureProtocolBounds(ctx, cfg);
  LoadCertificateAndKey(ctx, cfg);
  log::debug("TLS context ready (min={}, max={}, ciphers={})", cfg.minVersion().empty() ? "default" : cfg.minVersion(),
             cfg.maxVersion().empty() ? "default" : cfg.maxVersion(),
             cfg.cipherList().empty() ? "default" : cfg.cipherList());
}

SslPtr TlsContext::makeSsl(int fd) const {
  SslPtr ssl(::SSL_new(_ctx.get()), ::SSL_free);
  if (!ssl) {
    log::error("SSL_new failed for fd # {}{}", fd, OpenSslErrors());
    return {nullptr, ::SSL_free};
  }
  if (::SSL_set_fd(ssl.get(), fd) != 1) {
    log::error("SSL_set_fd failed for fd # {}{}", fd, OpenSslErrors());
    return {nullptr, ::SSL_free};
  }
  ::SSL_set_accept_state(ssl.get());
  return ssl;
}

}  // namespace floodgate
