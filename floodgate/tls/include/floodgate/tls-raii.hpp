#pragma once

#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

#include <cstddef>
#include <memory>
#include <new>
#include <string>
#include <string_view>

namespace floodgate {

// Owning handles of the OpenSSL objects floodgate creates. Function pointer deleters keep them one pointer wide.
using SslCtxPtr = std::unique_ptr<SSL_CTX, decltype(&::SSL_CTX_free)>;
using SslPtr = std::unique_ptr<SSL, decltype(&::SSL_free)>;
using BioPtr = std::unique_ptr<BIO, decltype(&::BIO_free)>;
using X509Ptr = std::unique_ptr<X509, decltype(&::X509_free)>;
using PKeyPtr = std::unique_ptr<EVP_PKEY, decltype(&::EVP_PKEY_free)>;
using PKeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, decltype(&::EVP_PKEY_CTX_free)>;

// Read only memory BIO over 'pem'. 'pem' must outlive the returned BIO.
inline BioPtr MakePemReadBio(std::string_view pem) {
  BIO* bio = ::BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size()));
  if (bio == nullptr) {
    throw std::bad_alloc();
  }
  return {bio, ::BIO_free};
}

// Growable memory BIO to serialize PEM objects into. Read back with PemBioContent.
inline BioPtr MakePemWriteBio() {
  BIO* bio = ::BIO_new(::BIO_s_mem());
  if (bio == nullptr) {
    throw std::bad_alloc();
  }
  return {bio, ::BIO_free};
}

inline std::string PemBioContent(BIO* bio) {
  char* data = nullptr;
  const long len = BIO_get_mem_data(bio, &data);
  if (len <= 0) {
    return {};
  }
  return {data, static_cast<std::size_t>(len)};
}

// First certificate of 'pem', null if there is none or if it cannot be parsed.
inline X509Ptr ReadPemCertificate(std::string_view pem) {
  auto bio = MakePemReadBio(pem);
  return {::PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr), ::X509_free};
}

// Unencrypted private key of 'pem', null if it cannot be parsed.
inline PKeyPtr ReadPemPrivateKey(std::string_view pem) {
  auto bio = MakePemReadBio(pem);
  return {::PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr), ::EVP_PKEY_free};
}

}  // namespace floodgate
