#include "floodgate/test-tls-helper.hpp"

#include <openssl/asn1.h>
#include <openssl/bio.h>
#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>

#include <cstddef>
#include <memory>
#include <string>
#include <utility>

#include "floodgate/tls-raii.hpp"

namespace floodgate::test {

namespace {

PKeyPtr GenerateKey(KeyAlgorithm alg) {
  const bool rsa = alg == KeyAlgorithm::Rsa2048;
  PKeyCtxPtr kctx(::EVP_PKEY_CTX_new_from_name(nullptr, rsa ? "RSA" : "EC", nullptr), ::EVP_PKEY_CTX_free);
  if (kctx == nullptr || ::EVP_PKEY_keygen_init(kctx.get()) != 1) {
    return {nullptr, ::EVP_PKEY_free};
  }
  const int paramRet = rsa ? ::EVP_PKEY_CTX_set_rsa_keygen_bits(kctx.get(), 2048)
                           : ::EVP_PKEY_CTX_set_ec_paramgen_curve_nid(kctx.get(), NID_X9_62_prime256v1);
  EVP_PKEY* pkey = nullptr;
  if (paramRet != 1 || ::EVP_PKEY_keygen(kctx.get(), &pkey) != 1) {
    return {nullptr, ::EVP_PKEY_free};
  }
  return {pkey, ::EVP_PKEY_free};
}

}  // namespace

std::pair<std::string, std::string> MakeEphemeralCertKey(const char* commonName, int validSeconds, KeyAlgorithm alg) {
  auto pkey = GenerateKey(alg);
  if (!pkey) {
    return {};
  }

  X509Ptr x509Ptr(::X509_new(), ::X509_free);
  X509* x509 = x509Ptr.get();
  if (x509 == nullptr) {
    return {};
  }
  ::ASN1_INTEGER_set(::X509_get_serialNumber(x509), 1);
  ::X509_gmtime_adj(::X509_get_notBefore(x509), 0);
  ::X509_gmtime_adj(::X509_get_notAfter(x509), validSeconds);
  ::X509_set_pubkey(x509, pkey.get());
  X509_NAME* name = ::X509_get_subject_name(x509);
  ::X509_NAME_add_entry_by_txt(name, "O", MBSTRING_ASC, reinterpret_cast<const unsigned char*>("FloodgateTest"), -1,
                               -1, 0);
  ::X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC, reinterpret_cast<const unsigned char*>(commonName), -1, -1,
                               0);
  ::X509_set_issuer_name(x509, name);
  if (::X509_sign(x509, pkey.get(), ::EVP_sha256()) <= 0) {
    return {};
  }

  auto certBio = MakePemWriteBio();
  auto keyBio = MakePemWriteBio();
  if (::PEM_write_bio_X509(certBio.get(), x509) != 1 ||
      ::PEM_write_bio_PrivateKey(keyBio.get(), pkey.get(), nullptr, nullptr, 0, nullptr, nullptr) != 1) {
    return {};
  }
  return {PemBioContent(certBio.get()), PemBioContent(keyBio.get())};
}

}  // namespace floodgate::test
