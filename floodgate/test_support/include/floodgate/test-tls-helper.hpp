#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace floodgate::test {

enum class KeyAlgorithm : uint8_t { Rsa2048, EcdsaP256 };

// Generates a self-signed certificate entirely in memory. Returns {certPem, keyPem}, both empty on failure.
std::pair<std::string, std::string> MakeEphemeralCertKey(const char* commonName = "localhost", int validSeconds = 3600,
                                                         KeyAlgorithm alg = KeyAlgorithm::EcdsaP256);

}  // namespace floodgate::test
