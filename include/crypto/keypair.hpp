#ifndef DFP_CRYPTO_KEYPAIR_HPP
#define DFP_CRYPTO_KEYPAIR_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <openssl/evp.h>
#include "crypto_error.hpp"

namespace dfp::crypto {

// Shared, immutable handle on an RSA keypair held by OpenSSL
class Keypair {
public:
  static constexpr int MODULUS_BITS = 2048;
  static constexpr unsigned long PUBLIC_EXPONENT = 65537;

  // ---- CONSTRUCTOR ----
  // Takes ownership of pkey
  explicit Keypair(EVP_PKEY* pkey);


  // ---- GETTERS ----
  EVP_PKEY* get() const { return pkey_.get(); }
  // Big-endian modulus bytes
  std::vector<uint8_t> modulus() const;
  // PEM encoded SubjectPublicKeyInfo
  std::string public_pem() const;

private:
  std::shared_ptr<EVP_PKEY> pkey_;
};


// ---- KEY DERIVATION ----
inline constexpr int PBKDF2_ITERATIONS = 100000;
inline constexpr size_t DERIVED_KEY_SIZE = 32;

// PBKDF2-HMAC-SHA256(passphrase, salt), 100000 iterations, 32 bytes
std::vector<uint8_t> derive_seed(const std::string& passphrase, const std::string& salt);

// Derives the 2048-bit RSA keypair for (passphrase, salt). The seed drives a
// counter-mode keystream that is the only source of randomness for the prime
// search, so the result is bit-identical for identical inputs.
Keypair derive_keypair(const std::string& passphrase, const std::string& salt);

} // namespace dfp::crypto

#endif // DFP_CRYPTO_KEYPAIR_HPP
