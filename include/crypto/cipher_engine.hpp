#ifndef DFP_CRYPTO_CIPHER_ENGINE_HPP
#define DFP_CRYPTO_CIPHER_ENGINE_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>
#include "crypto_error.hpp"
#include "keypair.hpp"

namespace dfp::crypto {

using Bytes = std::vector<uint8_t>;

// Opt-in store of derived keypairs keyed by (passphrase, salt). Parallel
// workers that are handed a cache share one immutable keypair instead of
// deriving their own.
class KeypairCache {
public:
  // Returns the cached keypair, deriving it on first use
  std::shared_ptr<const Keypair> get(const std::string& passphrase, const std::string& salt);
  size_t size() const;

private:
  mutable std::mutex mutex_;
  std::map<std::pair<std::string, std::string>, std::shared_ptr<const Keypair>> entries_;
};

class CipherEngine {
public:
  static constexpr size_t PLAINTEXT_SEGMENT_SIZE = 190;   // 256 - 2 * SHA-256 length - 2
  static constexpr size_t CIPHERTEXT_SEGMENT_SIZE = 256;  // 2048-bit modulus
  static constexpr const char* DEFAULT_SALT = "dfp#2025";

  // ---- CONSTRUCTORS ----
  // Derives the keypair for (passphrase, salt)
  explicit CipherEngine(const std::string& passphrase, const std::string& salt = DEFAULT_SALT);
  // Wraps an already derived keypair
  explicit CipherEngine(std::shared_ptr<const Keypair> keypair);


  // ---- SEGMENT OPERATIONS ----
  // Encrypts each 190-byte slice independently with RSA-OAEP (SHA-256)
  Bytes encrypt_segments(const Bytes& plaintext) const;
  // Decrypts each 256-byte slice; throws DecryptionError on any bad slice
  Bytes decrypt_segments(const Bytes& ciphertext) const;


  // ---- PARALLEL OPERATIONS ----
  // Splits data into `workers` near-equal byte ranges, encrypting each on an
  // independently constructed engine; output keeps partition order
  static Bytes parallel_encrypt(const Bytes& data, const std::string& passphrase,
                                const std::string& salt, size_t workers,
                                KeypairCache* cache = nullptr);
  // Splits ciphertext into `workers` ranges of whole segments
  static Bytes parallel_decrypt(const Bytes& ciphertext, const std::string& passphrase,
                                const std::string& salt, size_t workers,
                                KeypairCache* cache = nullptr);


  // ---- GETTERS ----
  const Keypair& keypair() const { return *keypair_; }
  // ceil(n / 190) * 256
  static size_t encrypted_size(size_t plaintext_size);

private:
  std::shared_ptr<const Keypair> keypair_;
};

// Number of hardware threads, never less than one
size_t host_parallelism();

} // namespace dfp::crypto

#endif // DFP_CRYPTO_CIPHER_ENGINE_HPP
