#include "crypto/keystream.hpp"
#include <openssl/evp.h>
#include <array>
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace dfp::crypto {

//=================================================
// RAII WRAPPER TO MANAGE CIPHER CONTEXT LIFECYCLE
//=================================================

struct CipherContext {
  EVP_CIPHER_CTX* ctx = nullptr;

  // Initialize new cipher context
  CipherContext() {
    ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
      throw InitializationError("Keystream: Failed to create cipher context");
    }
  }

  // Free cipher context when object is destroyed
  ~CipherContext() {
    if (ctx) {
      EVP_CIPHER_CTX_free(ctx);
    }
  }

  // Access the underlying context
  EVP_CIPHER_CTX* get() { return ctx; }
};

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CounterKeystream::CounterKeystream(const std::vector<uint8_t>& seed)
  : context_(std::make_unique<CipherContext>()) {
  if (seed.size() != SEED_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Keystream: Invalid seed size: " << seed.size() << " bytes (expected " << SEED_SIZE << " bytes)";
    throw InitializationError("Invalid keystream seed size");
  }

  // Counter block starts at zero and is incremented as a 128-bit big-endian integer
  std::array<uint8_t, COUNTER_SIZE> counter{};
  if (!EVP_EncryptInit_ex(context_->get(), EVP_aes_256_ctr(), nullptr, seed.data(), counter.data())) {
    throw InitializationError("Keystream: Failed to initialize AES-CTR context");
  }
  BOOST_LOG_TRIVIAL(trace) << "Keystream: Counter-mode keystream initialized";
}

CounterKeystream::~CounterKeystream() = default;

//==============================================
// KEYSTREAM OPERATIONS
//==============================================

std::vector<uint8_t> CounterKeystream::next(size_t n) {
  std::vector<uint8_t> zeros(n, 0);
  std::vector<uint8_t> out(n);
  if (n == 0) {
    return out;
  }

  int outlen = 0;
  if (!EVP_EncryptUpdate(context_->get(), out.data(), &outlen, zeros.data(), static_cast<int>(n))) {
    throw KeyDerivationError("Keystream: Failed to produce keystream bytes");
  }
  if (static_cast<size_t>(outlen) != n) {
    throw KeyDerivationError("Keystream: Short keystream output");
  }

  consumed_ += n;
  return out;
}

uint8_t CounterKeystream::next_byte() {
  return next(1)[0];
}

} // namespace dfp::crypto
