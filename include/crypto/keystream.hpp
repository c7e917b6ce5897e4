#ifndef DFP_CRYPTO_KEYSTREAM_HPP
#define DFP_CRYPTO_KEYSTREAM_HPP

#include <cstdint>
#include <memory>
#include <vector>
#include "crypto_error.hpp"

namespace dfp::crypto {

// Forward declaration for OpenSSL cipher context
struct CipherContext;

// Deterministic byte generator: AES-256 in counter mode over a stream of
// zero bytes. The 128-bit counter starts at 0 and the stream is continuous
// across calls, so two generators built from the same seed always hand out
// the same bytes in the same order.
class CounterKeystream {
public:
  static constexpr size_t SEED_SIZE = 32;    // 256 bits for AES-256
  static constexpr size_t COUNTER_SIZE = 16; // 128-bit counter block

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit CounterKeystream(const std::vector<uint8_t>& seed);
  ~CounterKeystream();

  CounterKeystream(const CounterKeystream&) = delete;
  CounterKeystream& operator=(const CounterKeystream&) = delete;


  // ---- KEYSTREAM OPERATIONS ----
  // Returns the next n bytes of keystream
  std::vector<uint8_t> next(size_t n);
  // Returns the next single byte of keystream
  uint8_t next_byte();

  // Total number of bytes handed out so far
  uint64_t consumed() const { return consumed_; }

private:
  // ---- PARAMETERS ----
  std::unique_ptr<CipherContext> context_;
  uint64_t consumed_ = 0;
};

} // namespace dfp::crypto

#endif // DFP_CRYPTO_KEYSTREAM_HPP
