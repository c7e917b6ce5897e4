#ifndef DFP_CLIENT_CHUNKER_HPP
#define DFP_CLIENT_CHUNKER_HPP

#include <cstdint>
#include <filesystem>
#include <random>
#include <string>
#include <vector>
#include "crypto/cipher_engine.hpp"

namespace dfp::client {

struct Chunk {
  uint32_t index = 0;
  // Raw slice, or its segmented ciphertext when encryption is enabled
  crypto::Bytes payload;
};

struct ChunkEncryption {
  bool enabled = false;
  std::string passphrase;
  std::string salt = crypto::CipherEngine::DEFAULT_SALT;
  size_t workers = 1;
  crypto::KeypairCache* keypair_cache = nullptr;
};

// Splits a file into randomly sized chunks of round(base * U(1 - v, 1 + v))
// bytes, at least one byte each
class Chunker {
public:
  // Throws std::invalid_argument unless base_size > 0 and 0 <= variance < 1
  Chunker(size_t base_size, double variance, ChunkEncryption encryption = {});
  // Fixed seed for reproducible chunk sizes
  Chunker(size_t base_size, double variance, ChunkEncryption encryption, uint32_t seed);

  // Reads the whole file; throws std::runtime_error if it cannot be opened
  std::vector<Chunk> chunk_file(const std::filesystem::path& path);

  // Next chunk length drawn from the size distribution
  size_t next_length();

private:
  size_t base_size_;
  double variance_;
  ChunkEncryption encryption_;
  std::mt19937 generator_;
  std::uniform_real_distribution<double> distribution_;
};

} // namespace dfp::client

#endif // DFP_CLIENT_CHUNKER_HPP
