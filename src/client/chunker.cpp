#include "client/chunker.hpp"
#include <chrono>
#include <cmath>
#include <fstream>
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace dfp::client {

namespace {

void validate(size_t base_size, double variance) {
  if (base_size == 0) {
    throw std::invalid_argument("Chunker: Base chunk size must be positive");
  }
  if (!(variance >= 0.0 && variance < 1.0)) {
    throw std::invalid_argument("Chunker: Chunk size variance must be in [0, 1)");
  }
}

} // namespace

Chunker::Chunker(size_t base_size, double variance, ChunkEncryption encryption)
  : Chunker(base_size, variance, std::move(encryption), std::random_device{}()) {}

Chunker::Chunker(size_t base_size, double variance, ChunkEncryption encryption, uint32_t seed)
  : base_size_((validate(base_size, variance), base_size)),
    variance_(variance),
    encryption_(std::move(encryption)),
    generator_(seed),
    distribution_(1.0 - variance, 1.0 + variance) {}

size_t Chunker::next_length() {
  // uniform_real_distribution needs a < b, so a zero variance is drawn directly
  const double factor = variance_ == 0.0 ? 1.0 : distribution_(generator_);
  const long long length = std::llround(static_cast<double>(base_size_) * factor);
  return length < 1 ? 1 : static_cast<size_t>(length);
}

std::vector<Chunk> Chunker::chunk_file(const std::filesystem::path& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Chunker: File not found: " << path.string();
    throw std::runtime_error("File not found: " + path.string());
  }

  std::vector<Chunk> chunks;
  uint32_t index = 0;
  while (true) {
    crypto::Bytes slice(next_length());
    file.read(reinterpret_cast<char*>(slice.data()), static_cast<std::streamsize>(slice.size()));
    const auto read = static_cast<size_t>(file.gcount());
    if (read == 0) {
      break;
    }
    slice.resize(read);

    Chunk chunk;
    chunk.index = index++;
    if (encryption_.enabled) {
      auto started = std::chrono::steady_clock::now();
      chunk.payload = crypto::CipherEngine::parallel_encrypt(slice, encryption_.passphrase, encryption_.salt,
                                                             encryption_.workers, encryption_.keypair_cache);
      BOOST_LOG_TRIVIAL(debug) << "Chunker: Chunk " << chunk.index << " encrypted, took "
                               << std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count() << "s";
    } else {
      chunk.payload = std::move(slice);
    }
    chunks.push_back(std::move(chunk));

    if (file.eof()) {
      break;
    }
  }

  if (file.bad()) {
    throw std::runtime_error("Read error while chunking " + path.string());
  }
  BOOST_LOG_TRIVIAL(info) << "Chunker: Created " << chunks.size() << " chunks from " << path.string();
  return chunks;
}

} // namespace dfp::client
