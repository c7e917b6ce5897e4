#include "crypto/cipher_engine.hpp"
#include <openssl/rsa.h>
#include <openssl/evp.h>
#include <algorithm>
#include <chrono>
#include <functional>
#include <future>
#include <thread>
#include <boost/log/trivial.hpp>

namespace dfp::crypto {

namespace {

using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using Range = std::pair<size_t, size_t>;

enum class Direction {
  Encrypt,
  Decrypt
};

// Builds an RSA-OAEP context with SHA-256 for both digest and MGF1
PkeyCtxPtr make_oaep_context(EVP_PKEY* pkey, Direction direction) {
  PkeyCtxPtr ctx(EVP_PKEY_CTX_new(pkey, nullptr), &EVP_PKEY_CTX_free);
  if (!ctx) {
    throw InitializationError("Cipher engine: Failed to create key context");
  }

  const int init = direction == Direction::Encrypt ? EVP_PKEY_encrypt_init(ctx.get())
                                                   : EVP_PKEY_decrypt_init(ctx.get());
  if (init <= 0 ||
      EVP_PKEY_CTX_set_rsa_padding(ctx.get(), RSA_PKCS1_OAEP_PADDING) <= 0 ||
      EVP_PKEY_CTX_set_rsa_oaep_md(ctx.get(), EVP_sha256()) <= 0 ||
      EVP_PKEY_CTX_set_rsa_mgf1_md(ctx.get(), EVP_sha256()) <= 0) {
    throw InitializationError("Cipher engine: Failed to configure OAEP padding");
  }
  return ctx;
}

std::shared_ptr<const Keypair> keypair_for(const std::string& passphrase, const std::string& salt,
                                           KeypairCache* cache) {
  if (cache) {
    return cache->get(passphrase, salt);
  }
  return std::make_shared<const Keypair>(derive_keypair(passphrase, salt));
}

// Runs one job per range on its own thread and joins the results in range order
Bytes run_partitions(const std::vector<Range>& ranges,
                     const std::function<Bytes(const Range&)>& job) {
  std::vector<std::future<Bytes>> results;
  results.reserve(ranges.size());
  for (const auto& range : ranges) {
    results.push_back(std::async(std::launch::async, job, range));
  }

  Bytes output;
  for (auto& result : results) {
    Bytes part = result.get();
    output.insert(output.end(), part.begin(), part.end());
  }
  return output;
}

} // namespace

//==============================================
// KEYPAIR CACHE
//==============================================

std::shared_ptr<const Keypair> KeypairCache::get(const std::string& passphrase, const std::string& salt) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto key = std::make_pair(passphrase, salt);
  auto it = entries_.find(key);
  if (it != entries_.end()) {
    return it->second;
  }

  BOOST_LOG_TRIVIAL(debug) << "Cipher engine: Keypair cache miss, deriving keypair";
  auto keypair = std::make_shared<const Keypair>(derive_keypair(passphrase, salt));
  entries_.emplace(std::move(key), keypair);
  return keypair;
}

size_t KeypairCache::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

//==============================================
// CONSTRUCTORS
//==============================================

CipherEngine::CipherEngine(const std::string& passphrase, const std::string& salt)
  : keypair_(std::make_shared<const Keypair>(derive_keypair(passphrase, salt))) {
  BOOST_LOG_TRIVIAL(debug) << "Cipher engine: Engine initialized";
}

CipherEngine::CipherEngine(std::shared_ptr<const Keypair> keypair)
  : keypair_(std::move(keypair)) {
  if (!keypair_) {
    throw InitializationError("Cipher engine: Null keypair");
  }
}

//==============================================
// SEGMENT OPERATIONS
//==============================================

Bytes CipherEngine::encrypt_segments(const Bytes& plaintext) const {
  Bytes ciphertext;
  if (plaintext.empty()) {
    return ciphertext;
  }

  auto ctx = make_oaep_context(keypair_->get(), Direction::Encrypt);
  ciphertext.reserve(encrypted_size(plaintext.size()));
  uint8_t block[CIPHERTEXT_SEGMENT_SIZE];

  for (size_t offset = 0; offset < plaintext.size(); offset += PLAINTEXT_SEGMENT_SIZE) {
    const size_t length = std::min(PLAINTEXT_SEGMENT_SIZE, plaintext.size() - offset);
    size_t outlen = sizeof(block);
    if (EVP_PKEY_encrypt(ctx.get(), block, &outlen, plaintext.data() + offset, length) <= 0 ||
        outlen != CIPHERTEXT_SEGMENT_SIZE) {
      throw EncryptionError("Cipher engine: Failed to encrypt segment at offset " + std::to_string(offset));
    }
    ciphertext.insert(ciphertext.end(), block, block + outlen);
  }

  BOOST_LOG_TRIVIAL(trace) << "Cipher engine: Encrypted " << plaintext.size() << " bytes into "
                           << ciphertext.size() << " bytes";
  return ciphertext;
}

Bytes CipherEngine::decrypt_segments(const Bytes& ciphertext) const {
  Bytes plaintext;
  if (ciphertext.empty()) {
    return plaintext;
  }
  if (ciphertext.size() % CIPHERTEXT_SEGMENT_SIZE != 0) {
    throw DecryptionError("Cipher engine: Ciphertext length " + std::to_string(ciphertext.size())
                          + " is not a multiple of " + std::to_string(CIPHERTEXT_SEGMENT_SIZE));
  }

  auto ctx = make_oaep_context(keypair_->get(), Direction::Decrypt);
  plaintext.reserve(ciphertext.size() / CIPHERTEXT_SEGMENT_SIZE * PLAINTEXT_SEGMENT_SIZE);
  uint8_t block[CIPHERTEXT_SEGMENT_SIZE];

  for (size_t offset = 0; offset < ciphertext.size(); offset += CIPHERTEXT_SEGMENT_SIZE) {
    size_t outlen = sizeof(block);
    if (EVP_PKEY_decrypt(ctx.get(), block, &outlen, ciphertext.data() + offset, CIPHERTEXT_SEGMENT_SIZE) <= 0) {
      throw DecryptionError("Cipher engine: Segment at offset " + std::to_string(offset)
                            + " failed OAEP validation");
    }
    plaintext.insert(plaintext.end(), block, block + outlen);
  }
  return plaintext;
}

//==============================================
// PARALLEL OPERATIONS
//==============================================

Bytes CipherEngine::parallel_encrypt(const Bytes& data, const std::string& passphrase,
                                     const std::string& salt, size_t workers,
                                     KeypairCache* cache) {
  if (data.empty()) {
    return {};
  }
  workers = std::max<size_t>(workers, 1);

  // ceil(len / workers) bytes per partition, trailing partitions may be short or empty
  const size_t per_partition = (data.size() + workers - 1) / workers;
  std::vector<Range> ranges;
  for (size_t rank = 0; rank < workers; ++rank) {
    const size_t begin = rank * per_partition;
    if (begin >= data.size()) {
      break;
    }
    ranges.emplace_back(begin, std::min(begin + per_partition, data.size()));
  }

  BOOST_LOG_TRIVIAL(debug) << "Cipher engine: Encrypting " << data.size() << " bytes across "
                           << ranges.size() << " workers";
  auto started = std::chrono::steady_clock::now();

  Bytes output = run_partitions(ranges, [&](const Range& range) {
    CipherEngine engine(keypair_for(passphrase, salt, cache));
    Bytes slice(data.begin() + static_cast<std::ptrdiff_t>(range.first),
                data.begin() + static_cast<std::ptrdiff_t>(range.second));
    return engine.encrypt_segments(slice);
  });

  BOOST_LOG_TRIVIAL(debug) << "Cipher engine: Encryption took "
                           << std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count() << "s";
  return output;
}

Bytes CipherEngine::parallel_decrypt(const Bytes& ciphertext, const std::string& passphrase,
                                     const std::string& salt, size_t workers,
                                     KeypairCache* cache) {
  if (ciphertext.empty()) {
    return {};
  }
  if (ciphertext.size() % CIPHERTEXT_SEGMENT_SIZE != 0) {
    throw DecryptionError("Cipher engine: Ciphertext length " + std::to_string(ciphertext.size())
                          + " is not a multiple of " + std::to_string(CIPHERTEXT_SEGMENT_SIZE));
  }
  workers = std::max<size_t>(workers, 1);

  // Partition on whole segments so no worker ever sees a split segment
  const size_t segments = ciphertext.size() / CIPHERTEXT_SEGMENT_SIZE;
  const size_t per_partition = (segments + workers - 1) / workers;
  std::vector<Range> ranges;
  for (size_t rank = 0; rank < workers; ++rank) {
    const size_t first = rank * per_partition;
    if (first >= segments) {
      break;
    }
    const size_t last = std::min(first + per_partition, segments);
    ranges.emplace_back(first * CIPHERTEXT_SEGMENT_SIZE, last * CIPHERTEXT_SEGMENT_SIZE);
  }

  BOOST_LOG_TRIVIAL(debug) << "Cipher engine: Decrypting " << segments << " segments across "
                           << ranges.size() << " workers";
  auto started = std::chrono::steady_clock::now();

  Bytes output = run_partitions(ranges, [&](const Range& range) {
    CipherEngine engine(keypair_for(passphrase, salt, cache));
    Bytes slice(ciphertext.begin() + static_cast<std::ptrdiff_t>(range.first),
                ciphertext.begin() + static_cast<std::ptrdiff_t>(range.second));
    return engine.decrypt_segments(slice);
  });

  BOOST_LOG_TRIVIAL(debug) << "Cipher engine: Decryption took "
                           << std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count() << "s";
  return output;
}

//==============================================
// UTILITY METHODS
//==============================================

size_t CipherEngine::encrypted_size(size_t plaintext_size) {
  return (plaintext_size + PLAINTEXT_SEGMENT_SIZE - 1) / PLAINTEXT_SEGMENT_SIZE * CIPHERTEXT_SEGMENT_SIZE;
}

size_t host_parallelism() {
  const unsigned int threads = std::thread::hardware_concurrency();
  return threads == 0 ? 1 : threads;
}

} // namespace dfp::crypto
