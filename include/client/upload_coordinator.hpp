#ifndef DFP_CLIENT_UPLOAD_COORDINATOR_HPP
#define DFP_CLIENT_UPLOAD_COORDINATOR_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "chunker.hpp"
#include "config/config.hpp"
#include "crypto/cipher_engine.hpp"
#include "transfer_api.hpp"

namespace dfp::client {

struct TransferResult {
  bool success = false;
  std::string session_id;
  std::string filename;
  uint64_t file_size = 0;
  double transfer_time = 0.0;
  double speed_mbps = 0.0;
  size_t chunks_uploaded = 0;
  std::string output_path;
  std::string error;
  // Indices still failing after every retry round
  std::vector<uint32_t> failed_chunks;
};

// (percent, uploaded, total), invoked after every successful chunk upload
using ProgressCallback = std::function<void(double, size_t, size_t)>;
using Sleeper = std::function<void(std::chrono::seconds)>;

// Drives one file transfer: hash, chunk, open a signed session, upload with
// bounded concurrency, retry failures with backoff, then complete
class UploadCoordinator {
public:
  // signer holds the keypair derived from the shared passphrase. A null
  // sleeper means std::this_thread::sleep_for.
  UploadCoordinator(const config::ClientConfig& config, TransferApi& api,
                    const crypto::CipherEngine& signer, Sleeper sleeper = nullptr);

  // Never throws; failures are reported through TransferResult
  TransferResult send(const std::filesystem::path& path, const ProgressCallback& progress = nullptr);

  // Server status document for a session; throws NetworkFailure
  utils::Json session_status(const std::string& session_id);

  // base64(encrypt_segments(current Unix time as decimal text))
  std::string make_signature() const;

private:
  struct UploadProgress {
    std::mutex mutex;
    size_t uploaded = 0;
    size_t total = 0;
    const ProgressCallback* callback = nullptr;
  };

  std::string open_session(const std::string& filename, uint64_t file_size,
                           uint32_t total_chunks, const std::string& file_hash);
  // Uploads the given chunks on a pool of `workers` threads and returns the
  // indices that failed, in ascending order
  std::vector<uint32_t> upload_round(const std::string& session_id, const std::vector<const Chunk*>& chunks,
                                     size_t workers, UploadProgress& progress);

  config::ClientConfig config_;
  TransferApi& api_;
  const crypto::CipherEngine& signer_;
  Sleeper sleeper_;
  std::unique_ptr<crypto::KeypairCache> keypair_cache_;
};

} // namespace dfp::client

#endif // DFP_CLIENT_UPLOAD_COORDINATOR_HPP
