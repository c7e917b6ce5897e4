#include "client/upload_coordinator.hpp"
#include <algorithm>
#include <cstdio>
#include <sstream>
#include <thread>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/log/trivial.hpp>
#include "crypto/digest.hpp"
#include "utils/encoding.hpp"

namespace dfp::client {

namespace {

std::string describe_indices(const std::vector<uint32_t>& indices) {
  std::ostringstream text;
  text << "[";
  for (size_t i = 0; i < indices.size(); ++i) {
    text << (i ? ", " : "") << indices[i];
  }
  text << "]";
  return text.str();
}

} // namespace

//==============================================
// CONSTRUCTOR
//==============================================

UploadCoordinator::UploadCoordinator(const config::ClientConfig& config, TransferApi& api,
                                     const crypto::CipherEngine& signer, Sleeper sleeper)
  : config_(config),
    api_(api),
    signer_(signer),
    sleeper_(sleeper ? std::move(sleeper) : Sleeper([](std::chrono::seconds delay) {
      std::this_thread::sleep_for(delay);
    })),
    keypair_cache_(config.cipher.cache_keypairs ? std::make_unique<crypto::KeypairCache>() : nullptr) {}

//==============================================
// TRANSFER
//==============================================

TransferResult UploadCoordinator::send(const std::filesystem::path& path, const ProgressCallback& progress) {
  TransferResult result;
  result.filename = path.filename().string();

  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    result.error = "File not found: " + path.string();
    BOOST_LOG_TRIVIAL(error) << "Upload coordinator: " << result.error;
    return result;
  }

  try {
    result.file_size = std::filesystem::file_size(path);
    BOOST_LOG_TRIVIAL(info) << "Upload coordinator: Starting transfer of " << result.filename
                            << " (" << result.file_size << " bytes)";

    const std::string file_hash = crypto::md5_file(path);

    ChunkEncryption encryption;
    encryption.enabled = config_.cipher.enable_encryption;
    encryption.passphrase = config_.cipher.passphrase;
    encryption.salt = config_.cipher.salt;
    encryption.workers = crypto::host_parallelism();
    encryption.keypair_cache = keypair_cache_.get();
    Chunker chunker(config_.chunk_size, config_.chunk_size_variance, encryption);
    const std::vector<Chunk> chunks = chunker.chunk_file(path);
    if (chunks.empty()) {
      result.error = "Failed to create session: file is empty";
      return result;
    }
    BOOST_LOG_TRIVIAL(info) << "Upload coordinator: Created " << chunks.size() << " chunks for transfer";

    try {
      result.session_id = open_session(result.filename, result.file_size,
                                       static_cast<uint32_t>(chunks.size()), file_hash);
    } catch (const NetworkFailure& e) {
      result.error = std::string("Failed to create session: ") + e.what();
      BOOST_LOG_TRIVIAL(error) << "Upload coordinator: " << result.error;
      return result;
    }
    if (result.session_id.empty()) {
      result.error = "Failed to create session";
      return result;
    }
    BOOST_LOG_TRIVIAL(info) << "Upload coordinator: Created session: " << result.session_id;

    const auto started = std::chrono::steady_clock::now();
    UploadProgress state;
    state.total = chunks.size();
    state.callback = progress ? &progress : nullptr;

    std::vector<const Chunk*> pending;
    pending.reserve(chunks.size());
    for (const auto& chunk : chunks) {
      pending.push_back(&chunk);
    }
    std::vector<uint32_t> failed = upload_round(result.session_id, pending, config_.max_workers, state);

    const size_t retry_workers = std::max<size_t>(1, config_.max_workers / 2);
    for (int attempt = 0; attempt < config_.retry_rounds && !failed.empty(); ++attempt) {
      BOOST_LOG_TRIVIAL(info) << "Upload coordinator: Retry attempt " << attempt + 1 << " for "
                              << failed.size() << " chunks";
      sleeper_(std::chrono::seconds(1LL << attempt));

      pending.clear();
      for (uint32_t index : failed) {
        pending.push_back(&chunks[index]);
      }
      failed = upload_round(result.session_id, pending, retry_workers, state);
    }

    result.chunks_uploaded = state.uploaded;
    if (!failed.empty()) {
      result.failed_chunks = failed;
      result.error = "Failed to upload chunks after retries: " + describe_indices(failed);
      BOOST_LOG_TRIVIAL(error) << "Upload coordinator: " << result.error;
      return result;
    }

    CompletionResponse completion;
    try {
      completion = api_.complete_session(result.session_id);
    } catch (const NetworkFailure& e) {
      result.error = std::string("Failed to complete session: ") + e.what();
      BOOST_LOG_TRIVIAL(error) << "Upload coordinator: " << result.error;
      return result;
    }
    if (completion.status != "completed") {
      result.error = "Failed to complete session: server answered '" + completion.status + "'";
      return result;
    }

    result.output_path = completion.output_path;
    result.transfer_time = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    const double speed = result.transfer_time > 0 ? result.file_size / result.transfer_time : 0.0;
    result.speed_mbps = speed / 1024 / 1024;
    result.success = true;

    BOOST_LOG_TRIVIAL(info) << "Upload coordinator: Completed successfully in " << result.transfer_time
                            << "s (" << result.speed_mbps << " MB/s)";
  } catch (const std::exception& e) {
    result.success = false;
    result.error = e.what();
    BOOST_LOG_TRIVIAL(error) << "Upload coordinator: Transfer failed: " << e.what();
  }
  return result;
}

utils::Json UploadCoordinator::session_status(const std::string& session_id) {
  return api_.session_status(session_id);
}

//==============================================
// SESSION AND UPLOAD HELPERS
//==============================================

std::string UploadCoordinator::make_signature() const {
  const double now = std::chrono::duration<double>(
    std::chrono::system_clock::now().time_since_epoch()).count();
  char text[64];
  std::snprintf(text, sizeof(text), "%.6f", now);
  const std::string timestamp(text);
  return utils::base64_encode(signer_.encrypt_segments(crypto::Bytes(timestamp.begin(), timestamp.end())));
}

std::string UploadCoordinator::open_session(const std::string& filename, uint64_t file_size,
                                            uint32_t total_chunks, const std::string& file_hash) {
  SessionRequest request;
  // The filename is always encrypted, independent of chunk encryption
  request.filename = utils::base64_encode(signer_.encrypt_segments(crypto::Bytes(filename.begin(), filename.end())));
  request.total_size = file_size;
  request.total_chunks = total_chunks;
  request.file_hash = file_hash;
  request.signature = make_signature();
  return api_.create_session(request);
}

std::vector<uint32_t> UploadCoordinator::upload_round(const std::string& session_id,
                                                      const std::vector<const Chunk*>& chunks,
                                                      size_t workers, UploadProgress& progress) {
  std::vector<uint32_t> failed;
  std::mutex failed_mutex;

  boost::asio::thread_pool pool(std::max<size_t>(1, workers));
  for (const Chunk* chunk : chunks) {
    boost::asio::post(pool, [this, &session_id, chunk, &failed, &failed_mutex, &progress]() {
      try {
        api_.upload_chunk(session_id, chunk->index, utils::base64_encode(chunk->payload));
      } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(warning) << "Upload coordinator: Failed to upload chunk " << chunk->index << ": " << e.what();
        std::lock_guard<std::mutex> lock(failed_mutex);
        failed.push_back(chunk->index);
        return;
      }

      // Serialized so callers observe a non-decreasing uploaded count
      std::lock_guard<std::mutex> lock(progress.mutex);
      ++progress.uploaded;
      if (progress.callback && *progress.callback) {
        const double percent = static_cast<double>(progress.uploaded) / progress.total * 100.0;
        (*progress.callback)(percent, progress.uploaded, progress.total);
      }
    });
  }
  pool.join();

  std::sort(failed.begin(), failed.end());
  return failed;
}

} // namespace dfp::client
