#include "server/finalizer.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <boost/log/trivial.hpp>
#include "crypto/digest.hpp"

namespace dfp::server {

namespace {

std::string lowercase(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

} // namespace

Finalizer::Finalizer(SessionStore& sessions, ReconstructionSettings settings)
  : sessions_(sessions), settings_(std::move(settings)) {}

std::filesystem::path Finalizer::finalize(const std::string& session_id, const CancellationToken& token) {
  // Fences concurrent finalize calls: only one caller sees the active state
  Session ticket = sessions_.begin_finalize(session_id);

  std::set<uint32_t> missing;
  for (uint32_t index = 0; index < ticket.total_chunks; ++index) {
    if (ticket.received_chunks.count(index) == 0) {
      missing.insert(index);
    }
  }
  if (!missing.empty()) {
    sessions_.abort_finalize(session_id);
    BOOST_LOG_TRIVIAL(warning) << "Finalizer: Session " << session_id << " is missing "
                               << missing.size() << " of " << ticket.total_chunks << " chunks";
    throw IncompleteSessionError(missing);
  }

  const std::filesystem::path output_path =
    std::filesystem::absolute(settings_.output_dir / ticket.filename);

  try {
    reconstruct(ticket, output_path, token);
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Finalizer: Failed to reconstruct file for session " << session_id << ": " << e.what();
    remove_quietly(output_path);
    sessions_.abort_finalize(session_id);
    throw;
  }

  if (!ticket.expected_hash.empty()) {
    std::string actual;
    try {
      actual = crypto::md5_file(output_path);
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Finalizer: Failed to verify file hash for session " << session_id << ": " << e.what();
      remove_quietly(output_path);
      sessions_.abort_finalize(session_id);
      throw;
    }
    if (actual != lowercase(ticket.expected_hash)) {
      // Session stays finalizing: it can neither succeed nor be finalized again
      remove_quietly(output_path);
      BOOST_LOG_TRIVIAL(error) << "Finalizer: Hash mismatch for session " << session_id
                               << " (expected " << ticket.expected_hash << ", got " << actual << ")";
      throw HashMismatchError(ticket.expected_hash, actual);
    }
  }

  if (token.cancelled()) {
    remove_quietly(output_path);
    sessions_.abort_finalize(session_id);
    throw OperationCancelled("finalize of session " + session_id);
  }

  sessions_.complete(session_id, output_path);

  try {
    ticket.scratch->delete_all();
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(warning) << "Finalizer: Failed to clean up session directory: " << e.what();
  }

  const double transfer_time =
    std::chrono::duration<double>(sessions_.now() - ticket.created_at).count();
  BOOST_LOG_TRIVIAL(info) << "Finalizer: Session " << session_id << " completed. File: " << ticket.filename
                          << ", Size: " << ticket.total_size << " bytes, Time: " << transfer_time << "s";
  return output_path;
}

void Finalizer::reconstruct(const Session& ticket, const std::filesystem::path& output_path,
                            const CancellationToken& token) const {
  std::filesystem::create_directories(output_path.parent_path());

  std::ofstream output(output_path, std::ios::binary | std::ios::trunc);
  if (!output) {
    throw store::ChunkStorageError("Finalizer: Failed to create output file: " + output_path.string());
  }

  for (uint32_t index = 0; index < ticket.total_chunks; ++index) {
    token.throw_if_cancelled("finalize of session " + ticket.id);

    store::Bytes chunk = ticket.scratch->get_chunk(index);
    if (settings_.decrypt) {
      auto started = std::chrono::steady_clock::now();
      chunk = crypto::CipherEngine::parallel_decrypt(chunk, settings_.passphrase, settings_.salt,
                                                     settings_.decrypt_workers, settings_.keypair_cache);
      BOOST_LOG_TRIVIAL(debug) << "Finalizer: Chunk " << index << " decrypted, took "
                               << std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count() << "s";
    }

    output.write(reinterpret_cast<const char*>(chunk.data()), static_cast<std::streamsize>(chunk.size()));
    if (!output) {
      throw store::ChunkStorageError("Finalizer: Failed to write chunk " + std::to_string(index)
                                     + " to " + output_path.string());
    }
  }

  output.close();
  if (!output) {
    throw store::ChunkStorageError("Finalizer: Failed to close output file: " + output_path.string());
  }
}

void Finalizer::remove_quietly(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "Finalizer: Failed to remove " << path.string() << ": " << ec.message();
  }
}

} // namespace dfp::server
