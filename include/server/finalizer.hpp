#ifndef DFP_SERVER_FINALIZER_HPP
#define DFP_SERVER_FINALIZER_HPP

#include <filesystem>
#include <string>
#include "crypto/cipher_engine.hpp"
#include "deadline.hpp"
#include "session_store.hpp"

namespace dfp::server {

struct ReconstructionSettings {
  std::filesystem::path output_dir = "dfp_received";
  // Chunks hold segmented ciphertext and are decrypted on reassembly
  bool decrypt = false;
  std::string passphrase;
  std::string salt = crypto::CipherEngine::DEFAULT_SALT;
  size_t decrypt_workers = 1;
  // Optional, shared with the rest of the server
  crypto::KeypairCache* keypair_cache = nullptr;
};

// Terminal transition of a session: completeness check, ordered
// reconstruction, hash verification and scratch cleanup
class Finalizer {
public:
  Finalizer(SessionStore& sessions, ReconstructionSettings settings);

  // Returns the path of the reconstructed file.
  // Missing chunks or a reconstruction failure revert the session to active.
  // A hash mismatch deletes the output and leaves the session finalizing.
  std::filesystem::path finalize(const std::string& session_id, const CancellationToken& token);

private:
  // Appends every chunk in index order; throws on the first failure
  void reconstruct(const Session& ticket, const std::filesystem::path& output_path,
                   const CancellationToken& token) const;
  static void remove_quietly(const std::filesystem::path& path);

  SessionStore& sessions_;
  ReconstructionSettings settings_;
};

} // namespace dfp::server

#endif // DFP_SERVER_FINALIZER_HPP
