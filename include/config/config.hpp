#ifndef DFP_CONFIG_CONFIG_HPP
#define DFP_CONFIG_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace dfp::config {

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

// Settings shared by both executables
struct CipherSettings {
  std::string passphrase;
  std::string salt = "dfp#2025";
  // Bulk chunk encryption; filenames and signatures are always encrypted
  bool enable_encryption = false;
  // Share one derived keypair between parallel workers
  bool cache_keypairs = false;
};

struct LoggingSettings {
  std::string file;
  std::string level = "info";
};

struct ServerConfig {
  std::string host = "localhost";
  uint16_t port = 8080;
  CipherSettings cipher;
  std::filesystem::path output_dir = "dfp_received";
  // Parent of per-session scratch directories; empty means the system temp dir
  std::filesystem::path scratch_root;
  std::chrono::seconds session_ttl{3600};
  std::chrono::seconds sweep_interval{300};
  std::chrono::seconds auth_window{30};
  std::chrono::seconds chunk_store_timeout{30};
  std::chrono::seconds finalize_timeout{60};
  size_t connection_threads = 8;
  size_t task_threads = 4;
  uint64_t max_body_bytes = 64ull * 1024 * 1024;
  LoggingSettings logging;
};

struct ClientConfig {
  std::string server_url = "http://localhost:8080";
  CipherSettings cipher;
  size_t max_workers = 8;
  size_t chunk_size = 4 * 1024 * 1024;
  double chunk_size_variance = 0.5;
  std::chrono::seconds request_timeout{30};
  std::chrono::seconds completion_timeout{60};
  std::chrono::seconds status_timeout{10};
  int retry_rounds = 3;
  LoggingSettings logging;
};

// ---- LOADERS ----
// Reads a JSON file; keys absent from the file keep their defaults.
// Throws ConfigError for unreadable or malformed files and bad values.
ServerConfig load_server_config(const std::filesystem::path& path);
ClientConfig load_client_config(const std::filesystem::path& path);

} // namespace dfp::config

#endif // DFP_CONFIG_CONFIG_HPP
