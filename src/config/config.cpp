#include "config/config.hpp"
#include <boost/log/trivial.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

namespace dfp::config {

namespace {

using boost::property_tree::ptree;

ptree read_tree(const std::filesystem::path& path) {
  if (!std::filesystem::exists(path)) {
    throw ConfigError("Config file not found: " + path.string());
  }
  ptree root;
  try {
    boost::property_tree::read_json(path.string(), root);
  } catch (const boost::property_tree::json_parser_error& e) {
    throw ConfigError("Malformed config file " + path.string() + ": " + e.what());
  }
  return root;
}

template <typename T>
T get_or(const ptree& root, const std::string& key, const T& fallback) {
  try {
    return root.get<T>(key, fallback);
  } catch (const boost::property_tree::ptree_bad_data& e) {
    throw ConfigError("Invalid value for '" + key + "': " + e.what());
  }
}

std::chrono::seconds seconds_or(const ptree& root, const std::string& key, std::chrono::seconds fallback) {
  const long long value = get_or<long long>(root, key, fallback.count());
  if (value <= 0) {
    throw ConfigError("'" + key + "' must be positive");
  }
  return std::chrono::seconds(value);
}

void read_cipher(const ptree& root, CipherSettings& cipher) {
  cipher.passphrase = get_or<std::string>(root, "cipher.passphrase", cipher.passphrase);
  cipher.salt = get_or<std::string>(root, "cipher.salt", cipher.salt);
  cipher.enable_encryption = get_or<bool>(root, "cipher.enable_encryption", cipher.enable_encryption);
  cipher.cache_keypairs = get_or<bool>(root, "cipher.cache_keypairs", cipher.cache_keypairs);
}

void read_logging(const ptree& root, LoggingSettings& logging) {
  logging.file = get_or<std::string>(root, "logging.file", logging.file);
  logging.level = get_or<std::string>(root, "logging.level", logging.level);
}

} // namespace

ServerConfig load_server_config(const std::filesystem::path& path) {
  BOOST_LOG_TRIVIAL(info) << "Config: Loading server config from " << path.string();
  const ptree root = read_tree(path);
  ServerConfig config;

  config.host = get_or<std::string>(root, "host", config.host);
  const int port = get_or<int>(root, "port", config.port);
  if (port <= 0 || port > 65535) {
    throw ConfigError("'port' out of range: " + std::to_string(port));
  }
  config.port = static_cast<uint16_t>(port);

  read_cipher(root, config.cipher);
  config.output_dir = get_or<std::string>(root, "output_dir", config.output_dir.string());
  config.scratch_root = get_or<std::string>(root, "scratch_root", config.scratch_root.string());
  config.session_ttl = seconds_or(root, "session_ttl", config.session_ttl);
  config.sweep_interval = seconds_or(root, "sweep_interval", config.sweep_interval);
  config.auth_window = seconds_or(root, "auth_window", config.auth_window);
  config.chunk_store_timeout = seconds_or(root, "chunk_store_timeout", config.chunk_store_timeout);
  config.finalize_timeout = seconds_or(root, "finalize_timeout", config.finalize_timeout);
  config.connection_threads = get_or<size_t>(root, "connection_threads", config.connection_threads);
  config.task_threads = get_or<size_t>(root, "task_threads", config.task_threads);
  config.max_body_bytes = get_or<uint64_t>(root, "max_body_bytes", config.max_body_bytes);
  read_logging(root, config.logging);

  if (config.connection_threads == 0 || config.task_threads == 0) {
    throw ConfigError("Thread counts must be at least 1");
  }
  return config;
}

ClientConfig load_client_config(const std::filesystem::path& path) {
  BOOST_LOG_TRIVIAL(info) << "Config: Loading client config from " << path.string();
  const ptree root = read_tree(path);
  ClientConfig config;

  config.server_url = get_or<std::string>(root, "server_url", config.server_url);
  read_cipher(root, config.cipher);
  config.max_workers = get_or<size_t>(root, "max_workers", config.max_workers);
  config.chunk_size = get_or<size_t>(root, "chunk_size", config.chunk_size);
  config.chunk_size_variance = get_or<double>(root, "chunk_size_variance", config.chunk_size_variance);
  config.request_timeout = seconds_or(root, "request_timeout", config.request_timeout);
  config.completion_timeout = seconds_or(root, "completion_timeout", config.completion_timeout);
  config.status_timeout = seconds_or(root, "status_timeout", config.status_timeout);
  config.retry_rounds = get_or<int>(root, "retry_rounds", config.retry_rounds);
  read_logging(root, config.logging);

  if (config.max_workers == 0) {
    throw ConfigError("'max_workers' must be at least 1");
  }
  if (config.chunk_size == 0) {
    throw ConfigError("'chunk_size' must be positive");
  }
  if (config.chunk_size_variance < 0.0 || config.chunk_size_variance >= 1.0) {
    throw ConfigError("'chunk_size_variance' must be in [0, 1)");
  }
  if (config.retry_rounds < 0) {
    throw ConfigError("'retry_rounds' must not be negative");
  }
  return config;
}

} // namespace dfp::config
