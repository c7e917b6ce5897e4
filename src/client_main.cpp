#include <cstdio>
#include <iostream>
#include <set>
#include <string>
#include <unordered_map>
#include <boost/property_tree/json_parser.hpp>
#include "client/http_transfer_api.hpp"
#include "client/upload_coordinator.hpp"
#include "config/config.hpp"
#include "logger/logger.hpp"

struct ClientOptions {
  dfp::config::ClientConfig config;
  std::string file_path;
  std::string status_session;
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " <file> [options]\n"
        << "       " << program_name << " --status <session id> [options]\n"
        << "Options:\n"
        << "  --server         Server URL (default: http://localhost:8080)\n"
        << "  --workers        Number of parallel uploads (default: 8)\n"
        << "  --chunk-size     Base chunk size in bytes (default: 4194304)\n"
        << "  --variance       Chunk size variance in [0, 1) (default: 0.5)\n"
        << "  --status         Print the status of an existing session\n"
        << "  -c, --config     JSON configuration file\n"
        << "  --passkey        Shared passphrase (prompted for when absent)\n"
        << "  --salt           Key derivation salt (default: dfp#2025)\n"
        << "  --encrypt        Encrypt chunks before sending\n"
        << "  --cache-keys     Share one derived keypair between encrypt workers\n"
        << "  --log-file       Also log to this file\n"
        << "  --log-level      trace, debug, info, warning, error or fatal\n"
        << "Example: " << program_name << " report.pdf --server http://10.0.0.2:8080 --encrypt\n";
}

ClientOptions parse_command_line(int argc, char* argv[]) {
  const std::set<std::string> value_flags = {
    "--server", "--workers", "--chunk-size", "--variance", "--status", "-c", "--config",
    "--passkey", "--salt", "--log-file", "--log-level"
  };
  const std::set<std::string> switch_flags = {"--encrypt", "--cache-keys"};

  ClientOptions options;
  std::unordered_map<std::string, std::string> values;
  std::set<std::string> switches;

  for (int i = 1; i < argc; ++i) {
    const std::string flag(argv[i]);
    if (flag == "--help") {
      print_usage(argv[0]);
      return options;
    }
    if (switch_flags.count(flag)) {
      switches.insert(flag);
    } else if (value_flags.count(flag) && i + 1 < argc) {
      values[flag] = argv[++i];
    } else if (!flag.empty() && flag[0] != '-' && options.file_path.empty()) {
      options.file_path = flag;
    } else {
      std::cerr << "Error: Unknown or incomplete argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }
  }

  try {
    if (auto it = values.count("--config") ? values.find("--config") : values.find("-c"); it != values.end()) {
      options.config = dfp::config::load_client_config(it->second);
    }
  } catch (const dfp::config::ConfigError& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return options;
  }

  auto& config = options.config;
  try {
    if (values.count("--server")) config.server_url = values["--server"];
    if (values.count("--workers")) config.max_workers = static_cast<size_t>(std::stoul(values["--workers"]));
    if (values.count("--chunk-size")) config.chunk_size = static_cast<size_t>(std::stoull(values["--chunk-size"]));
    if (values.count("--variance")) config.chunk_size_variance = std::stod(values["--variance"]);
  } catch (const std::exception&) {
    std::cerr << "Error: Invalid numeric argument\n";
    print_usage(argv[0]);
    return options;
  }
  if (values.count("--status")) options.status_session = values["--status"];
  if (values.count("--passkey")) config.cipher.passphrase = values["--passkey"];
  if (values.count("--salt")) config.cipher.salt = values["--salt"];
  if (values.count("--log-file")) config.logging.file = values["--log-file"];
  if (values.count("--log-level")) config.logging.level = values["--log-level"];
  if (switches.count("--encrypt")) config.cipher.enable_encryption = true;
  if (switches.count("--cache-keys")) config.cipher.cache_keypairs = true;

  if (config.max_workers == 0 || config.chunk_size == 0 ||
      config.chunk_size_variance < 0.0 || config.chunk_size_variance >= 1.0) {
    std::cerr << "Error: Workers and chunk size must be positive and variance in [0, 1)\n";
    return options;
  }
  if (options.file_path.empty() && options.status_session.empty()) {
    std::cerr << "Error: A file to send or --status is required\n";
    print_usage(argv[0]);
    return options;
  }

  options.valid = true;
  return options;
}

void print_progress(double percent, size_t uploaded, size_t total) {
  std::printf("\rProgress: %.2f%% (%zu/%zu chunks)", percent, uploaded, total);
  std::fflush(stdout);
}

bool run_client(ClientOptions options) {
  auto& config = options.config;
  try {
    dfp::logging::LogSettings log_settings;
    log_settings.log_file = config.logging.file;
    log_settings.min_level = dfp::logging::parse_severity(config.logging.level);
    dfp::logging::init_logging(log_settings);

    dfp::client::HttpTimeouts timeouts;
    timeouts.request = config.request_timeout;
    timeouts.completion = config.completion_timeout;
    timeouts.status = config.status_timeout;
    dfp::client::HttpTransferApi api(config.server_url, timeouts);

    if (!options.status_session.empty()) {
      const auto status = api.session_status(options.status_session);
      boost::property_tree::write_json(std::cout, status, true);
      return true;
    }

    if (config.cipher.passphrase.empty()) {
      std::cerr << "Passphrase: " << std::flush;
      std::getline(std::cin, config.cipher.passphrase);
      if (config.cipher.passphrase.empty()) {
        std::cerr << "Error: A passphrase is required\n";
        return false;
      }
    }

    dfp::crypto::CipherEngine signer(config.cipher.passphrase, config.cipher.salt);
    dfp::client::UploadCoordinator coordinator(config, api, signer);

    std::cout << "Sending: " << options.file_path << "\n"
              << "Server: " << config.server_url << "\n"
              << "Workers: " << config.max_workers << "\n"
              << "Chunk size: " << config.chunk_size << " bytes\n"
              << std::string(50, '-') << "\n";

    const auto result = coordinator.send(options.file_path, print_progress);

    std::cout << "\n" << std::string(50, '-') << "\n";
    if (!result.success) {
      std::cout << "Failed!\n" << "Error: " << result.error << "\n";
      return false;
    }

    std::printf("Completed successfully!\n");
    std::printf("Session ID: %s\n", result.session_id.c_str());
    std::printf("File: %s\n", result.filename.c_str());
    std::printf("Size: %llu bytes\n", static_cast<unsigned long long>(result.file_size));
    std::printf("Time: %.2f seconds\n", result.transfer_time);
    std::printf("Speed: %.5f MB/s\n", result.speed_mbps);
    std::printf("Chunks: %zu\n", result.chunks_uploaded);
    std::printf("Saved as: %s\n", result.output_path.c_str());
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  if (auto options = parse_command_line(argc, argv); !options.valid) {
    return 1;
  } else if (!run_client(std::move(options))) {
    return 1;
  }
  return 0;
}
