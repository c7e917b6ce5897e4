#include <iostream>
#include <set>
#include <string>
#include <unordered_map>
#include <boost/log/trivial.hpp>
#include "config/config.hpp"
#include "logger/logger.hpp"
#include "server/http_server.hpp"

struct ServerOptions {
  dfp::config::ServerConfig config;
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " [options]\n"
        << "Options:\n"
        << "  -h, --host       Host address (default: localhost)\n"
        << "  -p, --port       Port number (default: 8080)\n"
        << "  -c, --config     JSON configuration file\n"
        << "  -o, --output     Directory for received files (default: dfp_received)\n"
        << "  --passkey        Shared passphrase (prompted for when absent)\n"
        << "  --salt           Key derivation salt (default: dfp#2025)\n"
        << "  --encrypt        Expect encrypted chunks\n"
        << "  --cache-keys     Share one derived keypair between decrypt workers\n"
        << "  --log-file       Also log to this file\n"
        << "  --log-level      trace, debug, info, warning, error or fatal\n"
        << "Example: " << program_name << " -h 0.0.0.0 -p 8080 --encrypt\n";
}

ServerOptions parse_command_line(int argc, char* argv[]) {
  const std::set<std::string> value_flags = {
    "-h", "--host", "-p", "--port", "-c", "--config", "-o", "--output",
    "--passkey", "--salt", "--log-file", "--log-level"
  };
  const std::set<std::string> switch_flags = {"--encrypt", "--cache-keys"};

  ServerOptions options;
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
    } else {
      std::cerr << "Error: Unknown or incomplete argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }
  }

  auto value_of = [&values](const std::string& short_flag, const std::string& long_flag) -> const std::string* {
    if (auto it = values.find(long_flag); it != values.end()) return &it->second;
    if (auto it = values.find(short_flag); it != values.end()) return &it->second;
    return nullptr;
  };

  try {
    if (const auto* path = value_of("-c", "--config")) {
      options.config = dfp::config::load_server_config(*path);
    }
  } catch (const dfp::config::ConfigError& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return options;
  }

  auto& config = options.config;
  if (const auto* host = value_of("-h", "--host")) config.host = *host;
  if (const auto* port = value_of("-p", "--port")) {
    try {
      const int parsed = std::stoi(*port);
      if (parsed <= 0 || parsed > 65535) {
        throw std::out_of_range("port");
      }
      config.port = static_cast<uint16_t>(parsed);
    } catch (const std::exception&) {
      std::cerr << "Error: Invalid port number\n";
      print_usage(argv[0]);
      return options;
    }
  }
  if (const auto* output = value_of("-o", "--output")) config.output_dir = *output;
  if (const auto* passkey = value_of("", "--passkey")) config.cipher.passphrase = *passkey;
  if (const auto* salt = value_of("", "--salt")) config.cipher.salt = *salt;
  if (const auto* log_file = value_of("", "--log-file")) config.logging.file = *log_file;
  if (const auto* log_level = value_of("", "--log-level")) config.logging.level = *log_level;
  if (switches.count("--encrypt")) config.cipher.enable_encryption = true;
  if (switches.count("--cache-keys")) config.cipher.cache_keypairs = true;

  options.valid = true;
  return options;
}

bool run_server(dfp::config::ServerConfig config) {
  try {
    dfp::logging::LogSettings log_settings;
    log_settings.log_file = config.logging.file;
    log_settings.min_level = dfp::logging::parse_severity(config.logging.level);
    dfp::logging::init_logging(log_settings);

    if (config.cipher.passphrase.empty()) {
      std::cerr << "Passphrase: " << std::flush;
      std::getline(std::cin, config.cipher.passphrase);
      if (config.cipher.passphrase.empty()) {
        std::cerr << "Error: A passphrase is required\n";
        return false;
      }
    }

    std::cout << "DFP Server will be available at http://" << config.host << ":" << config.port << "\n";
    dfp::server::HttpServer server(config);
    BOOST_LOG_TRIVIAL(debug) << "DFP cipher initialized. Public key:\n" << server.engine().keypair().public_pem();

    if (!server.start(true)) {
      std::cerr << "Error: Failed to start server\n";
      return false;
    }

    BOOST_LOG_TRIVIAL(info) << "Available endpoints:";
    BOOST_LOG_TRIVIAL(info) << "  GET  /cs?f=X&s=Y&c=Z&h=H&g=G";
    BOOST_LOG_TRIVIAL(info) << "  POST /k (with JSON body)";
    BOOST_LOG_TRIVIAL(info) << "  POST /fs (with JSON body)";
    BOOST_LOG_TRIVIAL(info) << "  GET  /status?s=X";
    std::cout << "Press Ctrl+C to stop the server\n";

    server.wait();
    server.stop();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Server failed: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  if (auto options = parse_command_line(argc, argv); !options.valid) {
    return 1;
  } else if (!run_server(std::move(options.config))) {
    return 1;
  }
  return 0;
}
