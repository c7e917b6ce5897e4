#ifndef DFP_TEST_UTILS_HPP
#define DFP_TEST_UTILS_HPP

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <boost/log/core.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include "crypto/cipher_engine.hpp"
#include "crypto/keypair.hpp"

namespace dfp::test {

inline constexpr const char* TEST_PASSPHRASE = "correct horse battery staple";

// Set logging severity level and configure logging
inline void init_logging(boost::log::trivial::severity_level level = boost::log::trivial::warning) {
    // Remove any existing sinks to prevent duplicates
    boost::log::core::get()->remove_all_sinks();

    boost::log::register_simple_formatter_factory<boost::log::trivial::severity_level, char>("Severity");
    boost::log::add_console_log(
        std::cout,
        boost::log::keywords::format = "[%TimeStamp%] [%ThreadID%] [%Severity%] %Message%",
        boost::log::keywords::auto_flush = true
    );
    boost::log::core::get()->set_filter(boost::log::trivial::severity >= level);
    boost::log::add_common_attributes();
}

// Key derivation is slow, so every test in a binary shares one keypair
inline std::shared_ptr<const crypto::Keypair> shared_keypair() {
    static const auto keypair = std::make_shared<const crypto::Keypair>(
        crypto::derive_keypair(TEST_PASSPHRASE, crypto::CipherEngine::DEFAULT_SALT));
    return keypair;
}

// Cache shared by every parallel cipher call in a binary
inline crypto::KeypairCache& shared_cache() {
    static crypto::KeypairCache cache;
    return cache;
}

inline crypto::Bytes to_bytes(const std::string& text) {
    return crypto::Bytes(text.begin(), text.end());
}

inline std::string to_text(const crypto::Bytes& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

// Bytes with a repeating but non-trivial pattern
inline crypto::Bytes pattern_bytes(size_t length, uint8_t seed = 7) {
    crypto::Bytes data(length);
    for (size_t i = 0; i < length; ++i) {
        data[i] = static_cast<uint8_t>((i * 31 + seed) ^ (i >> 8));
    }
    return data;
}

// Unique directory under the system temp dir, removed on destruction
class TempDir {
public:
    explicit TempDir(const std::string& prefix) {
        path_ = std::filesystem::temp_directory_path() /
            (prefix + "_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

    std::filesystem::path write_file(const std::string& name, const crypto::Bytes& content) const {
        const auto file_path = path_ / name;
        std::ofstream file(file_path, std::ios::binary);
        file.write(reinterpret_cast<const char*>(content.data()), static_cast<std::streamsize>(content.size()));
        return file_path;
    }

private:
    std::filesystem::path path_;
};

} // namespace dfp::test

#endif // DFP_TEST_UTILS_HPP
