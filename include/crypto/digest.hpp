#ifndef DFP_CRYPTO_DIGEST_HPP
#define DFP_CRYPTO_DIGEST_HPP

#include <filesystem>
#include <istream>
#include <string>
#include "crypto_error.hpp"

namespace dfp::crypto {

// ---- MD5 HELPERS ----
// Lowercase hex MD5 of an in-memory buffer
std::string md5_hex(const std::string& data);
// Lowercase hex MD5 of everything left in the stream
std::string md5_hex(std::istream& input);
// Lowercase hex MD5 of a file on disk; throws CryptoError if it cannot be read
std::string md5_file(const std::filesystem::path& path);

} // namespace dfp::crypto

#endif // DFP_CRYPTO_DIGEST_HPP
