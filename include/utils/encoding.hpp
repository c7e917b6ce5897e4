#ifndef DFP_UTILS_ENCODING_HPP
#define DFP_UTILS_ENCODING_HPP

#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace dfp::utils {

class EncodingError : public std::runtime_error {
public:
  explicit EncodingError(const std::string& message) : std::runtime_error(message) {}
};

// ---- BASE64 ----
// Standard alphabet with '=' padding
std::string base64_encode(const std::vector<uint8_t>& data);
std::string base64_encode(const std::string& data);
// Strict decode: length must be a multiple of 4, only alphabet characters,
// padding only at the end. Throws EncodingError otherwise.
std::vector<uint8_t> base64_decode(const std::string& text);


// ---- URL ENCODING ----
// Percent-encodes everything except unreserved characters (RFC 3986)
std::string url_encode(const std::string& value);
// Decodes %XX escapes and '+' as space; throws EncodingError on a bad escape
std::string url_decode(const std::string& value);
// Parses "a=1&b=2" into a map, URL-decoding keys and values. The first
// occurrence of a repeated key wins.
std::map<std::string, std::string> parse_query(const std::string& query);
// Builds "a=1&b=2" from ordered pairs, URL-encoding values
std::string build_query(const std::vector<std::pair<std::string, std::string>>& params);

} // namespace dfp::utils

#endif // DFP_UTILS_ENCODING_HPP
