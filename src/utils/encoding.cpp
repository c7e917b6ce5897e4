#include "utils/encoding.hpp"
#include <openssl/evp.h>
#include <cctype>

namespace dfp::utils {

namespace {

bool is_base64_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/';
}

bool is_unreserved(unsigned char c) {
  return std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~';
}

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

//==============================================
// BASE64
//==============================================

std::string base64_encode(const std::vector<uint8_t>& data) {
  if (data.empty()) {
    return {};
  }
  // EVP_EncodeBlock writes a trailing NUL after the encoded text
  std::vector<unsigned char> buffer(4 * ((data.size() + 2) / 3) + 1);
  const int written = EVP_EncodeBlock(buffer.data(), data.data(), static_cast<int>(data.size()));
  return std::string(reinterpret_cast<const char*>(buffer.data()), static_cast<size_t>(written));
}

std::string base64_encode(const std::string& data) {
  return base64_encode(std::vector<uint8_t>(data.begin(), data.end()));
}

std::vector<uint8_t> base64_decode(const std::string& text) {
  if (text.empty()) {
    return {};
  }
  if (text.size() % 4 != 0) {
    throw EncodingError("Invalid base64 length: " + std::to_string(text.size()));
  }

  size_t padding = 0;
  for (size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (c == '=') {
      // Padding may only occupy the final one or two positions
      if (i < text.size() - 2) {
        throw EncodingError("Invalid base64 padding");
      }
      ++padding;
    } else if (padding > 0 || !is_base64_char(c)) {
      throw EncodingError("Invalid base64 character at position " + std::to_string(i));
    }
  }

  std::vector<uint8_t> out(text.size() / 4 * 3);
  const int decoded = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(text.data()),
                                      static_cast<int>(text.size()));
  if (decoded < 0) {
    throw EncodingError("Base64 decoding failed");
  }
  // EVP_DecodeBlock counts padding bytes as output
  out.resize(static_cast<size_t>(decoded) - padding);
  return out;
}

//==============================================
// URL ENCODING
//==============================================

std::string url_encode(const std::string& value) {
  static const char* hex = "0123456789ABCDEF";
  std::string out;
  out.reserve(value.size() * 3);
  for (unsigned char c : value) {
    if (is_unreserved(c)) {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(hex[c >> 4]);
      out.push_back(hex[c & 0x0F]);
    }
  }
  return out;
}

std::string url_decode(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (size_t i = 0; i < value.size(); ++i) {
    const char c = value[i];
    if (c == '+') {
      out.push_back(' ');
    } else if (c == '%') {
      if (i + 2 >= value.size()) {
        throw EncodingError("Truncated percent escape in: " + value);
      }
      const int high = hex_value(value[i + 1]);
      const int low = hex_value(value[i + 2]);
      if (high < 0 || low < 0) {
        throw EncodingError("Invalid percent escape in: " + value);
      }
      out.push_back(static_cast<char>((high << 4) | low));
      i += 2;
    } else {
      out.push_back(c);
    }
  }
  return out;
}

std::map<std::string, std::string> parse_query(const std::string& query) {
  std::map<std::string, std::string> params;
  size_t start = 0;
  while (start <= query.size()) {
    size_t end = query.find('&', start);
    if (end == std::string::npos) {
      end = query.size();
    }
    const std::string pair = query.substr(start, end - start);
    if (!pair.empty()) {
      const size_t eq = pair.find('=');
      std::string key = url_decode(pair.substr(0, eq));
      std::string val = eq == std::string::npos ? std::string() : url_decode(pair.substr(eq + 1));
      params.emplace(std::move(key), std::move(val));
    }
    start = end + 1;
  }
  return params;
}

std::string build_query(const std::vector<std::pair<std::string, std::string>>& params) {
  std::string out;
  for (const auto& [key, val] : params) {
    if (!out.empty()) {
      out.push_back('&');
    }
    out += url_encode(key);
    out.push_back('=');
    out += url_encode(val);
  }
  return out;
}

} // namespace dfp::utils
