#include "utils/json.hpp"
#include <regex>
#include <sstream>
#include <boost/property_tree/json_parser.hpp>

namespace dfp::utils {

namespace {

// Matches -?digits(.digits)?([eE][+-]?digits)? over text[begin, end)
bool is_number(const std::string& text, size_t begin, size_t end) {
  static const std::regex number("-?[0-9]+(\\.[0-9]+)?([eE][-+]?[0-9]+)?");
  if (begin >= end || end - begin > 64) {
    return false;
  }
  return std::regex_match(text.begin() + static_cast<std::ptrdiff_t>(begin),
                          text.begin() + static_cast<std::ptrdiff_t>(end), number);
}

} // namespace

Json parse_json(const std::string& text) {
  Json tree;
  std::istringstream input(text);
  try {
    boost::property_tree::read_json(input, tree);
  } catch (const boost::property_tree::json_parser_error& e) {
    throw JsonError("Invalid JSON: " + std::string(e.what()));
  }
  return tree;
}

std::string to_json(const Json& tree, const std::set<std::string>& numeric_keys) {
  std::ostringstream output;
  try {
    boost::property_tree::write_json(output, tree, false);
  } catch (const boost::property_tree::json_parser_error& e) {
    throw JsonError("Failed to serialise JSON: " + std::string(e.what()));
  }

  std::string text = output.str();
  // write_json terminates with a newline
  while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
    text.pop_back();
  }

  for (const auto& key : numeric_keys) {
    const std::string marker = "\"" + key + "\":\"";
    size_t pos = 0;
    while ((pos = text.find(marker, pos)) != std::string::npos) {
      const size_t value_start = pos + marker.size();
      const size_t value_end = text.find('"', value_start);
      if (value_end == std::string::npos) {
        break;
      }
      if (is_number(text, value_start, value_end)) {
        // Drop the closing quote first so value_start stays valid
        text.erase(value_end, 1);
        text.erase(value_start - 1, 1);
      }
      pos = value_start;
    }
  }
  return text;
}

} // namespace dfp::utils
