#ifndef DFP_UTILS_JSON_HPP
#define DFP_UTILS_JSON_HPP

#include <set>
#include <stdexcept>
#include <string>
#include <boost/property_tree/ptree.hpp>

namespace dfp::utils {

using Json = boost::property_tree::ptree;

class JsonError : public std::runtime_error {
public:
  explicit JsonError(const std::string& message) : std::runtime_error(message) {}
};

// Parses a JSON object; throws JsonError on malformed input
Json parse_json(const std::string& text);

// Serialises a flat or nested tree on one line. Property trees store every
// value as text, so values whose key is listed in `numeric_keys` are written
// without quotes.
std::string to_json(const Json& tree, const std::set<std::string>& numeric_keys = {});

} // namespace dfp::utils

#endif // DFP_UTILS_JSON_HPP
