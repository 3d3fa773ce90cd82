#ifndef FURNACELINE_SERIALIZATION_EXCHANGE_STRING_HPP
#define FURNACELINE_SERIALIZATION_EXCHANGE_STRING_HPP

#include <blueprint/blueprint.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace furnaceline {

// Leading character of every exchange string
constexpr char EXCHANGE_VERSION_PREFIX = '0';

// zlib level used for blueprint strings
constexpr int EXCHANGE_COMPRESSION_LEVEL = 9;

// Compact JSON (no whitespace, declaration key order, non-ASCII escaped)
std::string to_canonical_json(const Blueprint& blueprint);

// zlib-wrapped deflate of `data`; throws std::runtime_error on failure
std::vector<uint8_t> deflate_bytes(std::string_view data, int level);

// Standard alphabet, padded
std::string base64_encode(const std::vector<uint8_t>& data);

// "0" + base64(deflate(canonical json, level 9))
std::string encode_blueprint(const Blueprint& blueprint);

}  // namespace furnaceline

#endif // FURNACELINE_SERIALIZATION_EXCHANGE_STRING_HPP
