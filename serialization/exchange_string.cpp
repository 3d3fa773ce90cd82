#include "exchange_string.hpp"
#include "blueprint_json.hpp"
#include <common/logging.hpp>
#include <stdexcept>
#include <zlib.h>

namespace furnaceline {

std::string to_canonical_json(const Blueprint& blueprint) {
    // Non-ASCII escaped as \uXXXX so the payload is pure ASCII
    return blueprint_to_json(blueprint).dump(-1, ' ', true);
}

std::vector<uint8_t> deflate_bytes(std::string_view data, int level) {
    uLongf compressed_size = compressBound(static_cast<uLong>(data.size()));
    std::vector<uint8_t> compressed(compressed_size);

    int result = compress2(
        compressed.data(),
        &compressed_size,
        reinterpret_cast<const Bytef*>(data.data()),
        static_cast<uLong>(data.size()),
        level
    );

    if (result != Z_OK) {
        throw std::runtime_error("zlib compress2 failed with code " + std::to_string(result));
    }

    compressed.resize(compressed_size);
    return compressed;
}

std::string base64_encode(const std::vector<uint8_t>& data) {
    static const char* alphabet =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string out;
    out.reserve(((data.size() + 2) / 3) * 4);

    size_t i = 0;
    for (; i + 2 < data.size(); i += 3) {
        uint32_t triple = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8) | data[i + 2];
        out.push_back(alphabet[(triple >> 18) & 0x3F]);
        out.push_back(alphabet[(triple >> 12) & 0x3F]);
        out.push_back(alphabet[(triple >> 6) & 0x3F]);
        out.push_back(alphabet[triple & 0x3F]);
    }

    size_t remaining = data.size() - i;
    if (remaining == 1) {
        uint32_t triple = uint32_t(data[i]) << 16;
        out.push_back(alphabet[(triple >> 18) & 0x3F]);
        out.push_back(alphabet[(triple >> 12) & 0x3F]);
        out += "==";
    } else if (remaining == 2) {
        uint32_t triple = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8);
        out.push_back(alphabet[(triple >> 18) & 0x3F]);
        out.push_back(alphabet[(triple >> 12) & 0x3F]);
        out.push_back(alphabet[(triple >> 6) & 0x3F]);
        out.push_back('=');
    }

    return out;
}

std::string encode_blueprint(const Blueprint& blueprint) {
    auto log = furnaceline::logging::get_logger();

    std::string json_text = to_canonical_json(blueprint);
    std::vector<uint8_t> compressed = deflate_bytes(json_text, EXCHANGE_COMPRESSION_LEVEL);
    std::string encoded = EXCHANGE_VERSION_PREFIX + base64_encode(compressed);

    log->debug("Exchange string: {} json bytes, {} compressed, {} encoded",
               json_text.size(), compressed.size(), encoded.size());
    return encoded;
}

}  // namespace furnaceline
