#include <gtest/gtest.h>
#include <serialization/exchange_string.hpp>
#include <serialization/blueprint_json.hpp>
#include <layout/furnace_line_builder.hpp>
#include "test_helpers.hpp"
#include <string>
#include <vector>

using namespace furnaceline;
using furnaceline::test::make_config;

namespace {

std::vector<uint8_t> bytes_of(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

}  // namespace

TEST(Base64, KnownVectors) {
    EXPECT_EQ(base64_encode(bytes_of("")), "");
    EXPECT_EQ(base64_encode(bytes_of("f")), "Zg==");
    EXPECT_EQ(base64_encode(bytes_of("fo")), "Zm8=");
    EXPECT_EQ(base64_encode(bytes_of("foo")), "Zm9v");
    EXPECT_EQ(base64_encode(bytes_of("foob")), "Zm9vYg==");
    EXPECT_EQ(base64_encode(bytes_of("fooba")), "Zm9vYmE=");
    EXPECT_EQ(base64_encode(bytes_of("foobar")), "Zm9vYmFy");
}

TEST(Base64, HighBytesUseFullAlphabet) {
    EXPECT_EQ(base64_encode({0xFB, 0xFF, 0xBF}), "+/+/");
    EXPECT_EQ(base64_encode({0x00, 0x00, 0x00}), "AAAA");
}

TEST(Deflate, ProducesZlibStreamAtMaxLevel) {
    std::string input(1000, 'a');
    std::vector<uint8_t> compressed = deflate_bytes(input, 9);

    ASSERT_GE(compressed.size(), 2u);
    EXPECT_EQ(compressed[0], 0x78);
    EXPECT_EQ(compressed[1], 0xDA);
    EXPECT_LT(compressed.size(), input.size());
    EXPECT_EQ(test::inflate_bytes(compressed), input);
}

TEST(Deflate, EmptyInput) {
    std::vector<uint8_t> compressed = deflate_bytes("", 9);
    EXPECT_FALSE(compressed.empty());
    EXPECT_EQ(test::inflate_bytes(compressed), "");
}

TEST(Deflate, InvalidLevelFails) {
    EXPECT_THROW(deflate_bytes("abc", 42), std::runtime_error);
}

TEST(ExchangeString, Envelope) {
    std::string encoded = encode_blueprint(
        generate_furnace_blueprint(make_config(Side::North, Side::South, 3)));

    ASSERT_FALSE(encoded.empty());
    EXPECT_EQ(encoded[0], '0');

    std::string body = encoded.substr(1);
    EXPECT_EQ(body.size() % 4, 0u);
    EXPECT_EQ(body.find_first_not_of(
                  "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/="),
              std::string::npos);
}

TEST(ExchangeString, RoundTripMatchesStructuredOutput) {
    std::vector<FurnaceLineConfig> configs = {
        FurnaceLineConfig{},
        make_config(Side::East, Side::West, 1),
        make_config(Side::South, Side::North, 17),
        make_config(Side::West, Side::East, 200),
    };
    configs[1].furnace = FurnaceType::Electric;
    configs[2].belt = BeltType::Express;
    configs[3].label = "Copper smelting \xE2\x9C\x93";

    for (const auto& config : configs) {
        Blueprint bp = generate_furnace_blueprint(config);
        nlohmann::ordered_json decoded = test::decode_exchange_string(encode_blueprint(bp));
        EXPECT_EQ(decoded, blueprint_to_json(bp));
    }
}

TEST(ExchangeString, DecodedTextIsCanonicalJson) {
    Blueprint bp = generate_furnace_blueprint(make_config(Side::North, Side::South, 2));
    std::string encoded = encode_blueprint(bp);
    std::string text = test::inflate_bytes(test::base64_decode(encoded.substr(1)));
    EXPECT_EQ(text, to_canonical_json(bp));
}

TEST(ExchangeString, Deterministic) {
    FurnaceLineConfig config = make_config(Side::West, Side::East, 12);
    EXPECT_EQ(encode_blueprint(generate_furnace_blueprint(config)),
              encode_blueprint(generate_furnace_blueprint(config)));
}
