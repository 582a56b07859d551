#include <cstdint>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "crypto/base64.h"
#include "crypto/hex.h"
#include "crypto/hex_with_quotes.h"

namespace s3stream {
namespace crypto {
namespace tests {

namespace {
struct KnownAnswer {
  const char *plain;
  const char *hex;
  const char *hex_quote;
  const char *base64;
};

// base64 values are from RFC 4648
constexpr KnownAnswer KAT_TESTS[] = {
    {"", "", "\"\"", ""},
    {"f", "66", "\"66\"", "Zg=="},
    {"fo", "666f", "\"666f\"", "Zm8="},
    {"foo", "666f6f", "\"666f6f\"", "Zm9v"},
    {"foob", "666f6f62", "\"666f6f62\"", "Zm9vYg=="},
    {"fooba", "666f6f6261", "\"666f6f6261\"", "Zm9vYmE="},
    {"foobar", "666f6f626172", "\"666f6f626172\"", "Zm9vYmFy"},
    {"hello world!", "68656c6c6f20776f726c6421",
     "\"68656c6c6f20776f726c6421\"", "aGVsbG8gd29ybGQh"}};

template <class Encoding>
std::string Encode(const std::string &in) {
  return Encoding::Encode(reinterpret_cast<const uint8_t *>(in.data()),
                          in.size());
}

template <class Encoding>
void EncodeKat(const char *KnownAnswer::*output) {
  for (const auto &kat : KAT_TESTS)
    EXPECT_EQ(kat.*output, Encode<Encoding>(kat.plain))
        << "for input [" << kat.plain << "]";
}
}  // namespace

TEST(Hex, EncodeKnownAnswers) { EncodeKat<Hex>(&KnownAnswer::hex); }

TEST(Hex, EveryByteValue) {
  std::vector<uint8_t> in(256);

  for (size_t i = 0; i < in.size(); i++) in[i] = static_cast<uint8_t>(i);

  const std::string out = Hex::Encode(in.data(), in.size());

  ASSERT_EQ(512u, out.size());
  EXPECT_EQ("000102", out.substr(0, 6));
  EXPECT_EQ("7f80", out.substr(254, 4));
  EXPECT_EQ("fdfeff", out.substr(506));
  EXPECT_EQ(std::string::npos, out.find_first_not_of("0123456789abcdef"));
}

TEST(HexWithQuotes, EncodeKnownAnswers) {
  EncodeKat<HexWithQuotes>(&KnownAnswer::hex_quote);
}

TEST(Base64, EncodeKnownAnswers) { EncodeKat<Base64>(&KnownAnswer::base64); }

TEST(Base64, LargeInputHasNoLineBreaks) {
  const std::string in(100000, '\xfb');
  const std::string out = Encode<Base64>(in);

  EXPECT_EQ((in.size() + 2) / 3 * 4, out.size());
  EXPECT_EQ(std::string::npos, out.find('\n'));
  EXPECT_EQ("+/v7", out.substr(0, 4));
}

}  // namespace tests
}  // namespace crypto
}  // namespace s3stream
