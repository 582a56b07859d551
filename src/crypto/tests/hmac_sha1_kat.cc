#include <string>

#include <gtest/gtest.h>

#include "crypto/base64.h"
#include "crypto/hex.h"
#include "crypto/hmac_sha1.h"

namespace s3stream {
namespace crypto {
namespace tests {

namespace {
struct KnownAnswer {
  const char *key;
  const char *data;
  const char *mac;
};

// the first is from RFC 2202
constexpr KnownAnswer TESTS[] = {
    {"Jefe", "what do ya want for nothing?",
     "effcdf6ae5eb2fa2d27416d5f184df9c259a7c79"},
    {"key", "The quick brown fox jumps over the lazy dog",
     "de7c9b85b8b78aa6bc8a7a36f70a90701c9db4d9"},
};
}  // namespace

TEST(HmacSha1, KnownAnswers) {
  for (const auto &kat : TESTS)
    EXPECT_EQ(kat.mac, HmacSha1::Sign<Hex>(kat.key, kat.data))
        << "for key = " << kat.key;
}

TEST(HmacSha1, RawMacMatchesEncoded) {
  const std::string data = "what do ya want for nothing?";
  const HmacSha1::Mac mac = HmacSha1::Sign("Jefe", data);

  EXPECT_EQ(HmacSha1::Sign<Hex>("Jefe", data),
            Hex::Encode(mac.data(), mac.size()));
}

TEST(HmacSha1, AwsExampleSignature) {
  EXPECT_EQ("bWq2s1WEIj+Ydj0vQ697zp+IXMU=",
            HmacSha1::Sign<Base64>("wJalrXUtnFEMI/K7MDENG/bPxRfiCYEXAMPLEKEY",
                                   "GET\n\n\nTue, 27 Mar 2007 19:36:42 +0000\n"
                                   "/johnsmith/photos/puppy.jpg"));
}

}  // namespace tests
}  // namespace crypto
}  // namespace s3stream
