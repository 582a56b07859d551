#include <unistd.h>

#include <fstream>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

#include "base/config.h"

namespace s3stream {
namespace base {
namespace tests {

namespace {
const char *TEMP_FILE = "/tmp/" PACKAGE_NAME ".test-config";

void WriteConfig(const std::string &contents) {
  std::ofstream f(TEMP_FILE, std::ofstream::out | std::ofstream::trunc);
  f << contents;
}

class ConfigTest : public ::testing::Test {
 protected:
  void TearDown() override {
    unlink(TEMP_FILE);

    Config::set_concurrency(10);
    Config::set_part_size(20 * 1024 * 1024);
    Config::set_max_retries(10);
    Config::set_verify_checksum(true);
    Config::set_url_scheme("https");
  }
};
}  // namespace

TEST_F(ConfigTest, LoadFromInvalidFile) {
  EXPECT_THROW(Config::Init("/tmp/this shouldn't be a file"),
               std::runtime_error);
}

TEST_F(ConfigTest, LoadEmptyFile) {
  WriteConfig("");
  EXPECT_THROW(Config::Init(TEMP_FILE), std::runtime_error);
}

TEST_F(ConfigTest, LoadCommentsOnly) {
  WriteConfig("# nothing here\n\n   # or here\n");
  EXPECT_THROW(Config::Init(TEMP_FILE), std::runtime_error);
}

TEST_F(ConfigTest, Defaults) {
  EXPECT_EQ(10, Config::concurrency());
  EXPECT_EQ(20 * 1024 * 1024, Config::part_size());
  EXPECT_EQ(10, Config::max_retries());
  EXPECT_TRUE(Config::verify_checksum());
  EXPECT_EQ("https", Config::url_scheme());
  EXPECT_EQ("s3.amazonaws.com", Config::default_domain());
}

TEST_F(ConfigTest, LoadValues) {
  WriteConfig(
      "# transfer settings\n"
      "concurrency = 4\n"
      "  part_size=6291456  \n"
      "max_retries = 0 # no retries\n"
      "verify_checksum = no\n"
      "url_scheme = http\n");

  ASSERT_NO_THROW(Config::Init(TEMP_FILE));

  EXPECT_EQ(4, Config::concurrency());
  EXPECT_EQ(6291456, Config::part_size());
  EXPECT_EQ(0, Config::max_retries());
  EXPECT_FALSE(Config::verify_checksum());
  EXPECT_EQ("http", Config::url_scheme());
}

TEST_F(ConfigTest, UnknownKey) {
  WriteConfig("no_such_key = 1\n");
  EXPECT_THROW(Config::Init(TEMP_FILE), std::runtime_error);
}

TEST_F(ConfigTest, MissingEquals) {
  WriteConfig("concurrency 4\n");
  EXPECT_THROW(Config::Init(TEMP_FILE), std::runtime_error);
}

TEST_F(ConfigTest, BadValue) {
  WriteConfig("concurrency = lots\n");
  EXPECT_THROW(Config::Init(TEMP_FILE), std::runtime_error);

  WriteConfig("verify_checksum = maybe\n");
  EXPECT_THROW(Config::Init(TEMP_FILE), std::runtime_error);
}

TEST_F(ConfigTest, ConstraintViolated) {
  WriteConfig("concurrency = 0\n");
  EXPECT_THROW(Config::Init(TEMP_FILE), std::runtime_error);

  WriteConfig("concurrency = 1\npart_size = 1024\n");
  EXPECT_THROW(Config::Init(TEMP_FILE), std::runtime_error);

  WriteConfig("concurrency = 1\npart_size = 6291456\nurl_scheme = ftp\n");
  EXPECT_THROW(Config::Init(TEMP_FILE), std::runtime_error);
}

}  // namespace tests
}  // namespace base
}  // namespace s3stream
