#include <ctype.h>
#include <errno.h>
#include <stdint.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <gtest/gtest.h>

#include "base/config.h"
#include "base/request_hook.h"
#include "base/timer.h"
#include "base/xml.h"
#include "crypto/hex.h"
#include "crypto/md5.h"
#include "transfer/getter.h"
#include "transfer/tests/mock_s3.h"

namespace s3stream {
namespace transfer {
namespace tests {

namespace {
const std::string URL = "http://bucket.mock/obj";
const std::string DIGEST_URL = "http://bucket.mock/.md5/obj.md5";
const std::string PATH = "/obj";
const std::string DIGEST_PATH = "/.md5/obj.md5";

std::string Md5Hex(const std::string &data) {
  return crypto::Md5::Compute<crypto::Hex>(data);
}

std::string MakeTestData(size_t size) {
  std::string data(size, '\0');

  for (size_t i = 0; i < size; i++)
    data[i] = static_cast<char>((i * 7919 + i / 13) & 0xff);

  return data;
}

class GetterTest : public ::testing::Test {
 protected:
  void SetUp() override {
    static std::once_flag flag;
    std::call_once(flag, []() { base::XmlDocument::Init(); });

    min_part_size_ = base::Config::min_part_size();
    base::Config::set_min_part_size(1);

    config_.http_client = &s3_;
    config_.scheme = "http";
    config_.part_size = 100;
    config_.concurrency = 4;
    config_.max_retries = 3;
  }

  void TearDown() override { base::Config::set_min_part_size(min_part_size_); }

  // Stores |data| along with its digest.
  void PutWithDigest(const std::string &data) {
    s3_.PutObject(PATH, data);
    s3_.PutObject(DIGEST_PATH, Md5Hex(data));
  }

  int Open(std::unique_ptr<Getter> *getter,
           base::HeaderMap *headers = nullptr) {
    return Getter::Open(URL, DIGEST_URL, nullptr, config_, getter, headers);
  }

  // Reads until the end of the object, in |chunk|-byte reads.
  int ReadAll(Getter *getter, size_t chunk, std::string *out) {
    std::string buffer(chunk, '\0');

    out->clear();

    while (true) {
      const ssize_t r = getter->Read(&buffer[0], chunk);

      if (r < 0) return static_cast<int>(r);
      if (r == 0) return 0;

      out->append(buffer.data(), r);
    }
  }

  MockS3 s3_;
  TransferConfig config_;
  int64_t min_part_size_ = 0;
};
}  // namespace

TEST_F(GetterTest, ReadsWholeObject) {
  const std::string data = MakeTestData(1050);
  std::unique_ptr<Getter> getter;
  std::string out;

  PutWithDigest(data);

  ASSERT_EQ(0, Open(&getter));
  EXPECT_EQ(1050, getter->content_length());

  EXPECT_EQ(0, ReadAll(getter.get(), 333, &out));
  EXPECT_EQ(data, out);
  EXPECT_EQ(1050u, getter->bytes_read());
  EXPECT_EQ(Md5Hex(data), getter->md5());
  EXPECT_EQ(11, s3_.CountRequests("GET /obj bytes="));
  EXPECT_EQ(0, getter->Close());
}

TEST_F(GetterTest, OrderSurvivesOutOfOrderCompletion) {
  const std::string data = MakeTestData(800);
  std::unique_ptr<Getter> getter;
  std::string out;

  PutWithDigest(data);
  s3_.SetDelay("bytes=0-", 150);
  s3_.SetDelay("bytes=200-", 75);

  ASSERT_EQ(0, Open(&getter));
  EXPECT_EQ(0, ReadAll(getter.get(), 64, &out));
  EXPECT_EQ(data, out);
}

TEST_F(GetterTest, SequentialAndParallelAgree) {
  const std::string data = MakeTestData(2 * 100);
  std::string sequential, parallel;

  PutWithDigest(data);

  {
    std::unique_ptr<Getter> getter;

    config_.concurrency = 1;
    ASSERT_EQ(0, Open(&getter));
    EXPECT_EQ(0, ReadAll(getter.get(), 4096, &sequential));
  }

  {
    std::unique_ptr<Getter> getter;

    config_.concurrency = 4;
    ASSERT_EQ(0, Open(&getter));
    EXPECT_EQ(0, ReadAll(getter.get(), 4096, &parallel));
  }

  EXPECT_EQ(data, sequential);
  EXPECT_EQ(sequential, parallel);
  EXPECT_EQ(4, s3_.CountRequests("GET /obj bytes="));
}

TEST_F(GetterTest, EmptyObject) {
  std::unique_ptr<Getter> getter;
  char c = 0;

  PutWithDigest("");

  ASSERT_EQ(0, Open(&getter));
  EXPECT_EQ(0, getter->content_length());
  EXPECT_EQ(0, getter->Read(&c, 1));
  EXPECT_EQ(0, s3_.CountRequests("bytes="));
  EXPECT_EQ(0, getter->Close());
}

TEST_F(GetterTest, PartCount) {
  EXPECT_EQ(0u, Getter::GetPartCount(0, 100));
  EXPECT_EQ(1u, Getter::GetPartCount(1, 100));
  EXPECT_EQ(1u, Getter::GetPartCount(100, 100));
  EXPECT_EQ(2u, Getter::GetPartCount(101, 100));
}

TEST_F(GetterTest, PartCountNearLargestLength) {
  EXPECT_EQ(static_cast<size_t>(INT64_MAX / 100 + 1),
            Getter::GetPartCount(INT64_MAX, 100));
  EXPECT_EQ(1u, Getter::GetPartCount(INT64_MAX, INT64_MAX));
  EXPECT_EQ(2u, Getter::GetPartCount(INT64_MAX, INT64_MAX / 2 + 1));
}

TEST_F(GetterTest, ZeroSizeReadReturnsNothing) {
  std::unique_ptr<Getter> getter;
  char c = 0;

  PutWithDigest(MakeTestData(10));

  ASSERT_EQ(0, Open(&getter));
  EXPECT_EQ(0, getter->Read(&c, 0));
  EXPECT_EQ(0u, getter->bytes_read());
}

TEST_F(GetterTest, MissingObject) {
  std::unique_ptr<Getter> getter;

  EXPECT_EQ(-ENOENT, Open(&getter));
  EXPECT_FALSE(getter);
  EXPECT_EQ(1, s3_.CountRequests("HEAD /obj"));
}

TEST_F(GetterTest, InvalidConfig) {
  std::unique_ptr<Getter> getter;

  config_.concurrency = 0;
  EXPECT_EQ(-EINVAL, Open(&getter));
  EXPECT_EQ(0, s3_.CountRequests(""));
}

TEST_F(GetterTest, ReturnsHeaders) {
  std::unique_ptr<Getter> getter;
  base::HeaderMap headers;
  const std::string data = MakeTestData(10);

  PutWithDigest(data);

  ASSERT_EQ(0, Open(&getter, &headers));
  EXPECT_EQ("10", headers["content-length"]);
  EXPECT_EQ("\"" + Md5Hex(data) + "\"", headers["ETag"]);
}

TEST_F(GetterTest, RetriesFailedHead) {
  std::unique_ptr<Getter> getter;

  PutWithDigest(MakeTestData(10));
  s3_.InjectFault("HEAD /obj", MockS3::FaultType::STATUS, 2, 503);

  ASSERT_EQ(0, Open(&getter));
  EXPECT_EQ(3, s3_.CountRequests("HEAD /obj"));
}

TEST_F(GetterTest, RetriesTransientPartFailures) {
  const std::string data = MakeTestData(500);
  std::unique_ptr<Getter> getter;
  std::string out;

  PutWithDigest(data);
  s3_.InjectFault("bytes=100-", MockS3::FaultType::STATUS, 2, 500);
  s3_.InjectFault("bytes=300-", MockS3::FaultType::TRANSPORT_ERROR, 3,
                  -ETIMEDOUT);
  s3_.InjectFault("bytes=400-", MockS3::FaultType::TRANSPORT_ERROR, 1,
                  -EAGAIN);

  ASSERT_EQ(0, Open(&getter));
  EXPECT_EQ(0, ReadAll(getter.get(), 1000, &out));
  EXPECT_EQ(data, out);
  EXPECT_EQ(3, s3_.CountRequests("bytes=100-"));
  EXPECT_EQ(4, s3_.CountRequests("bytes=300-"));
  EXPECT_EQ(2, s3_.CountRequests("bytes=400-"));
  EXPECT_EQ(1, s3_.CountRequests("bytes=0-"));
}

TEST_F(GetterTest, PlainBadRequestIsNotRetried) {
  const std::string data = MakeTestData(150);
  std::unique_ptr<Getter> getter;
  std::string out;

  PutWithDigest(data);
  s3_.InjectFault("bytes=100-", MockS3::FaultType::STATUS, 1, 400);

  ASSERT_EQ(0, Open(&getter));
  EXPECT_EQ(-EPROTO, ReadAll(getter.get(), 1000, &out));
  EXPECT_EQ(1, s3_.CountRequests("bytes=100-"));
}

TEST_F(GetterTest, GivesUpAfterMaxRetries) {
  std::unique_ptr<Getter> getter;
  std::string out;

  PutWithDigest(MakeTestData(300));
  s3_.InjectFault("bytes=100-", MockS3::FaultType::STATUS, 100, 500);

  ASSERT_EQ(0, Open(&getter));
  EXPECT_EQ(-EAGAIN, ReadAll(getter.get(), 1000, &out));
  EXPECT_EQ(4, s3_.CountRequests("bytes=100-"));
  EXPECT_EQ(-EAGAIN, getter->Close());
}

TEST_F(GetterTest, NoRetriesAllowed) {
  std::unique_ptr<Getter> getter;
  std::string out;

  config_.max_retries = 0;
  PutWithDigest(MakeTestData(300));
  s3_.InjectFault("bytes=200-", MockS3::FaultType::STATUS, 1, 503);

  ASSERT_EQ(0, Open(&getter));
  EXPECT_EQ(-EAGAIN, ReadAll(getter.get(), 1000, &out));
  EXPECT_EQ(1, s3_.CountRequests("bytes=200-"));
}

TEST_F(GetterTest, ShortPartIsNotRetried) {
  std::unique_ptr<Getter> getter;
  std::string out;

  PutWithDigest(MakeTestData(300));
  s3_.InjectFault("bytes=100-", MockS3::FaultType::SHORT_BODY, 1);

  ASSERT_EQ(0, Open(&getter));
  EXPECT_EQ(-EBADMSG, ReadAll(getter.get(), 1000, &out));
  EXPECT_EQ(1, s3_.CountRequests("bytes=100-"));
}

TEST_F(GetterTest, WrongRangeIsProtocolError) {
  std::unique_ptr<Getter> getter;
  std::string out;

  PutWithDigest(MakeTestData(300));
  s3_.InjectFault("bytes=200-", MockS3::FaultType::BAD_RANGE, 1);

  ASSERT_EQ(0, Open(&getter));
  EXPECT_EQ(-EPROTO, ReadAll(getter.get(), 1000, &out));
}

TEST_F(GetterTest, DataBeforeFailureIsDelivered) {
  const std::string data = MakeTestData(300);
  std::unique_ptr<Getter> getter;
  std::string buffer(100, '\0');

  config_.concurrency = 1;
  PutWithDigest(data);
  s3_.InjectFault("bytes=100-", MockS3::FaultType::STATUS, 1, 403);

  ASSERT_EQ(0, Open(&getter));
  ASSERT_EQ(100, getter->Read(&buffer[0], 100));
  EXPECT_EQ(data.substr(0, 100), buffer);
  EXPECT_EQ(-EPROTO, getter->Read(&buffer[0], 100));
  EXPECT_EQ(-EPROTO, getter->Close());
}

TEST_F(GetterTest, VerifiesDigest) {
  const std::string data = MakeTestData(250);
  std::unique_ptr<Getter> getter;
  std::string out;

  PutWithDigest(data);

  ASSERT_EQ(0, Open(&getter));
  EXPECT_EQ(0, ReadAll(getter.get(), 1000, &out));
  EXPECT_EQ(1, s3_.CountRequests("GET " + DIGEST_PATH));
}

TEST_F(GetterTest, UppercaseDigestMatches) {
  const std::string data = MakeTestData(250);
  std::unique_ptr<Getter> getter;
  std::string out;
  std::string digest = Md5Hex(data);

  for (auto &c : digest) c = toupper(c);

  s3_.PutObject(PATH, data);
  s3_.PutObject(DIGEST_PATH, digest + "\n");

  ASSERT_EQ(0, Open(&getter));
  EXPECT_EQ(0, ReadAll(getter.get(), 1000, &out));
}

TEST_F(GetterTest, CorruptPartFailsDigest) {
  const std::string data = MakeTestData(250);
  std::unique_ptr<Getter> getter;
  std::string out;

  PutWithDigest(data);
  s3_.InjectFault("bytes=100-", MockS3::FaultType::CORRUPT_BODY, 1);

  ASSERT_EQ(0, Open(&getter));
  EXPECT_EQ(-EBADMSG, ReadAll(getter.get(), 1000, &out));

  // every byte was still handed over
  EXPECT_EQ(data.size(), out.size());
  EXPECT_NE(data, out);
  EXPECT_EQ(-EBADMSG, getter->Close());
}

TEST_F(GetterTest, MissingDigestIsNotAnError) {
  const std::string data = MakeTestData(250);

  s3_.PutObject(PATH, data);

  for (bool verify : {true, false}) {
    std::unique_ptr<Getter> getter;
    std::string out;

    config_.verify_checksum = verify;

    ASSERT_EQ(0, Open(&getter));
    EXPECT_EQ(0, ReadAll(getter.get(), 1000, &out));
    EXPECT_EQ(data, out);
    EXPECT_EQ(0, getter->Close());
  }
}

TEST_F(GetterTest, NoDigestRequestWhenNotVerifying) {
  const std::string data = MakeTestData(250);
  std::unique_ptr<Getter> getter;
  std::string out;

  config_.verify_checksum = false;
  s3_.PutObject(PATH, data);
  s3_.PutObject(DIGEST_PATH, "00000000000000000000000000000000");

  ASSERT_EQ(0, Open(&getter));
  EXPECT_EQ(0, ReadAll(getter.get(), 1000, &out));
  EXPECT_EQ(0, s3_.CountRequests(DIGEST_PATH));
}

TEST_F(GetterTest, BoundsRequestsInFlight) {
  for (int concurrency : {1, 5, 10}) {
    MockS3 s3;
    std::unique_ptr<Getter> getter;
    std::string out;
    const std::string data = MakeTestData(3000);

    s3.PutObject(PATH, data);
    s3.SetDelay("bytes=", 5);

    config_.http_client = &s3;
    config_.concurrency = concurrency;

    ASSERT_EQ(0, Open(&getter));
    EXPECT_EQ(0, ReadAll(getter.get(), 4096, &out));
    EXPECT_EQ(data, out);
    EXPECT_LE(s3.max_in_flight(), concurrency);
    EXPECT_EQ(30, s3.CountRequests("bytes="));

    getter.reset();
  }
}

TEST_F(GetterTest, UnreadPartsHoldSlots) {
  std::unique_ptr<Getter> getter;
  std::string buffer(100, '\0');

  config_.concurrency = 3;
  PutWithDigest(MakeTestData(1000));

  ASSERT_EQ(0, Open(&getter));

  // nothing is read, so nothing past the first three parts is requested
  base::Timer::SleepMs(200);
  EXPECT_EQ(3, s3_.CountRequests("bytes="));

  ASSERT_EQ(100, getter->Read(&buffer[0], 100));
  base::Timer::SleepMs(200);
  EXPECT_EQ(4, s3_.CountRequests("bytes="));
}

TEST_F(GetterTest, CloseUnblocksReader) {
  std::unique_ptr<Getter> getter;
  std::atomic_int read_result(1);
  std::string buffer(100, '\0');

  PutWithDigest(MakeTestData(300));
  s3_.SetDelay("bytes=0-", 1000);

  ASSERT_EQ(0, Open(&getter));

  std::thread reader(
      [&]() { read_result = getter->Read(&buffer[0], buffer.size()); });

  base::Timer::SleepMs(100);
  EXPECT_EQ(1, read_result.load());

  EXPECT_EQ(-ECANCELED, getter->Close());
  reader.join();

  EXPECT_EQ(-ECANCELED, read_result.load());
}

TEST_F(GetterTest, CloseBeforeEnd) {
  std::unique_ptr<Getter> getter;
  std::string buffer(50, '\0');

  PutWithDigest(MakeTestData(1000));

  ASSERT_EQ(0, Open(&getter));
  ASSERT_EQ(50, getter->Read(&buffer[0], buffer.size()));

  EXPECT_EQ(-ECANCELED, getter->Close());
  EXPECT_EQ(-ECANCELED, getter->Close());
  EXPECT_EQ(-EBADF, getter->Read(&buffer[0], buffer.size()));
}

TEST_F(GetterTest, CloseAfterLastByteVerifies) {
  const std::string data = MakeTestData(100);
  std::unique_ptr<Getter> getter;
  std::string buffer(100, '\0');

  s3_.PutObject(PATH, data);
  s3_.PutObject(DIGEST_PATH, "00000000000000000000000000000000");

  ASSERT_EQ(0, Open(&getter));
  ASSERT_EQ(100, getter->Read(&buffer[0], buffer.size()));

  // end of stream never seen by the reader
  EXPECT_EQ(-EBADMSG, getter->Close());
}

}  // namespace tests
}  // namespace transfer
}  // namespace s3stream
