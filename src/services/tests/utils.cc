#include <map>
#include <memory>
#include <mutex>
#include <string>

#include <gtest/gtest.h>

#include "base/request.h"
#include "base/transport.h"
#include "base/xml.h"
#include "services/utils.h"

namespace s3stream {
namespace services {
namespace tests {

namespace {
// Responds with whatever status and body it was last given.
class CannedClient : public base::HttpClient {
 public:
  std::unique_ptr<base::Transport> CreateTransport() override {
    return std::unique_ptr<base::Transport>(new CannedTransport(this));
  }

  int timeout_in_s() const override { return 1; }

  int code = base::HTTP_SC_OK;
  std::string body;

 private:
  class CannedTransport : public base::Transport {
   public:
    explicit CannedTransport(CannedClient *client) : client_(client) {}

    void Perform(const base::Request &, int,
                 base::Response *response) override {
      response->code = client_->code;
      response->body.assign(client_->body.begin(), client_->body.end());
    }

   private:
    CannedClient *client_;
  };
};

class TransientResponseTest : public ::testing::Test {
 protected:
  TransientResponseTest() : factory_(&client_, nullptr) {
    static std::once_flag flag;
    std::call_once(flag, []() { base::XmlDocument::Init(); });
  }

  bool IsTransient(int code, const std::string &body = "") {
    client_.code = code;
    client_.body = body;

    auto req = factory_.New();
    req->Init(base::HttpMethod::GET);
    req->SetUrl("http://bucket.example.com/key");
    req->Run();

    return IsTransientResponse(*req);
  }

  CannedClient client_;
  base::RequestFactory factory_;
};
}  // namespace

TEST_F(TransientResponseTest, ServerErrors) {
  EXPECT_TRUE(IsTransient(500));
  EXPECT_TRUE(IsTransient(503));
  EXPECT_TRUE(IsTransient(502));
  EXPECT_TRUE(IsTransient(504));
}

TEST_F(TransientResponseTest, Success) {
  EXPECT_FALSE(IsTransient(200));
  EXPECT_FALSE(IsTransient(206));
}

TEST_F(TransientResponseTest, ClientErrors) {
  EXPECT_FALSE(IsTransient(403));
  EXPECT_FALSE(IsTransient(404));
  EXPECT_FALSE(IsTransient(416));
}

TEST_F(TransientResponseTest, BadRequest) {
  EXPECT_TRUE(IsTransient(400,
                          "<?xml version=\"1.0\" encoding=\"UTF-8\"?>"
                          "<Error><Code>RequestTimeout</Code>"
                          "<Message>Idle connection.</Message></Error>"));
  EXPECT_FALSE(IsTransient(400,
                           "<?xml version=\"1.0\" encoding=\"UTF-8\"?>"
                           "<Error><Code>BadDigest</Code></Error>"));
  EXPECT_FALSE(IsTransient(400, "not xml"));
  EXPECT_FALSE(IsTransient(400));
}

TEST(FindOrDefault, Map) {
  std::map<std::string, std::string> m = {{"a", "1"}};

  EXPECT_EQ("1", FindOrDefault(m, "a"));
  EXPECT_EQ("", FindOrDefault(m, "b"));

  base::HeaderMap headers = {{"Content-Type", "text/plain"}};
  EXPECT_EQ("text/plain", FindOrDefault(headers, "content-type"));
}

}  // namespace tests
}  // namespace services
}  // namespace s3stream
