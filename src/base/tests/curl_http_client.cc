#include <memory>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "base/curl_http_client.h"
#include "base/request.h"
#include "base/transport.h"

namespace s3stream {
namespace base {
namespace tests {

TEST(CurlHttpClient, TransportsOutliveEachOther) {
  CurlHttpClient client(5);

  auto first = client.CreateTransport();
  auto second = client.CreateTransport();

  ASSERT_TRUE(first);
  ASSERT_TRUE(second);

  first.reset();
  second.reset();

  // the library is set up again once every transport is gone
  EXPECT_TRUE(client.CreateTransport());
}

TEST(CurlHttpClient, ConcurrentTransports) {
  CurlHttpClient client(5);
  std::vector<std::thread> threads;

  for (int i = 0; i < 8; i++)
    threads.emplace_back([&client]() {
      for (int j = 0; j < 20; j++) EXPECT_TRUE(client.CreateTransport());
    });

  for (auto &t : threads) t.join();
}

TEST(CurlHttpClient, RefusedConnectionRaisesTransportError) {
  CurlHttpClient client(5);
  RequestFactory factory(&client, nullptr);
  auto req = factory.New();

  req->Init(HttpMethod::GET);
  req->SetUrl("http://127.0.0.1:1/");

  EXPECT_THROW(req->Run(5), TransportError);
}

}  // namespace tests
}  // namespace base
}  // namespace s3stream
