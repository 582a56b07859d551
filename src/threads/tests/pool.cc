#include <errno.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "base/request.h"
#include "base/transport.h"
#include "threads/pool.h"
#include "threads/tests/null_client.h"

namespace s3stream {
namespace threads {
namespace tests {

TEST(Pool, NeedsWorkers) {
  NullClient client;
  base::RequestFactory factory(&client, nullptr);

  EXPECT_THROW(Pool("test", 0, &factory), std::runtime_error);
}

TEST(Pool, CallReturnsResult) {
  NullClient client;
  base::RequestFactory factory(&client, nullptr);
  Pool pool("test", 2, &factory);

  EXPECT_EQ(42, pool.Call([](base::Request *) { return 42; }));
  EXPECT_EQ(-ENOENT, pool.Call([](base::Request *) { return -ENOENT; }));
}

TEST(Pool, EachWorkerHasARequest) {
  NullClient client;
  base::RequestFactory factory(&client, nullptr);
  Pool pool("test", 1, &factory);

  EXPECT_EQ(0, pool.Call([](base::Request *req) { return req ? 0 : -EINVAL; }));
}

TEST(Pool, TransportErrorBecomesCode) {
  NullClient client;
  base::RequestFactory factory(&client, nullptr);
  Pool pool("test", 1, &factory);

  EXPECT_EQ(-ETIMEDOUT, pool.Call([](base::Request *) -> int {
    throw base::TransportError(-ETIMEDOUT, "timed out");
  }));

  // the null transport throws -EIO
  EXPECT_EQ(-EIO, pool.Call([](base::Request *req) {
    req->Init(base::HttpMethod::GET);
    req->SetUrl("http://example.com/");
    req->Run();
    return 0;
  }));
}

TEST(Pool, OtherExceptionBecomesEio) {
  NullClient client;
  base::RequestFactory factory(&client, nullptr);
  Pool pool("test", 1, &factory);

  EXPECT_EQ(-EIO, pool.Call([](base::Request *) -> int {
    throw std::runtime_error("something broke");
  }));
}

TEST(Pool, PostRunsCallback) {
  NullClient client;
  base::RequestFactory factory(&client, nullptr);
  Pool pool("test", 4, &factory);

  std::atomic_int sum(0), calls(0);

  for (int i = 1; i <= 100; i++)
    pool.Post([i](base::Request *) { return i; },
              [&sum, &calls](int r) {
                sum += r;
                ++calls;
              });

  // callbacks may still be running
  while (calls.load() < 100) std::this_thread::yield();
  EXPECT_EQ(5050, sum.load());
}

TEST(Pool, ConcurrentCalls) {
  NullClient client;
  base::RequestFactory factory(&client, nullptr);
  Pool pool("test", 3, &factory);
  std::vector<std::thread> callers;
  std::atomic_int sum(0);

  for (int i = 1; i <= 10; i++)
    callers.emplace_back([&pool, &sum, i]() {
      sum += pool.Call([i](base::Request *) { return i; });
    });

  for (auto &t : callers) t.join();

  EXPECT_EQ(55, sum.load());
}

TEST(Pool, DestructionDropsQueuedItems) {
  NullClient client;
  base::RequestFactory factory(&client, nullptr);
  std::atomic_int callbacks(0);
  std::atomic_bool started(false), release(false);
  std::thread releaser;

  {
    Pool pool("test", 1, &factory);

    // keeps the only worker busy while more items queue up behind it
    pool.Post(
        [&started, &release](base::Request *) {
          started = true;
          while (!release.load()) std::this_thread::yield();
          return 0;
        },
        [&callbacks](int) { ++callbacks; });

    while (!started.load()) std::this_thread::yield();

    for (int i = 0; i < 5; i++)
      pool.Post([](base::Request *) { return 0; },
                [&callbacks](int) { ++callbacks; });

    releaser = std::thread([&release]() {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
      release = true;
    });
  }

  releaser.join();
  EXPECT_EQ(1, callbacks.load());
}

}  // namespace tests
}  // namespace threads
}  // namespace s3stream
