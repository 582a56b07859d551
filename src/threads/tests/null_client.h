#ifndef S3STREAM_THREADS_TESTS_NULL_CLIENT_H
#define S3STREAM_THREADS_TESTS_NULL_CLIENT_H

#include <errno.h>

#include <memory>

#include "base/transport.h"

namespace s3stream {
namespace threads {
namespace tests {

// For work items that never send their request.
class NullClient : public base::HttpClient {
 public:
  std::unique_ptr<base::Transport> CreateTransport() override {
    return std::unique_ptr<base::Transport>(new NullTransport());
  }

  int timeout_in_s() const override { return 1; }

 private:
  class NullTransport : public base::Transport {
   public:
    void Perform(const base::Request &, int, base::Response *) override {
      throw base::TransportError(-EIO, "no transport in this test");
    }
  };
};

}  // namespace tests
}  // namespace threads
}  // namespace s3stream

#endif
