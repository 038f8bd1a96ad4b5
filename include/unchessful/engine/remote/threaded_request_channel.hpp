#pragma once
#include <atomic>
#include <future>
#include <memory>
#include <unordered_map>

#include "request_channel.hpp"
#include "unchessful/engine/worker_pool.hpp"
#include "unchessful/net/http_transport.hpp"

namespace unchessful::engine {

// Runs each exchange as a packaged task on a worker pool; the task's future is
// the handoff back to the polling thread. Abandoning raises the task's cancel
// flag, which the transport checks while it waits.
class ThreadedRequestChannel final : public IRequestChannel {
 public:
  explicit ThreadedRequestChannel(std::shared_ptr<net::IHttpTransport> transport,
                                  int workers = 2);
  ~ThreadedRequestChannel() override;

  RequestHandle send(net::HttpRequest req) override;
  std::optional<net::HttpResponse> poll(RequestHandle h) override;
  void abandon(RequestHandle h) override;

  [[nodiscard]] std::size_t outstanding() const override { return m_slots.size(); }
  [[nodiscard]] config::Scheduling scheduling() const override {
    return config::Scheduling::Threaded;
  }

 private:
  struct Slot {
    std::future<net::HttpResponse> result;
    std::shared_ptr<std::atomic<bool>> cancel;
  };

  std::shared_ptr<net::IHttpTransport> m_transport;
  RequestHandle m_next_handle = 1;
  std::unordered_map<RequestHandle, Slot> m_slots;
  // last member: joined before the slots go away
  WorkerPool m_pool;
};

}  // namespace unchessful::engine
