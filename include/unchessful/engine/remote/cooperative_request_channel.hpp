#pragma once
#include <memory>
#include <unordered_map>
#include <vector>

#include "request_channel.hpp"
#include "unchessful/net/http_transport.hpp"

namespace unchessful::engine {

// Single-threaded channel: service() and every poll drive the transport
// forward. Abandoned transfers are left to run out and their responses are
// thrown away when they show up.
class CooperativeRequestChannel final : public IRequestChannel {
 public:
  explicit CooperativeRequestChannel(std::shared_ptr<net::IAsyncHttpTransport> transport);
  ~CooperativeRequestChannel() override;

  CooperativeRequestChannel(const CooperativeRequestChannel&) = delete;
  CooperativeRequestChannel& operator=(const CooperativeRequestChannel&) = delete;

  RequestHandle send(net::HttpRequest req) override;
  std::optional<net::HttpResponse> poll(RequestHandle h) override;
  void abandon(RequestHandle h) override;
  void service() override;

  [[nodiscard]] std::size_t outstanding() const override { return m_live.size(); }
  [[nodiscard]] config::Scheduling scheduling() const override {
    return config::Scheduling::Cooperative;
  }
  [[nodiscard]] std::size_t abandonedInFlight() const noexcept { return m_abandoned.size(); }

 private:
  using TransferId = net::IAsyncHttpTransport::TransferId;

  void reapAbandoned();

  std::shared_ptr<net::IAsyncHttpTransport> m_transport;
  RequestHandle m_next_handle = 1;
  std::unordered_map<RequestHandle, TransferId> m_live;
  std::vector<TransferId> m_abandoned;
};

}  // namespace unchessful::engine
