#include "unchessful/engine/remote/cooperative_request_channel.hpp"

#include <iostream>

namespace unchessful::engine {

CooperativeRequestChannel::CooperativeRequestChannel(
    std::shared_ptr<net::IAsyncHttpTransport> transport)
    : m_transport(std::move(transport)) {}

CooperativeRequestChannel::~CooperativeRequestChannel() {
  for (const auto& [h, id] : m_live) m_transport->discard(id);
  for (TransferId id : m_abandoned) m_transport->discard(id);
}

RequestHandle CooperativeRequestChannel::send(net::HttpRequest req) {
  const RequestHandle h = m_next_handle++;
  m_live.emplace(h, m_transport->start(req));
  return h;
}

void CooperativeRequestChannel::service() {
  m_transport->drive();
  reapAbandoned();
}

std::optional<net::HttpResponse> CooperativeRequestChannel::poll(RequestHandle h) {
  service();

  auto it = m_live.find(h);
  if (it == m_live.end()) return std::nullopt;
  auto resp = m_transport->take(it->second);
  if (!resp) return std::nullopt;
  m_live.erase(it);
  return resp;
}

void CooperativeRequestChannel::abandon(RequestHandle h) {
  auto it = m_live.find(h);
  if (it == m_live.end()) return;
  m_abandoned.push_back(it->second);
  m_live.erase(it);
}

void CooperativeRequestChannel::reapAbandoned() {
  for (auto it = m_abandoned.begin(); it != m_abandoned.end();) {
    if (m_transport->take(*it)) {
      std::cout << "[RequestChannel] dropped late response of an abandoned request\n";
      it = m_abandoned.erase(it);
    } else {
      ++it;
    }
  }
}

}  // namespace unchessful::engine
