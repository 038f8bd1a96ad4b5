#include "unchessful/engine/remote/threaded_request_channel.hpp"

#include <chrono>

namespace unchessful::engine {

ThreadedRequestChannel::ThreadedRequestChannel(std::shared_ptr<net::IHttpTransport> transport,
                                               int workers)
    : m_transport(std::move(transport)), m_pool(workers) {}

ThreadedRequestChannel::~ThreadedRequestChannel() {
  for (auto& [h, slot] : m_slots) slot.cancel->store(true);
}

RequestHandle ThreadedRequestChannel::send(net::HttpRequest req) {
  const RequestHandle h = m_next_handle++;
  auto cancel = std::make_shared<std::atomic<bool>>(false);

  // the job owns everything it touches, so it may outlive an abandoned slot
  auto transport = m_transport;
  Slot slot;
  slot.cancel = cancel;
  slot.result = m_pool.submit([transport, cancel, req = std::move(req)]() {
    return transport->perform(req, *cancel);
  });
  m_slots.emplace(h, std::move(slot));
  return h;
}

std::optional<net::HttpResponse> ThreadedRequestChannel::poll(RequestHandle h) {
  auto it = m_slots.find(h);
  if (it == m_slots.end()) return std::nullopt;
  if (it->second.result.wait_for(std::chrono::seconds(0)) != std::future_status::ready)
    return std::nullopt;

  std::future<net::HttpResponse> ready = std::move(it->second.result);
  m_slots.erase(it);
  return ready.get();
}

void ThreadedRequestChannel::abandon(RequestHandle h) {
  auto it = m_slots.find(h);
  if (it == m_slots.end()) return;
  it->second.cancel->store(true);
  m_slots.erase(it);
}

}  // namespace unchessful::engine
