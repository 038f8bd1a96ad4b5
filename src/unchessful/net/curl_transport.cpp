#include "unchessful/net/curl_transport.hpp"

#include <cstdint>
#include <iostream>

#include "curl_easy.hpp"

namespace unchessful::net {

namespace {

int abortWhenCancelled(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
  const auto* cancel = static_cast<const std::atomic<bool>*>(clientp);
  return cancel->load(std::memory_order_relaxed) ? 1 : 0;
}

HttpResponse failure(TransferResult result, std::string msg) {
  HttpResponse resp;
  resp.result = result;
  resp.error = std::move(msg);
  return resp;
}

}  // namespace

CurlTransport::CurlTransport() : m_global(CurlGlobal::acquire()) {}

HttpResponse CurlTransport::perform(const HttpRequest& req, const std::atomic<bool>& cancel) {
  if (!m_global->ok()) return failure(TransferResult::Failed, "libcurl is not initialised");
  if (cancel.load()) return failure(TransferResult::Aborted, "cancelled before start");

  detail::EasyExchange ex;
  std::string err;
  if (!ex.setup(req, &err)) return failure(TransferResult::Failed, err);

  // the callback only reads the flag
  auto* flag = const_cast<std::atomic<bool>*>(&cancel);
  if (curl_easy_setopt(ex.easy, CURLOPT_XFERINFOFUNCTION, &abortWhenCancelled) != CURLE_OK ||
      curl_easy_setopt(ex.easy, CURLOPT_XFERINFODATA, static_cast<void*>(flag)) != CURLE_OK ||
      curl_easy_setopt(ex.easy, CURLOPT_NOPROGRESS, 0L) != CURLE_OK) {
    return failure(TransferResult::Failed, "cannot install progress callback");
  }

  return ex.finish(curl_easy_perform(ex.easy));
}

struct CurlMultiTransport::Transfer {
  detail::EasyExchange exchange;
};

void CurlMultiTransport::MultiDeleter::operator()(void* multi) const noexcept {
  curl_multi_cleanup(static_cast<CURLM*>(multi));
}

CurlMultiTransport::CurlMultiTransport()
    : m_global(CurlGlobal::acquire()), m_multi(m_global->ok() ? curl_multi_init() : nullptr) {
  if (!m_multi) std::cerr << "[Http] curl_multi_init failed\n";
}

CurlMultiTransport::~CurlMultiTransport() {
  auto* multi = static_cast<CURLM*>(m_multi.get());
  for (auto& [id, t] : m_running) {
    if (multi) curl_multi_remove_handle(multi, t->exchange.easy);
  }
  m_running.clear();
}

IAsyncHttpTransport::TransferId CurlMultiTransport::start(const HttpRequest& req) {
  const TransferId id = m_next_id++;
  auto* multi = static_cast<CURLM*>(m_multi.get());
  if (!multi) {
    m_done.emplace(id, failure(TransferResult::Failed, "libcurl multi handle unavailable"));
    return id;
  }

  auto transfer = std::make_unique<Transfer>();
  std::string err;
  if (!transfer->exchange.setup(req, &err)) {
    m_done.emplace(id, failure(TransferResult::Failed, err));
    return id;
  }
  void* tag = reinterpret_cast<void*>(static_cast<std::uintptr_t>(id));
  if (curl_easy_setopt(transfer->exchange.easy, CURLOPT_PRIVATE, tag) != CURLE_OK) {
    m_done.emplace(id, failure(TransferResult::Failed, "cannot tag transfer"));
    return id;
  }
  const CURLMcode mc = curl_multi_add_handle(multi, transfer->exchange.easy);
  if (mc != CURLM_OK) {
    m_done.emplace(id, failure(TransferResult::Failed, curl_multi_strerror(mc)));
    return id;
  }
  m_running.emplace(id, std::move(transfer));
  return id;
}

void CurlMultiTransport::drive() {
  auto* multi = static_cast<CURLM*>(m_multi.get());
  if (!multi || m_running.empty()) return;

  int stillRunning = 0;
  const CURLMcode mc = curl_multi_perform(multi, &stillRunning);
  if (mc != CURLM_OK) {
    std::cerr << "[Http] curl_multi_perform: " << curl_multi_strerror(mc) << "\n";
    return;
  }

  int queued = 0;
  while (CURLMsg* msg = curl_multi_info_read(multi, &queued)) {
    if (msg->msg != CURLMSG_DONE) continue;
    char* tag = nullptr;
    if (curl_easy_getinfo(msg->easy_handle, CURLINFO_PRIVATE, &tag) != CURLE_OK) continue;
    const auto id = static_cast<TransferId>(reinterpret_cast<std::uintptr_t>(tag));
    const CURLcode result = msg->data.result;

    auto it = m_running.find(id);
    if (it == m_running.end()) continue;
    curl_multi_remove_handle(multi, it->second->exchange.easy);
    m_done.emplace(id, it->second->exchange.finish(result));
    m_running.erase(it);
  }
}

std::optional<HttpResponse> CurlMultiTransport::take(TransferId id) {
  auto it = m_done.find(id);
  if (it == m_done.end()) return std::nullopt;
  HttpResponse resp = std::move(it->second);
  m_done.erase(it);
  return resp;
}

void CurlMultiTransport::discard(TransferId id) {
  m_done.erase(id);
  auto it = m_running.find(id);
  if (it == m_running.end()) return;
  if (auto* multi = static_cast<CURLM*>(m_multi.get()))
    curl_multi_remove_handle(multi, it->second->exchange.easy);
  m_running.erase(it);
}

}  // namespace unchessful::net
