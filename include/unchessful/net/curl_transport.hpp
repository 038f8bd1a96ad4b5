#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>

#include "http_transport.hpp"

namespace unchessful::net {

// curl_global_init/cleanup; held by every curl-backed transport.
class CurlGlobal {
 public:
  static std::shared_ptr<CurlGlobal> acquire();
  ~CurlGlobal();
  [[nodiscard]] bool ok() const noexcept { return m_ok; }

 private:
  CurlGlobal();
  bool m_ok = false;
};

// Blocking exchange over the libcurl easy interface.
class CurlTransport final : public IHttpTransport {
 public:
  CurlTransport();
  HttpResponse perform(const HttpRequest& req, const std::atomic<bool>& cancel) override;

 private:
  std::shared_ptr<CurlGlobal> m_global;
};

// Exchanges driven by curl_multi_perform from the owner's loop.
class CurlMultiTransport final : public IAsyncHttpTransport {
 public:
  CurlMultiTransport();
  ~CurlMultiTransport() override;

  CurlMultiTransport(const CurlMultiTransport&) = delete;
  CurlMultiTransport& operator=(const CurlMultiTransport&) = delete;

  TransferId start(const HttpRequest& req) override;
  void drive() override;
  std::optional<HttpResponse> take(TransferId id) override;
  void discard(TransferId id) override;
  [[nodiscard]] std::size_t active() const override { return m_running.size(); }

 private:
  struct Transfer;
  struct MultiDeleter {
    void operator()(void* multi) const noexcept;
  };

  std::shared_ptr<CurlGlobal> m_global;
  std::unique_ptr<void, MultiDeleter> m_multi;
  TransferId m_next_id = 1;
  std::unordered_map<TransferId, std::unique_ptr<Transfer>> m_running;
  std::unordered_map<TransferId, HttpResponse> m_done;
};

}  // namespace unchessful::net
