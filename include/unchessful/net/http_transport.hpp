#pragma once
#include <atomic>
#include <cstdint>
#include <optional>

#include "http_types.hpp"

namespace unchessful::net {

// Runs one exchange to completion on the calling thread. Implementations poll
// `cancel` while waiting and return TransferResult::Aborted once it is set.
class IHttpTransport {
 public:
  virtual ~IHttpTransport() = default;
  virtual HttpResponse perform(const HttpRequest& req, const std::atomic<bool>& cancel) = 0;
};

// Non-blocking transport for a single-threaded loop. Nothing happens between
// calls to drive().
class IAsyncHttpTransport {
 public:
  using TransferId = std::uint64_t;

  virtual ~IAsyncHttpTransport() = default;

  virtual TransferId start(const HttpRequest& req) = 0;
  // Advances all transfers as far as possible without waiting.
  virtual void drive() = 0;
  // Hands out a finished transfer once; later calls return std::nullopt.
  virtual std::optional<HttpResponse> take(TransferId id) = 0;
  // Drops a transfer, finished or not. Whether the socket work stops is up to
  // the implementation.
  virtual void discard(TransferId id) = 0;
  [[nodiscard]] virtual std::size_t active() const = 0;
};

}  // namespace unchessful::net
