#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>

#include "unchessful/config/client_config.hpp"
#include "unchessful/net/http_types.hpp"

namespace unchessful::engine {

using RequestHandle = std::uint64_t;
constexpr RequestHandle NO_REQUEST = 0;

// Carries HTTP exchanges across the boundary between the render loop and
// whatever performs the I/O. Every call returns without waiting.
class IRequestChannel {
 public:
  virtual ~IRequestChannel() = default;

  virtual RequestHandle send(net::HttpRequest req) = 0;

  // The response for `h` exactly once. Unknown, abandoned or already
  // delivered handles yield std::nullopt.
  virtual std::optional<net::HttpResponse> poll(RequestHandle h) = 0;

  // Stops tracking `h`. Whether the transfer itself stops depends on the
  // implementation; its response is never delivered.
  virtual void abandon(RequestHandle h) = 0;

  // Moves transfers along without asking for any of them. The frame loop calls
  // this every tick so abandoned exchanges finish even when nothing is polled.
  virtual void service() {}

  [[nodiscard]] virtual std::size_t outstanding() const = 0;
  [[nodiscard]] virtual config::Scheduling scheduling() const = 0;
};

// Builds the libcurl-backed channel for the configured scheduling model.
std::unique_ptr<IRequestChannel> makeRequestChannel(const config::NetworkSettings& settings);

}  // namespace unchessful::engine
