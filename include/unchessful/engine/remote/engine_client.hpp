#pragma once
#include <optional>
#include <string>
#include <unordered_map>

#include "engine_types.hpp"
#include "request_channel.hpp"

namespace unchessful::engine {

// Asks some engine for a move in a position and hands the answer back later.
struct IEngineClient {
  virtual ~IEngineClient() = default;

  // Starts a request for the side to move in `fen`. Never blocks.
  virtual RequestHandle requestMove(const std::string& fen, Epoch epoch) = 0;
  // The reply for `h` once, std::nullopt before and after.
  virtual std::optional<EngineReply> poll(RequestHandle h) = 0;
  virtual void abandon(RequestHandle h) = 0;
};

// Talks to the remote engine over HTTP: posts the FEN, decodes the JSON move
// and resolves it against the requested position.
class EngineClient final : public IEngineClient {
 public:
  EngineClient(IRequestChannel& channel, EngineEndpoint endpoint);

  RequestHandle requestMove(const std::string& fen, Epoch epoch) override;
  std::optional<EngineReply> poll(RequestHandle h) override;
  void abandon(RequestHandle h) override;

  void setEndpoint(EngineEndpoint endpoint) { m_endpoint = std::move(endpoint); }
  [[nodiscard]] const EngineEndpoint& endpoint() const noexcept { return m_endpoint; }
  [[nodiscard]] std::size_t pending() const noexcept { return m_pending.size(); }

  // Maps a finished exchange for the given request to a reply.
  static EngineReply interpret(const net::HttpResponse& resp, const std::string& fen, Epoch epoch);

 private:
  struct Pending {
    std::string fen;
    Epoch epoch = 0;
  };

  IRequestChannel& m_channel;
  EngineEndpoint m_endpoint;
  std::unordered_map<RequestHandle, Pending> m_pending;
};

}  // namespace unchessful::engine
