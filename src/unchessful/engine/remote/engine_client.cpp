#include "unchessful/engine/remote/engine_client.hpp"

#include <iostream>

#include "unchessful/engine/remote/wire_codec.hpp"
#include "unchessful/model/analysis/san_notation.hpp"
#include "unchessful/model/chess_game.hpp"

namespace unchessful::engine {

EngineClient::EngineClient(IRequestChannel& channel, EngineEndpoint endpoint)
    : m_channel(channel), m_endpoint(std::move(endpoint)) {}

RequestHandle EngineClient::requestMove(const std::string& fen, Epoch epoch) {
  net::HttpRequest req;
  req.method = net::HttpMethod::Post;
  req.url = m_endpoint.gameUrl;
  req.body = wire::encodeMoveRequest(fen);
  req.headers = {"Content-Type: application/json", "Accept: application/json"};
  req.connectTimeoutMs = m_endpoint.connectTimeoutMs;
  req.totalTimeoutMs = m_endpoint.requestTimeoutMs;
  req.userAgent = m_endpoint.userAgent;

  const RequestHandle h = m_channel.send(std::move(req));
  m_pending[h] = Pending{fen, epoch};
  std::cout << "[EngineClient] request #" << epoch << " sent for " << fen << "\n";
  return h;
}

std::optional<EngineReply> EngineClient::poll(RequestHandle h) {
  auto it = m_pending.find(h);
  if (it == m_pending.end()) return std::nullopt;

  auto resp = m_channel.poll(h);
  if (!resp) return std::nullopt;

  const Pending p = std::move(it->second);
  m_pending.erase(it);

  EngineReply reply = interpret(*resp, p.fen, p.epoch);
  if (reply.ok())
    std::cout << "[EngineClient] reply #" << p.epoch << ": " << reply.moveText << "\n";
  else
    std::cerr << "[EngineClient] reply #" << p.epoch << " failed (" << toString(*reply.failure)
              << "): " << reply.detail << "\n";
  return reply;
}

void EngineClient::abandon(RequestHandle h) {
  if (m_pending.erase(h) == 0) return;
  m_channel.abandon(h);
}

EngineReply EngineClient::interpret(const net::HttpResponse& resp, const std::string& fen,
                                    Epoch epoch) {
  if (resp.result != net::TransferResult::Completed)
    return EngineReply::failed(epoch, EngineFailure::NetworkError, resp.error);

  if (resp.status >= 500)
    return EngineReply::failed(epoch, EngineFailure::NetworkError,
                               "HTTP " + std::to_string(resp.status) + ": " +
                                   wire::describeErrorBody(resp.body));
  if (resp.status < 200 || resp.status >= 300)
    return EngineReply::failed(epoch, EngineFailure::ProtocolError,
                               "HTTP " + std::to_string(resp.status) + ": " +
                                   wire::describeErrorBody(resp.body));

  std::string err;
  const auto text = wire::decodeMoveText(resp.body, &err);
  if (!text) return EngineReply::failed(epoch, EngineFailure::ProtocolError, err);

  model::ChessGame position;
  if (!position.setPosition(fen, &err))
    return EngineReply::failed(epoch, EngineFailure::IllegalEngineMove,
                               "requested position is invalid: " + err);

  model::Move mv;
  if (!model::notation::fromSan(position.position(), *text, mv))
    return EngineReply::failed(epoch, EngineFailure::IllegalEngineMove,
                               "'" + *text + "' is not legal in " + fen);
  return EngineReply::success(epoch, mv, *text);
}

}  // namespace unchessful::engine
