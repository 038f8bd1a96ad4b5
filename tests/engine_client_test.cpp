#include <algorithm>
#include <cassert>
#include <iostream>
#include <string>

#include "support/fakes.hpp"
#include "unchessful/engine/remote/engine_client.hpp"

using namespace unchessful;
using engine::EngineFailure;
using testing::httpReply;

static const std::string AFTER_E4 =
    "rnbqkbnr/pppppppp/8/8/4P3/8/PPPP1PPP/RNBQKBNR b KQkq e3 0 1";

static core::Square sq(const char* name) {
  return *core::parseSquare(name);
}

static engine::EngineReply roundTrip(net::HttpResponse resp, engine::Epoch epoch = 7) {
  testing::ScriptedChannel channel;
  engine::EngineClient client(channel, {"https://api/games/sf", 0, 0, "test"});
  const auto h = client.requestMove(AFTER_E4, epoch);
  assert(!client.poll(h));
  channel.complete(h, std::move(resp));
  const auto reply = client.poll(h);
  assert(reply);
  assert(reply->epoch == epoch);
  assert(!client.poll(h));
  assert(client.pending() == 0);
  return *reply;
}

int main() {
  // The request that goes over the wire
  {
    testing::ScriptedChannel channel;
    engine::EngineEndpoint ep{"https://api/games/sf", 1500, 9000, "unchessful-test"};
    engine::EngineClient client(channel, ep);
    const auto h = client.requestMove(AFTER_E4, 1);
    const net::HttpRequest& req = channel.sent(h);
    assert(req.method == net::HttpMethod::Post);
    assert(req.url == "https://api/games/sf");
    assert(req.body == "{\"fen\":\"" + AFTER_E4 + "\"}");
    assert(std::find(req.headers.begin(), req.headers.end(),
                     "Content-Type: application/json") != req.headers.end());
    assert(req.connectTimeoutMs == 1500);
    assert(req.totalTimeoutMs == 9000);
    assert(req.userAgent == "unchessful-test");
    assert(client.pending() == 1);

    client.setEndpoint({"https://api/games/other", 0, 0, "x"});
    const auto h2 = client.requestMove(AFTER_E4, 2);
    assert(channel.sent(h2).url == "https://api/games/other");
  }

  // Successful replies in either notation
  {
    auto r = roundTrip(httpReply(200, "{\"move_san\": \"e5\"}"));
    assert(r.ok());
    assert(r.move->from() == sq("e7") && r.move->to() == sq("e5"));
    assert(r.moveText == "e5");

    r = roundTrip(httpReply(200, "{\"move_uci\": \"g8f6\"}"));
    assert(r.ok() && r.move->from() == sq("g8") && r.move->to() == sq("f6"));

    r = roundTrip(httpReply(201, "{\"move_san\": \"Nc6\", \"eval\": 0.3}"));
    assert(r.ok() && r.move->to() == sq("c6"));
  }

  // Transport trouble and server errors are network errors
  {
    auto r = roundTrip(httpReply(500, "{\"error\": \"model crashed\"}"));
    assert(!r.ok() && *r.failure == EngineFailure::NetworkError);
    assert(r.detail.find("500") != std::string::npos);
    assert(r.detail.find("model crashed") != std::string::npos);

    r = roundTrip(httpReply(503, "busy"));
    assert(*r.failure == EngineFailure::NetworkError);

    r = roundTrip(testing::transportFailure("Couldn't connect to server"));
    assert(*r.failure == EngineFailure::NetworkError);
    assert(r.detail == "Couldn't connect to server");

    net::HttpResponse aborted;
    aborted.result = net::TransferResult::Aborted;
    r = roundTrip(aborted);
    assert(*r.failure == EngineFailure::NetworkError);
  }

  // Anything else the server says that is not a move is a protocol error
  {
    auto r = roundTrip(httpReply(404, "not found"));
    assert(*r.failure == EngineFailure::ProtocolError);
    r = roundTrip(httpReply(422, "{\"detail\": \"bad fen\"}"));
    assert(*r.failure == EngineFailure::ProtocolError && r.detail.find("bad fen") != std::string::npos);
    r = roundTrip(httpReply(302, ""));
    assert(*r.failure == EngineFailure::ProtocolError);
    r = roundTrip(httpReply(200, "{\"move_san\": "));
    assert(*r.failure == EngineFailure::ProtocolError);
    r = roundTrip(httpReply(200, "{\"best\": \"e5\"}"));
    assert(*r.failure == EngineFailure::ProtocolError);
    r = roundTrip(httpReply(200, ""));
    assert(*r.failure == EngineFailure::ProtocolError);
  }

  // Moves that do not fit the requested position are never handed out as moves
  {
    auto r = roundTrip(httpReply(200, "{\"move_san\": \"e4\"}"));
    assert(*r.failure == EngineFailure::IllegalEngineMove && !r.move);
    r = roundTrip(httpReply(200, "{\"move_uci\": \"e2e4\"}"));
    assert(*r.failure == EngineFailure::IllegalEngineMove);
    r = roundTrip(httpReply(200, "{\"move_san\": \"Qxf7#\"}"));
    assert(*r.failure == EngineFailure::IllegalEngineMove);
    r = roundTrip(httpReply(200, "{\"move_san\": \"hello\"}"));
    assert(*r.failure == EngineFailure::IllegalEngineMove);

    const auto bad = engine::EngineClient::interpret(httpReply(200, "{\"move_san\": \"e5\"}"),
                                                     "not a fen", 3);
    assert(bad.epoch == 3 && *bad.failure == EngineFailure::IllegalEngineMove);
  }

  // Abandoning forgets the request on both ends
  {
    testing::ScriptedChannel channel;
    engine::EngineClient client(channel, {"https://api/games/sf", 0, 0, ""});
    const auto h = client.requestMove(AFTER_E4, 1);
    client.abandon(h);
    assert(client.pending() == 0);
    assert(channel.abandoned().size() == 1 && channel.abandoned()[0] == h);
    channel.complete(h, httpReply(200, "{\"move_san\": \"e5\"}"));
    assert(!client.poll(h));
    // a second abandon is a no-op
    client.abandon(h);
    assert(channel.abandoned().size() == 1);
  }

  std::cout << "engine_client_test passed\n";
  return 0;
}
