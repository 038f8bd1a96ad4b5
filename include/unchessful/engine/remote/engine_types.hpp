#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "unchessful/model/move.hpp"

namespace unchessful::engine {

// Strictly increasing per session; tags every move request.
using Epoch = std::uint64_t;

enum class EngineFailure {
  NetworkError,      // no response, refused, timed out, aborted, 5xx
  ProtocolError,     // other non-2xx, malformed JSON, missing fields
  IllegalEngineMove  // the proposed move is not legal in the requested position
};

const char* toString(EngineFailure f);

struct EngineReply {
  Epoch epoch = 0;
  std::optional<model::Move> move;  // set on success
  std::string moveText;             // the move as the backend wrote it
  std::optional<EngineFailure> failure;
  std::string detail;

  [[nodiscard]] bool ok() const noexcept { return move.has_value() && !failure; }

  static EngineReply success(Epoch e, model::Move m, std::string text) {
    EngineReply r;
    r.epoch = e;
    r.move = m;
    r.moveText = std::move(text);
    return r;
  }
  static EngineReply failed(Epoch e, EngineFailure f, std::string why) {
    EngineReply r;
    r.epoch = e;
    r.failure = f;
    r.detail = std::move(why);
    return r;
  }
};

// Backend directory and engine descriptions.
struct EngineVariant {
  std::string name;
  std::string gameUrl;
};

struct EngineRef {
  std::string engineId;
  std::string name;
  std::string entrypointUrl;
};

struct EngineDirectory {
  std::vector<EngineRef> engines;
};

struct EngineDescription {
  std::string name;
  std::string textDescription;
  std::vector<EngineVariant> variants;
  std::optional<EngineVariant> bestAvailableVariant;
};

// Where move requests go.
struct EngineEndpoint {
  std::string gameUrl;
  long connectTimeoutMs = 0;
  long requestTimeoutMs = 0;
  std::string userAgent;
};

}  // namespace unchessful::engine
