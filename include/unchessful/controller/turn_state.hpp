#pragma once
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "unchessful/engine/remote/engine_types.hpp"
#include "unchessful/model/board.hpp"
#include "unchessful/model/game_status.hpp"
#include "unchessful/model/move.hpp"

namespace unchessful::controller {

struct AwaitingHuman {
  friend bool operator==(const AwaitingHuman&, const AwaitingHuman&) = default;
};
struct RequestInFlight {
  engine::Epoch epoch = 0;
  friend bool operator==(const RequestInFlight&, const RequestInFlight&) = default;
};
struct GameOver {
  model::GameStatus status;
  friend bool operator==(const GameOver&, const GameOver&) = default;
};

using TurnState = std::variant<AwaitingHuman, RequestInFlight, GameOver>;

const char* stateName(const TurnState& s);

enum class SubmitResult { Applied, IllegalMove };

// Local: one person moves both sides and no engine is asked.
// Engine: the engine answers every human move.
enum class PlayMode { Local, Engine };

const char* toString(PlayMode m);

// Engine-side failure kept for display until the next successful exchange.
struct TurnError {
  engine::EngineFailure kind = engine::EngineFailure::NetworkError;
  std::string detail;
  engine::Epoch epoch = 0;
};

// Everything a frame needs, copied out of the controller.
struct TurnSnapshot {
  TurnState state;
  engine::Epoch epoch = 0;  // last epoch issued
  model::PieceArray board{};
  std::string fen;
  std::vector<model::Move> moves;
  std::vector<std::string> sanMoves;
  std::optional<model::Move> lastMove;
  model::GameStatus status;
  PlayMode mode = PlayMode::Engine;
  core::Color humanColor = core::Color::White;
  core::Color sideToMove = core::Color::White;
  bool inCheck = false;  // side to move
  // legal moves the human may play right now; empty unless AwaitingHuman on the
  // human's turn (in Local mode, on either side's turn)
  std::vector<model::Move> humanMoves;
  std::optional<TurnError> lastError;
};

}  // namespace unchessful::controller
