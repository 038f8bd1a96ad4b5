#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "turn_state.hpp"
#include "unchessful/engine/remote/engine_client.hpp"
#include "unchessful/model/chess_game.hpp"

namespace unchessful::controller {

// Owns the game and decides whose turn it is. The human moves through
// submitHumanMove(); the engine's replies are picked up by update(), which the
// render loop calls once per frame. Every reply is checked against the epoch
// of the request currently in flight, so answers to abandoned requests can
// never reach the board.
class TurnController {
 public:
  using MoveCallback = std::function<void(const model::Move& mv, bool byHuman)>;
  using EndCallback = std::function<void(const model::GameStatus&)>;
  using ErrorCallback = std::function<void(const TurnError&)>;

  explicit TurnController(std::unique_ptr<engine::IEngineClient> client,
                          core::Color humanColor = core::Color::White);
  ~TurnController();

  TurnController(const TurnController&) = delete;
  TurnController& operator=(const TurnController&) = delete;

  SubmitResult submitHumanMove(const model::Move& mv);
  void update();

  // Fresh game. Requests the first move at once when the engine plays White.
  void newGame();
  void newGame(core::Color humanColor);
  // Asks the engine again after a failure or a cancel.
  bool retryEngine();
  // Gives up waiting for the current request.
  bool cancelEngine();
  bool resign();
  // Takes back plies until the human is to move again. In Local mode, one ply.
  bool undo();

  // Switching to Local drops any request in flight. Switching to Engine asks
  // for a move at once if the engine is to move in a running game.
  void setMode(PlayMode mode);
  [[nodiscard]] PlayMode mode() const noexcept { return m_mode; }

  [[nodiscard]] const TurnState& state() const noexcept { return m_state; }
  [[nodiscard]] engine::Epoch currentEpoch() const noexcept { return m_epoch; }
  [[nodiscard]] const model::ChessGame& game() const noexcept { return m_game; }
  [[nodiscard]] core::Color humanColor() const noexcept { return m_human; }
  [[nodiscard]] bool isHumanTurn() const;
  [[nodiscard]] const std::optional<TurnError>& lastError() const noexcept {
    return m_last_error;
  }

  [[nodiscard]] TurnSnapshot snapshot() const;

  void setOnMoveExecuted(MoveCallback cb) { onMoveExecuted_ = std::move(cb); }
  void setOnGameEnd(EndCallback cb) { onGameEnd_ = std::move(cb); }
  void setOnEngineError(ErrorCallback cb) { onEngineError_ = std::move(cb); }

 private:
  [[nodiscard]] bool engineToMove() const;
  void requestEngineMove();
  void abandonInFlight();
  void recordFailure(engine::EngineFailure kind, std::string detail, engine::Epoch epoch);
  bool applyAndSettle(const model::Move& mv, bool byHuman);

  model::ChessGame m_game;
  std::unique_ptr<engine::IEngineClient> m_client;
  core::Color m_human;
  PlayMode m_mode = PlayMode::Engine;

  TurnState m_state{AwaitingHuman{}};
  engine::Epoch m_epoch = 0;
  engine::RequestHandle m_handle = engine::NO_REQUEST;
  std::optional<TurnError> m_last_error;

  MoveCallback onMoveExecuted_;
  EndCallback onGameEnd_;
  ErrorCallback onEngineError_;
};

}  // namespace unchessful::controller
