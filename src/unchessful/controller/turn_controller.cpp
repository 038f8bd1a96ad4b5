#include "unchessful/controller/turn_controller.hpp"

#include <iostream>
#include <type_traits>
#include <utility>

namespace unchessful::controller {

const char* stateName(const TurnState& s) {
  return std::visit(
      [](const auto& st) -> const char* {
        using T = std::decay_t<decltype(st)>;
        if constexpr (std::is_same_v<T, AwaitingHuman>)
          return "AwaitingHuman";
        else if constexpr (std::is_same_v<T, RequestInFlight>)
          return "RequestInFlight";
        else
          return "GameOver";
      },
      s);
}

const char* toString(PlayMode m) {
  return m == PlayMode::Local ? "local" : "engine";
}

TurnController::TurnController(std::unique_ptr<engine::IEngineClient> client,
                               core::Color humanColor)
    : m_client(std::move(client)), m_human(humanColor) {}

TurnController::~TurnController() {
  abandonInFlight();
}

bool TurnController::isHumanTurn() const {
  if (!std::holds_alternative<AwaitingHuman>(m_state) || m_game.status().isTerminal())
    return false;
  return m_mode == PlayMode::Local || m_game.sideToMove() == m_human;
}

bool TurnController::engineToMove() const {
  return m_mode == PlayMode::Engine && m_game.sideToMove() != m_human &&
         !m_game.status().isTerminal();
}

SubmitResult TurnController::submitHumanMove(const model::Move& mv) {
  if (!isHumanTurn()) return SubmitResult::IllegalMove;
  if (!applyAndSettle(mv, true)) return SubmitResult::IllegalMove;

  m_last_error.reset();
  if (std::holds_alternative<AwaitingHuman>(m_state) && engineToMove()) requestEngineMove();
  return SubmitResult::Applied;
}

void TurnController::update() {
  const auto* inFlight = std::get_if<RequestInFlight>(&m_state);
  if (!inFlight) return;

  std::optional<engine::EngineReply> reply = m_client->poll(m_handle);
  if (!reply) return;

  if (reply->epoch != inFlight->epoch) {
    std::cout << "[TurnController] dropping reply for epoch " << reply->epoch << " (current "
              << inFlight->epoch << ")\n";
    return;
  }

  const engine::Epoch epoch = inFlight->epoch;
  m_handle = engine::NO_REQUEST;

  if (reply->failure) {
    recordFailure(*reply->failure, reply->detail, epoch);
    m_state = AwaitingHuman{};
    return;
  }
  m_state = AwaitingHuman{};
  if (!reply->move || !applyAndSettle(*reply->move, false)) {
    recordFailure(engine::EngineFailure::IllegalEngineMove,
                  "engine proposed '" + reply->moveText + "'", epoch);
    return;
  }
  m_last_error.reset();
}

void TurnController::newGame() {
  abandonInFlight();
  m_game.reset();
  m_last_error.reset();
  m_state = AwaitingHuman{};
  if (engineToMove()) requestEngineMove();
}

void TurnController::newGame(core::Color humanColor) {
  m_human = humanColor;
  newGame();
}

bool TurnController::retryEngine() {
  if (!std::holds_alternative<AwaitingHuman>(m_state) || !engineToMove()) return false;
  m_last_error.reset();
  requestEngineMove();
  return true;
}

bool TurnController::cancelEngine() {
  if (!std::holds_alternative<RequestInFlight>(m_state)) return false;
  abandonInFlight();
  ++m_epoch;
  m_state = AwaitingHuman{};
  return true;
}

bool TurnController::resign() {
  if (std::holds_alternative<GameOver>(m_state)) return false;
  abandonInFlight();
  const core::Color loser = m_mode == PlayMode::Local ? m_game.sideToMove() : m_human;
  if (!m_game.resign(loser)) return false;
  m_state = GameOver{m_game.status()};
  if (onGameEnd_) onGameEnd_(m_game.status());
  return true;
}

bool TurnController::undo() {
  if (std::holds_alternative<GameOver>(m_state)) return false;

  if (m_mode == PlayMode::Local) {
    if (!m_game.undo()) return false;
    m_state = AwaitingHuman{};
    return true;
  }

  // Plies alternate from the start position, so the human has moved at least
  // once iff there is a ply and either the first or the second one was theirs.
  const std::size_t plies = m_game.moveHistory().size();
  const core::Color firstMover = (plies % 2 == 0) ? m_game.sideToMove() : ~m_game.sideToMove();
  if (plies == 0 || (firstMover != m_human && plies < 2)) return false;

  abandonInFlight();
  while (!m_game.moveHistory().empty()) {
    const core::Color mover = ~m_game.sideToMove();
    if (!m_game.undo()) break;
    if (mover == m_human) break;
  }
  m_last_error.reset();
  m_state = AwaitingHuman{};
  return true;
}

void TurnController::setMode(PlayMode mode) {
  if (mode == m_mode) return;
  std::cout << "[TurnController] switching to " << toString(mode) << " play\n";
  m_mode = mode;
  m_last_error.reset();
  if (mode == PlayMode::Local) {
    if (!cancelEngine()) abandonInFlight();
    return;
  }
  if (std::holds_alternative<AwaitingHuman>(m_state) && engineToMove()) requestEngineMove();
}

TurnSnapshot TurnController::snapshot() const {
  TurnSnapshot s;
  s.state = m_state;
  s.epoch = m_epoch;
  s.board = m_game.pieces();
  s.fen = m_game.getFen();
  s.moves = m_game.moveHistory();
  s.sanMoves = m_game.sanHistory();
  s.lastMove = m_game.lastMove();
  s.status = m_game.status();
  s.mode = m_mode;
  s.humanColor = m_human;
  s.sideToMove = m_game.sideToMove();
  s.inCheck = m_game.isKingInCheck(m_game.sideToMove());
  if (isHumanTurn()) s.humanMoves = m_game.legalMoves();
  s.lastError = m_last_error;
  return s;
}

void TurnController::requestEngineMove() {
  const engine::Epoch epoch = ++m_epoch;
  m_handle = m_client->requestMove(m_game.getFen(), epoch);
  m_state = RequestInFlight{epoch};
}

void TurnController::abandonInFlight() {
  if (m_handle == engine::NO_REQUEST) return;
  m_client->abandon(m_handle);
  m_handle = engine::NO_REQUEST;
}

void TurnController::recordFailure(engine::EngineFailure kind, std::string detail,
                                   engine::Epoch epoch) {
  std::cerr << "[TurnController] engine request " << epoch << " failed: " << engine::toString(kind)
            << (detail.empty() ? "" : " - ") << detail << "\n";
  m_last_error = TurnError{kind, std::move(detail), epoch};
  if (onEngineError_) onEngineError_(*m_last_error);
}

bool TurnController::applyAndSettle(const model::Move& mv, bool byHuman) {
  const std::optional<model::GameStatus> status = m_game.apply(mv);
  if (!status) return false;

  if (onMoveExecuted_) onMoveExecuted_(*m_game.lastMove(), byHuman);

  if (status->isTerminal()) {
    m_state = GameOver{*status};
    if (onGameEnd_) onGameEnd_(*status);
  }
  return true;
}

}  // namespace unchessful::controller
