#include "unchessful/model/game_status.hpp"

namespace unchessful::model {

const char* toString(DrawReason reason) {
  switch (reason) {
    case DrawReason::InsufficientMaterial:
      return "insufficient material";
    case DrawReason::FiftyMoveRule:
      return "fifty-move rule";
    case DrawReason::ThreefoldRepetition:
      return "threefold repetition";
  }
  return "unknown";
}

std::string toString(const GameStatus& status) {
  switch (status.kind) {
    case GameStatus::Kind::InProgress:
      return "In progress";
    case GameStatus::Kind::Checkmate:
      return std::string("Checkmate - ") + core::colorName(status.side) + " wins";
    case GameStatus::Kind::Stalemate:
      return "Draw by stalemate";
    case GameStatus::Kind::DrawByRule:
      return std::string("Draw by ") + toString(status.reason);
    case GameStatus::Kind::Resigned:
      return std::string(core::colorName(status.side)) + " resigned";
  }
  return "Unknown";
}

const char* resultToken(const GameStatus& status) {
  if (!status.isTerminal()) return "*";
  const auto w = status.winner();
  if (!w) return "1/2-1/2";
  return *w == core::Color::White ? "1-0" : "0-1";
}

}  // namespace unchessful::model
