#pragma once

#include <vector>

#include "board.hpp"
#include "game_state.hpp"
#include "move.hpp"

namespace unchessful::model {

class MoveGenerator {
 public:
  // Quiet moves, captures, promotions, en passant and castling for the side to
  // move. Castling is only emitted when the king does not pass through check;
  // every other move may still leave the own king attacked and is filtered by
  // Position::doMove().
  void generatePseudoLegalMoves(const Board& b, const GameState& st, std::vector<Move>& out) const;

  // Pseudo-legal moves filtered by make/unmake on a scratch position.
  void generateLegalMoves(const Board& b, const GameState& st, std::vector<Move>& out) const;
};

}  // namespace unchessful::model
