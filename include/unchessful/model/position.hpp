#pragma once
#include <cstdint>
#include <vector>

#include "board.hpp"
#include "core/bitboard.hpp"
#include "game_state.hpp"

namespace unchessful::model {

class Position {
 public:
  Position() { m_keys.push_back(computeKey()); }

  Board& getBoard() { return m_board; }
  const Board& getBoard() const { return m_board; }
  GameState& getState() { return m_state; }
  const GameState& getState() const { return m_state; }

  // Called after the board or state was edited directly (FEN setup).
  void resetHistory();

  // The move must carry the generator's flags. Returns false, leaving the
  // position untouched, if the mover would leave its own king attacked.
  bool doMove(const Move& m);
  void undoMove();

  [[nodiscard]] std::size_t plyCount() const noexcept { return m_history.size(); }
  [[nodiscard]] const StateInfo& lastState() const { return m_history.back(); }

  [[nodiscard]] bool inCheck() const;
  [[nodiscard]] bool checkInsufficientMaterial() const;
  [[nodiscard]] bool checkMoveRule() const;
  [[nodiscard]] bool checkRepetition() const;

  [[nodiscard]] PositionKey computeKey() const;

 private:
  Board m_board;
  GameState m_state;
  std::vector<StateInfo> m_history;
  // one key per reached position; m_keys.back() is the current one
  std::vector<PositionKey> m_keys;

  void applyMove(const Move& m, StateInfo& st);
  void unapplyMove(const StateInfo& st);
};

}  // namespace unchessful::model
