#pragma once

#include <optional>
#include <string>
#include <vector>

#include "../constants.hpp"
#include "board.hpp"
#include "game_status.hpp"
#include "move_generator.hpp"
#include "position.hpp"

namespace unchessful::model {

// Authoritative game record: the start position, every applied move and the
// board derived from them. The board only ever changes by appending a legal
// move, taking the last one back, or resetting.
class ChessGame {
 public:
  ChessGame();

  // Replaces the game with the given position and an empty move list. On a
  // malformed FEN the game is left untouched and false is returned.
  bool setPosition(const std::string& fen, std::string* outError = nullptr);
  void reset();

  // Applies a legal move of the side to move. Only from/to/promotion of `mv`
  // are looked at. Returns the new status, or std::nullopt if the move is not
  // legal here (nothing changes then).
  std::optional<GameStatus> apply(const Move& mv);
  std::optional<GameStatus> apply(core::Square from, core::Square to,
                                  core::PieceType promotion = core::PieceType::None) {
    return apply(Move{from, to, promotion});
  }
  bool doMoveUCI(const std::string& uciMove);

  // Takes back the last applied move. Clears a resignation first if there is one.
  bool undo();
  bool resign(core::Color loser);

  // Empty exactly when the side to move is checkmated or stalemated.
  const std::vector<Move>& legalMoves() const;
  std::optional<Move> findLegalMove(core::Square from, core::Square to,
                                    core::PieceType promotion = core::PieceType::None) const;

  [[nodiscard]] const GameStatus& status() const noexcept { return m_status; }
  [[nodiscard]] core::Color sideToMove() const noexcept {
    return m_position.getState().sideToMove;
  }
  [[nodiscard]] bool isKingInCheck(core::Color c) const;

  [[nodiscard]] Piece getPiece(core::Square sq) const;
  [[nodiscard]] const PieceArray& pieces() const { return m_position.getBoard().pieces(); }
  [[nodiscard]] const Position& position() const noexcept { return m_position; }
  [[nodiscard]] const GameState& getGameState() const { return m_position.getState(); }

  [[nodiscard]] const std::vector<Move>& moveHistory() const noexcept { return m_moves; }
  [[nodiscard]] std::optional<Move> lastMove() const;
  [[nodiscard]] const std::string& startFen() const noexcept { return m_start_fen; }
  [[nodiscard]] std::vector<std::string> sanHistory() const;

  [[nodiscard]] std::string getFen() const;

 private:
  MoveGenerator m_move_gen;
  Position m_position;
  std::string m_start_fen = core::START_FEN;
  std::vector<Move> m_moves;
  GameStatus m_status;
  std::optional<core::Color> m_resigned;

  mutable std::vector<Move> m_legal_moves;
  mutable bool m_legal_dirty = true;

  void recomputeStatus();
};

// Parses the board, side, castling, en-passant and clock fields of a FEN into
// `pos`. The two clock fields may be omitted.
bool parseFen(const std::string& fen, Position& pos, std::string* outError = nullptr);
std::string toFen(const Position& pos);

}  // namespace unchessful::model
