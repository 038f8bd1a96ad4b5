#pragma once
#include <array>
#include <cstdint>
#include <optional>

#include "core/bitboard.hpp"
#include "piece.hpp"

namespace unchessful::model {

using PieceArray = std::array<Piece, 64>;

// Piece placement: one bitboard per colour and type plus a square lookup table.
class Board {
 public:
  Board() { clear(); }

  void clear() noexcept;

  void setPiece(core::Square sq, Piece p) noexcept;
  void removePiece(core::Square sq) noexcept;
  [[nodiscard]] std::optional<Piece> getPiece(core::Square sq) const noexcept;

  // Moves whatever stands on `from` to `to`, dropping any piece already on `to`.
  void movePiece(core::Square from, core::Square to) noexcept;

  [[nodiscard]] bb::Bitboard getPieces(core::Color c) const noexcept {
    return m_color_occ[colorIndex(c)];
  }
  [[nodiscard]] bb::Bitboard getPieces(core::Color c, core::PieceType t) const noexcept {
    if (t == core::PieceType::None) return 0;
    return m_bb[colorIndex(c)][core::idx(t)];
  }
  [[nodiscard]] bb::Bitboard getAllPieces() const noexcept { return m_all_occ; }

  [[nodiscard]] const PieceArray& pieces() const noexcept { return m_piece_on; }

  friend bool operator==(const Board& a, const Board& b) noexcept {
    return a.m_piece_on == b.m_piece_on;
  }

 private:
  std::array<std::array<bb::Bitboard, 6>, 2> m_bb{};
  std::array<bb::Bitboard, 2> m_color_occ{};
  bb::Bitboard m_all_occ = 0;
  PieceArray m_piece_on{};
};

}  // namespace unchessful::model
