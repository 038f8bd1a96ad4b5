#include "unchessful/model/board.hpp"

namespace unchessful::model {

void Board::clear() noexcept {
  for (auto& byColor : m_bb) byColor.fill(0);
  m_color_occ = {0, 0};
  m_all_occ = 0;
  m_piece_on.fill(Piece{});
}

void Board::setPiece(core::Square sq, Piece p) noexcept {
  if (!core::validSquare(sq)) return;
  removePiece(sq);
  if (p.isNone()) return;

  const bb::Bitboard mask = bb::sq_bb(sq);
  const int ci = colorIndex(p.color);
  m_bb[ci][core::idx(p.type)] |= mask;
  m_color_occ[ci] |= mask;
  m_all_occ |= mask;
  m_piece_on[sq] = p;
}

void Board::removePiece(core::Square sq) noexcept {
  if (!core::validSquare(sq)) return;
  const Piece old = m_piece_on[sq];
  if (old.isNone()) return;

  const bb::Bitboard mask = bb::sq_bb(sq);
  const int ci = colorIndex(old.color);
  m_bb[ci][core::idx(old.type)] &= ~mask;
  m_color_occ[ci] &= ~mask;
  m_all_occ &= ~mask;
  m_piece_on[sq] = Piece{};
}

std::optional<Piece> Board::getPiece(core::Square sq) const noexcept {
  if (!core::validSquare(sq)) return std::nullopt;
  const Piece p = m_piece_on[sq];
  if (p.isNone()) return std::nullopt;
  return p;
}

void Board::movePiece(core::Square from, core::Square to) noexcept {
  const auto mover = getPiece(from);
  if (!mover) return;
  removePiece(from);
  setPiece(to, *mover);
}

}  // namespace unchessful::model
