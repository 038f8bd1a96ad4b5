#pragma once
#include "../chess_types.hpp"
#include "board.hpp"
#include "core/bitboard.hpp"

namespace unchessful::model {

// True if any piece of `by` attacks `sq` given the occupancy `occ`.
[[nodiscard]] inline bool attackedBy(const Board& b, core::Square sq, core::Color by,
                                     bb::Bitboard occ) noexcept {
  const bb::Bitboard target = bb::sq_bb(sq);

  // a pawn of `by` attacks sq from the squares a pawn of the other colour would attack
  if (bb::pawn_attacks(~by, target) & b.getPieces(by, core::PieceType::Pawn)) return true;
  if (bb::knight_attacks_from(sq) & b.getPieces(by, core::PieceType::Knight)) return true;
  if (bb::king_attacks_from(sq) & b.getPieces(by, core::PieceType::King)) return true;

  const bb::Bitboard q = b.getPieces(by, core::PieceType::Queen);
  const bb::Bitboard bq = b.getPieces(by, core::PieceType::Bishop) | q;
  if (bq && (bb::bishop_attacks(sq, occ) & bq)) return true;
  const bb::Bitboard rq = b.getPieces(by, core::PieceType::Rook) | q;
  if (rq && (bb::rook_attacks(sq, occ) & rq)) return true;

  return false;
}

}  // namespace unchessful::model
