#include "unchessful/model/move_generator.hpp"

#include "unchessful/model/core/bitboard.hpp"
#include "unchessful/model/move_helper.hpp"
#include "unchessful/model/position.hpp"

namespace unchessful::model {

namespace {

using core::Color;
using core::Square;
using PT = core::PieceType;

constexpr PT PROMO_ORDER[4] = {PT::Queen, PT::Rook, PT::Bishop, PT::Knight};

void pushPawnMove(std::vector<Move>& out, Square from, Square to, bool capture, bool promotes) {
  if (!promotes) {
    out.emplace_back(from, to, PT::None, capture);
    return;
  }
  for (PT promo : PROMO_ORDER) out.emplace_back(from, to, promo, capture);
}

void genPawnMoves(const Board& b, const GameState& st, std::vector<Move>& out) {
  const Color us = st.sideToMove;
  const bool white = us == Color::White;
  const bb::Bitboard occ = b.getAllPieces();
  const bb::Bitboard enemy = b.getPieces(~us);
  const bb::Bitboard promoRank = white ? bb::RANK_8 : bb::RANK_1;
  const bb::Bitboard startRank = white ? bb::RANK_2 : bb::RANK_7;
  const int forward = white ? 8 : -8;

  for (bb::Bitboard pawns = b.getPieces(us, PT::Pawn); pawns;) {
    const Square from = bb::pop_lsb(pawns);
    const bb::Bitboard fromBB = bb::sq_bb(from);

    const bb::Bitboard one = (white ? bb::north(fromBB) : bb::south(fromBB)) & ~occ;
    if (one) {
      const Square to = static_cast<Square>(from + forward);
      pushPawnMove(out, from, to, false, (one & promoRank) != 0);
      if (fromBB & startRank) {
        const bb::Bitboard two = (white ? bb::north(one) : bb::south(one)) & ~occ;
        if (two) out.emplace_back(from, static_cast<Square>(from + 2 * forward));
      }
    }

    for (bb::Bitboard caps = bb::pawn_attacks(us, fromBB) & enemy; caps;) {
      const Square to = bb::pop_lsb(caps);
      pushPawnMove(out, from, to, true, (bb::sq_bb(to) & promoRank) != 0);
    }

    const Square ep = st.enPassantSquare;
    if (ep != core::NO_SQUARE && (bb::pawn_attacks(us, fromBB) & bb::sq_bb(ep)))
      out.emplace_back(from, ep, PT::None, true, true);
  }
}

template <bb::Bitboard (*Attacks)(Square, bb::Bitboard)>
void genSliderOrLeaper(const Board& b, Color us, PT type, std::vector<Move>& out) {
  const bb::Bitboard occ = b.getAllPieces();
  const bb::Bitboard own = b.getPieces(us);
  const bb::Bitboard enemy = b.getPieces(~us);
  for (bb::Bitboard pcs = b.getPieces(us, type); pcs;) {
    const Square from = bb::pop_lsb(pcs);
    for (bb::Bitboard targets = Attacks(from, occ) & ~own; targets;) {
      const Square to = bb::pop_lsb(targets);
      out.emplace_back(from, to, PT::None, (enemy & bb::sq_bb(to)) != 0);
    }
  }
}

bb::Bitboard knightTargets(Square s, bb::Bitboard) {
  return bb::knight_attacks_from(s);
}
bb::Bitboard kingTargets(Square s, bb::Bitboard) {
  return bb::king_attacks_from(s);
}
bb::Bitboard bishopTargets(Square s, bb::Bitboard occ) {
  return bb::bishop_attacks(s, occ);
}
bb::Bitboard rookTargets(Square s, bb::Bitboard occ) {
  return bb::rook_attacks(s, occ);
}
bb::Bitboard queenTargets(Square s, bb::Bitboard occ) {
  return bb::queen_attacks(s, occ);
}

struct CastlePath {
  std::uint8_t right;
  Square king;
  Square rook;
  Square kingTo;
  bb::Bitboard mustBeEmpty;
  Square passes[3];  // king's start, transit and destination squares
  CastleSide side;
};

constexpr CastlePath CASTLE_PATHS[4] = {
    {Castling::WK, bb::E1, bb::H1, bb::G1, bb::sq_bb(bb::F1) | bb::sq_bb(bb::G1),
     {bb::E1, bb::F1, bb::G1}, CastleSide::KingSide},
    {Castling::WQ, bb::E1, bb::A1, bb::C1,
     bb::sq_bb(bb::D1) | bb::sq_bb(bb::C1) | bb::sq_bb(bb::B1), {bb::E1, bb::D1, bb::C1},
     CastleSide::QueenSide},
    {Castling::BK, bb::E8, bb::H8, bb::G8, bb::sq_bb(bb::F8) | bb::sq_bb(bb::G8),
     {bb::E8, bb::F8, bb::G8}, CastleSide::KingSide},
    {Castling::BQ, bb::E8, bb::A8, bb::C8,
     bb::sq_bb(bb::D8) | bb::sq_bb(bb::C8) | bb::sq_bb(bb::B8), {bb::E8, bb::D8, bb::C8},
     CastleSide::QueenSide},
};

void genCastling(const Board& b, const GameState& st, std::vector<Move>& out) {
  const Color us = st.sideToMove;
  const bb::Bitboard occ = b.getAllPieces();
  const bb::Bitboard king = b.getPieces(us, PT::King);
  const bb::Bitboard rooks = b.getPieces(us, PT::Rook);

  for (const CastlePath& path : CASTLE_PATHS) {
    if (!(st.castlingRights & path.right)) continue;
    const bool ours = us == Color::White ? path.king == bb::E1 : path.king == bb::E8;
    if (!ours) continue;
    if (!(king & bb::sq_bb(path.king)) || !(rooks & bb::sq_bb(path.rook))) continue;
    if (occ & path.mustBeEmpty) continue;

    bool safe = true;
    for (Square s : path.passes) {
      if (attackedBy(b, s, ~us, occ)) {
        safe = false;
        break;
      }
    }
    if (safe) out.emplace_back(path.king, path.kingTo, PT::None, false, false, path.side);
  }
}

}  // namespace

void MoveGenerator::generatePseudoLegalMoves(const Board& b, const GameState& st,
                                             std::vector<Move>& out) const {
  const Color us = st.sideToMove;
  genPawnMoves(b, st, out);
  genSliderOrLeaper<knightTargets>(b, us, PT::Knight, out);
  genSliderOrLeaper<bishopTargets>(b, us, PT::Bishop, out);
  genSliderOrLeaper<rookTargets>(b, us, PT::Rook, out);
  genSliderOrLeaper<queenTargets>(b, us, PT::Queen, out);
  genSliderOrLeaper<kingTargets>(b, us, PT::King, out);
  genCastling(b, st, out);
}

void MoveGenerator::generateLegalMoves(const Board& b, const GameState& st,
                                       std::vector<Move>& out) const {
  std::vector<Move> pseudo;
  pseudo.reserve(64);
  generatePseudoLegalMoves(b, st, pseudo);

  Position scratch;
  scratch.getBoard() = b;
  scratch.getState() = st;
  scratch.resetHistory();
  for (const Move& m : pseudo) {
    if (scratch.doMove(m)) {
      scratch.undoMove();
      out.push_back(m);
    }
  }
}

}  // namespace unchessful::model
