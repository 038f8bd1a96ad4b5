#include "unchessful/model/position.hpp"

#include <algorithm>
#include <array>

#include "unchessful/model/move_helper.hpp"

namespace unchessful::model {

namespace {

// castling rights lost when a piece leaves or lands on the square
constexpr std::array<std::uint8_t, 64> CR_CLEAR = [] {
  std::array<std::uint8_t, 64> a{};
  a[bb::E1] |= Castling::WK | Castling::WQ;
  a[bb::E8] |= Castling::BK | Castling::BQ;
  a[bb::H1] |= Castling::WK;
  a[bb::A1] |= Castling::WQ;
  a[bb::H8] |= Castling::BK;
  a[bb::A8] |= Castling::BQ;
  return a;
}();

struct RookHop {
  core::Square from;
  core::Square to;
};

RookHop castlingRook(core::Color us, CastleSide side) {
  const bool white = us == core::Color::White;
  if (side == CastleSide::KingSide) return white ? RookHop{bb::H1, bb::F1} : RookHop{bb::H8, bb::F8};
  return white ? RookHop{bb::A1, bb::D1} : RookHop{bb::A8, bb::D8};
}

inline core::Square epVictimSquare(core::Color us, core::Square to) {
  return static_cast<core::Square>(us == core::Color::White ? to - 8 : to + 8);
}

}  // namespace

void Position::resetHistory() {
  m_history.clear();
  m_keys.clear();
  m_keys.push_back(computeKey());
}

bool Position::doMove(const Move& m) {
  if (m.isNull()) return false;

  const core::Color us = m_state.sideToMove;
  const auto fromPiece = m_board.getPiece(m.from());
  if (!fromPiece || fromPiece->color != us) return false;

  if (m.isPromotion()) {
    if (fromPiece->type != core::PieceType::Pawn) return false;
    const int toRank = bb::rank_of(m.to());
    if (toRank != (us == core::Color::White ? 7 : 0)) return false;
    switch (m.promotion()) {
      case core::PieceType::Knight:
      case core::PieceType::Bishop:
      case core::PieceType::Rook:
      case core::PieceType::Queen:
        break;
      default:
        return false;
    }
  }

  StateInfo st{};
  st.move = m;
  st.prevCastlingRights = m_state.castlingRights;
  st.prevEnPassantSquare = m_state.enPassantSquare;
  st.prevHalfmoveClock = m_state.halfmoveClock;
  st.prevFullmoveNumber = m_state.fullmoveNumber;

  applyMove(m, st);

  const bb::Bitboard king = m_board.getPieces(us, core::PieceType::King);
  if (!king || attackedBy(m_board, static_cast<core::Square>(bb::ctz64(king)), ~us,
                          m_board.getAllPieces())) {
    unapplyMove(st);
    return false;
  }

  m_history.push_back(st);
  m_keys.push_back(computeKey());
  return true;
}

void Position::undoMove() {
  if (m_history.empty()) return;
  const StateInfo st = m_history.back();
  m_history.pop_back();
  m_keys.pop_back();
  unapplyMove(st);
}

void Position::applyMove(const Move& m, StateInfo& st) {
  const core::Color us = m_state.sideToMove;
  const core::Square from = m.from();
  const core::Square to = m.to();
  const Piece mover = *m_board.getPiece(from);

  if (m.isEnPassant()) {
    const core::Square victim = epVictimSquare(us, to);
    st.captured = m_board.getPiece(victim).value_or(Piece{});
    m_board.removePiece(victim);
  } else {
    st.captured = m_board.getPiece(to).value_or(Piece{});
  }

  m_board.movePiece(from, to);
  if (m.isPromotion()) m_board.setPiece(to, Piece{m.promotion(), us});

  if (m.castle() != CastleSide::None) {
    const RookHop hop = castlingRook(us, m.castle());
    m_board.movePiece(hop.from, hop.to);
  }

  m_state.castlingRights &= static_cast<std::uint8_t>(~(CR_CLEAR[from] | CR_CLEAR[to]));

  m_state.enPassantSquare = core::NO_SQUARE;
  if (mover.type == core::PieceType::Pawn) {
    const int delta = static_cast<int>(to) - static_cast<int>(from);
    if (delta == 16 || delta == -16)
      m_state.enPassantSquare = static_cast<core::Square>((static_cast<int>(from) + to) / 2);
  }

  if (mover.type == core::PieceType::Pawn || !st.captured.isNone())
    m_state.halfmoveClock = 0;
  else
    ++m_state.halfmoveClock;

  if (us == core::Color::Black) ++m_state.fullmoveNumber;
  m_state.sideToMove = ~us;
}

void Position::unapplyMove(const StateInfo& st) {
  const Move m = st.move;
  const core::Color us = ~m_state.sideToMove;
  const core::Square from = m.from();
  const core::Square to = m.to();

  if (m.isPromotion()) m_board.setPiece(to, Piece{core::PieceType::Pawn, us});
  m_board.movePiece(to, from);

  if (m.castle() != CastleSide::None) {
    const RookHop hop = castlingRook(us, m.castle());
    m_board.movePiece(hop.to, hop.from);
  }

  if (!st.captured.isNone())
    m_board.setPiece(m.isEnPassant() ? epVictimSquare(us, to) : to, st.captured);

  m_state.sideToMove = us;
  m_state.castlingRights = st.prevCastlingRights;
  m_state.enPassantSquare = st.prevEnPassantSquare;
  m_state.halfmoveClock = st.prevHalfmoveClock;
  m_state.fullmoveNumber = st.prevFullmoveNumber;
}

bool Position::inCheck() const {
  const core::Color us = m_state.sideToMove;
  const bb::Bitboard king = m_board.getPieces(us, core::PieceType::King);
  if (!king) return false;
  return attackedBy(m_board, static_cast<core::Square>(bb::ctz64(king)), ~us,
                    m_board.getAllPieces());
}

bool Position::checkInsufficientMaterial() const {
  using core::Color;
  using core::PieceType;
  for (Color c : {Color::White, Color::Black}) {
    if (m_board.getPieces(c, PieceType::Pawn) | m_board.getPieces(c, PieceType::Rook) |
        m_board.getPieces(c, PieceType::Queen))
      return false;
  }

  const bb::Bitboard bishops = m_board.getPieces(Color::White, PieceType::Bishop) |
                               m_board.getPieces(Color::Black, PieceType::Bishop);
  const int knights = bb::popcount(m_board.getPieces(Color::White, PieceType::Knight) |
                                   m_board.getPieces(Color::Black, PieceType::Knight));
  const int minors = bb::popcount(bishops) + knights;

  if (minors <= 1) return true;  // KK, KNK, KBK
  // any number of bishops, all on one square colour
  if (knights == 0) return (bishops & bb::DARK_SQUARES) == 0 || (bishops & ~bb::DARK_SQUARES) == 0;
  return false;
}

bool Position::checkMoveRule() const {
  return m_state.halfmoveClock >= 100;
}

bool Position::checkRepetition() const {
  const int n = static_cast<int>(m_keys.size());
  const int lim = std::min<int>(n - 1, m_state.halfmoveClock);
  const PositionKey& current = m_keys.back();
  int count = 0;
  for (int back = 2; back <= lim; back += 2) {
    if (m_keys[n - 1 - back] == current && ++count >= 2) return true;
  }
  return false;
}

PositionKey Position::computeKey() const {
  PositionKey key;
  const auto& pieces = m_board.pieces();
  for (int s = 0; s < 64; ++s) {
    const Piece p = pieces[s];
    key.squares[s] = p.isNone() ? 0
                                : static_cast<std::uint8_t>((core::idx(p.type) + 1) |
                                                            (colorIndex(p.color) << 3));
  }
  key.castlingRights = m_state.castlingRights;
  key.sideToMove = m_state.sideToMove;

  const core::Square ep = m_state.enPassantSquare;
  if (ep != core::NO_SQUARE) {
    const core::Color stm = m_state.sideToMove;
    const bb::Bitboard capturers =
        bb::pawn_attacks(~stm, bb::sq_bb(ep)) & m_board.getPieces(stm, core::PieceType::Pawn);
    if (capturers) key.enPassantSquare = ep;
  }
  return key;
}

}  // namespace unchessful::model
