#include "unchessful/model/chess_game.hpp"

#include <cctype>
#include <cstdint>
#include <limits>
#include <iostream>
#include <string_view>

#include "unchessful/model/analysis/san_notation.hpp"
#include "unchessful/model/move_helper.hpp"

namespace unchessful::model {

namespace {

core::PieceType pieceFromChar(char lower) {
  switch (lower) {
    case 'k':
      return core::PieceType::King;
    case 'q':
      return core::PieceType::Queen;
    case 'r':
      return core::PieceType::Rook;
    case 'b':
      return core::PieceType::Bishop;
    case 'n':
      return core::PieceType::Knight;
    case 'p':
      return core::PieceType::Pawn;
    default:
      return core::PieceType::None;
  }
}

char charFromPiece(Piece p) {
  static constexpr char LETTERS[] = {'p', 'n', 'b', 'r', 'q', 'k'};
  const char c = LETTERS[core::idx(p.type)];
  return p.color == core::Color::White ? static_cast<char>(std::toupper(c)) : c;
}

bool parseClock(std::string_view sv, std::uint32_t maxValue, std::uint32_t& out) {
  if (sv.empty() || sv.size() > 10) return false;
  std::uint64_t val = 0;
  for (char c : sv) {
    if (c < '0' || c > '9') return false;
    val = val * 10 + static_cast<std::uint64_t>(c - '0');
  }
  if (val > maxValue) return false;
  out = static_cast<std::uint32_t>(val);
  return true;
}

bool fail(std::string* outError, const char* msg) {
  if (outError) *outError = msg;
  return false;
}

}  // namespace

bool parseFen(const std::string& fen, Position& pos, std::string* outError) {
  std::string_view sv{fen};
  std::string_view fields[6]{};
  int count = 0;
  while (!sv.empty() && count < 6) {
    while (!sv.empty() && sv.front() == ' ') sv.remove_prefix(1);
    if (sv.empty()) break;
    const std::size_t sp = sv.find(' ');
    fields[count++] = sv.substr(0, sp);
    sv.remove_prefix(sp == std::string_view::npos ? sv.size() : sp);
  }
  if (count < 4) return fail(outError, "FEN needs at least 4 fields");

  Board board;
  int rank = 7, file = 0;
  for (char ch : fields[0]) {
    if (ch == '/') {
      if (file != 8 || rank == 0) return fail(outError, "FEN rank has wrong length");
      --rank;
      file = 0;
      continue;
    }
    if (ch >= '1' && ch <= '8') {
      file += ch - '0';
      if (file > 8) return fail(outError, "FEN rank overflows");
      continue;
    }
    const char lo = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    const core::PieceType type = pieceFromChar(lo);
    if (type == core::PieceType::None) return fail(outError, "FEN has an unknown piece letter");
    if (file > 7) return fail(outError, "FEN rank overflows");
    const core::Color col = (ch == lo) ? core::Color::Black : core::Color::White;
    board.setPiece(core::makeSquare(file, rank), {type, col});
    ++file;
  }
  if (rank != 0 || file != 8) return fail(outError, "FEN board must have 8 ranks of 8 squares");
  for (core::Color c : {core::Color::White, core::Color::Black}) {
    if (bb::popcount(board.getPieces(c, core::PieceType::King)) != 1)
      return fail(outError, "each side needs exactly one king");
  }

  GameState st;
  if (fields[1] == "w")
    st.sideToMove = core::Color::White;
  else if (fields[1] == "b")
    st.sideToMove = core::Color::Black;
  else
    return fail(outError, "FEN side to move must be 'w' or 'b'");

  st.castlingRights = 0;
  if (fields[2] != "-") {
    for (char c : fields[2]) {
      switch (c) {
        case 'K':
          st.castlingRights |= Castling::WK;
          break;
        case 'Q':
          st.castlingRights |= Castling::WQ;
          break;
        case 'k':
          st.castlingRights |= Castling::BK;
          break;
        case 'q':
          st.castlingRights |= Castling::BQ;
          break;
        default:
          return fail(outError, "FEN castling field is malformed");
      }
    }
  }

  st.enPassantSquare = core::NO_SQUARE;
  if (fields[3] != "-") {
    const auto ep = core::parseSquare(fields[3]);
    if (!ep) return fail(outError, "FEN en-passant square is malformed");
    st.enPassantSquare = *ep;
  }

  std::uint32_t hm = 0, fm = 1;
  if (count >= 5 && !parseClock(fields[4], std::numeric_limits<std::uint16_t>::max(), hm))
    return fail(outError, "FEN halfmove clock");
  if (count >= 6 && !parseClock(fields[5], std::numeric_limits<std::uint32_t>::max(), fm))
    return fail(outError, "FEN fullmove number");
  st.halfmoveClock = static_cast<std::uint16_t>(hm);
  st.fullmoveNumber = fm == 0 ? 1u : fm;

  pos = Position{};
  pos.getBoard() = board;
  pos.getState() = st;
  pos.resetHistory();
  return true;
}

std::string toFen(const Position& pos) {
  std::string fen;
  fen.reserve(90);
  const Board& board = pos.getBoard();

  for (int rank = 7; rank >= 0; --rank) {
    int empty = 0;
    for (int file = 0; file < 8; ++file) {
      const auto piece = board.getPiece(core::makeSquare(file, rank));
      if (!piece) {
        ++empty;
        continue;
      }
      if (empty) {
        fen.push_back(static_cast<char>('0' + empty));
        empty = 0;
      }
      fen.push_back(charFromPiece(*piece));
    }
    if (empty) fen.push_back(static_cast<char>('0' + empty));
    if (rank) fen.push_back('/');
  }

  const GameState& st = pos.getState();
  fen += st.sideToMove == core::Color::White ? " w " : " b ";
  if (st.castlingRights) {
    if (st.castlingRights & Castling::WK) fen.push_back('K');
    if (st.castlingRights & Castling::WQ) fen.push_back('Q');
    if (st.castlingRights & Castling::BK) fen.push_back('k');
    if (st.castlingRights & Castling::BQ) fen.push_back('q');
  } else {
    fen.push_back('-');
  }
  fen.push_back(' ');
  fen += core::squareName(st.enPassantSquare);
  fen.push_back(' ');
  fen += std::to_string(st.halfmoveClock);
  fen.push_back(' ');
  fen += std::to_string(st.fullmoveNumber);
  return fen;
}

ChessGame::ChessGame() {
  reset();
}

bool ChessGame::setPosition(const std::string& fen, std::string* outError) {
  Position parsed;
  if (!parseFen(fen, parsed, outError)) return false;

  m_position = std::move(parsed);
  m_start_fen = fen;
  m_moves.clear();
  m_resigned.reset();
  m_legal_dirty = true;
  recomputeStatus();
  return true;
}

void ChessGame::reset() {
  std::string err;
  if (!setPosition(core::START_FEN, &err))
    std::cerr << "[ChessGame] start position rejected: " << err << '\n';
}

std::optional<GameStatus> ChessGame::apply(const Move& mv) {
  if (m_status.isTerminal()) return std::nullopt;
  const auto legal = findLegalMove(mv.from(), mv.to(), mv.promotion());
  if (!legal || !m_position.doMove(*legal)) return std::nullopt;

  m_moves.push_back(*legal);
  m_legal_dirty = true;
  recomputeStatus();
  return m_status;
}

bool ChessGame::doMoveUCI(const std::string& uciMove) {
  const auto mv = notation::parseUci(uciMove);
  return mv && apply(*mv).has_value();
}

bool ChessGame::undo() {
  if (m_resigned) {
    m_resigned.reset();
    recomputeStatus();
    return true;
  }
  if (m_moves.empty()) return false;
  m_position.undoMove();
  m_moves.pop_back();
  m_legal_dirty = true;
  recomputeStatus();
  return true;
}

bool ChessGame::resign(core::Color loser) {
  if (m_status.isTerminal()) return false;
  m_resigned = loser;
  recomputeStatus();
  return true;
}

const std::vector<Move>& ChessGame::legalMoves() const {
  if (m_legal_dirty) {
    m_legal_moves.clear();
    m_move_gen.generateLegalMoves(m_position.getBoard(), m_position.getState(), m_legal_moves);
    m_legal_dirty = false;
  }
  return m_legal_moves;
}

std::optional<Move> ChessGame::findLegalMove(core::Square from, core::Square to,
                                             core::PieceType promotion) const {
  for (const auto& m : legalMoves()) {
    if (m.from() == from && m.to() == to && m.promotion() == promotion) return m;
  }
  return std::nullopt;
}

bool ChessGame::isKingInCheck(core::Color c) const {
  const bb::Bitboard kbb = m_position.getBoard().getPieces(c, core::PieceType::King);
  if (!kbb) return false;
  const auto ksq = static_cast<core::Square>(bb::ctz64(kbb));
  return attackedBy(m_position.getBoard(), ksq, ~c, m_position.getBoard().getAllPieces());
}

Piece ChessGame::getPiece(core::Square sq) const {
  return m_position.getBoard().getPiece(sq).value_or(Piece{});
}

std::optional<Move> ChessGame::lastMove() const {
  if (m_moves.empty()) return std::nullopt;
  return m_moves.back();
}

std::vector<std::string> ChessGame::sanHistory() const {
  std::vector<std::string> out;
  out.reserve(m_moves.size());
  Position replay;
  if (!parseFen(m_start_fen, replay)) return out;
  for (const Move& m : m_moves) {
    out.push_back(notation::toSan(replay, m));
    if (!replay.doMove(m)) break;
  }
  return out;
}

std::string ChessGame::getFen() const {
  return toFen(m_position);
}

void ChessGame::recomputeStatus() {
  if (m_resigned) {
    m_status = GameStatus::resigned(*m_resigned);
    return;
  }
  const core::Color stm = sideToMove();
  if (legalMoves().empty()) {
    m_status = isKingInCheck(stm) ? GameStatus::checkmate(~stm) : GameStatus::stalemate();
  } else if (m_position.checkInsufficientMaterial()) {
    m_status = GameStatus::drawByRule(DrawReason::InsufficientMaterial);
  } else if (m_position.checkMoveRule()) {
    m_status = GameStatus::drawByRule(DrawReason::FiftyMoveRule);
  } else if (m_position.checkRepetition()) {
    m_status = GameStatus::drawByRule(DrawReason::ThreefoldRepetition);
  } else {
    m_status = GameStatus::inProgress();
  }
}

}  // namespace unchessful::model
