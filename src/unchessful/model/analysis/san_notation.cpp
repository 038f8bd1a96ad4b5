#include "unchessful/model/analysis/san_notation.hpp"

#include <cctype>
#include <string>
#include <string_view>
#include <vector>

#include "unchessful/model/move_generator.hpp"

namespace unchessful::model::notation {

namespace {

char pieceLetter(core::PieceType pt) {
  switch (pt) {
    case core::PieceType::Knight:
      return 'N';
    case core::PieceType::Bishop:
      return 'B';
    case core::PieceType::Rook:
      return 'R';
    case core::PieceType::Queen:
      return 'Q';
    case core::PieceType::King:
      return 'K';
    default:
      return '\0';
  }
}

core::PieceType parsePromo(char c) {
  switch (std::tolower(static_cast<unsigned char>(c))) {
    case 'q':
      return core::PieceType::Queen;
    case 'r':
      return core::PieceType::Rook;
    case 'b':
      return core::PieceType::Bishop;
    case 'n':
      return core::PieceType::Knight;
    default:
      return core::PieceType::None;
  }
}

bool isUciLike(std::string_view t) {
  if (t.size() != 4 && t.size() != 5) return false;
  auto in = [](char c, char lo, char hi) { return c >= lo && c <= hi; };
  if (!in(t[0], 'a', 'h') || !in(t[1], '1', '8') || !in(t[2], 'a', 'h') || !in(t[3], '1', '8'))
    return false;
  return t.size() == 4 || parsePromo(t[4]) != core::PieceType::None;
}

std::string normalizeSan(std::string_view in) {
  std::size_t a = 0, b = in.size();
  while (a < b && std::isspace(static_cast<unsigned char>(in[a]))) ++a;
  while (b > a && std::isspace(static_cast<unsigned char>(in[b - 1]))) --b;
  std::string s(in.substr(a, b - a));

  while (!s.empty()) {
    const char c = s.back();
    if (c == '+' || c == '#' || c == '!' || c == '?')
      s.pop_back();
    else
      break;
  }
  if (s == "0-0") s = "O-O";
  if (s == "0-0-0") s = "O-O-O";

  // "e8Q" -> "e8=Q"
  const std::size_t n = s.size();
  if (n >= 3 && !isUciLike(s) && std::isdigit(static_cast<unsigned char>(s[n - 2])) &&
      std::isupper(static_cast<unsigned char>(s[n - 1])) &&
      parsePromo(s[n - 1]) != core::PieceType::None)
    s.insert(n - 1, 1, '=');
  return s;
}

std::vector<Move> legalMovesOf(const Position& pos) {
  std::vector<Move> out;
  MoveGenerator{}.generateLegalMoves(pos.getBoard(), pos.getState(), out);
  return out;
}

// "+", "#" or nothing, for the position after `mv`.
std::string checkSuffix(const Position& pos, const Move& mv) {
  Position after;
  after.getBoard() = pos.getBoard();
  after.getState() = pos.getState();
  after.resetHistory();
  if (!after.doMove(mv) || !after.inCheck()) return "";
  return legalMovesOf(after).empty() ? "#" : "+";
}

}  // namespace

std::string toUci(const Move& mv) {
  std::string s = core::squareName(mv.from()) + core::squareName(mv.to());
  if (mv.isPromotion())
    s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(pieceLetter(mv.promotion())))));
  return s;
}

std::optional<Move> parseUci(std::string_view token) {
  if (!isUciLike(token)) return std::nullopt;
  const auto from = core::parseSquare(token.substr(0, 2));
  const auto to = core::parseSquare(token.substr(2, 2));
  const core::PieceType promo = token.size() == 5 ? parsePromo(token[4]) : core::PieceType::None;
  return Move{*from, *to, promo};
}

std::string toSan(const Position& pos, const Move& mv) {
  const std::vector<Move> legals = legalMovesOf(pos);
  const Move* match = nullptr;
  for (const auto& m : legals) {
    if (m == mv) {
      match = &m;
      break;
    }
  }
  if (!match) return "";
  const Move m = *match;

  if (m.castle() != CastleSide::None)
    return (m.castle() == CastleSide::KingSide ? "O-O" : "O-O-O") + checkSuffix(pos, m);

  const Board& board = pos.getBoard();
  const Piece mover = *board.getPiece(m.from());
  const bool isPawn = mover.type == core::PieceType::Pawn;

  std::string san;
  if (!isPawn) {
    san.push_back(pieceLetter(mover.type));

    bool ambiguous = false, sameFile = false, sameRank = false;
    for (const auto& other : legals) {
      if (other.to() != m.to() || other.from() == m.from()) continue;
      const auto pc = board.getPiece(other.from());
      if (!pc || pc->type != mover.type) continue;
      ambiguous = true;
      if (bb::file_of(other.from()) == bb::file_of(m.from())) sameFile = true;
      if (bb::rank_of(other.from()) == bb::rank_of(m.from())) sameRank = true;
    }
    if (ambiguous) {
      const std::string from = core::squareName(m.from());
      if (!sameFile)
        san.push_back(from[0]);
      else if (!sameRank)
        san.push_back(from[1]);
      else
        san += from;
    }
  }

  if (m.isCapture()) {
    if (isPawn) san.push_back(core::squareName(m.from())[0]);
    san.push_back('x');
  }
  san += core::squareName(m.to());

  if (m.isPromotion()) {
    san.push_back('=');
    san.push_back(pieceLetter(m.promotion()));
  }
  return san + checkSuffix(pos, m);
}

bool fromSan(const Position& pos, std::string_view sanToken, Move& out) {
  const std::string tok = normalizeSan(sanToken);
  if (tok.empty()) return false;
  if (tok == "1-0" || tok == "0-1" || tok == "1/2-1/2" || tok == "*") return false;

  const std::vector<Move> legals = legalMovesOf(pos);

  if (isUciLike(tok)) {
    const auto wanted = parseUci(tok);
    for (const auto& m : legals) {
      if (m == *wanted) {
        out = m;
        return true;
      }
    }
    return false;
  }

  for (const auto& m : legals) {
    if (normalizeSan(toSan(pos, m)) == tok) {
      out = m;
      return true;
    }
  }
  return false;
}

}  // namespace unchessful::model::notation
