#include "unchessful/chess_types.hpp"

namespace unchessful::core {

std::string squareName(Square sq) {
  if (!validSquare(sq)) return "-";
  std::string s(2, ' ');
  s[0] = static_cast<char>('a' + (sq & 7));
  s[1] = static_cast<char>('1' + (sq >> 3));
  return s;
}

std::optional<Square> parseSquare(std::string_view s) {
  if (s.size() != 2) return std::nullopt;
  const int file = s[0] - 'a';
  const int rank = s[1] - '1';
  if (file < 0 || file > 7 || rank < 0 || rank > 7) return std::nullopt;
  return makeSquare(file, rank);
}

const char* colorName(Color c) {
  return c == Color::White ? "White" : "Black";
}

}  // namespace unchessful::core
