#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace unchessful::core {

using Square = std::uint8_t;
constexpr Square NO_SQUARE = 64;

inline bool validSquare(Square sq) {
  return sq < NO_SQUARE;
}

constexpr std::uint8_t NUM_PIECE_TYPES = 6;
enum class PieceType : std::uint8_t { Pawn = 0, Knight, Bishop, Rook, Queen, King, None };

constexpr int idx(PieceType p) noexcept {
  return static_cast<int>(p);
}

enum class Color : std::uint8_t { White = 0, Black = 1 };

constexpr Color operator~(Color c) {
  return c == Color::White ? Color::Black : Color::White;
}

constexpr Square makeSquare(int file, int rank) noexcept {
  return static_cast<Square>(rank * 8 + file);
}

// "e4" style names; NO_SQUARE renders as "-".
std::string squareName(Square sq);
std::optional<Square> parseSquare(std::string_view s);

const char* colorName(Color c);

}  // namespace unchessful::core
