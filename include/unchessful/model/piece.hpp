#pragma once
#include <cstdint>

#include "../chess_types.hpp"

namespace unchessful::model {

struct Piece {
  core::PieceType type = core::PieceType::None;
  core::Color color = core::Color::White;

  [[nodiscard]] constexpr bool isNone() const noexcept { return type == core::PieceType::None; }

  // all empty squares compare equal, whatever colour they carry
  friend constexpr bool operator==(const Piece& a, const Piece& b) noexcept {
    if (a.isNone() || b.isNone()) return a.isNone() && b.isNone();
    return a.type == b.type && a.color == b.color;
  }
};

// White 0, Black 1; indexes the per-colour bitboards.
constexpr int colorIndex(core::Color c) noexcept {
  return c == core::Color::White ? 0 : 1;
}

}  // namespace unchessful::model
