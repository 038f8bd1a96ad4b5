#pragma once
#include <array>
#include <cstdint>
#include <type_traits>

#include "move.hpp"
#include "piece.hpp"

namespace unchessful::model {

enum Castling : std::uint8_t { WK = 1 << 0, WQ = 1 << 1, BK = 1 << 2, BQ = 1 << 3 };
constexpr std::uint8_t ALL_CASTLING = WK | WQ | BK | BQ;

struct GameState {
  std::uint32_t fullmoveNumber = 1;
  std::uint16_t halfmoveClock = 0;
  std::uint8_t castlingRights = ALL_CASTLING;
  core::Color sideToMove = core::Color::White;
  core::Square enPassantSquare = core::NO_SQUARE;
};

// Everything needed to take a move back.
struct StateInfo {
  Move move{};
  Piece captured{};
  std::uint32_t prevFullmoveNumber{1};
  std::uint16_t prevHalfmoveClock{};
  std::uint8_t prevCastlingRights{};
  core::Square prevEnPassantSquare{core::NO_SQUARE};
};

// Identity of a position for repetition detection. The en-passant square only
// counts when a pawn of the side to move could actually take there.
struct PositionKey {
  std::array<std::uint8_t, 64> squares{};
  std::uint8_t castlingRights = 0;
  core::Color sideToMove = core::Color::White;
  core::Square enPassantSquare = core::NO_SQUARE;

  friend bool operator==(const PositionKey&, const PositionKey&) = default;
};

static_assert(std::is_trivially_copyable_v<GameState>, "GameState should be POD");
static_assert(std::is_trivially_copyable_v<StateInfo>, "StateInfo should be POD");

}  // namespace unchessful::model
