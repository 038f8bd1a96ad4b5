#pragma once
#include <array>
#include <bit>
#include <cstdint>

#include "../../chess_types.hpp"

namespace unchessful::model::bb {

using Bitboard = std::uint64_t;

constexpr Bitboard FILE_A = 0x0101010101010101ULL;
constexpr Bitboard FILE_B = 0x0202020202020202ULL;
constexpr Bitboard FILE_G = 0x4040404040404040ULL;
constexpr Bitboard FILE_H = 0x8080808080808080ULL;

constexpr Bitboard RANK_1 = 0x00000000000000FFULL;
constexpr Bitboard RANK_2 = 0x000000000000FF00ULL;
constexpr Bitboard RANK_7 = 0x00FF000000000000ULL;
constexpr Bitboard RANK_8 = 0xFF00000000000000ULL;

constexpr Bitboard DARK_SQUARES = 0xAA55AA55AA55AA55ULL;

// corner and castling squares
constexpr core::Square A1 = 0, B1 = 1, C1 = 2, D1 = 3, E1 = 4, F1 = 5, G1 = 6, H1 = 7;
constexpr core::Square A8 = 56, B8 = 57, C8 = 58, D8 = 59, E8 = 60, F8 = 61, G8 = 62, H8 = 63;

constexpr int file_of(core::Square s) noexcept {
  return s & 7;
}
constexpr int rank_of(core::Square s) noexcept {
  return s >> 3;
}
// s must be 0..63
constexpr Bitboard sq_bb(core::Square s) noexcept {
  return Bitboard{1} << static_cast<unsigned>(s);
}

[[nodiscard]] constexpr int popcount(Bitboard b) noexcept {
  return std::popcount(b);
}

[[nodiscard]] constexpr int ctz64(std::uint64_t x) noexcept {
  return static_cast<int>(std::countr_zero(x));
}

[[nodiscard]] inline core::Square pop_lsb(Bitboard& b) noexcept {
  if (!b) return core::NO_SQUARE;
  const int idx = ctz64(b);
  b &= (b - 1);
  return static_cast<core::Square>(idx);
}

[[nodiscard]] constexpr Bitboard north(Bitboard b) noexcept {
  return b << 8;
}
[[nodiscard]] constexpr Bitboard south(Bitboard b) noexcept {
  return b >> 8;
}
[[nodiscard]] constexpr Bitboard east(Bitboard b) noexcept {
  return (b & ~FILE_H) << 1;
}
[[nodiscard]] constexpr Bitboard west(Bitboard b) noexcept {
  return (b & ~FILE_A) >> 1;
}
[[nodiscard]] constexpr Bitboard ne(Bitboard b) noexcept {
  return (b & ~FILE_H) << 9;
}
[[nodiscard]] constexpr Bitboard nw(Bitboard b) noexcept {
  return (b & ~FILE_A) << 7;
}
[[nodiscard]] constexpr Bitboard se(Bitboard b) noexcept {
  return (b & ~FILE_H) >> 7;
}
[[nodiscard]] constexpr Bitboard sw(Bitboard b) noexcept {
  return (b & ~FILE_A) >> 9;
}

namespace detail {

template <Bitboard (*Step)(Bitboard)>
[[nodiscard]] constexpr Bitboard ray(Bitboard from, Bitboard occ) noexcept {
  Bitboard atk = 0;
  Bitboard r = Step(from);
  while (r) {
    atk |= r;
    if (r & occ) break;
    r = Step(r);
  }
  return atk;
}

constexpr Bitboard knight_from_sq(core::Square s) noexcept {
  Bitboard b = sq_bb(s);
  Bitboard l1 = (b & ~FILE_A) >> 1;
  Bitboard l2 = (b & ~(FILE_A | FILE_B)) >> 2;
  Bitboard r1 = (b & ~FILE_H) << 1;
  Bitboard r2 = (b & ~(FILE_H | FILE_G)) << 2;
  return (l2 << 8) | (l2 >> 8) | (r2 << 8) | (r2 >> 8) | (l1 << 16) | (l1 >> 16) | (r1 << 16) |
         (r1 >> 16);
}

constexpr Bitboard king_from_sq(core::Square s) noexcept {
  Bitboard b = sq_bb(s);
  return east(b) | west(b) | north(b) | south(b) | ne(b) | nw(b) | se(b) | sw(b);
}

template <Bitboard (*Gen)(core::Square)>
constexpr auto build_table() noexcept {
  std::array<Bitboard, 64> t{};
  for (int i = 0; i < 64; ++i) t[i] = Gen(static_cast<core::Square>(i));
  return t;
}

inline constexpr auto KNIGHT_ATTACKS = build_table<knight_from_sq>();
inline constexpr auto KING_ATTACKS = build_table<king_from_sq>();

}  // namespace detail

[[nodiscard]] constexpr Bitboard knight_attacks_from(
    core::Square s) noexcept {
  return detail::KNIGHT_ATTACKS[static_cast<int>(s)];
}

[[nodiscard]] constexpr Bitboard king_attacks_from(
    core::Square s) noexcept {
  return detail::KING_ATTACKS[static_cast<int>(s)];
}

[[nodiscard]] constexpr Bitboard bishop_attacks(core::Square s,
                                                                         Bitboard occ) noexcept {
  const Bitboard from = sq_bb(s);
  return detail::ray<ne>(from, occ) | detail::ray<nw>(from, occ) | detail::ray<se>(from, occ) |
         detail::ray<sw>(from, occ);
}

[[nodiscard]] constexpr Bitboard rook_attacks(core::Square s,
                                                                       Bitboard occ) noexcept {
  const Bitboard from = sq_bb(s);
  return detail::ray<north>(from, occ) | detail::ray<south>(from, occ) |
         detail::ray<east>(from, occ) | detail::ray<west>(from, occ);
}

[[nodiscard]] constexpr Bitboard queen_attacks(core::Square s,
                                                                        Bitboard occ) noexcept {
  return bishop_attacks(s, occ) | rook_attacks(s, occ);
}

// Squares attacked by pawns of the given colour.
[[nodiscard]] constexpr Bitboard pawn_attacks(core::Color c,
                                                                       Bitboard pawns) noexcept {
  return c == core::Color::White ? (nw(pawns) | ne(pawns)) : (sw(pawns) | se(pawns));
}

}  // namespace unchessful::model::bb
