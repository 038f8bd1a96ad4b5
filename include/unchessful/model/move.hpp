#pragma once
#include <cstdint>
#include <type_traits>

#include "../chess_types.hpp"

namespace unchessful::model {

enum class CastleSide : std::uint8_t { None = 0, KingSide = 1, QueenSide = 2 };

// Packed move: from (6) | to (6) | promotion (4) | capture | en passant | castle (2).
// Only the low 16 bits identify a move; the flags are filled in by the generator.
class Move {
 public:
  static constexpr std::uint32_t TO_SHIFT = 6;
  static constexpr std::uint32_t PROMO_SHIFT = 12;
  static constexpr std::uint32_t CAP_MASK = 1u << 16;
  static constexpr std::uint32_t EP_MASK = 1u << 17;
  static constexpr std::uint32_t CASTLE_SHIFT = 18;
  static constexpr std::uint32_t IDENTITY_MASK = 0xFFFFu;

  constexpr Move() noexcept = default;

  constexpr Move(core::Square f, core::Square t, core::PieceType promo = core::PieceType::None,
                 bool isCap = false, bool isEP = false, CastleSide cs = CastleSide::None) noexcept
      : m_raw((static_cast<std::uint32_t>(f) & 0x3Fu) |
              ((static_cast<std::uint32_t>(t) & 0x3Fu) << TO_SHIFT) |
              ((static_cast<std::uint32_t>(promo) & 0x0Fu) << PROMO_SHIFT) |
              (isCap ? CAP_MASK : 0u) | (isEP ? EP_MASK : 0u) |
              ((static_cast<std::uint32_t>(cs) & 0x03u) << CASTLE_SHIFT)) {}

  [[nodiscard]] constexpr core::Square from() const noexcept {
    return static_cast<core::Square>(m_raw & 0x3Fu);
  }
  [[nodiscard]] constexpr core::Square to() const noexcept {
    return static_cast<core::Square>((m_raw >> TO_SHIFT) & 0x3Fu);
  }
  [[nodiscard]] constexpr core::PieceType promotion() const noexcept {
    return static_cast<core::PieceType>((m_raw >> PROMO_SHIFT) & 0x0Fu);
  }
  [[nodiscard]] constexpr bool isCapture() const noexcept { return (m_raw & CAP_MASK) != 0; }
  [[nodiscard]] constexpr bool isEnPassant() const noexcept { return (m_raw & EP_MASK) != 0; }
  [[nodiscard]] constexpr CastleSide castle() const noexcept {
    return static_cast<CastleSide>((m_raw >> CASTLE_SHIFT) & 0x03u);
  }
  [[nodiscard]] constexpr bool isPromotion() const noexcept {
    return promotion() != core::PieceType::None;
  }
  [[nodiscard]] constexpr bool isNull() const noexcept { return from() == to(); }

  friend constexpr bool operator==(const Move& a, const Move& b) noexcept {
    return (a.m_raw & IDENTITY_MASK) == (b.m_raw & IDENTITY_MASK);
  }
  friend constexpr bool operator!=(const Move& a, const Move& b) noexcept { return !(a == b); }

 private:
  // promotion field defaults to PieceType::None (6)
  std::uint32_t m_raw{static_cast<std::uint32_t>(core::PieceType::None) << PROMO_SHIFT};
};

static_assert(std::is_trivially_copyable_v<Move>, "Move must be trivially copyable");
static_assert(sizeof(Move) == 4, "Move should stay packed to 4 bytes");

}  // namespace unchessful::model
