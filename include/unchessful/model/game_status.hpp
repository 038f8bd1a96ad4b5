#pragma once
#include <cstdint>
#include <optional>
#include <string>

#include "../chess_types.hpp"

namespace unchessful::model {

enum class DrawReason : std::uint8_t { InsufficientMaterial, FiftyMoveRule, ThreefoldRepetition };

struct GameStatus {
  enum class Kind : std::uint8_t { InProgress, Checkmate, Stalemate, DrawByRule, Resigned };

  Kind kind = Kind::InProgress;
  // winner for Checkmate, loser for Resigned; unused otherwise
  core::Color side = core::Color::White;
  DrawReason reason = DrawReason::InsufficientMaterial;

  static constexpr GameStatus inProgress() { return {}; }
  static constexpr GameStatus checkmate(core::Color winner) {
    return {Kind::Checkmate, winner, DrawReason::InsufficientMaterial};
  }
  static constexpr GameStatus stalemate() {
    return {Kind::Stalemate, core::Color::White, DrawReason::InsufficientMaterial};
  }
  static constexpr GameStatus drawByRule(DrawReason why) {
    return {Kind::DrawByRule, core::Color::White, why};
  }
  static constexpr GameStatus resigned(core::Color loser) {
    return {Kind::Resigned, loser, DrawReason::InsufficientMaterial};
  }

  [[nodiscard]] constexpr bool isTerminal() const noexcept { return kind != Kind::InProgress; }

  [[nodiscard]] constexpr std::optional<core::Color> winner() const noexcept {
    if (kind == Kind::Checkmate) return side;
    if (kind == Kind::Resigned) return ~side;
    return std::nullopt;
  }

  friend constexpr bool operator==(const GameStatus& a, const GameStatus& b) noexcept {
    if (a.kind != b.kind) return false;
    switch (a.kind) {
      case Kind::Checkmate:
      case Kind::Resigned:
        return a.side == b.side;
      case Kind::DrawByRule:
        return a.reason == b.reason;
      default:
        return true;
    }
  }
};

const char* toString(DrawReason reason);
// Human readable, e.g. "Checkmate - White wins".
std::string toString(const GameStatus& status);
// PGN style result token: "1-0", "0-1", "1/2-1/2" or "*".
const char* resultToken(const GameStatus& status);

}  // namespace unchessful::model
