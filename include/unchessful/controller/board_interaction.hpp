#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "turn_controller.hpp"

namespace unchessful::controller {

// What the board view draws this frame.
struct FrameModel {
  bool interactive = false;  // the human may pick a piece
  bool spinner = false;      // an engine request is in flight
  std::string banner;
  std::string statusLine;

  model::PieceArray board{};
  core::Color orientation = core::Color::White;
  core::Square selected = core::NO_SQUARE;
  std::vector<core::Square> targets;
  core::Square promotionSquare = core::NO_SQUARE;
  std::optional<model::Move> lastMove;
  core::Square checkedKing = core::NO_SQUARE;
  std::vector<std::string> sanMoves;
};

// Turns clicks and key commands into controller transitions and keeps the
// purely visual state (selection, pending promotion) that the controller does
// not care about.
class BoardInteraction {
 public:
  enum class ClickResult { Ignored, Selected, Deselected, PromotionPending, Submitted, Rejected };

  explicit BoardInteraction(TurnController& controller);

  ClickResult clickSquare(core::Square sq);
  bool choosePromotion(core::PieceType type);
  void cancelPromotion();
  [[nodiscard]] bool promotionPending() const noexcept { return m_pending_promo.has_value(); }

  void requestNewGame();
  void requestNewGame(core::Color humanColor);
  bool requestRetry();
  bool requestCancel();
  bool requestUndo();
  bool requestResign();

  // Polls the controller once and builds the frame.
  FrameModel tick();
  [[nodiscard]] FrameModel frame() const;

  [[nodiscard]] core::Square selected() const noexcept { return m_selected; }

 private:
  void refresh();
  void clearSelection();
  [[nodiscard]] bool hasMovesFrom(core::Square from) const;

  TurnController& m_controller;
  TurnSnapshot m_snap;
  core::Square m_selected = core::NO_SQUARE;
  std::optional<std::pair<core::Square, core::Square>> m_pending_promo;
};

}  // namespace unchessful::controller
