#include "unchessful/controller/board_interaction.hpp"

#include <algorithm>

namespace unchessful::controller {

namespace {

std::string bannerFor(const TurnSnapshot& s) {
  if (const auto* over = std::get_if<GameOver>(&s.state)) return model::toString(over->status);
  if (s.lastError) {
    std::string text = std::string("Engine error: ") + engine::toString(s.lastError->kind);
    if (!s.lastError->detail.empty()) text += " (" + s.lastError->detail + ")";
    return text + ". Press R to retry.";
  }
  if (std::holds_alternative<RequestInFlight>(s.state)) return "Engine is thinking...";
  if (s.mode == PlayMode::Engine && s.sideToMove != s.humanColor)
    return "Engine to move. Press R to ask again.";
  return {};
}

}  // namespace

BoardInteraction::BoardInteraction(TurnController& controller)
    : m_controller(controller), m_snap(controller.snapshot()) {}

void BoardInteraction::refresh() {
  m_snap = m_controller.snapshot();
  if (m_snap.humanMoves.empty()) {
    m_selected = core::NO_SQUARE;
    m_pending_promo.reset();
  }
}

void BoardInteraction::clearSelection() {
  m_selected = core::NO_SQUARE;
  m_pending_promo.reset();
}

bool BoardInteraction::hasMovesFrom(core::Square from) const {
  return std::any_of(m_snap.humanMoves.begin(), m_snap.humanMoves.end(),
                     [from](const model::Move& m) { return m.from() == from; });
}

BoardInteraction::ClickResult BoardInteraction::clickSquare(core::Square sq) {
  refresh();
  if (!core::validSquare(sq) || m_pending_promo) return ClickResult::Ignored;
  if (m_snap.humanMoves.empty()) return ClickResult::Ignored;

  if (m_selected != core::NO_SQUARE) {
    if (sq == m_selected) {
      clearSelection();
      return ClickResult::Deselected;
    }

    bool promotes = false;
    std::optional<model::Move> chosen;
    for (const auto& m : m_snap.humanMoves) {
      if (m.from() != m_selected || m.to() != sq) continue;
      chosen = m;
      promotes = promotes || m.isPromotion();
    }
    if (chosen) {
      if (promotes) {
        m_pending_promo = std::make_pair(m_selected, sq);
        return ClickResult::PromotionPending;
      }
      const SubmitResult r = m_controller.submitHumanMove(*chosen);
      clearSelection();
      refresh();
      return r == SubmitResult::Applied ? ClickResult::Submitted : ClickResult::Rejected;
    }
  }

  const model::Piece pc = m_snap.board[sq];
  if (!pc.isNone() && pc.color == m_snap.sideToMove && hasMovesFrom(sq)) {
    m_selected = sq;
    return ClickResult::Selected;
  }
  const bool had = m_selected != core::NO_SQUARE;
  clearSelection();
  return had ? ClickResult::Deselected : ClickResult::Ignored;
}

bool BoardInteraction::choosePromotion(core::PieceType type) {
  if (!m_pending_promo) return false;
  const auto [from, to] = *m_pending_promo;
  clearSelection();
  const SubmitResult r = m_controller.submitHumanMove(model::Move{from, to, type});
  refresh();
  return r == SubmitResult::Applied;
}

void BoardInteraction::cancelPromotion() {
  clearSelection();
}

void BoardInteraction::requestNewGame() {
  clearSelection();
  m_controller.newGame();
  refresh();
}

void BoardInteraction::requestNewGame(core::Color humanColor) {
  clearSelection();
  m_controller.newGame(humanColor);
  refresh();
}

bool BoardInteraction::requestRetry() {
  const bool ok = m_controller.retryEngine();
  refresh();
  return ok;
}

bool BoardInteraction::requestCancel() {
  const bool ok = m_controller.cancelEngine();
  refresh();
  return ok;
}

bool BoardInteraction::requestUndo() {
  clearSelection();
  const bool ok = m_controller.undo();
  refresh();
  return ok;
}

bool BoardInteraction::requestResign() {
  clearSelection();
  const bool ok = m_controller.resign();
  refresh();
  return ok;
}

FrameModel BoardInteraction::tick() {
  m_controller.update();
  refresh();
  return frame();
}

FrameModel BoardInteraction::frame() const {
  FrameModel f;
  f.interactive = !m_snap.humanMoves.empty() && !m_pending_promo;
  f.spinner = std::holds_alternative<RequestInFlight>(m_snap.state);
  f.banner = bannerFor(m_snap);
  f.statusLine = std::string(core::colorName(m_snap.sideToMove)) + " to move";
  f.board = m_snap.board;
  f.orientation = m_snap.humanColor;
  f.selected = m_selected;
  f.lastMove = m_snap.lastMove;
  f.sanMoves = m_snap.sanMoves;

  if (m_selected != core::NO_SQUARE) {
    for (const auto& m : m_snap.humanMoves) {
      if (m.from() != m_selected) continue;
      if (std::find(f.targets.begin(), f.targets.end(), m.to()) == f.targets.end())
        f.targets.push_back(m.to());
    }
  }
  if (m_pending_promo) f.promotionSquare = m_pending_promo->second;

  if (m_snap.inCheck) {
    for (int sq = 0; sq < 64; ++sq) {
      const model::Piece pc = m_snap.board[sq];
      if (pc.type == core::PieceType::King && pc.color == m_snap.sideToMove) {
        f.checkedKing = static_cast<core::Square>(sq);
        break;
      }
    }
  }
  return f;
}

}  // namespace unchessful::controller
