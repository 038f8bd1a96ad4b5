#include <algorithm>
#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "support/fakes.hpp"
#include "unchessful/controller/board_interaction.hpp"

using namespace unchessful;
using controller::BoardInteraction;
using Click = BoardInteraction::ClickResult;

static core::Square sq(const char* name) {
  return *core::parseSquare(name);
}

static bool hasTarget(const controller::FrameModel& f, const char* name) {
  return std::find(f.targets.begin(), f.targets.end(), sq(name)) != f.targets.end();
}

struct Table {
  testing::ScriptedEngineClient* engine;
  std::unique_ptr<controller::TurnController> ctl;
  std::unique_ptr<BoardInteraction> ui;

  explicit Table(core::Color human = core::Color::White) {
    auto client = std::make_unique<testing::ScriptedEngineClient>();
    engine = client.get();
    ctl = std::make_unique<controller::TurnController>(std::move(client), human);
    ui = std::make_unique<BoardInteraction>(*ctl);
    ui->requestNewGame();
  }

  // human move by two clicks, then the engine's reply on the next tick
  void play(const char* from, const char* to, const char* reply) {
    assert(ui->clickSquare(sq(from)) == Click::Selected);
    assert(ui->clickSquare(sq(to)) == Click::Submitted);
    engine->deliverMove(engine->last(), reply);
    ui->tick();
  }
};

static void selectionAndTargets() {
  Table t;
  auto f = t.ui->frame();
  assert(f.interactive && !f.spinner);
  assert(f.banner.empty());
  assert(f.statusLine == "White to move");
  assert(f.orientation == core::Color::White);
  assert(f.selected == core::NO_SQUARE && f.targets.empty());

  assert(t.ui->clickSquare(sq("e2")) == Click::Selected);
  f = t.ui->frame();
  assert(f.selected == sq("e2"));
  assert(f.targets.size() == 2 && hasTarget(f, "e3") && hasTarget(f, "e4"));

  // an empty square that is no target drops the selection
  assert(t.ui->clickSquare(sq("e5")) == Click::Deselected);
  assert(t.ui->selected() == core::NO_SQUARE);

  // pieces that cannot move, and the opponent's pieces, are not selectable
  assert(t.ui->clickSquare(sq("e7")) == Click::Ignored);
  assert(t.ui->clickSquare(sq("a1")) == Click::Ignored);

  assert(t.ui->clickSquare(sq("g1")) == Click::Selected);
  f = t.ui->frame();
  assert(f.targets.size() == 2 && hasTarget(f, "f3") && hasTarget(f, "h3"));
  // another own piece switches the selection
  assert(t.ui->clickSquare(sq("b1")) == Click::Selected);
  assert(t.ui->selected() == sq("b1"));
  assert(t.ui->clickSquare(sq("b1")) == Click::Deselected);
}

static void moveAndWait() {
  Table t;
  assert(t.ui->clickSquare(sq("e2")) == Click::Selected);
  assert(t.ui->clickSquare(sq("e4")) == Click::Submitted);

  auto f = t.ui->frame();
  assert(f.spinner && !f.interactive);
  assert(f.banner == "Engine is thinking...");
  assert(f.statusLine == "Black to move");
  assert(f.selected == core::NO_SQUARE);
  assert(f.lastMove && f.lastMove->to() == sq("e4"));

  // the board is locked while the engine thinks
  assert(t.ui->clickSquare(sq("d2")) == Click::Ignored);
  f = t.ui->tick();
  assert(f.spinner);

  t.engine->deliverMove(t.engine->last(), "e5");
  f = t.ui->tick();
  assert(!f.spinner && f.interactive);
  assert(f.banner.empty());
  assert(f.sanMoves.size() == 2 && f.sanMoves[1] == "e5");
  assert(f.lastMove->from() == sq("e7"));
}

static void errorBannerAndCommands() {
  Table t;
  assert(t.ui->clickSquare(sq("d2")) == Click::Selected);
  assert(t.ui->clickSquare(sq("d4")) == Click::Submitted);
  t.engine->deliverHttp(t.engine->last(), testing::httpReply(500, R"({"error": "GPU lost"})"));
  auto f = t.ui->tick();
  assert(!f.spinner && !f.interactive);
  assert(f.banner.find("Engine error: NetworkError") == 0);
  assert(f.banner.find("GPU lost") != std::string::npos);

  assert(t.ui->requestRetry());
  f = t.ui->frame();
  assert(f.spinner && f.banner == "Engine is thinking...");

  assert(t.ui->requestCancel());
  f = t.ui->frame();
  assert(!f.spinner);
  assert(f.banner == "Engine to move. Press R to ask again.");
  assert(!t.ui->requestCancel());

  assert(t.ui->requestUndo());
  f = t.ui->frame();
  assert(f.interactive && f.sanMoves.empty());

  assert(t.ui->requestResign());
  f = t.ui->frame();
  assert(!f.interactive);
  assert(f.banner == "White resigned");
  assert(t.ui->clickSquare(sq("e2")) == Click::Ignored);

  t.ui->requestNewGame(core::Color::Black);
  f = t.ui->frame();
  assert(f.orientation == core::Color::Black);
  assert(f.spinner);
}

static void promotionFlow() {
  Table t;
  t.play("a2", "a4", "b5");
  t.play("a4", "b5", "a6");
  t.play("b5", "a6", "e6");
  t.play("a6", "a7", "Nf6");

  assert(t.ui->clickSquare(sq("a7")) == Click::Selected);
  auto f = t.ui->frame();
  // the rook blocks a8, the knight on b8 can be taken
  assert(f.targets.size() == 1 && hasTarget(f, "b8"));

  assert(t.ui->clickSquare(sq("b8")) == Click::PromotionPending);
  assert(t.ui->promotionPending());
  f = t.ui->frame();
  assert(f.promotionSquare == sq("b8"));
  assert(!f.interactive);
  assert(t.ui->clickSquare(sq("h2")) == Click::Ignored);

  t.ui->cancelPromotion();
  assert(!t.ui->promotionPending());
  f = t.ui->frame();
  assert(f.promotionSquare == core::NO_SQUARE);
  assert(f.selected == core::NO_SQUARE && f.targets.empty());
  assert(f.interactive);

  assert(t.ui->clickSquare(sq("a7")) == Click::Selected);
  assert(t.ui->clickSquare(sq("b8")) == Click::PromotionPending);
  assert(t.ui->choosePromotion(core::PieceType::Knight));
  assert(!t.ui->promotionPending());
  f = t.ui->frame();
  assert(f.spinner);
  assert(f.lastMove->promotion() == core::PieceType::Knight);
  assert(f.sanMoves.back() == "axb8=N");
  assert(f.board[sq("b8")].type == core::PieceType::Knight);
  assert(f.board[sq("b8")].color == core::Color::White);

  assert(!t.ui->choosePromotion(core::PieceType::Queen));
}

static void checkmateFrame() {
  Table t;
  t.play("f2", "f3", "e5");
  t.play("g2", "g4", "Qh4#");
  const auto f = t.ui->frame();
  assert(!f.interactive && !f.spinner);
  assert(f.banner == "Checkmate - Black wins");
  assert(f.checkedKing == sq("e1"));
  assert(f.sanMoves.back() == "Qh4#");
}

static void localPlayMovesBothColours() {
  Table t;
  t.ctl->setMode(controller::PlayMode::Local);
  auto f = t.ui->tick();
  assert(t.ui->clickSquare(sq("e2")) == Click::Selected);
  assert(t.ui->clickSquare(sq("e4")) == Click::Submitted);
  f = t.ui->frame();
  assert(f.statusLine == "Black to move");
  assert(f.banner.empty() && !f.spinner && f.interactive);
  assert(f.orientation == core::Color::White);

  // White's pieces wait their turn, Black's are live
  assert(t.ui->clickSquare(sq("d2")) == Click::Ignored);
  assert(t.ui->clickSquare(sq("e7")) == Click::Selected);
  f = t.ui->frame();
  assert(hasTarget(f, "e6") && hasTarget(f, "e5"));
  assert(t.ui->clickSquare(sq("e5")) == Click::Submitted);
  assert(t.ui->frame().statusLine == "White to move");
  assert(t.engine->requests().empty());
}

int main() {
  selectionAndTargets();
  moveAndWait();
  errorBannerAndCommands();
  promotionFlow();
  checkmateFrame();
  localPlayMovesBothColours();
  std::cout << "board_interaction_test passed\n";
  return 0;
}
