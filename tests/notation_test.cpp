#include <cassert>
#include <iostream>
#include <string>

#include "unchessful/model/analysis/san_notation.hpp"
#include "unchessful/model/chess_game.hpp"

using namespace unchessful;
using model::notation::fromSan;
using model::notation::toSan;

static core::Square sq(const char* name) {
  return *core::parseSquare(name);
}

static model::ChessGame gameAt(const std::string& fen) {
  model::ChessGame g;
  const bool ok = g.setPosition(fen);
  assert(ok);
  return g;
}

static std::string san(const model::ChessGame& g, const char* from, const char* to,
                       core::PieceType promo = core::PieceType::None) {
  const auto m = g.findLegalMove(sq(from), sq(to), promo);
  assert(m);
  return toSan(g.position(), *m);
}

int main() {
  // Plain moves, captures and castling
  {
    model::ChessGame g;
    assert(san(g, "e2", "e4") == "e4");
    assert(san(g, "g1", "f3") == "Nf3");
    assert(toSan(g.position(), model::Move{sq("e2"), sq("e5")}).empty());

    auto c = gameAt("rnbqkbnr/ppp1pppp/8/3p4/4P3/8/PPPP1PPP/RNBQKBNR w KQkq d6 0 2");
    assert(san(c, "e4", "d5") == "exd5");

    auto castle = gameAt("r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1");
    assert(san(castle, "e1", "g1") == "O-O");
    assert(san(castle, "e1", "c1") == "O-O-O");
  }

  // Disambiguation by file, then by rank
  {
    auto knights = gameAt("4k3/8/8/8/8/5N2/8/1N2K3 w - - 0 1");
    assert(san(knights, "b1", "d2") == "Nbd2");
    assert(san(knights, "f3", "d2") == "Nfd2");
    assert(san(knights, "f3", "e5") == "Ne5");

    auto rooks = gameAt("4k3/8/8/R7/8/8/8/R3K3 w - - 0 1");
    assert(san(rooks, "a1", "a3") == "R1a3");
    assert(san(rooks, "a5", "a3") == "R5a3");
  }

  // Check, mate and promotion suffixes
  {
    model::ChessGame g;
    assert(g.doMoveUCI("f2f3"));
    assert(g.doMoveUCI("e7e5"));
    assert(g.doMoveUCI("g2g4"));
    assert(san(g, "d8", "h4") == "Qh4#");

    auto promo = gameAt("8/P6k/8/8/8/8/8/K7 w - - 0 1");
    assert(san(promo, "a7", "a8", core::PieceType::Queen) == "a8=Q");
    assert(san(promo, "a7", "a8", core::PieceType::Knight) == "a8=N");

    auto check = gameAt("4k3/8/8/8/8/8/8/R3K3 w - - 0 1");
    assert(san(check, "a1", "a8") == "Ra8+");
  }

  // Reading the forms a backend may send
  {
    model::ChessGame g;
    model::Move m;
    assert(fromSan(g.position(), "e4", m) && m.from() == sq("e2") && m.to() == sq("e4"));
    assert(fromSan(g.position(), "Nf3", m) && m.from() == sq("g1"));
    assert(fromSan(g.position(), " g1f3 ", m) && m.to() == sq("f3"));
    assert(fromSan(g.position(), "e4!", m));
    assert(!fromSan(g.position(), "e5", m));
    assert(!fromSan(g.position(), "Nf6", m));
    assert(!fromSan(g.position(), "", m));
    assert(!fromSan(g.position(), "1-0", m));
    assert(!fromSan(g.position(), "e2e5", m));
    assert(!fromSan(g.position(), "zz", m));

    auto castle = gameAt("r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1");
    assert(fromSan(castle.position(), "0-0", m) && m.castle() == model::CastleSide::KingSide);
    assert(fromSan(castle.position(), "O-O-O", m) && m.castle() == model::CastleSide::QueenSide);
    assert(fromSan(castle.position(), "e1g1", m) && m.castle() == model::CastleSide::KingSide);

    auto promo = gameAt("8/P6k/8/8/8/8/8/K7 w - - 0 1");
    assert(fromSan(promo.position(), "a8=Q", m) && m.promotion() == core::PieceType::Queen);
    assert(fromSan(promo.position(), "a8Q", m) && m.promotion() == core::PieceType::Queen);
    assert(fromSan(promo.position(), "a7a8n", m) && m.promotion() == core::PieceType::Knight);
    assert(fromSan(promo.position(), "a7a8R", m) && m.promotion() == core::PieceType::Rook);
    assert(!fromSan(promo.position(), "a8", m));

    // a mate sent with a plain check sign still resolves
    model::ChessGame fool;
    assert(fool.doMoveUCI("f2f3"));
    assert(fool.doMoveUCI("e7e5"));
    assert(fool.doMoveUCI("g2g4"));
    assert(fromSan(fool.position(), "Qh4+", m) && m.to() == sq("h4"));

    // en passant keeps its flags
    auto ep = gameAt("rnbqkbnr/ppp1p1pp/8/3pPp2/8/8/PPPP1PPP/RNBQKBNR w KQkq f6 0 3");
    assert(fromSan(ep.position(), "exf6", m) && m.isEnPassant());
  }

  // Coordinate notation
  {
    const auto m = model::notation::parseUci("e7e8q");
    assert(m && m->from() == sq("e7") && m->to() == sq("e8"));
    assert(m->promotion() == core::PieceType::Queen);
    assert(model::notation::toUci(*m) == "e7e8q");
    assert(model::notation::toUci(model::Move{sq("g1"), sq("f3")}) == "g1f3");
    assert(!model::notation::parseUci("e7e8k"));
    assert(!model::notation::parseUci("i2e4"));
    assert(!model::notation::parseUci("e2"));
  }

  // The game can render its own history
  {
    model::ChessGame g;
    for (const char* m : {"e2e4", "e7e5", "g1f3", "b8c6", "f1b5", "a7a6", "e1g1"})
      assert(g.doMoveUCI(m));
    const auto history = g.sanHistory();
    const char* expected[] = {"e4", "e5", "Nf3", "Nc6", "Bb5", "a6", "O-O"};
    assert(history.size() == 7);
    for (int i = 0; i < 7; ++i) assert(history[i] == expected[i]);
  }

  std::cout << "notation_test passed\n";
  return 0;
}
