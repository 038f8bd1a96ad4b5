#include <cassert>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "unchessful/model/chess_game.hpp"
#include "unchessful/model/move_generator.hpp"
#include "unchessful/model/position.hpp"

using namespace unchessful;

static core::Square sq(const char* name) {
  return *core::parseSquare(name);
}

static std::uint64_t perft(model::Position& pos, int depth) {
  std::vector<model::Move> moves;
  model::MoveGenerator{}.generatePseudoLegalMoves(pos.getBoard(), pos.getState(), moves);
  std::uint64_t nodes = 0;
  for (const auto& m : moves) {
    if (!pos.doMove(m)) continue;
    nodes += depth <= 1 ? 1 : perft(pos, depth - 1);
    pos.undoMove();
  }
  return nodes;
}

static std::uint64_t perftFen(const std::string& fen, int depth) {
  model::Position pos;
  const bool ok = model::parseFen(fen, pos);
  assert(ok);
  const std::string before = model::toFen(pos);
  const std::uint64_t n = perft(pos, depth);
  // make/unmake must leave the position exactly as it was
  assert(model::toFen(pos) == before);
  return n;
}

int main() {
  // Move generation counts for well known positions
  {
    assert(perftFen(core::START_FEN, 1) == 20);
    assert(perftFen(core::START_FEN, 2) == 400);
    assert(perftFen(core::START_FEN, 3) == 8902);

    const std::string kiwipete =
        "r3k2r/p1ppqpb1/bn2pnp1/3PN3/1p2P3/2N2Q1p/PPPBBPPP/R3K2R w KQkq - 0 1";
    assert(perftFen(kiwipete, 1) == 48);
    assert(perftFen(kiwipete, 2) == 2039);

    const std::string endgame = "8/2p5/3p4/KP5r/1R3p1k/8/4P1P1/8 w - - 0 1";
    assert(perftFen(endgame, 1) == 14);
    assert(perftFen(endgame, 2) == 191);
    assert(perftFen(endgame, 3) == 2812);

    const std::string promotions = "r3k2r/Pppp1ppp/1b3nbN/nP6/BBP1P3/q4N2/Pp1P2PP/R2Q1RK1 w kq - 0 1";
    assert(perftFen(promotions, 1) == 6);
    assert(perftFen(promotions, 2) == 264);

    const std::string tricky = "rnbq1k1r/pp1Pbppp/2p5/8/2B5/8/PPP1NnPP/RNBQK2R w KQ - 1 8";
    assert(perftFen(tricky, 1) == 44);
    assert(perftFen(tricky, 2) == 1486);
  }

  // A fresh game offers the twenty opening moves
  {
    model::ChessGame game;
    assert(game.legalMoves().size() == 20);
    assert(game.status() == model::GameStatus::inProgress());
    assert(game.getFen() == core::START_FEN);
  }

  // FEN round trip and rejection of malformed input
  {
    model::ChessGame game;
    const std::string fen = "r1bqkbnr/pppp1ppp/2n5/4p3/4P3/5N2/PPPP1PPP/RNBQKB1R w KQkq - 2 3";
    assert(game.setPosition(fen));
    assert(game.getFen() == fen);

    std::string err;
    assert(!game.setPosition("rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP w KQkq - 0 1", &err));
    assert(!err.empty());
    assert(!game.setPosition("rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR x KQkq - 0 1", &err));
    assert(!game.setPosition("rnbq1bnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQ - 0 1", &err));
    assert(!game.setPosition("", &err));
    // a rejected FEN leaves the game alone
    assert(game.getFen() == fen);

    // clocks may be left out
    assert(game.setPosition("4k3/8/8/8/8/8/8/4K2R w K -"));
    assert(game.getFen() == "4k3/8/8/8/8/8/8/4K2R w K - 0 1");

    // the halfmove clock must fit its 16 bits instead of wrapping
    assert(!game.setPosition("4k3/8/8/8/8/8/8/4K2R w K - 70000 1", &err));
    assert(err == "FEN halfmove clock");
    assert(game.getFen() == "4k3/8/8/8/8/8/8/4K2R w K - 0 1");
    assert(game.setPosition("4k3/8/8/8/8/8/8/4K2R w K - 65535 1200000"));
    assert(game.getFen() == "4k3/8/8/8/8/8/8/4K2R w K - 65535 1200000");
    assert(!game.setPosition("4k3/8/8/8/8/8/8/4K2R w K - 0 99999999999", &err));
    assert(err == "FEN fullmove number");
  }

  // Illegal moves change nothing
  {
    model::ChessGame game;
    const std::string before = game.getFen();
    assert(!game.apply(sq("e2"), sq("e5")));
    assert(!game.apply(sq("e7"), sq("e5")));  // not black's turn
    assert(!game.apply(sq("e1"), sq("e2")));  // own piece
    assert(!game.apply(sq("a1"), sq("a1")));
    assert(game.getFen() == before);
    assert(game.moveHistory().empty());
  }

  // Castling both ways, blocked by an attacked transit square
  {
    model::ChessGame game;
    assert(game.setPosition("r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1"));
    assert(game.findLegalMove(sq("e1"), sq("g1")));
    assert(game.findLegalMove(sq("e1"), sq("c1")));
    assert(game.apply(sq("e1"), sq("g1")));
    assert(game.getPiece(sq("f1")).type == core::PieceType::Rook);
    assert(game.getPiece(sq("g1")).type == core::PieceType::King);
    assert(game.getFen() == "r3k2r/8/8/8/8/8/8/R4RK1 b kq - 1 1");

    assert(game.setPosition("r3k2r/8/8/8/8/8/5r2/R3K2R w KQkq - 0 1"));
    assert(!game.findLegalMove(sq("e1"), sq("g1")));
    assert(game.findLegalMove(sq("e1"), sq("c1")));

    // moving the rook gives up that side only
    assert(game.setPosition("r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1"));
    assert(game.apply(sq("h1"), sq("h2")));
    assert(game.getGameState().castlingRights == (model::Castling::WQ |
                                                   model::Castling::BK |
                                                   model::Castling::BQ));
  }

  // En passant removes the passed pawn and undo puts it back
  {
    model::ChessGame game;
    const std::string fen = "rnbqkbnr/ppp1p1pp/8/3pPp2/8/8/PPPP1PPP/RNBQKBNR w KQkq f6 0 3";
    assert(game.setPosition(fen));
    const auto ep = game.findLegalMove(sq("e5"), sq("f6"));
    assert(ep && ep->isEnPassant() && ep->isCapture());
    assert(game.apply(*ep));
    assert(game.getPiece(sq("f5")).isNone());
    assert(game.getPiece(sq("f6")).type == core::PieceType::Pawn);
    assert(game.undo());
    assert(game.getFen() == fen);
  }

  // Promotion offers four pieces; the chosen one lands on the board
  {
    model::ChessGame game;
    assert(game.setPosition("8/P6k/8/8/8/8/8/K7 w - - 0 1"));
    int promos = 0;
    for (const auto& m : game.legalMoves())
      if (m.from() == sq("a7")) ++promos;
    assert(promos == 4);
    assert(!game.apply(sq("a7"), sq("a8")));  // a piece has to be named
    assert(game.apply(sq("a7"), sq("a8"), core::PieceType::Knight));
    assert(game.getPiece(sq("a8")).type == core::PieceType::Knight);
  }

  // Fool's mate: no legal moves left, further moves refused
  {
    model::ChessGame game;
    assert(game.doMoveUCI("f2f3"));
    assert(game.doMoveUCI("e7e5"));
    assert(game.doMoveUCI("g2g4"));
    const auto st = game.apply(sq("d8"), sq("h4"));
    assert(st && *st == model::GameStatus::checkmate(core::Color::Black));
    assert(game.legalMoves().empty());
    assert(game.status().winner() == core::Color::Black);
    assert(!game.apply(sq("a2"), sq("a3")));
    assert(model::toString(game.status()) == "Checkmate - Black wins");
    assert(std::string(model::resultToken(game.status())) == "0-1");
  }

  // Stalemate
  {
    model::ChessGame game;
    assert(game.setPosition("7k/5Q2/6K1/8/8/8/8/8 b - - 0 1"));
    assert(game.legalMoves().empty());
    assert(game.status() == model::GameStatus::stalemate());
  }

  // Draws by rule
  {
    model::ChessGame game;
    assert(game.setPosition("8/8/8/4k3/8/8/8/4K2B w - - 0 1"));
    assert(game.status() == model::GameStatus::drawByRule(model::DrawReason::InsufficientMaterial));

    // two knights can still mate
    assert(game.setPosition("8/8/8/4k3/8/8/8/3NKN2 w - - 0 1"));
    assert(game.status() == model::GameStatus::inProgress());

    // same coloured bishops cannot
    assert(game.setPosition("8/8/8/4k3/8/8/2B5/4KB2 w - - 0 1"));
    assert(game.status() == model::GameStatus::drawByRule(model::DrawReason::InsufficientMaterial));

    assert(game.setPosition("8/8/8/4k3/8/8/8/R3K3 w - - 99 80"));
    assert(game.status() == model::GameStatus::inProgress());
    const auto st = game.apply(sq("a1"), sq("a2"));
    assert(st && *st == model::GameStatus::drawByRule(model::DrawReason::FiftyMoveRule));

    // mate on the hundredth half move still counts as mate
    assert(game.setPosition("7k/8/6K1/8/8/8/8/R7 w - - 99 80"));
    const auto mate = game.apply(sq("a1"), sq("a8"));
    assert(mate && *mate == model::GameStatus::checkmate(core::Color::White));
  }

  // Threefold repetition by shuffling knights
  {
    model::ChessGame game;
    const char* shuffle[] = {"g1f3", "g8f6", "f3g1", "f6g8"};
    for (int round = 0; round < 2; ++round) {
      for (int i = 0; i < 4; ++i) {
        assert(!game.status().isTerminal());
        assert(game.doMoveUCI(shuffle[i]));
      }
    }
    assert(game.status() == model::GameStatus::drawByRule(model::DrawReason::ThreefoldRepetition));
    assert(game.undo());
    assert(game.status() == model::GameStatus::inProgress());
  }

  // Replaying the history from the start reproduces the board
  {
    model::ChessGame game;
    const char* line[] = {"e2e4", "c7c5", "g1f3", "d7d6", "d2d4", "c5d4", "f3d4", "g8f6",
                          "b1c3", "a7a6", "c1e3", "e7e5", "d4b3", "c8e6", "f2f3", "f8e7"};
    for (const char* m : line) assert(game.doMoveUCI(m));

    model::ChessGame replay;
    assert(replay.setPosition(game.startFen()));
    for (const auto& m : game.moveHistory()) assert(replay.apply(m));
    assert(replay.pieces() == game.pieces());
    assert(replay.getFen() == game.getFen());

    while (game.undo()) {
    }
    assert(game.getFen() == core::START_FEN);
  }

  // Resignation ends the game and undo lifts it
  {
    model::ChessGame game;
    assert(game.doMoveUCI("e2e4"));
    assert(game.resign(core::Color::White));
    assert(game.status() == model::GameStatus::resigned(core::Color::White));
    assert(game.status().winner() == core::Color::Black);
    assert(!game.doMoveUCI("e7e5"));
    assert(!game.resign(core::Color::Black));
    assert(game.undo());
    assert(game.status() == model::GameStatus::inProgress());
    assert(game.moveHistory().size() == 1);
  }

  std::cout << "rules_test passed\n";
  return 0;
}
