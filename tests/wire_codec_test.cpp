#include <cassert>
#include <iostream>
#include <string>

#include "unchessful/engine/remote/wire_codec.hpp"

using namespace unchessful;
namespace wire = unchessful::engine::wire;

int main() {
  // Move request body
  {
    const std::string fen = "rnbqkbnr/pppppppp/8/8/4P3/8/PPPP1PPP/RNBQKBNR b KQkq e3 0 1";
    assert(wire::encodeMoveRequest(fen) == "{\"fen\":\"" + fen + "\"}");
  }

  // Move responses
  {
    std::string err;
    auto t = wire::decodeMoveText("{\"move_san\": \"e5\"}", &err);
    assert(t && *t == "e5");
    t = wire::decodeMoveText("{\"move_uci\": \"e7e5\", \"score\": 12}", &err);
    assert(t && *t == "e7e5");
    // SAN wins when both are present
    t = wire::decodeMoveText("{\"move_uci\": \"g8f6\", \"move_san\": \"Nf6\"}", &err);
    assert(t && *t == "Nf6");
    t = wire::decodeMoveText("{\"move\": \"Nc6\"}", &err);
    assert(t && *t == "Nc6");

    assert(!wire::decodeMoveText("{\"move_san\": \"\"}", &err));
    assert(!wire::decodeMoveText("{\"move_san\": 42}", &err));
    assert(!wire::decodeMoveText("{\"best\": \"e5\"}", &err));
    assert(err.find("move_san") != std::string::npos);

    err.clear();
    assert(!wire::decodeMoveText("{\"move_san\": \"e5\"", &err));
    assert(err.rfind("invalid JSON", 0) == 0);
    assert(!wire::decodeMoveText("[\"e5\"]", &err));
    assert(!wire::decodeMoveText("", &err));
    assert(!wire::decodeMoveText("<html>502 Bad Gateway</html>", &err));
    assert(!wire::decodeMoveText(std::string(5000, '['), &err));
  }

  // Engine directory
  {
    const std::string body = R"({"engines": [
        {"engine_id": "stockfish-nn", "name": "Stockfish NN", "entrypoint_url": "https://x/sf"},
        {"id": "legacy", "entrypoint_url": "https://x/legacy"},
        {"engine_id": "broken", "name": "No entry"},
        "junk"
      ]})";
    std::string err;
    const auto dir = wire::decodeDirectory(body, &err);
    assert(dir);
    assert(dir->engines.size() == 2);
    assert(dir->engines[0].engineId == "stockfish-nn");
    assert(dir->engines[0].name == "Stockfish NN");
    assert(dir->engines[0].entrypointUrl == "https://x/sf");
    assert(dir->engines[1].engineId == "legacy");
    assert(dir->engines[1].name == "legacy");

    assert(!wire::decodeDirectory("{\"engines\": {}}", &err));
    assert(!wire::decodeDirectory("{}", &err));
    const auto empty = wire::decodeDirectory("{\"engines\": []}", &err);
    assert(empty && empty->engines.empty());
  }

  // Engine description
  {
    const std::string body = R"({
        "name": "Stockfish NN",
        "text_description": "A small net",
        "variants": [
          {"name": "blitz", "game_url": "https://x/sf/blitz"},
          {"name": "deep", "game_url": "https://x/sf/deep"},
          {"name": "no-url"}
        ],
        "best_available_variant": {"name": "deep", "game_url": "https://x/sf/deep"}
      })";
    std::string err;
    const auto desc = wire::decodeDescription(body, &err);
    assert(desc);
    assert(desc->name == "Stockfish NN");
    assert(desc->textDescription == "A small net");
    assert(desc->variants.size() == 2);
    assert(desc->variants[1].gameUrl == "https://x/sf/deep");
    assert(desc->bestAvailableVariant && desc->bestAvailableVariant->name == "deep");

    const auto onlyBest = wire::decodeDescription(
        R"({"best_available_variant": {"name": "v", "game_url": "https://x/v"}})", &err);
    assert(onlyBest && onlyBest->variants.empty() && onlyBest->bestAvailableVariant);

    assert(!wire::decodeDescription("{\"name\": \"x\", \"variants\": []}", &err));
    assert(!wire::decodeDescription("not json", &err));
  }

  // Error bodies
  {
    assert(wire::describeErrorBody("{\"error\": \"engine overloaded\"}") == "engine overloaded");
    assert(wire::describeErrorBody("{\"detail\": \"bad fen\"}") == "bad fen");
    assert(wire::describeErrorBody("Service Unavailable") == "Service Unavailable");
    const std::string longBody(500, 'x');
    const std::string shortened = wire::describeErrorBody(longBody);
    assert(shortened.size() < longBody.size());
    assert(shortened.substr(shortened.size() - 3) == "...");
  }

  std::cout << "wire_codec_test passed\n";
  return 0;
}
