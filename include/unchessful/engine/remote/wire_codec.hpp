#pragma once
#include <optional>
#include <string>

#include "engine_types.hpp"

namespace unchessful::engine::wire {

// {"fen": "<fen>"}
std::string encodeMoveRequest(const std::string& fen);

// Extracts the move token ("move_san" or "move_uci") from a move response.
// Returns std::nullopt and fills `outError` if the body is not such an object.
std::optional<std::string> decodeMoveText(const std::string& body, std::string* outError = nullptr);

std::optional<EngineDirectory> decodeDirectory(const std::string& body,
                                               std::string* outError = nullptr);
std::optional<EngineDescription> decodeDescription(const std::string& body,
                                                   std::string* outError = nullptr);

// Backend error bodies look like {"error": "..."}; falls back to a prefix of the raw text.
std::string describeErrorBody(const std::string& body);

}  // namespace unchessful::engine::wire
