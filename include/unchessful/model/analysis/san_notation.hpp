#pragma once
#include <optional>
#include <string>
#include <string_view>

#include "unchessful/model/move.hpp"
#include "unchessful/model/position.hpp"

namespace unchessful::model::notation {

// Empty string if `mv` is not legal in `pos`.
std::string toSan(const model::Position& pos, const model::Move& mv);

// Resolves a SAN token ("Nf3", "exd6", "O-O", "e8=Q+") or a coordinate token
// ("g1f3", "e7e8q") to the matching legal move, flags included.
bool fromSan(const model::Position& pos, std::string_view sanToken, model::Move& out);

// Coordinate form, e.g. "e2e4" or "a7a8q".
std::string toUci(const model::Move& mv);
// Only checks the syntax; the result carries no capture/castle flags.
std::optional<model::Move> parseUci(std::string_view token);

}  // namespace unchessful::model::notation
