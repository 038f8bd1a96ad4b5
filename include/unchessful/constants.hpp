#pragma once

#include <string>
#include <string_view>

namespace unchessful::core {

const std::string START_FEN = "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1";

inline constexpr std::string_view CLIENT_VERSION{"unchessful 0.1.0"};
inline constexpr std::string_view DEFAULT_API_ROOT{"https://api.unchessful.games/"};

}  // namespace unchessful::core
