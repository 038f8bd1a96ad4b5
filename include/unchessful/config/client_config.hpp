#pragma once
#include <optional>
#include <string>
#include <string_view>

#include "unchessful/chess_types.hpp"
#include "unchessful/constants.hpp"

namespace unchessful::config {

enum class Scheduling { Threaded, Cooperative };

#ifdef UNCHESSFUL_COOPERATIVE_DEFAULT
inline constexpr Scheduling DEFAULT_SCHEDULING = Scheduling::Cooperative;
#else
inline constexpr Scheduling DEFAULT_SCHEDULING = Scheduling::Threaded;
#endif

const char* toString(Scheduling s);
std::optional<Scheduling> parseScheduling(std::string_view s);

struct EngineSettings {
  std::string apiRoot{core::DEFAULT_API_ROOT};
  std::string engineId;  // empty: first engine of the directory
  std::string variant;   // empty: the engine's best available variant
  std::string gameUrl;   // set: skip the directory and post moves here
};

struct NetworkSettings {
  Scheduling scheduling{DEFAULT_SCHEDULING};
  int workerThreads{2};
  long connectTimeoutMs{0};  // 0: libcurl default
  long requestTimeoutMs{0};  // 0: wait forever
  std::string userAgent{core::CLIENT_VERSION};
};

struct GameSettings {
  core::Color humanColor{core::Color::White};
};

struct UiSettings {
  unsigned squareSize{88};
  std::string fontPath;  // empty: search the usual system locations
  bool showCoordinates{true};
};

struct ClientConfig {
  EngineSettings engine;
  NetworkSettings network;
  GameSettings game;
  UiSettings ui;
};

}  // namespace unchessful::config
