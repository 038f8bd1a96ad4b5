#pragma once
#include <optional>
#include <string>

#include "engine_types.hpp"
#include "request_channel.hpp"
#include "unchessful/config/client_config.hpp"

namespace unchessful::engine {

// Discovers engines: fetches the directory at the API root, then the chosen
// engine's description, then settles on a variant whose game URL takes moves.
// Driven by update() from the frame loop like everything else on the channel.
class EngineCatalog {
 public:
  enum class Stage { Idle, FetchingDirectory, FetchingDescription, Ready, Failed };

  EngineCatalog(IRequestChannel& channel, config::EngineSettings engine,
                config::NetworkSettings network);
  ~EngineCatalog();

  EngineCatalog(const EngineCatalog&) = delete;
  EngineCatalog& operator=(const EngineCatalog&) = delete;

  void refresh();
  // Returns true when the stage changed.
  bool update();

  bool selectEngine(const std::string& engineId);
  bool selectVariant(const std::string& name);
  // The description's best_available_variant, else its first variant.
  [[nodiscard]] std::optional<EngineVariant> bestVariant() const;

  [[nodiscard]] Stage stage() const noexcept { return m_stage; }
  [[nodiscard]] const std::string& lastError() const noexcept { return m_last_error; }
  [[nodiscard]] const std::optional<EngineDirectory>& directory() const noexcept {
    return m_directory;
  }
  [[nodiscard]] const std::optional<EngineDescription>& description() const noexcept {
    return m_description;
  }
  [[nodiscard]] const std::optional<EngineRef>& selectedEngine() const noexcept {
    return m_engine;
  }
  [[nodiscard]] const std::optional<EngineVariant>& selectedVariant() const noexcept {
    return m_variant;
  }

  // Endpoint for EngineClient once a variant is chosen.
  [[nodiscard]] std::optional<EngineEndpoint> endpoint() const;

 private:
  net::HttpRequest makeGet(const std::string& url) const;
  void fail(std::string why);
  void cancelInFlight();
  void onDirectory(const net::HttpResponse& resp);
  void onDescription(const net::HttpResponse& resp);

  IRequestChannel& m_channel;
  config::EngineSettings m_engine_settings;
  config::NetworkSettings m_network;

  Stage m_stage = Stage::Idle;
  RequestHandle m_inflight = NO_REQUEST;
  std::string m_last_error;

  std::optional<EngineDirectory> m_directory;
  std::optional<EngineRef> m_engine;
  std::optional<EngineDescription> m_description;
  std::optional<EngineVariant> m_variant;
};

const char* toString(EngineCatalog::Stage s);

}  // namespace unchessful::engine
