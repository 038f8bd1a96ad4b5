#include "unchessful/engine/remote/engine_catalog.hpp"

#include <algorithm>
#include <iostream>

#include "unchessful/engine/remote/wire_codec.hpp"

namespace unchessful::engine {

const char* toString(EngineCatalog::Stage s) {
  switch (s) {
    case EngineCatalog::Stage::Idle:
      return "idle";
    case EngineCatalog::Stage::FetchingDirectory:
      return "fetching engine list";
    case EngineCatalog::Stage::FetchingDescription:
      return "fetching engine description";
    case EngineCatalog::Stage::Ready:
      return "ready";
    case EngineCatalog::Stage::Failed:
      return "failed";
  }
  return "unknown";
}

EngineCatalog::EngineCatalog(IRequestChannel& channel, config::EngineSettings engine,
                             config::NetworkSettings network)
    : m_channel(channel), m_engine_settings(std::move(engine)), m_network(std::move(network)) {}

EngineCatalog::~EngineCatalog() {
  cancelInFlight();
}

net::HttpRequest EngineCatalog::makeGet(const std::string& url) const {
  net::HttpRequest req;
  req.method = net::HttpMethod::Get;
  req.url = url;
  req.headers = {"Accept: application/json"};
  req.connectTimeoutMs = m_network.connectTimeoutMs;
  req.totalTimeoutMs = m_network.requestTimeoutMs;
  req.userAgent = m_network.userAgent;
  return req;
}

void EngineCatalog::cancelInFlight() {
  if (m_inflight == NO_REQUEST) return;
  m_channel.abandon(m_inflight);
  m_inflight = NO_REQUEST;
}

void EngineCatalog::fail(std::string why) {
  std::cerr << "[EngineCatalog] " << toString(m_stage) << ": " << why << "\n";
  m_last_error = std::move(why);
  m_stage = Stage::Failed;
}

void EngineCatalog::refresh() {
  cancelInFlight();
  m_directory.reset();
  m_engine.reset();
  m_description.reset();
  m_variant.reset();
  m_last_error.clear();

  m_inflight = m_channel.send(makeGet(m_engine_settings.apiRoot));
  m_stage = Stage::FetchingDirectory;
}

bool EngineCatalog::update() {
  if (m_inflight == NO_REQUEST) return false;
  auto resp = m_channel.poll(m_inflight);
  if (!resp) return false;
  m_inflight = NO_REQUEST;

  if (m_stage == Stage::FetchingDirectory)
    onDirectory(*resp);
  else if (m_stage == Stage::FetchingDescription)
    onDescription(*resp);
  return true;
}

void EngineCatalog::onDirectory(const net::HttpResponse& resp) {
  if (!resp.ok()) {
    fail(resp.result == net::TransferResult::Completed
             ? "HTTP " + std::to_string(resp.status) + ": " + wire::describeErrorBody(resp.body)
             : resp.error);
    return;
  }
  std::string err;
  auto dir = wire::decodeDirectory(resp.body, &err);
  if (!dir) {
    fail(err);
    return;
  }
  if (dir->engines.empty()) {
    fail("the server lists no engines");
    return;
  }
  m_directory = std::move(dir);
  std::cout << "[EngineCatalog] " << m_directory->engines.size() << " engine(s) available\n";

  const std::string& wanted = m_engine_settings.engineId;
  if (!wanted.empty() && selectEngine(wanted)) return;
  if (!wanted.empty())
    std::cerr << "[EngineCatalog] engine '" << wanted << "' not listed, using the first one\n";
  if (!selectEngine(m_directory->engines.front().engineId)) fail("no selectable engine");
}

bool EngineCatalog::selectEngine(const std::string& engineId) {
  if (!m_directory) return false;
  const auto& engines = m_directory->engines;
  auto it = std::find_if(engines.begin(), engines.end(),
                         [&](const EngineRef& e) { return e.engineId == engineId; });
  if (it == engines.end()) return false;

  cancelInFlight();
  m_engine = *it;
  m_description.reset();
  m_variant.reset();
  m_inflight = m_channel.send(makeGet(it->entrypointUrl));
  m_stage = Stage::FetchingDescription;
  return true;
}

void EngineCatalog::onDescription(const net::HttpResponse& resp) {
  if (!resp.ok()) {
    fail(resp.result == net::TransferResult::Completed
             ? "HTTP " + std::to_string(resp.status) + ": " + wire::describeErrorBody(resp.body)
             : resp.error);
    return;
  }
  std::string err;
  auto desc = wire::decodeDescription(resp.body, &err);
  if (!desc) {
    fail(err);
    return;
  }
  m_description = std::move(desc);

  const std::string& wanted = m_engine_settings.variant;
  if (!wanted.empty() && selectVariant(wanted)) return;
  if (!wanted.empty())
    std::cerr << "[EngineCatalog] variant '" << wanted << "' not offered, using the default\n";

  m_variant = bestVariant();
  if (!m_variant) {
    fail("engine description lists no usable variant");
    return;
  }
  m_stage = Stage::Ready;
  std::cout << "[EngineCatalog] playing " << m_description->name << " / " << m_variant->name
            << "\n";
}

bool EngineCatalog::selectVariant(const std::string& name) {
  if (!m_description) return false;
  const auto& variants = m_description->variants;
  auto it = std::find_if(variants.begin(), variants.end(),
                         [&](const EngineVariant& v) { return v.name == name; });
  if (it == variants.end()) return false;
  m_variant = *it;
  m_stage = Stage::Ready;
  return true;
}

std::optional<EngineVariant> EngineCatalog::bestVariant() const {
  if (!m_description) return std::nullopt;
  if (m_description->bestAvailableVariant) return m_description->bestAvailableVariant;
  if (m_description->variants.empty()) return std::nullopt;
  return m_description->variants.front();
}

std::optional<EngineEndpoint> EngineCatalog::endpoint() const {
  if (!m_variant) return std::nullopt;
  EngineEndpoint ep;
  ep.gameUrl = m_variant->gameUrl;
  ep.connectTimeoutMs = m_network.connectTimeoutMs;
  ep.requestTimeoutMs = m_network.requestTimeoutMs;
  ep.userAgent = m_network.userAgent;
  return ep;
}

}  // namespace unchessful::engine
