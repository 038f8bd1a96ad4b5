#include "unchessful/config/config_store.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <iostream>

namespace unchessful::config {

namespace fs = std::filesystem;

namespace {

std::string trim(std::string s) {
  auto issp = [](unsigned char c) { return std::isspace(c); };
  while (!s.empty() && issp(static_cast<unsigned char>(s.front()))) s.erase(s.begin());
  while (!s.empty() && issp(static_cast<unsigned char>(s.back()))) s.pop_back();
  return s;
}

template <class T>
bool parseNumber(const std::string& v, T& out) {
  T value{};
  const auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), value);
  if (ec != std::errc{} || ptr != v.data() + v.size()) return false;
  out = value;
  return true;
}

bool parseBool(const std::string& v, bool& out) {
  if (v == "1" || v == "true" || v == "yes" || v == "on") {
    out = true;
    return true;
  }
  if (v == "0" || v == "false" || v == "no" || v == "off") {
    out = false;
    return true;
  }
  return false;
}

bool parseColor(const std::string& v, core::Color& out) {
  if (v == "white" || v == "w") {
    out = core::Color::White;
    return true;
  }
  if (v == "black" || v == "b") {
    out = core::Color::Black;
    return true;
  }
  return false;
}

// false if the key is unknown; `badValue` is set when the key is known but the value is not usable
bool applyKey(ClientConfig& cfg, const std::string& section, const std::string& k,
              const std::string& v, bool& badValue) {
  badValue = false;
  if (section == "engine") {
    if (k == "api_root")
      cfg.engine.apiRoot = v;
    else if (k == "engine_id")
      cfg.engine.engineId = v;
    else if (k == "variant")
      cfg.engine.variant = v;
    else if (k == "game_url")
      cfg.engine.gameUrl = v;
    else
      return false;
    return true;
  }
  if (section == "network") {
    if (k == "scheduling") {
      const auto s = parseScheduling(v);
      if (s)
        cfg.network.scheduling = *s;
      else
        badValue = true;
    } else if (k == "worker_threads") {
      int n = 0;
      badValue = !parseNumber(v, n) || n < 1;
      if (!badValue) cfg.network.workerThreads = n;
    } else if (k == "connect_timeout_ms") {
      badValue = !parseNumber(v, cfg.network.connectTimeoutMs);
    } else if (k == "request_timeout_ms") {
      badValue = !parseNumber(v, cfg.network.requestTimeoutMs);
    } else if (k == "user_agent") {
      cfg.network.userAgent = v;
    } else {
      return false;
    }
    return true;
  }
  if (section == "game") {
    if (k != "human_color") return false;
    badValue = !parseColor(v, cfg.game.humanColor);
    return true;
  }
  if (section == "ui") {
    if (k == "square_size") {
      unsigned n = 0;
      badValue = !parseNumber(v, n) || n < 16;
      if (!badValue) cfg.ui.squareSize = n;
    } else if (k == "font") {
      cfg.ui.fontPath = v;
    } else if (k == "coordinates") {
      badValue = !parseBool(v, cfg.ui.showCoordinates);
    } else {
      return false;
    }
    return true;
  }
  return false;
}

}  // namespace

const char* toString(Scheduling s) {
  return s == Scheduling::Cooperative ? "cooperative" : "threaded";
}

std::optional<Scheduling> parseScheduling(std::string_view s) {
  if (s == "threaded") return Scheduling::Threaded;
  if (s == "cooperative") return Scheduling::Cooperative;
  return std::nullopt;
}

ConfigStore::ConfigStore(fs::path path) : m_path(std::move(path)) {}

fs::path ConfigStore::defaultPath() {
  if (const char* explicitPath = std::getenv("UNCHESSFUL_CONFIG"); explicitPath && *explicitPath)
    return fs::path(explicitPath);
  const char* xdg = std::getenv("XDG_CONFIG_HOME");
  if (xdg && *xdg) return fs::path(xdg) / "unchessful" / "client.ini";
  const char* home = std::getenv("HOME");
  const fs::path h = home ? fs::path(home) : fs::temp_directory_path();
  return h / ".config" / "unchessful" / "client.ini";
}

void ConfigStore::parse(std::istream& in, ClientConfig& cfg, std::vector<std::string>* warnings) {
  std::string section;
  std::string line;
  int lineNo = 0;
  auto warn = [&](const std::string& msg) {
    if (warnings) warnings->push_back("line " + std::to_string(lineNo) + ": " + msg);
  };

  while (std::getline(in, line)) {
    ++lineNo;
    line = trim(line);
    if (line.empty() || line.front() == '#' || line.front() == ';') continue;

    if (line.front() == '[' && line.back() == ']') {
      section = trim(line.substr(1, line.size() - 2));
      continue;
    }

    const auto eq = line.find('=');
    if (eq == std::string::npos) {
      warn("expected key=value");
      continue;
    }
    const std::string k = trim(line.substr(0, eq));
    const std::string v = trim(line.substr(eq + 1));

    bool badValue = false;
    if (!applyKey(cfg, section, k, v, badValue))
      warn("unknown key '" + section + "." + k + "'");
    else if (badValue)
      warn("bad value '" + v + "' for " + section + "." + k);
  }
}

void ConfigStore::write(std::ostream& out, const ClientConfig& cfg) {
  out << "[engine]\n";
  out << "api_root=" << cfg.engine.apiRoot << "\n";
  out << "engine_id=" << cfg.engine.engineId << "\n";
  out << "variant=" << cfg.engine.variant << "\n";
  out << "game_url=" << cfg.engine.gameUrl << "\n\n";

  out << "[network]\n";
  out << "scheduling=" << toString(cfg.network.scheduling) << "\n";
  out << "worker_threads=" << cfg.network.workerThreads << "\n";
  out << "connect_timeout_ms=" << cfg.network.connectTimeoutMs << "\n";
  out << "request_timeout_ms=" << cfg.network.requestTimeoutMs << "\n";
  out << "user_agent=" << cfg.network.userAgent << "\n\n";

  out << "[game]\n";
  out << "human_color=" << (cfg.game.humanColor == core::Color::White ? "white" : "black")
      << "\n\n";

  out << "[ui]\n";
  out << "square_size=" << cfg.ui.squareSize << "\n";
  out << "font=" << cfg.ui.fontPath << "\n";
  out << "coordinates=" << (cfg.ui.showCoordinates ? "1" : "0") << "\n";
}

bool ConfigStore::load(ClientConfig& cfg, std::string* outError) const {
  std::error_code ec;
  if (!fs::exists(m_path, ec)) return true;

  std::ifstream in(m_path);
  if (!in.good()) {
    if (outError) *outError = "cannot open " + m_path.string();
    return false;
  }

  std::vector<std::string> warnings;
  parse(in, cfg, &warnings);
  for (const auto& w : warnings) std::cerr << "[Config] " << m_path.string() << " " << w << "\n";
  return true;
}

bool ConfigStore::save(const ClientConfig& cfg, std::string* outError) const {
  std::error_code ec;
  if (m_path.has_parent_path()) fs::create_directories(m_path.parent_path(), ec);
  if (ec) {
    if (outError) *outError = "cannot create " + m_path.parent_path().string() + ": " + ec.message();
    return false;
  }

  std::ofstream out(m_path, std::ios::trunc);
  if (!out.good()) {
    if (outError) *outError = "cannot write " + m_path.string();
    return false;
  }
  write(out, cfg);
  out.flush();
  if (!out.good()) {
    if (outError) *outError = "write to " + m_path.string() + " failed";
    return false;
  }
  return true;
}

}  // namespace unchessful::config
