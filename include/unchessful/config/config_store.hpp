#pragma once
#include <filesystem>
#include <iosfwd>
#include <string>
#include <vector>

#include "client_config.hpp"

namespace unchessful::config {

// INI-style persistence of ClientConfig:
//
//   [engine]
//   api_root=https://api.unchessful.games/
//   [network]
//   scheduling=threaded
//
// Unknown keys and unparsable values are reported as warnings and leave the
// defaults in place.
class ConfigStore {
 public:
  explicit ConfigStore(std::filesystem::path path = defaultPath());

  // $UNCHESSFUL_CONFIG, else $XDG_CONFIG_HOME/unchessful/client.ini, else
  // ~/.config/unchessful/client.ini
  static std::filesystem::path defaultPath();

  // A missing file is not an error: `cfg` keeps its values and true is returned.
  bool load(ClientConfig& cfg, std::string* outError = nullptr) const;
  bool save(const ClientConfig& cfg, std::string* outError = nullptr) const;

  static void parse(std::istream& in, ClientConfig& cfg, std::vector<std::string>* warnings);
  static void write(std::ostream& out, const ClientConfig& cfg);

  [[nodiscard]] const std::filesystem::path& path() const noexcept { return m_path; }

 private:
  std::filesystem::path m_path;
};

}  // namespace unchessful::config
