#pragma once

#include "unchessful/config/client_config.hpp"

namespace unchessful::app {

class App {
 public:
  explicit App(config::ClientConfig cfg);
  int run();

 private:
  config::ClientConfig m_cfg;
};

}  // namespace unchessful::app
