#include <iostream>
#include <string>
#include <utility>

#include "unchessful/config/config_store.hpp"

#ifdef UNCHESSFUL_UI
#include "unchessful/app/app.hpp"
#endif

int main()
{
  unchessful::config::ClientConfig cfg;
  unchessful::config::ConfigStore store;
  std::string error;
  if (!store.load(cfg, &error))
    std::cerr << "[Config] " << error << ", falling back to defaults\n";

#ifdef UNCHESSFUL_UI
  unchessful::app::App app(std::move(cfg));
  return app.run();
#else
  std::cerr << "unchessful was built without the SFML front end\n";
  return 1;
#endif
}
