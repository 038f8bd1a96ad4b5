#include "unchessful/app/app.hpp"

#include <SFML/Graphics/RenderWindow.hpp>
#include <SFML/System/Clock.hpp>
#include <SFML/Window/Event.hpp>
#include <iostream>
#include <memory>
#include <utility>

#include "unchessful/controller/board_interaction.hpp"
#include "unchessful/controller/turn_controller.hpp"
#include "unchessful/engine/remote/engine_catalog.hpp"
#include "unchessful/engine/remote/engine_client.hpp"
#include "unchessful/engine/remote/request_channel.hpp"
#include "unchessful/view/board_view.hpp"

namespace unchessful::app {

namespace {

std::string catalogBanner(const engine::EngineCatalog& catalog) {
  switch (catalog.stage()) {
    case engine::EngineCatalog::Stage::Failed:
      return "Engine lookup failed: " + catalog.lastError() + ". Press R to retry.";
    case engine::EngineCatalog::Stage::Ready:
      return {};
    default:
      return "Looking up engines... moves for both sides meanwhile.";
  }
}

}  // namespace

App::App(config::ClientConfig cfg) : m_cfg(std::move(cfg)) {}

int App::run() {
  // The channel outlives everything that holds handles on it.
  std::unique_ptr<engine::IRequestChannel> channel = engine::makeRequestChannel(m_cfg.network);

  engine::EngineEndpoint endpoint{m_cfg.engine.gameUrl, m_cfg.network.connectTimeoutMs,
                                  m_cfg.network.requestTimeoutMs, m_cfg.network.userAgent};
  auto client = std::make_unique<engine::EngineClient>(*channel, endpoint);
  engine::EngineClient& clientRef = *client;

  engine::EngineCatalog catalog(*channel, m_cfg.engine, m_cfg.network);
  controller::TurnController turns(std::move(client), m_cfg.game.humanColor);
  controller::BoardInteraction interaction(turns);

  turns.setOnGameEnd([](const model::GameStatus& st) {
    std::cout << "[App] game over: " << model::toString(st) << " (" << model::resultToken(st)
              << ")\n";
  });

  // Without an endpoint the board is played locally until the catalog finds one.
  bool engineReady = !endpoint.gameUrl.empty();
  if (engineReady) {
    std::cout << "[App] posting moves to " << endpoint.gameUrl << "\n";
  } else {
    std::cout << "[App] looking up engines at " << m_cfg.engine.apiRoot << "\n";
    turns.setMode(controller::PlayMode::Local);
    catalog.refresh();
  }
  interaction.requestNewGame();

  view::BoardView boardView(m_cfg.ui.squareSize, m_cfg.ui.showCoordinates);
  if (!boardView.loadFont(m_cfg.ui.fontPath))
    std::cerr << "[App] no usable font" << (m_cfg.ui.fontPath.empty() ? "" : " at ")
              << m_cfg.ui.fontPath << ", text is not drawn\n";

  const sf::Vector2u size = boardView.windowSize();
  sf::RenderWindow window(sf::VideoMode(size.x, size.y), "unchessful",
                          sf::Style::Titlebar | sf::Style::Close);
  window.setFramerateLimit(60);

  auto onKey = [&](sf::Keyboard::Key key) {
    if (interaction.promotionPending()) {
      switch (key) {
        case sf::Keyboard::Q:
          if (!interaction.choosePromotion(core::PieceType::Queen))
            std::cerr << "[App] promotion rejected\n";
          break;
        case sf::Keyboard::R:
          if (!interaction.choosePromotion(core::PieceType::Rook))
            std::cerr << "[App] promotion rejected\n";
          break;
        case sf::Keyboard::B:
          if (!interaction.choosePromotion(core::PieceType::Bishop))
            std::cerr << "[App] promotion rejected\n";
          break;
        case sf::Keyboard::N:
          if (!interaction.choosePromotion(core::PieceType::Knight))
            std::cerr << "[App] promotion rejected\n";
          break;
        case sf::Keyboard::Escape:
          interaction.cancelPromotion();
          break;
        default:
          break;
      }
      return;
    }

    if (!engineReady && key == sf::Keyboard::R) {
      if (catalog.stage() == engine::EngineCatalog::Stage::Failed) catalog.refresh();
      return;
    }

    switch (key) {
      case sf::Keyboard::N:
        interaction.requestNewGame();
        break;
      case sf::Keyboard::F:
        interaction.requestNewGame(~turns.humanColor());
        break;
      case sf::Keyboard::R:
        if (!interaction.requestRetry()) std::cout << "[App] nothing to retry\n";
        break;
      case sf::Keyboard::Escape:
        if (!interaction.requestCancel()) std::cout << "[App] no engine request to cancel\n";
        break;
      case sf::Keyboard::U:
        if (!interaction.requestUndo()) std::cout << "[App] nothing to undo\n";
        break;
      case sf::Keyboard::G:
        if (!interaction.requestResign()) std::cout << "[App] game already over\n";
        break;
      default:
        break;
    }
  };

  sf::Clock clock;
  while (window.isOpen()) {
    sf::Event event;
    while (window.pollEvent(event)) {
      if (event.type == sf::Event::Closed) {
        window.close();
      } else if (event.type == sf::Event::KeyPressed) {
        onKey(event.key.code);
      } else if (event.type == sf::Event::MouseButtonPressed &&
                 event.mouseButton.button == sf::Mouse::Left) {
        const core::Square sq =
            boardView.squareAt({event.mouseButton.x, event.mouseButton.y}, turns.humanColor());
        interaction.clickSquare(sq);
      }
    }

    if (!engineReady && catalog.update()) {
      if (catalog.stage() == engine::EngineCatalog::Stage::Ready) {
        if (auto ep = catalog.endpoint()) {
          std::cout << "[App] posting moves to " << ep->gameUrl << "\n";
          clientRef.setEndpoint(std::move(*ep));
          // fresh game first, so the engine is only asked when it has White
          interaction.requestNewGame();
          turns.setMode(controller::PlayMode::Engine);
          engineReady = true;
        }
      } else if (catalog.stage() == engine::EngineCatalog::Stage::Failed) {
        std::cerr << "[App] engine lookup failed: " << catalog.lastError() << "\n";
      }
    }

    channel->service();
    controller::FrameModel frame = interaction.tick();
    if (!engineReady && frame.banner.empty()) frame.banner = catalogBanner(catalog);

    window.clear(sf::Color(24, 24, 28));
    boardView.draw(window, frame, clock.getElapsedTime().asSeconds());
    window.display();
  }
  return 0;
}

}  // namespace unchessful::app
