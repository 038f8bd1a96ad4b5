#pragma once

#include <SFML/Graphics/Font.hpp>
#include <SFML/Graphics/RenderTarget.hpp>
#include <SFML/System/Vector2.hpp>
#include <string>

#include "unchessful/chess_types.hpp"
#include "unchessful/controller/board_interaction.hpp"

namespace unchessful::view {

// Draws a FrameModel: the board from the human's side, highlights, pieces and
// a side panel with the move list and the banner.
class BoardView {
 public:
  BoardView(unsigned squareSize, bool showCoordinates);

  // Empty path: tries a few common system fonts.
  bool loadFont(const std::string& path);

  void draw(sf::RenderTarget& target, const controller::FrameModel& frame, float seconds) const;

  // NO_SQUARE outside the board.
  [[nodiscard]] core::Square squareAt(sf::Vector2i pixel, core::Color orientation) const;
  [[nodiscard]] sf::Vector2u windowSize() const;

 private:
  [[nodiscard]] sf::Vector2f squareOrigin(core::Square sq, core::Color orientation) const;

  void drawSquares(sf::RenderTarget& t, const controller::FrameModel& f) const;
  void drawPieces(sf::RenderTarget& t, const controller::FrameModel& f) const;
  void drawPromotionChoice(sf::RenderTarget& t) const;
  void drawPanel(sf::RenderTarget& t, const controller::FrameModel& f, float seconds) const;

  unsigned m_square;
  float m_margin;
  float m_panel_width;
  bool m_coords;
  sf::Font m_font;
  bool m_has_font = false;
};

}  // namespace unchessful::view
