#include "unchessful/view/board_view.hpp"

#include <SFML/Graphics.hpp>
#include <algorithm>
#include <array>
#include <cmath>

namespace unchessful::view {

namespace {

const sf::Color COL_LIGHT(240, 217, 181);
const sf::Color COL_DARK(181, 136, 99);
const sf::Color COL_LAST_MOVE(205, 210, 106, 160);
const sf::Color COL_SELECTED(106, 160, 205, 170);
const sf::Color COL_TARGET(40, 40, 40, 90);
const sf::Color COL_CHECK(220, 60, 60, 170);
const sf::Color COL_PANEL(36, 36, 40);
const sf::Color COL_TEXT(230, 230, 230);
const sf::Color COL_BANNER(255, 200, 90);

constexpr std::array<const char*, 4> FONT_CANDIDATES{
    "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
    "/usr/share/fonts/TTF/DejaVuSans.ttf",
    "/usr/share/fonts/dejavu/DejaVuSans.ttf",
    "/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf",
};

char pieceGlyph(core::PieceType t) {
  switch (t) {
    case core::PieceType::Pawn:
      return 'P';
    case core::PieceType::Knight:
      return 'N';
    case core::PieceType::Bishop:
      return 'B';
    case core::PieceType::Rook:
      return 'R';
    case core::PieceType::Queen:
      return 'Q';
    case core::PieceType::King:
      return 'K';
    default:
      return '?';
  }
}

}  // namespace

BoardView::BoardView(unsigned squareSize, bool showCoordinates)
    : m_square(std::max(24u, squareSize)),
      m_margin(static_cast<float>(m_square) * 0.5f),
      m_panel_width(static_cast<float>(m_square) * 3.5f),
      m_coords(showCoordinates) {}

bool BoardView::loadFont(const std::string& path) {
  if (!path.empty()) {
    m_has_font = m_font.loadFromFile(path);
    return m_has_font;
  }
  for (const char* candidate : FONT_CANDIDATES) {
    if (m_font.loadFromFile(candidate)) {
      m_has_font = true;
      return true;
    }
  }
  return false;
}

sf::Vector2u BoardView::windowSize() const {
  const float board = static_cast<float>(m_square * 8);
  return {static_cast<unsigned>(board + m_margin * 3.f + m_panel_width),
          static_cast<unsigned>(board + m_margin * 2.f)};
}

sf::Vector2f BoardView::squareOrigin(core::Square sq, core::Color orientation) const {
  int file = static_cast<int>(sq) & 7;
  int rank = static_cast<int>(sq) >> 3;
  if (orientation == core::Color::Black) {
    file = 7 - file;
    rank = 7 - rank;
  }
  const float s = static_cast<float>(m_square);
  return {m_margin + static_cast<float>(file) * s, m_margin + static_cast<float>(7 - rank) * s};
}

core::Square BoardView::squareAt(sf::Vector2i pixel, core::Color orientation) const {
  const float x = static_cast<float>(pixel.x) - m_margin;
  const float y = static_cast<float>(pixel.y) - m_margin;
  const float s = static_cast<float>(m_square);
  if (x < 0.f || y < 0.f || x >= s * 8.f || y >= s * 8.f) return core::NO_SQUARE;
  int file = static_cast<int>(x / s);
  int rank = 7 - static_cast<int>(y / s);
  if (orientation == core::Color::Black) {
    file = 7 - file;
    rank = 7 - rank;
  }
  return core::makeSquare(file, rank);
}

void BoardView::draw(sf::RenderTarget& target, const controller::FrameModel& frame,
                     float seconds) const {
  drawSquares(target, frame);
  drawPieces(target, frame);
  if (frame.promotionSquare != core::NO_SQUARE) drawPromotionChoice(target);
  drawPanel(target, frame, seconds);
}

void BoardView::drawSquares(sf::RenderTarget& t, const controller::FrameModel& f) const {
  const float s = static_cast<float>(m_square);
  sf::RectangleShape cell({s, s});

  auto overlay = [&](core::Square sq, sf::Color col) {
    if (sq == core::NO_SQUARE) return;
    cell.setPosition(squareOrigin(sq, f.orientation));
    cell.setFillColor(col);
    t.draw(cell);
  };

  for (int sq = 0; sq < 64; ++sq) {
    const bool dark = (((sq & 7) + (sq >> 3)) & 1) == 0;
    overlay(static_cast<core::Square>(sq), dark ? COL_DARK : COL_LIGHT);
  }
  if (f.lastMove) {
    overlay(f.lastMove->from(), COL_LAST_MOVE);
    overlay(f.lastMove->to(), COL_LAST_MOVE);
  }
  overlay(f.checkedKing, COL_CHECK);
  overlay(f.selected, COL_SELECTED);

  const float r = s * 0.16f;
  sf::CircleShape dot(r);
  dot.setOrigin(r, r);
  dot.setFillColor(COL_TARGET);
  for (core::Square sq : f.targets) {
    const sf::Vector2f o = squareOrigin(sq, f.orientation);
    dot.setPosition(o.x + s * 0.5f, o.y + s * 0.5f);
    t.draw(dot);
  }

  if (!m_coords || !m_has_font) return;
  const unsigned size = std::max(10u, m_square / 6);
  for (int i = 0; i < 8; ++i) {
    const int file = f.orientation == core::Color::White ? i : 7 - i;
    sf::Text fileLabel(std::string(1, static_cast<char>('a' + file)), m_font, size);
    fileLabel.setFillColor(COL_TEXT);
    fileLabel.setPosition(m_margin + s * (static_cast<float>(i) + 0.45f), m_margin + s * 8.f + 2.f);
    t.draw(fileLabel);

    const int rank = f.orientation == core::Color::White ? 7 - i : i;
    sf::Text rankLabel(std::string(1, static_cast<char>('1' + rank)), m_font, size);
    rankLabel.setFillColor(COL_TEXT);
    rankLabel.setPosition(m_margin * 0.35f, m_margin + s * (static_cast<float>(i) + 0.35f));
    t.draw(rankLabel);
  }
}

void BoardView::drawPieces(sf::RenderTarget& t, const controller::FrameModel& f) const {
  const float s = static_cast<float>(m_square);
  for (int sq = 0; sq < 64; ++sq) {
    const model::Piece pc = f.board[sq];
    if (pc.isNone()) continue;

    const bool white = pc.color == core::Color::White;
    const float r = s * (pc.type == core::PieceType::Pawn ? 0.28f : 0.36f);
    const sf::Vector2f o = squareOrigin(static_cast<core::Square>(sq), f.orientation);

    sf::CircleShape body(r);
    body.setOrigin(r, r);
    body.setPosition(o.x + s * 0.5f, o.y + s * 0.5f);
    body.setFillColor(white ? sf::Color(250, 250, 250) : sf::Color(30, 30, 30));
    body.setOutlineThickness(2.f);
    body.setOutlineColor(white ? sf::Color(30, 30, 30) : sf::Color(250, 250, 250));
    t.draw(body);

    if (!m_has_font) continue;
    sf::Text glyph(std::string(1, pieceGlyph(pc.type)), m_font, static_cast<unsigned>(r));
    glyph.setFillColor(white ? sf::Color(30, 30, 30) : sf::Color(250, 250, 250));
    const sf::FloatRect b = glyph.getLocalBounds();
    glyph.setOrigin(b.left + b.width * 0.5f, b.top + b.height * 0.5f);
    glyph.setPosition(o.x + s * 0.5f, o.y + s * 0.5f);
    t.draw(glyph);
  }
}

void BoardView::drawPromotionChoice(sf::RenderTarget& t) const {
  const float s = static_cast<float>(m_square);
  sf::RectangleShape shade({s * 8.f, s * 8.f});
  shade.setPosition(m_margin, m_margin);
  shade.setFillColor(sf::Color(0, 0, 0, 120));
  t.draw(shade);

  if (!m_has_font) return;
  sf::Text prompt("Promote: Q  R  B  N", m_font, std::max(14u, m_square / 3));
  prompt.setFillColor(COL_BANNER);
  const sf::FloatRect b = prompt.getLocalBounds();
  prompt.setOrigin(b.left + b.width * 0.5f, b.top + b.height * 0.5f);
  prompt.setPosition(m_margin + s * 4.f, m_margin + s * 4.f);
  t.draw(prompt);
}

void BoardView::drawPanel(sf::RenderTarget& t, const controller::FrameModel& f,
                          float seconds) const {
  const float s = static_cast<float>(m_square);
  const float x = m_margin * 2.f + s * 8.f;
  sf::RectangleShape panel({m_panel_width, s * 8.f});
  panel.setPosition(x, m_margin);
  panel.setFillColor(COL_PANEL);
  t.draw(panel);

  if (f.spinner) {
    const float r = s * 0.15f;
    sf::CircleShape dot(r * 0.3f);
    dot.setFillColor(COL_BANNER);
    for (int i = 0; i < 3; ++i) {
      const float phase = seconds * 4.f + static_cast<float>(i) * 2.094f;
      dot.setPosition(x + m_panel_width - r * 2.f + std::cos(phase) * r,
                      m_margin + r * 2.f + std::sin(phase) * r);
      t.draw(dot);
    }
  }

  if (!m_has_font) return;
  const unsigned size = std::max(12u, m_square / 5);
  float y = m_margin + 8.f;

  sf::Text status(f.statusLine, m_font, size);
  status.setFillColor(COL_TEXT);
  status.setPosition(x + 10.f, y);
  t.draw(status);
  y += static_cast<float>(size) * 1.6f;

  if (!f.banner.empty()) {
    sf::Text banner(f.banner, m_font, size);
    banner.setFillColor(COL_BANNER);
    banner.setPosition(x + 10.f, y);
    t.draw(banner);
    y += static_cast<float>(size) * 1.6f;
  }

  // newest moves stay visible when the list outgrows the panel
  const float lineH = static_cast<float>(size) * 1.3f;
  const std::size_t rows = (f.sanMoves.size() + 1) / 2;
  const std::size_t fit = static_cast<std::size_t>(
      std::max(1.f, (m_margin + s * 8.f - y - lineH * 2.f) / lineH));
  const std::size_t first = rows > fit ? rows - fit : 0;
  for (std::size_t row = first; row < rows; ++row) {
    std::string line = std::to_string(row + 1) + ". " + f.sanMoves[row * 2];
    if (row * 2 + 1 < f.sanMoves.size()) line += "  " + f.sanMoves[row * 2 + 1];
    sf::Text text(line, m_font, size);
    text.setFillColor(COL_TEXT);
    text.setPosition(x + 10.f, y);
    t.draw(text);
    y += lineH;
  }

  sf::Text help("N new  R retry  Esc cancel  U undo  G resign  F flip", m_font,
                std::max(10u, size * 3 / 4));
  help.setFillColor(sf::Color(150, 150, 150));
  help.setPosition(x + 10.f, m_margin + s * 8.f - lineH * 1.2f);
  t.draw(help);
}

}  // namespace unchessful::view
