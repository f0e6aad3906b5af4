#include "castle/color.hpp"

namespace castle {

char color_char(Color c) {
  switch (c) {
    case Color::White: return 'w';
    case Color::Black: return 'b';
  }
  return 'w';
}

std::optional<Color> color_from_char(char ch) {
  switch (ch) {
    case 'W': case 'w': return Color::White;
    case 'B': case 'b': return Color::Black;
    default:            return std::nullopt;
  }
}

std::string_view color_name(Color c) {
  switch (c) {
    case Color::White: return "White";
    case Color::Black: return "Black";
  }
  return "White";
}

std::ostream& operator<<(std::ostream& os, Color c) {
  return os << color_name(c);
}

} // namespace castle
