#pragma once
#include <optional>
#include <ostream>
#include <string_view>
#include "castle/types.hpp"

namespace castle {

inline constexpr bool is_white(Color c) { return c == Color::White; }
inline constexpr bool is_black(Color c) { return c == Color::Black; }

inline constexpr Color inverse(Color c) {
  switch (c) {
    case Color::White: return Color::Black;
    case Color::Black: return Color::White;
  }
  return Color::White; // unreachable
}

inline void invert(Color& c) { c = inverse(c); }

// Lowercase FEN letter: 'w' or 'b'
char color_char(Color c);

// Accepts either case; anything else is nullopt
std::optional<Color> color_from_char(char ch);

// "White" / "Black"
std::string_view color_name(Color c);

std::ostream& operator<<(std::ostream& os, Color c);

} // namespace castle
