#pragma once
#include <array>
#include <optional>
#include <ostream>
#include <string_view>
#include "castle/types.hpp"
#include "castle/color.hpp"

namespace castle {

// One castling privilege. Values are the bit index of the right's flag.
enum class Right : int {
  WhiteKingside  = 0,
  WhiteQueenside = 1,
  BlackKingside  = 2,
  BlackQueenside = 3,
};

// Flag order K, Q, k, q
inline constexpr std::array<Right, RIGHT_N> ALL_RIGHTS = {
  Right::WhiteKingside, Right::WhiteQueenside,
  Right::BlackKingside, Right::BlackQueenside,
};

inline constexpr Right make_right(Color c, Side s) {
  switch (c) {
    case Color::White:
      switch (s) {
        case Side::Kingside:  return Right::WhiteKingside;
        case Side::Queenside: return Right::WhiteQueenside;
      }
      break;
    case Color::Black:
      switch (s) {
        case Side::Kingside:  return Right::BlackKingside;
        case Side::Queenside: return Right::BlackQueenside;
      }
      break;
  }
  return Right::WhiteKingside; // unreachable
}

inline constexpr Color color_of(Right r) {
  switch (r) {
    case Right::WhiteKingside:
    case Right::WhiteQueenside: return Color::White;
    case Right::BlackKingside:
    case Right::BlackQueenside: return Color::Black;
  }
  return Color::White; // unreachable
}

inline constexpr Side side_of(Right r) {
  switch (r) {
    case Right::WhiteKingside:
    case Right::BlackKingside:  return Side::Kingside;
    case Right::WhiteQueenside:
    case Right::BlackQueenside: return Side::Queenside;
  }
  return Side::Kingside; // unreachable
}

// Same side, other owner (and vice versa)
inline constexpr Right with_color(Right r, Color c) { return make_right(c, side_of(r)); }
inline constexpr Right with_side(Right r, Side s) { return make_right(color_of(r), s); }

inline constexpr unsigned right_flag(Right r) { return 1u << static_cast<int>(r); }

// Squares between king and rook that must be vacant
inline constexpr U64 empty_squares(Right r) {
  switch (r) {
    case Right::WhiteKingside:  return 0b01100000ULL;
    case Right::WhiteQueenside: return 0b00001110ULL;
    case Right::BlackKingside:  return 0b01100000ULL << 56;
    case Right::BlackQueenside: return 0b00001110ULL << 56;
  }
  return 0ULL; // unreachable
}

// King destination after castling
inline constexpr Square castle_square(Right r) {
  switch (r) {
    case Right::WhiteKingside:  return SQ_G1;
    case Right::WhiteQueenside: return SQ_C1;
    case Right::BlackKingside:  return SQ_G8;
    case Right::BlackQueenside: return SQ_C8;
  }
  return SQ_G1; // unreachable
}

// Home square of the rook this right belongs to
inline constexpr Square rook_square(Right r) {
  switch (r) {
    case Right::WhiteKingside:  return SQ_H1;
    case Right::WhiteQueenside: return SQ_A1;
    case Right::BlackKingside:  return SQ_H8;
    case Right::BlackQueenside: return SQ_A8;
  }
  return SQ_H1; // unreachable
}

inline constexpr Square king_square(Right r) {
  return color_of(r) == Color::White ? SQ_E1 : SQ_E8;
}

// FEN letter: K, Q, k, q
char right_char(Right r);
std::optional<Right> right_from_char(char ch);

// Enumerator name, e.g. "WhiteKingside"
std::string_view right_name(Right r);

std::ostream& operator<<(std::ostream& os, Right r);

} // namespace castle
