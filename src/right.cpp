#include "castle/right.hpp"

namespace castle {

char right_char(Right r) {
  switch (r) {
    case Right::WhiteKingside:  return 'K';
    case Right::WhiteQueenside: return 'Q';
    case Right::BlackKingside:  return 'k';
    case Right::BlackQueenside: return 'q';
  }
  return 'K';
}

std::optional<Right> right_from_char(char ch) {
  switch (ch) {
    case 'K': return Right::WhiteKingside;
    case 'Q': return Right::WhiteQueenside;
    case 'k': return Right::BlackKingside;
    case 'q': return Right::BlackQueenside;
    default:  return std::nullopt;
  }
}

std::string_view right_name(Right r) {
  switch (r) {
    case Right::WhiteKingside:  return "WhiteKingside";
    case Right::WhiteQueenside: return "WhiteQueenside";
    case Right::BlackKingside:  return "BlackKingside";
    case Right::BlackQueenside: return "BlackQueenside";
  }
  return "WhiteKingside";
}

std::ostream& operator<<(std::ostream& os, Right r) {
  return os << right_name(r);
}

} // namespace castle
