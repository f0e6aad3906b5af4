#include "castle/fen.hpp"
#include <string>

namespace castle {

Color parse_active_color(std::string_view field) {
  if (field.size() != 1)
    throw FenError("Invalid active color in FEN: expected one character, got '" + std::string(field) + "'");
  auto c = color_from_char(field[0]);
  if (!c) throw FenError("Invalid active color in FEN: '" + std::string(field) + "'");
  return *c;
}

CastlingRights parse_castling_field(std::string_view field) {
  auto cr = CastlingRights::from_string(field);
  if (!cr) {
    if (field.empty()) throw FenError("Missing castling field in FEN");
    throw FenError("Invalid castling field in FEN: '" + std::string(field) + "'");
  }
  return *cr;
}

std::string active_color_field(Color c) {
  return std::string(1, color_char(c));
}

std::string castling_field(const CastlingRights& cr) {
  return cr.to_string();
}

} // namespace castle
