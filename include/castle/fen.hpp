#pragma once
#include <string>
#include <string_view>
#include <stdexcept>
#include "castle/color.hpp"
#include "castle/castling_rights.hpp"

namespace castle {

struct FenError : std::runtime_error { using std::runtime_error::runtime_error; };

// Fields 2 and 3 of the standard start position
inline constexpr char STARTPOS_ACTIVE[] = "w";
inline constexpr char STARTPOS_CASTLING[] = "KQkq";

// Loader-side parsing: malformed fields throw FenError.
Color parse_active_color(std::string_view field);
CastlingRights parse_castling_field(std::string_view field);

std::string active_color_field(Color c);
std::string castling_field(const CastlingRights& cr);

} // namespace castle
