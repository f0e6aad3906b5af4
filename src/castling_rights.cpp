#include "castle/castling_rights.hpp"

namespace castle {

std::optional<CastlingRights> CastlingRights::from_string(std::string_view s) {
  if (s.empty()) return std::nullopt;
  if (s == "-") return CastlingRights{};

  CastlingRights cr;
  for (char ch : s) {
    auto r = right_from_char(ch);
    if (!r) return std::nullopt;
    cr.insert(*r);
  }
  return cr;
}

std::optional<Right> CastlingRights::remove(Right r) {
  if (!contains(r)) return std::nullopt;
  bits_ &= ~right_flag(r);
  return r;
}

std::string CastlingRights::to_string() const {
  if (empty()) return "-";
  // Flag order is already character order: 'K' < 'Q' < 'k' < 'q'
  std::string out;
  out.reserve(RIGHT_N);
  for (Right r : *this) out += right_char(r);
  return out;
}

std::ostream& operator<<(std::ostream& os, const CastlingRights& cr) {
  return os << cr.to_string();
}

} // namespace castle
