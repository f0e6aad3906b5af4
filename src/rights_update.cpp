#include "castle/rights_update.hpp"

namespace castle {

static inline void revoke_rook_home(CastlingRights& cr, Color owner, Square sq) {
  for (Side s : {Side::Kingside, Side::Queenside}) {
    const Right r = make_right(owner, s);
    if (sq == rook_square(r)) cr.remove(r);
  }
}

void revoke_after_move(CastlingRights& cr, Color mover, Piece moved, Square from) {
  if (moved == Piece::King) cr.remove_color(mover);
  else if (moved == Piece::Rook) revoke_rook_home(cr, mover, from);
}

void revoke_after_capture(CastlingRights& cr, Color victim, Piece captured, Square sq) {
  if (captured != Piece::Rook) return;
  revoke_rook_home(cr, victim, sq);
}

void revoke_after_castle(CastlingRights& cr, Color mover) {
  cr.remove_color(mover);
}

std::optional<Right> castle_right_for(Color mover, Square king_from, Square king_to) {
  for (Side s : {Side::Kingside, Side::Queenside}) {
    const Right r = make_right(mover, s);
    if (king_from == king_square(r) && king_to == castle_square(r)) return r;
  }
  return std::nullopt;
}

} // namespace castle
