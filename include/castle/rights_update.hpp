#pragma once
#include <optional>
#include "castle/types.hpp"
#include "castle/castling_rights.hpp"

namespace castle {

// Rights only ever shrink here; nothing is restored.

// King move drops both of the mover's rights; a rook leaving its home
// square drops the matching one.
void revoke_after_move(CastlingRights& cr, Color mover, Piece moved, Square from);

// A rook captured on its home square takes the victim's matching right with it.
void revoke_after_capture(CastlingRights& cr, Color victim, Piece captured, Square sq);

void revoke_after_castle(CastlingRights& cr, Color mover);

// Which right a king step king_from -> king_to exercises, if it is a castle at all
std::optional<Right> castle_right_for(Color mover, Square king_from, Square king_to);

} // namespace castle
