#pragma once
#include <cstdint>


namespace castle {


using U64 = std::uint64_t;
using Square = int; // 0..63, a1 = 0 .. h8 = 63


enum class Color : int { White = 0, Black = 1 };


enum class Side : int { Kingside = 0, Queenside = 1 };


enum class Piece : int { Pawn=0, Knight=1, Bishop=2, Rook=3, Queen=4, King=5, None=6 };


constexpr int COLOR_N = 2;
constexpr int RIGHT_N = 4;


// Squares the castling code refers to
constexpr Square SQ_A1 = 0;
constexpr Square SQ_C1 = 2;
constexpr Square SQ_E1 = 4;
constexpr Square SQ_G1 = 6;
constexpr Square SQ_H1 = 7;
constexpr Square SQ_A8 = 56;
constexpr Square SQ_C8 = 58;
constexpr Square SQ_E8 = 60;
constexpr Square SQ_G8 = 62;
constexpr Square SQ_H8 = 63;


inline constexpr int file_of(Square s) { return s & 7; }
inline constexpr int rank_of(Square s) { return s >> 3; }
inline constexpr U64 square_bb(Square s) { return 1ULL << s; }


} // namespace castle
