#pragma once
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include "castle/types.hpp"
#include "castle/right.hpp"

namespace castle {

// Set of castling rights. bit 0..3 = KQkq (K=1, Q=2, k=4, q=8)
class CastlingRights {
public:
  // Forward iterator over members in flag order (K, Q, k, q)
  class Iterator {
  public:
    using iterator_category = std::forward_iterator_tag;
    using value_type        = Right;
    using difference_type   = std::ptrdiff_t;
    using pointer           = const Right*;
    using reference         = Right;

    Iterator() = default;
    explicit Iterator(unsigned rest) : rest_(rest) {}

    Right operator*() const { return static_cast<Right>(__builtin_ctz(rest_)); }
    Iterator& operator++() { rest_ &= rest_ - 1; return *this; }
    Iterator operator++(int) { Iterator t = *this; ++*this; return t; }

    bool operator==(const Iterator& o) const { return rest_ == o.rest_; }
    bool operator!=(const Iterator& o) const { return rest_ != o.rest_; }

  private:
    unsigned rest_ = 0; // members not yet visited
  };

  CastlingRights() = default;
  CastlingRights(std::initializer_list<Right> rights) {
    for (Right r : rights) insert(r);
  }
  template <class It>
  CastlingRights(It first, It last) {
    for (; first != last; ++first) insert(*first);
  }

  static CastlingRights all() { return CastlingRights(ALL_MASK); }
  static CastlingRights for_color(Color c) {
    return {make_right(c, Side::Kingside), make_right(c, Side::Queenside)};
  }

  // "-" is the empty set; "" or any character outside KQkq fails the whole parse.
  static std::optional<CastlingRights> from_string(std::string_view s);

  bool contains(Right r) const { return (bits_ & right_flag(r)) != 0; }
  bool empty() const { return bits_ == 0; }
  int size() const { return __builtin_popcount(bits_); }
  unsigned bits() const { return bits_; }

  CastlingRights union_with(const CastlingRights& o) const { return CastlingRights(bits_ | o.bits_); }
  CastlingRights intersect(const CastlingRights& o) const { return CastlingRights(bits_ & o.bits_); }
  CastlingRights exclusive_or(const CastlingRights& o) const { return CastlingRights(bits_ ^ o.bits_); }

  void union_in_place(const CastlingRights& o) { bits_ |= o.bits_; }
  void intersect_in_place(const CastlingRights& o) { bits_ &= o.bits_; }
  void exclusive_or_in_place(const CastlingRights& o) { bits_ ^= o.bits_; }

  void insert(Right r) { bits_ |= right_flag(r); }

  // Returns r if it was a member. r is never a member afterwards.
  std::optional<Right> remove(Right r);

  void remove_color(Color c) { bits_ &= ~for_color(c).bits_; }

  Iterator begin() const { return Iterator(bits_); }
  Iterator end() const { return Iterator(0); }

  // OR of member flags; equal sets hash equal whatever the insertion order
  std::size_t hash() const { return bits_; }

  // Canonical FEN field: "-" or the member letters sorted (K < Q < k < q)
  std::string to_string() const;

  CastlingRights& operator|=(const CastlingRights& o) { union_in_place(o); return *this; }
  CastlingRights& operator&=(const CastlingRights& o) { intersect_in_place(o); return *this; }
  CastlingRights& operator^=(const CastlingRights& o) { exclusive_or_in_place(o); return *this; }

  friend CastlingRights operator|(CastlingRights a, const CastlingRights& b) { return a |= b; }
  friend CastlingRights operator&(CastlingRights a, const CastlingRights& b) { return a &= b; }
  friend CastlingRights operator^(CastlingRights a, const CastlingRights& b) { return a ^= b; }

  friend bool operator==(const CastlingRights& a, const CastlingRights& b) { return a.bits_ == b.bits_; }
  friend bool operator!=(const CastlingRights& a, const CastlingRights& b) { return a.bits_ != b.bits_; }

private:
  static constexpr unsigned ALL_MASK = 0xFu;

  explicit CastlingRights(unsigned bits) : bits_(bits & ALL_MASK) {}

  unsigned bits_ = 0;
};

std::ostream& operator<<(std::ostream& os, const CastlingRights& cr);

} // namespace castle

template <>
struct std::hash<castle::CastlingRights> {
  std::size_t operator()(const castle::CastlingRights& cr) const noexcept { return cr.hash(); }
};
