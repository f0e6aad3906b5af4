#include <cassert>
#include <sstream>
#include <string>
#include <unordered_set>
#include <vector>
#include "castle/castling_rights.hpp"

using namespace castle;

static CastlingRights subset(unsigned mask) {
  CastlingRights cr;
  for (Right r : ALL_RIGHTS)
    if (mask & right_flag(r)) cr.insert(r);
  return cr;
}

int main() {
  // Empty and all
  {
    CastlingRights none;
    assert(none.empty());
    assert(none.size() == 0);
    assert(none.to_string() == "-");
    assert(CastlingRights::all().to_string() == "KQkq");
    assert(CastlingRights::all().size() == 4);
    for (Right r : ALL_RIGHTS) assert(CastlingRights::all().contains(r));
  }

  // Parsing
  {
    assert(!CastlingRights::from_string(""));
    assert(!CastlingRights::from_string("x"));
    assert(!CastlingRights::from_string("KQx"));
    assert(!CastlingRights::from_string("K-"));
    assert(!CastlingRights::from_string("--"));
    assert(CastlingRights::from_string("KQ"));
    assert(*CastlingRights::from_string("-") == CastlingRights{});
    assert(*CastlingRights::from_string("KQkqK") == CastlingRights::all());
    assert(CastlingRights::from_string("qkQK")->to_string() == "KQkq");
    const CastlingRights kq = *CastlingRights::from_string("qK");
    assert(kq.to_string() == "Kq");
    assert(kq == (CastlingRights{Right::WhiteKingside, Right::BlackQueenside}));
  }

  // Text round trip for every subset
  for (unsigned m = 0; m < 16; ++m) {
    const CastlingRights cr = subset(m);
    assert(cr.bits() == m);
    auto back = CastlingRights::from_string(cr.to_string());
    assert(back && *back == cr);
  }

  // Sequence construction deduplicates
  {
    std::vector<Right> v = {Right::BlackKingside, Right::WhiteKingside, Right::BlackKingside};
    CastlingRights cr(v.begin(), v.end());
    assert(cr.size() == 2);
    assert(cr.to_string() == "Kk");
  }

  // insert is idempotent, remove is exact match
  {
    CastlingRights cr;
    cr.insert(Right::WhiteQueenside);
    cr.insert(Right::WhiteQueenside);
    assert(cr.size() == 1);
    assert(cr.remove(Right::WhiteKingside) == std::nullopt);
    assert(cr.contains(Right::WhiteQueenside));
    assert(cr.remove(Right::WhiteQueenside) == Right::WhiteQueenside);
    assert(cr.empty());
    assert(!cr.remove(Right::WhiteQueenside));
  }
  for (unsigned m = 0; m < 16; ++m)
    for (Right r : ALL_RIGHTS) {
      CastlingRights cr = subset(m);
      const bool had = cr.contains(r);
      auto got = cr.remove(r);
      assert(got.has_value() == had);
      assert(!cr.contains(r));
      assert(cr.intersect(CastlingRights{r}).empty());
      assert(cr.size() == subset(m).size() - (had ? 1 : 0));
    }

  // Iteration visits each member once and restarts
  {
    const CastlingRights cr{Right::BlackQueenside, Right::WhiteKingside, Right::BlackKingside};
    std::string first, second;
    for (Right r : cr) first += right_char(r);
    for (auto it = cr.begin(); it != cr.end(); ++it) second += right_char(*it);
    assert(first == "Kkq");
    assert(first == second);
    int n = 0;
    for (Right r : CastlingRights{}) { (void)r; ++n; }
    assert(n == 0);
  }

  // Hash ignores insertion order
  {
    CastlingRights a, b;
    a.insert(Right::WhiteKingside); a.insert(Right::BlackQueenside); a.insert(Right::WhiteQueenside);
    b.insert(Right::WhiteQueenside); b.insert(Right::WhiteKingside); b.insert(Right::BlackQueenside);
    assert(a == b);
    assert(a.hash() == b.hash());
    assert(std::hash<CastlingRights>{}(a) == std::hash<CastlingRights>{}(b));
    assert(CastlingRights{}.hash() == 0);
    assert(CastlingRights::all().hash() == 0xF);

    std::unordered_set<CastlingRights> seen;
    for (unsigned m = 0; m < 16; ++m) seen.insert(subset(m));
    seen.insert(a);
    assert(seen.size() == 16);
  }

  // Per-color helpers
  {
    assert(CastlingRights::for_color(Color::White).to_string() == "KQ");
    assert(CastlingRights::for_color(Color::Black).to_string() == "kq");
    CastlingRights cr = CastlingRights::all();
    cr.remove_color(Color::Black);
    assert(cr.to_string() == "KQ");
  }

  // Starting rights minus white's
  {
    CastlingRights cr = CastlingRights::all();
    cr.remove(Right::WhiteKingside);
    cr.remove(Right::WhiteQueenside);
    assert(cr.to_string() == "kq");
    std::ostringstream os;
    os << cr << ' ' << CastlingRights{};
    assert(os.str() == "kq -");
  }
  return 0;
}
