// =============================================================================
// symbol_map_test.cpp
// =============================================================================
// Unit tests for recon::SymbolMap.
//
// Validates:
//   - canonicalPairFor maps "<BASE>-PERP" onto "<BASE>-USDC"
//   - rebuild() accepts the three instrument payload shapes
//   - Inactive and malformed instruments are skipped
//   - An empty or unusable payload keeps the previous map
//   - Lookups in both directions; add() replaces stale mappings
// =============================================================================

#include "recon/symbols/symbol_map.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using nlohmann::json;

class SymbolMapTest : public ::testing::Test {
 protected:
  recon::SymbolMap symbols;

  static json instrument(const std::string& name, bool active = true) {
    return json{{"instrument_name", name}, {"is_active", active}};
  }
};

// -----------------------------------------------------------------------------
// 1. Canonical pair naming.
// -----------------------------------------------------------------------------
TEST_F(SymbolMapTest, CanonicalPairFor) {
  EXPECT_EQ(recon::SymbolMap::canonicalPairFor("ETH-PERP"), "ETH-USDC");
  EXPECT_EQ(recon::SymbolMap::canonicalPairFor("BTC-PERP"), "BTC-USDC");
  EXPECT_EQ(recon::SymbolMap::canonicalPairFor("-PERP"), "");
}

// -----------------------------------------------------------------------------
// 2. All three payload shapes are understood.
// -----------------------------------------------------------------------------
TEST_F(SymbolMapTest, RebuildAcceptsPayloadShapes) {
  EXPECT_EQ(symbols.rebuild(json::array({instrument("ETH-PERP")})), 1u);
  EXPECT_EQ(symbols.rebuild(json{{"result", json::array({instrument("ETH-PERP"),
                                                          instrument("BTC-PERP")})}}),
            2u);
  EXPECT_EQ(symbols.rebuild(json{{"result",
                                  {{"instruments",
                                    json::array({instrument("SOL-PERP")})}}}}),
            1u);

  EXPECT_EQ(symbols.toTradingPair("SOL-PERP"), "SOL-USDC");
  EXPECT_FALSE(symbols.toTradingPair("ETH-PERP").has_value());
}

// -----------------------------------------------------------------------------
// 3. Inactive and nameless instruments are not mapped.
// -----------------------------------------------------------------------------
TEST_F(SymbolMapTest, SkipsInactiveAndMalformed) {
  json list = json::array({instrument("ETH-PERP"), instrument("BTC-PERP", false),
                           json{{"is_active", true}}, json("garbage")});

  EXPECT_EQ(symbols.rebuild(list), 1u);
  EXPECT_EQ(symbols.toExchangeSymbol("ETH-USDC"), "ETH-PERP");
  EXPECT_FALSE(symbols.toExchangeSymbol("BTC-USDC").has_value());
}

// -----------------------------------------------------------------------------
// 4. A bad refresh does not wipe a good map.
// Why: a failed instrument poll would otherwise make every event
//      unresolvable until the next long cycle.
// -----------------------------------------------------------------------------
TEST_F(SymbolMapTest, EmptyPayloadKeepsCurrentMap) {
  ASSERT_EQ(symbols.rebuild(json::array({instrument("ETH-PERP")})), 1u);

  EXPECT_EQ(symbols.rebuild(json::array()), 0u);
  EXPECT_EQ(symbols.rebuild(json{{"error", {{"message", "boom"}}}}), 0u);
  EXPECT_EQ(symbols.rebuild(json::array({instrument("BTC-PERP", false)})), 0u);

  EXPECT_EQ(symbols.size(), 1u);
  EXPECT_EQ(symbols.toTradingPair("ETH-PERP"), "ETH-USDC");
}

// -----------------------------------------------------------------------------
// 5. add() keeps both directions consistent.
// -----------------------------------------------------------------------------
TEST_F(SymbolMapTest, AddReplacesStaleMappings) {
  symbols.add("ETH-PERP", "ETH-USDC");
  symbols.add("ETH-PERP-V2", "ETH-USDC");

  EXPECT_EQ(symbols.toExchangeSymbol("ETH-USDC"), "ETH-PERP-V2");
  EXPECT_FALSE(symbols.toTradingPair("ETH-PERP").has_value());
  EXPECT_EQ(symbols.size(), 1u);
}
