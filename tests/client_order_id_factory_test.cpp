// =============================================================================
// client_order_id_factory_test.cpp
// =============================================================================
// Unit tests for recon::ClientOrderIdFactory.
//
// Validates:
//   - Raw id layout: broker, side letter, compacted pair, nonce
//   - Prefix trimming at max_len keeps the nonce whole
//   - MD5 digest against known vectors, "0x" prefix, lowercase hex
//   - Consecutive ids differ; same nonce gives the same id
//   - No duplicates when many threads generate ids at once
// =============================================================================

#include "recon/concurrent/client_order_id_factory.hpp"

#include <gtest/gtest.h>

#include <set>
#include <string>
#include <thread>
#include <vector>

using recon::ClientOrderIdFactory;
using recon::domain::Side;

// -----------------------------------------------------------------------------
// 1. Raw id layout.
// -----------------------------------------------------------------------------
TEST(ClientOrderIdFactoryTest, RawIdLayout) {
  ClientOrderIdFactory factory("HBOT", 32);

  EXPECT_EQ(factory.rawId(Side::Buy, "ETH-USDC", 7), "HBOTBETHUSDC7");
  EXPECT_EQ(factory.rawId(Side::Sell, "ETH-USDC", 7), "HBOTSETHUSDC7");
}

// -----------------------------------------------------------------------------
// 2. Each half of the pair is cut to four characters.
// -----------------------------------------------------------------------------
TEST(ClientOrderIdFactoryTest, LongSymbolsAreCompacted) {
  ClientOrderIdFactory factory("HBOT", 32);
  EXPECT_EQ(factory.rawId(Side::Buy, "DOGECOIN-USDC", 1), "HBOTBDOGEUSDC1");
}

// -----------------------------------------------------------------------------
// 3. Over max_len the prefix is trimmed, never the nonce.
// Why: trimming the nonce would let two orders share one raw id.
// -----------------------------------------------------------------------------
TEST(ClientOrderIdFactoryTest, TrimsPrefixNotNonce) {
  ClientOrderIdFactory factory("HBOT", 16);

  const std::string a = factory.rawId(Side::Buy, "ETH-USDC", 1234567);
  const std::string b = factory.rawId(Side::Buy, "ETH-USDC", 1234568);

  EXPECT_EQ(a.size(), 16u);
  EXPECT_EQ(a, "HBOTBETHU1234567");
  EXPECT_NE(a, b);
}

// -----------------------------------------------------------------------------
// 4. md5Hex matches published test vectors.
// -----------------------------------------------------------------------------
TEST(ClientOrderIdFactoryTest, Md5KnownVectors) {
  EXPECT_EQ(ClientOrderIdFactory::md5Hex(""),
            "0xd41d8cd98f00b204e9800998ecf8427e");
  EXPECT_EQ(ClientOrderIdFactory::md5Hex("abc"),
            "0x900150983cd24fb0d6963f7d28e17f72");
}

// -----------------------------------------------------------------------------
// 5. next() returns the digest of the raw id for the current nonce and
//    advances the nonce.
// -----------------------------------------------------------------------------
TEST(ClientOrderIdFactoryTest, NextIsDigestOfRawId) {
  ClientOrderIdFactory factory("HBOT", 32, 100);

  const std::string first = factory.next(Side::Buy, "ETH-USDC");
  const std::string second = factory.next(Side::Buy, "ETH-USDC");

  EXPECT_EQ(first, ClientOrderIdFactory::md5Hex(
                       factory.rawId(Side::Buy, "ETH-USDC", 100)));
  EXPECT_EQ(second, ClientOrderIdFactory::md5Hex(
                        factory.rawId(Side::Buy, "ETH-USDC", 101)));
  EXPECT_NE(first, second);
  EXPECT_EQ(first.size(), 34u);  // "0x" + 32 hex digits
  EXPECT_EQ(first.find_first_not_of("0123456789abcdefx"), std::string::npos);
}

// -----------------------------------------------------------------------------
// 6. Concurrent next() calls never produce the same id.
// -----------------------------------------------------------------------------
TEST(ClientOrderIdFactoryTest, ConcurrentIdsAreUnique) {
  constexpr int kThreads = 4;
  constexpr int kIdsPerThread = 500;

  ClientOrderIdFactory factory("HBOT", 32);
  std::vector<std::vector<std::string>> per_thread(kThreads);

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&factory, &per_thread, t] {
      for (int i = 0; i < kIdsPerThread; ++i) {
        per_thread[t].push_back(factory.next(Side::Sell, "BTC-USDC"));
      }
    });
  }
  for (auto& t : threads) t.join();

  std::set<std::string> unique;
  for (const auto& ids : per_thread) {
    unique.insert(ids.begin(), ids.end());
  }
  EXPECT_EQ(unique.size(), static_cast<std::size_t>(kThreads * kIdsPerThread));
}
