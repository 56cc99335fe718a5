#include <gtest/gtest.h>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "kg/key_selector.hpp"
#include "kg/gateway_config.hpp"

TEST(KeySelectorTest, VisitsKeysInConfiguredOrder)
{
    // The first N calls return the credentials in list order, starting at index 0.
    const std::vector<std::string> keys{"A", "B", "C"};
    kg::KeySelector sel(keys);
    EXPECT_EQ(sel.next(), "A");
    EXPECT_EQ(sel.next(), "B");
    EXPECT_EQ(sel.next(), "C");
    EXPECT_EQ(sel.next(), "A");
}

TEST(KeySelectorTest, FairOverMultipleOfN)
{
    // M calls with M a multiple of N hand out every credential exactly M/N times, periodically.
    const std::vector<std::string> keys{"k1", "k2", "k3", "k4"};
    kg::KeySelector sel(keys);
    std::vector<std::string> seen;
    for (int i = 0; i < 40; ++i) seen.push_back(sel.next());

    std::map<std::string, int> counts;
    for (const auto& k : seen) ++counts[k];
    for (const auto& k : keys) EXPECT_EQ(counts[k], 10);
    for (std::size_t i = keys.size(); i < seen.size(); ++i) {
        EXPECT_EQ(seen[i], seen[i - keys.size()]);
    }
    EXPECT_EQ(sel.slots_issued(), 40u);
}

TEST(KeySelectorTest, SingleKeyAlwaysReturned)
{
    // With one credential every call returns it.
    const std::vector<std::string> keys{"only"};
    kg::KeySelector sel(keys);
    for (int i = 0; i < 5; ++i) EXPECT_EQ(sel.next(), "only");
}

TEST(KeySelectorTest, DuplicateEntriesKeepTheirSlots)
{
    // Repeated credentials occupy one rotation slot per occurrence.
    const std::vector<std::string> keys{"A", "A", "B"};
    kg::KeySelector sel(keys);
    EXPECT_EQ(sel.next(), "A");
    EXPECT_EQ(sel.next(), "A");
    EXPECT_EQ(sel.next(), "B");
}

TEST(KeySelectorTest, EmptyListIsConfigError)
{
    // An empty credential list cannot build a selector.
    const std::vector<std::string> keys;
    EXPECT_THROW({ kg::KeySelector sel(keys); }, kg::ConfigError);
}

TEST(KeySelectorTest, ConcurrentCallersNeverShareASlot)
{
    // K concurrent callers advance the cursor by exactly K with an even spread.
    std::vector<std::string> keys;
    for (int i = 0; i < 8; ++i) keys.push_back("key" + std::to_string(i));
    kg::KeySelector sel(keys);

    constexpr int kThreads = 8;
    constexpr int kPerThread = 1000;
    std::mutex mtx;
    std::map<std::string, int> counts;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&] {
            std::map<std::string, int> local;
            for (int i = 0; i < kPerThread; ++i) ++local[sel.next()];
            std::lock_guard<std::mutex> lk(mtx);
            for (const auto& kv : local) counts[kv.first] += kv.second;
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(sel.slots_issued(), static_cast<std::uint64_t>(kThreads * kPerThread));
    for (const auto& k : keys) EXPECT_EQ(counts[k], kThreads * kPerThread / 8);
    // The cursor is back at slot 0 after a whole number of rounds.
    EXPECT_EQ(sel.next(), "key0");
}
