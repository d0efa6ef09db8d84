#include <gtest/gtest.h>

#include <limits>
#include <set>
#include <vector>

#include "CNPJStrategy_Sequential.hpp"
#include "CNPJUtil.hpp"
#include "test_util.hpp"

using test_util::Bases;
using test_util::Collect;

class SequentialStrategyTest : public ::testing::Test {
 protected:
  std::vector<int64_t> Sweep(int64_t start, int64_t end, int64_t step,
                             bool filtered, int shard_index = 0,
                             int shards_total = 1) {
    CNPJStrategy_Sequential::Options options;
    options.start = start;
    options.end = end;
    options.step = step;
    options.shard_index = shard_index;
    options.shards_total = shards_total;
    CNPJStrategy_Sequential strategy(options, CNPJSequenceFilter(filtered));
    return Bases(Collect(&strategy));
  }
};

TEST_F(SequentialStrategyTest, EmitsEveryBaseOnceInOrder) {
  CNPJStrategy_Sequential::Options options;
  options.start = 0;
  options.end = 20;
  CNPJStrategy_Sequential strategy(options, CNPJSequenceFilter(false));
  std::vector<CNPJ> cnpjs = Collect(&strategy);

  ASSERT_EQ(cnpjs.size(), 20u);
  for (int64_t i = 0; i < 20; ++i) {
    EXPECT_EQ(cnpjs[i].base12(), i);
    EXPECT_TRUE(CNPJUtil::IsValid(cnpjs[i].Digits()));
  }
  EXPECT_EQ(strategy.emitted(), 20);
  EXPECT_TRUE(strategy.Target() == CNPJStrategy::kUnbounded);
}

TEST_F(SequentialStrategyTest, HonorsStep) {
  EXPECT_EQ(Sweep(5, 30, 7, false), std::vector<int64_t>({5, 12, 19, 26}));
  // end is exclusive even when it lands on the progression.
  EXPECT_EQ(Sweep(5, 26, 7, false), std::vector<int64_t>({5, 12, 19}));
}

TEST_F(SequentialStrategyTest, StepLargerThanRangeEmitsOnlyStart) {
  const int64_t huge_step = std::numeric_limits<int64_t>::max() - 1;
  EXPECT_EQ(Sweep(5, CNPJ::kBase12Limit, huge_step, false),
            std::vector<int64_t>({5}));
  EXPECT_EQ(Sweep(0, 1, huge_step, false), std::vector<int64_t>({0}));
  EXPECT_EQ(Sweep(7, 7, huge_step, false), std::vector<int64_t>());
}

TEST_F(SequentialStrategyTest, StopsAtCount) {
  CNPJStrategy_Sequential::Options options;
  options.count = 3;
  CNPJStrategy_Sequential strategy(options, CNPJSequenceFilter(false));
  EXPECT_EQ(Bases(Collect(&strategy)), std::vector<int64_t>({0, 1, 2}));
  EXPECT_EQ(strategy.emitted(), 3);
}

TEST_F(SequentialStrategyTest, FilteredBasesDoNotCountTowardTarget) {
  CNPJStrategy_Sequential::Options options;
  options.count = 3;
  CNPJStrategy_Sequential strategy(options, CNPJSequenceFilter());
  EXPECT_EQ(Bases(Collect(&strategy)), std::vector<int64_t>({1, 2, 3}));
}

TEST_F(SequentialStrategyTest, RunsOutBeforeCount) {
  CNPJStrategy_Sequential::Options options;
  options.end = 5;
  options.count = 10;
  CNPJStrategy_Sequential strategy(options, CNPJSequenceFilter(false));
  EXPECT_EQ(Collect(&strategy).size(), 5u);
  EXPECT_TRUE(strategy.RangeExhausted());
  EXPECT_LT(strategy.emitted(), strategy.Target());

  CNPJ cnpj;
  EXPECT_FALSE(strategy.Next(&cnpj));
}

TEST_F(SequentialStrategyTest, EmptyRange) {
  EXPECT_TRUE(Sweep(10, 10, 1, false).empty());
  EXPECT_TRUE(Sweep(10, 3, 1, false).empty());
}

TEST_F(SequentialStrategyTest, ReachesTheTopOfTheSpace) {
  std::vector<int64_t> unfiltered = Sweep(999999999990LL, 1000000000000LL, 1, false);
  ASSERT_EQ(unfiltered.size(), 10u);
  EXPECT_EQ(unfiltered.back(), 999999999999LL);

  // 999999999990 has branch 9990, only the all nines base goes away.
  std::vector<int64_t> filtered = Sweep(999999999990LL, 1000000000000LL, 1, true);
  ASSERT_EQ(filtered.size(), 9u);
  EXPECT_EQ(filtered.back(), 999999999998LL);
}

TEST_F(SequentialStrategyTest, DefaultRangeIsLazy) {
  // The default sweep covers 10^12 bases; pulling a few must be immediate.
  CNPJStrategy_Sequential strategy{CNPJStrategy_Sequential::Options(),
                                   CNPJSequenceFilter()};
  CNPJ cnpj;
  ASSERT_TRUE(strategy.Next(&cnpj));
  EXPECT_EQ(cnpj.base12(), 1);
  ASSERT_TRUE(strategy.Next(&cnpj));
  EXPECT_EQ(cnpj.base12(), 2);
  EXPECT_FALSE(strategy.RangeExhausted());
}

TEST_F(SequentialStrategyTest, ShardsPartitionTheSweep) {
  for (bool filtered : {false, true}) {
    std::vector<int64_t> whole = Sweep(3, 100003, 3, filtered);
    std::set<int64_t> expected(whole.begin(), whole.end());

    std::set<int64_t> united;
    size_t total = 0;
    for (int shard = 0; shard < 4; ++shard) {
      std::vector<int64_t> part = Sweep(3, 100003, 3, filtered, shard, 4);
      total += part.size();
      for (int64_t base12 : part) {
        // Shard membership follows the index in the progression.
        EXPECT_EQ(((base12 - 3) / 3) % 4, shard);
        EXPECT_TRUE(united.insert(base12).second) << "duplicate " << base12;
      }
    }
    EXPECT_EQ(total, whole.size());
    EXPECT_EQ(united, expected);
  }
}

TEST_F(SequentialStrategyTest, MoreShardsThanTerms) {
  // Five terms over eight shards: three shards stay empty.
  int non_empty = 0;
  size_t total = 0;
  for (int shard = 0; shard < 8; ++shard) {
    std::vector<int64_t> part = Sweep(0, 5, 1, false, shard, 8);
    total += part.size();
    if (!part.empty()) ++non_empty;
  }
  EXPECT_EQ(total, 5u);
  EXPECT_EQ(non_empty, 5);
}
