#include <gtest/gtest.h>
#include "skipgram/errors.hpp"
#include "skipgram/unigram_sampler.hpp"
#include <cmath>
#include <set>

using namespace skipgram;

TEST(UnigramSamplerTest, TableFollowsDistortedUnigram) {
    std::vector<long long> counts = {1000, 100, 10, 1};
    UnigramSampler sampler(counts, 0.75, 1000000);

    // 验证词频分布 P(w) = count(w)^0.75 / Σ count^0.75
    double total = 0.0;
    for (long long c : counts) total += std::pow(c, 0.75);
    double sum = 0.0;
    for (size_t i = 0; i < counts.size(); ++i) {
        double expected = std::pow(counts[i], 0.75) / total;
        EXPECT_NEAR(sampler.Probability(static_cast<int>(i)), expected, 1e-5);
        sum += sampler.Probability(static_cast<int>(i));
    }
    EXPECT_NEAR(sum, 1.0, 1e-12);
    EXPECT_EQ(sampler.NumSampleable(), 4);
}

TEST(UnigramSamplerTest, DistortionFlattensFrequencies) {
    std::vector<long long> counts = {1000, 1};
    UnigramSampler sampler(counts, 0.75, 1000000);
    // 不做 0.75 次方时低频词的概率约为 0.001
    EXPECT_GT(sampler.Probability(1), 0.004);
}

TEST(UnigramSamplerTest, EmpiricalFrequenciesMatchTable) {
    std::vector<long long> counts = {50, 30, 20};
    UnigramSampler sampler(counts, 0.75, 100000);
    std::mt19937_64 rng(11);

    const int trials = 200000;
    std::vector<int> hits(counts.size(), 0);
    for (int i = 0; i < trials; ++i) {
        hits[sampler.Sample(rng)]++;
    }
    for (size_t i = 0; i < counts.size(); ++i) {
        EXPECT_NEAR(static_cast<double>(hits[i]) / trials, sampler.Probability(static_cast<int>(i)), 0.01);
    }
}

TEST(UnigramSamplerTest, SampleUniqueHasNoDuplicates) {
    std::vector<long long> counts = {500, 200, 100, 50, 20, 10, 5, 1};
    UnigramSampler sampler(counts, 0.75, 100000);
    std::mt19937_64 rng(3);

    for (int round = 0; round < 100; ++round) {
        auto sampled = sampler.SampleUnique(5, rng);
        ASSERT_EQ(sampled.size(), 5u);
        std::set<int> unique(sampled.begin(), sampled.end());
        EXPECT_EQ(unique.size(), 5u);
        for (int index : sampled) {
            EXPECT_GE(index, 0);
            EXPECT_LT(index, 8);
        }
    }

    // 全部采完
    auto all = sampler.SampleUnique(8, rng);
    EXPECT_EQ(std::set<int>(all.begin(), all.end()).size(), 8u);
    EXPECT_TRUE(sampler.SampleUnique(0, rng).empty());
}

TEST(UnigramSamplerTest, ZeroCountWordsAreNeverSampled) {
    std::vector<long long> counts = {0, 10, 0, 10};
    UnigramSampler sampler(counts, 0.75, 1000);
    EXPECT_DOUBLE_EQ(sampler.Probability(0), 0.0);
    EXPECT_DOUBLE_EQ(sampler.Probability(2), 0.0);
    EXPECT_EQ(sampler.NumSampleable(), 2);

    std::mt19937_64 rng(1);
    EXPECT_THROW(sampler.SampleUnique(3, rng), ConfigurationError);
    for (int i = 0; i < 1000; ++i) {
        int index = sampler.Sample(rng);
        EXPECT_TRUE(index == 1 || index == 3);
    }
}

TEST(UnigramSamplerTest, InvalidTablesThrow) {
    EXPECT_THROW(UnigramSampler(std::vector<long long>{}), ConfigurationError);
    EXPECT_THROW(UnigramSampler(std::vector<long long>{0, 0}), ConfigurationError);
    EXPECT_THROW(UnigramSampler(std::vector<long long>{1, -1}), ConfigurationError);
    EXPECT_THROW(UnigramSampler(std::vector<long long>{1}, 0.75, 10).Probability(1), IndexError);
}
