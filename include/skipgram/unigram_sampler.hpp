#pragma once

#include <cstdint>
#include <random>
#include <vector>

namespace skipgram {

// 按 count^0.75 分布采样词索引（负采样表）
class UnigramSampler {
public:
    static constexpr double kDistortion = 0.75;
    static constexpr size_t kDefaultTableSize = 10000000;

    explicit UnigramSampler(const std::vector<long long>& counts,
                            double distortion = kDistortion,
                            size_t table_size = kDefaultTableSize);

    int Sample(std::mt19937_64& rng) const;

    // 不放回地采样 k 个不同的索引（重复的直接拒绝重采）
    std::vector<int> SampleUnique(int k, std::mt19937_64& rng) const;

    // 索引 i 在采样表中实际占的比例
    double Probability(int index) const;

    // 至少占一个槽位、可以被采到的词数
    int NumSampleable() const { return sampleable_; }

private:
    std::vector<int> table_;
    std::vector<size_t> slots_;
    int sampleable_ = 0;
};

} // namespace skipgram
