#include "skipgram/unigram_sampler.hpp"
#include "skipgram/errors.hpp"

#include <cmath>
#include <string>
#include <unordered_set>

namespace skipgram {

UnigramSampler::UnigramSampler(const std::vector<long long>& counts,
                               double distortion, size_t table_size) {
    if (counts.empty()) {
        throw ConfigurationError("Cannot build unigram table from an empty vocabulary");
    }
    if (table_size == 0) {
        throw ConfigurationError("Unigram table size must be positive");
    }

    double total_pow = 0.0;
    for (long long c : counts) {
        if (c < 0) {
            throw ConfigurationError("Negative word count in frequency table");
        }
        total_pow += std::pow(static_cast<double>(c), distortion);
    }
    if (total_pow <= 0.0) {
        throw ConfigurationError("Unigram frequency table has no positive counts");
    }

    // 每个词占据与 count^0.75 成比例的连续槽位
    table_.resize(table_size);
    slots_.assign(counts.size(), 0);

    size_t word_idx = 0;
    double cumulative_prob = std::pow(static_cast<double>(counts[0]), distortion) / total_pow;

    for (size_t i = 0; i < table_size; ++i) {
        // 跳过已经用完份额的词（包括 count 为 0 的词）
        while ((i + 0.5) / table_size > cumulative_prob && word_idx + 1 < counts.size()) {
            word_idx++;
            cumulative_prob += std::pow(static_cast<double>(counts[word_idx]), distortion) / total_pow;
        }
        table_[i] = static_cast<int>(word_idx);
        slots_[word_idx]++;
    }

    for (size_t n : slots_) {
        if (n > 0) sampleable_++;
    }
}

int UnigramSampler::Sample(std::mt19937_64& rng) const {
    std::uniform_int_distribution<size_t> table_dist(0, table_.size() - 1);
    return table_[table_dist(rng)];
}

std::vector<int> UnigramSampler::SampleUnique(int k, std::mt19937_64& rng) const {
    if (k < 0 || k > sampleable_) {
        throw ConfigurationError("Cannot draw " + std::to_string(k) +
                                 " unique samples from " + std::to_string(sampleable_) +
                                 " sampleable words");
    }

    std::vector<int> sampled;
    sampled.reserve(k);
    std::unordered_set<int> seen;
    while (static_cast<int>(sampled.size()) < k) {
        int candidate = Sample(rng);
        if (seen.insert(candidate).second) {
            sampled.push_back(candidate);
        }
    }
    return sampled;
}

double UnigramSampler::Probability(int index) const {
    if (index < 0 || static_cast<size_t>(index) >= slots_.size()) {
        throw IndexError("Word index " + std::to_string(index) + " out of range [0, " +
                         std::to_string(slots_.size()) + ")");
    }
    return static_cast<double>(slots_[index]) / table_.size();
}

} // namespace skipgram
