#pragma once

#include <cstdint>
#include <random>
#include <string>

#include "skipgram/corpus.hpp"
#include "skipgram/vocabulary.hpp"

namespace skipgram {

class SubsampledReader;

// Read() 返回的过滤后词流
class SubsampledStream : public TokenStream<std::string> {
public:
    SubsampledStream(SubsampledReader& reader, TokenStream<std::string>& docs)
        : reader_(reader), docs_(docs) {}

    bool NextDocument() override { return docs_.NextDocument(); }
    bool NextToken(std::string* token) override;

private:
    SubsampledReader& reader_;
    TokenStream<std::string>& docs_;
};

// 高频词下采样（Subsampling）
// 先用 CountWords()/Fit() 得到词频，再用 Read() 按概率丢弃高频词
class SubsampledReader {
public:
    static constexpr double kDefaultSubsample = 1e-3;

    explicit SubsampledReader(double subsample = kDefaultSubsample,
                              uint64_t seed = std::mt19937_64::default_seed);

    // 一次遍历语料统计词频
    void CountWords(TokenStream<std::string>& docs, int min_count = 1);

    // 使用已有的词汇表（例如从文件加载）
    void Fit(const Vocabulary& vocab);

    bool fitted() const { return fitted_; }
    double subsample() const { return subsample_; }
    const Vocabulary& vocabulary() const;

    // 保留概率 P(keep) = (sqrt(f/t) + 1) * t/f 的等价形式 sqrt(f/t + 1) * t/f，上限 1.0
    // f = count / total_words，未登录词按 count = 1 计算，count <= 1 时总是保留
    double KeepProbability(const std::string& word) const;
    double KeepProbabilityForCount(long long count) const;

    // 对一次出现做独立的随机决定
    bool Include(const std::string& word);

    SubsampledStream Read(TokenStream<std::string>& docs);

private:
    double subsample_;
    bool fitted_ = false;
    Vocabulary vocab_;
    std::mt19937_64 rng_;
    std::uniform_real_distribution<double> uniform_dist_{0.0, 1.0};

    void CheckFitted(const char* op) const;
};

} // namespace skipgram
