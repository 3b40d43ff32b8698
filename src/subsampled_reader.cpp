#include "skipgram/subsampled_reader.hpp"
#include "skipgram/errors.hpp"

#include <cmath>

namespace skipgram {

bool SubsampledStream::NextToken(std::string* token) {
    while (docs_.NextToken(token)) {
        if (reader_.Include(*token)) return true;
    }
    return false;
}

SubsampledReader::SubsampledReader(double subsample, uint64_t seed)
    : subsample_(subsample), rng_(seed) {
    if (!(subsample_ >= 0.0 && subsample_ < 1.0)) {
        throw ConfigurationError("Subsample threshold must be in [0, 1), got " +
                                 std::to_string(subsample_));
    }
}

void SubsampledReader::CountWords(TokenStream<std::string>& docs, int min_count) {
    fitted_ = false;
    vocab_.Learn(docs, min_count);
    fitted_ = true;
}

void SubsampledReader::Fit(const Vocabulary& vocab) {
    vocab_ = vocab;
    fitted_ = true;
}

const Vocabulary& SubsampledReader::vocabulary() const {
    CheckFitted("vocabulary()");
    return vocab_;
}

void SubsampledReader::CheckFitted(const char* op) const {
    if (!fitted_) {
        throw NotFittedError(std::string("SubsampledReader::") + op +
                             " called before CountWords()");
    }
}

double SubsampledReader::KeepProbabilityForCount(long long count) const {
    // 阈值为 0 时关闭下采样
    if (subsample_ <= 0.0 || vocab_.TotalWords() <= 0) return 1.0;
    // 只出现一次的词和未登录词总是保留，与语料大小无关
    if (count <= 1) return 1.0;

    // =========================================================================
    // f >> t（高频词）：P(keep) ≈ sqrt(t/f)，接近 0
    // f <= 1.618t：P(keep) >= 1，总是保留
    // =========================================================================
    double freq = static_cast<double>(count) / vocab_.TotalWords();
    double keep_prob = std::sqrt(freq / subsample_ + 1.0) * (subsample_ / freq);
    return keep_prob < 1.0 ? keep_prob : 1.0;
}

double SubsampledReader::KeepProbability(const std::string& word) const {
    CheckFitted("KeepProbability()");
    int index = vocab_.GetWordIndex(word);
    long long count = index == -1 ? 1 : vocab_.GetWord(index).count;
    return KeepProbabilityForCount(count);
}

bool SubsampledReader::Include(const std::string& word) {
    double keep_prob = KeepProbability(word);
    if (keep_prob >= 1.0) return true;
    return uniform_dist_(rng_) < keep_prob;
}

SubsampledStream SubsampledReader::Read(TokenStream<std::string>& docs) {
    CheckFitted("Read()");
    return SubsampledStream(*this, docs);
}

} // namespace skipgram
