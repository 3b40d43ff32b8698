#pragma once

#include <string>
#include <vector>
#include <unordered_map>

#include "skipgram/corpus.hpp"

namespace skipgram {

struct VocabWord {
    std::string word;
    long long count;

    VocabWord(const std::string& w = "", long long c = 0)
        : word(w), count(c) {}
};

class Vocabulary {
public:
    Vocabulary() = default;

    // 一次完整遍历语料，统计词频并建立索引
    // 词按词频降序排列，同频词保持首次出现的顺序
    void Learn(TokenStream<std::string>& docs, int min_count = 1, bool quiet = true);

    // 从训练文件学习词汇表（每行一个文档）
    void LearnFromFile(const std::string& filename, int min_count = 1);

    // 保存/加载词汇表，格式为每行 "word count"
    void Save(const std::string& filename) const;
    void Load(const std::string& filename);

    // 查询
    int GetWordIndex(const std::string& word) const;
    const VocabWord& GetWord(int index) const;
    size_t Size() const { return vocab_.size(); }
    long long TotalWords() const { return train_words_; }

    // 词频表，与索引一一对应（负采样分布的输入）
    std::vector<long long> Counts() const;

private:
    std::vector<VocabWord> vocab_;
    std::unordered_map<std::string, int> word_to_index_;
    long long train_words_ = 0;

    void SortAndFilter(int min_count);
};

// 把词流映射为索引流，跳过未登录词
class IndexedTokenStream : public TokenStream<int> {
public:
    IndexedTokenStream(TokenStream<std::string>& words, const Vocabulary& vocab)
        : words_(words), vocab_(vocab) {}

    bool NextDocument() override { return words_.NextDocument(); }
    bool NextToken(int* index) override;

    long long skipped() const { return skipped_; }

private:
    TokenStream<std::string>& words_;
    const Vocabulary& vocab_;
    std::string word_;
    long long skipped_ = 0;
};

} // namespace skipgram
