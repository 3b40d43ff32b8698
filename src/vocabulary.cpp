#include "skipgram/vocabulary.hpp"
#include "skipgram/errors.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <iostream>

namespace skipgram {

void Vocabulary::Learn(TokenStream<std::string>& docs, int min_count, bool quiet) {
    if (min_count < 1) {
        throw ConfigurationError("min_count must be >= 1, got " + std::to_string(min_count));
    }

    // 初始化
    vocab_.clear();
    word_to_index_.clear();
    train_words_ = 0;

    // 统计词频
    std::string word;
    while (docs.NextDocument()) {
        while (docs.NextToken(&word)) {
            if (word.empty()) continue;

            train_words_++;

            // 进度显示（每10万词）
            if (!quiet && train_words_ % 100000 == 0) {
                std::cout << train_words_ / 1000 << "K\r" << std::flush;
            }

            auto it = word_to_index_.find(word);
            if (it == word_to_index_.end()) {
                word_to_index_[word] = static_cast<int>(vocab_.size());
                vocab_.emplace_back(word, 1);
            } else {
                vocab_[it->second].count++;
            }
        }
    }

    SortAndFilter(min_count);

    if (!quiet) {
        std::cout << "\nVocabulary size: " << vocab_.size() << "\n";
        std::cout << "Words in train file: " << train_words_ << "\n";
    }
}

void Vocabulary::LearnFromFile(const std::string& filename, int min_count) {
    TextFileCorpus corpus(filename);
    std::cout << "Learning vocabulary from " << filename << "...\n";
    Learn(corpus, min_count, false);
}

void Vocabulary::SortAndFilter(int min_count) {
    // 按词频降序排序，stable_sort 保证同频词顺序确定
    std::stable_sort(vocab_.begin(), vocab_.end(),
                     [](const VocabWord& a, const VocabWord& b) {
                         return a.count > b.count;
                     });

    // 重建哈希表并过滤低频词
    word_to_index_.clear();
    std::vector<VocabWord> filtered_vocab;

    for (auto& entry : vocab_) {
        if (entry.count >= min_count) {
            word_to_index_[entry.word] = static_cast<int>(filtered_vocab.size());
            filtered_vocab.push_back(std::move(entry));
        }
    }

    vocab_ = std::move(filtered_vocab);

    // 重新计算总词数（只计入保留下来的词）
    train_words_ = 0;
    for (const auto& entry : vocab_) {
        train_words_ += entry.count;
    }
}

int Vocabulary::GetWordIndex(const std::string& word) const {
    auto it = word_to_index_.find(word);
    return it != word_to_index_.end() ? it->second : -1;
}

const VocabWord& Vocabulary::GetWord(int index) const {
    if (index < 0 || static_cast<size_t>(index) >= vocab_.size()) {
        throw IndexError("Word index " + std::to_string(index) +
                         " out of range [0, " + std::to_string(vocab_.size()) + ")");
    }
    return vocab_[index];
}

std::vector<long long> Vocabulary::Counts() const {
    std::vector<long long> counts;
    counts.reserve(vocab_.size());
    for (const auto& entry : vocab_) {
        counts.push_back(entry.count);
    }
    return counts;
}

void Vocabulary::Save(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file) {
        throw std::runtime_error("Cannot open vocabulary file for writing: " + filename);
    }
    for (const auto& entry : vocab_) {
        file << entry.word << " " << entry.count << "\n";
    }
}

void Vocabulary::Load(const std::string& filename) {
    std::ifstream file(filename);
    if (!file) {
        throw std::runtime_error("Cannot open vocabulary file: " + filename);
    }

    std::vector<VocabWord> loaded;
    std::unordered_map<std::string, int> index;
    long long total = 0;

    std::string line;
    int line_no = 0;
    while (std::getline(file, line)) {
        line_no++;
        if (line.empty()) continue;

        std::istringstream fields(line);
        std::string word;
        long long count = 0;
        std::string extra;
        if (!(fields >> word >> count) || count < 0 || (fields >> extra)) {
            throw std::runtime_error("Malformed vocabulary line " + std::to_string(line_no) +
                                     " in " + filename);
        }
        if (index.count(word)) {
            throw std::runtime_error("Duplicate word '" + word + "' in " + filename);
        }
        index[word] = static_cast<int>(loaded.size());
        loaded.emplace_back(word, count);
        total += count;
    }

    vocab_ = std::move(loaded);
    word_to_index_ = std::move(index);
    train_words_ = total;
}

bool IndexedTokenStream::NextToken(int* index) {
    while (words_.NextToken(&word_)) {
        int word_index = vocab_.GetWordIndex(word_);
        // 未登录词（不在词汇表中）：跳过
        if (word_index == -1) {
            skipped_++;
            continue;
        }
        *index = word_index;
        return true;
    }
    return false;
}

} // namespace skipgram
