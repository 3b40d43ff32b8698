#pragma once

#include <algorithm>
#include <string>
#include <vector>

#include "skipgram/corpus.hpp"
#include "skipgram/errors.hpp"

namespace skipgram {

// 一个训练样本：中心词 + 上下文词
template <typename Token>
struct WordPair {
    Token center;
    Token context;

    bool operator==(const WordPair& other) const {
        return center == other.center && context == other.context;
    }
};

// 样本流的拉取接口
template <typename Token>
class PairStream {
public:
    virtual ~PairStream() = default;

    // 取下一个样本，流结束时返回 false
    virtual bool Next(WordPair<Token>* pair) = 0;
};

// 固定容量的环形窗口，满了以后写入会覆盖最旧的元素
// 容量在构造时确定，之后不再分配内存
template <typename Token>
class RingWindow {
public:
    explicit RingWindow(size_t capacity) : slots_(capacity) {}

    void Clear() {
        head_ = 0;
        size_ = 0;
    }

    void Push(const Token& token) {
        if (size_ < slots_.size()) {
            slots_[(head_ + size_) % slots_.size()] = token;
            size_++;
        } else {
            slots_[head_] = token;
            head_ = (head_ + 1) % slots_.size();
        }
    }

    // i = 0 为最旧的元素
    const Token& At(size_t i) const { return slots_[(head_ + i) % slots_.size()]; }

    size_t Size() const { return size_; }
    size_t Capacity() const { return slots_.size(); }

private:
    std::vector<Token> slots_;
    size_t head_ = 0;
    size_t size_ = 0;
};

// =============================================================================
// 滑动窗口样本生成器
// =============================================================================
//
// 对每个文档，产出所有满足 0 < |i - j| <= span 的 (word[i], word[j])。
// 顺序：按中心词位置，再按上下文位置升序。
//
// 举例：span = 2，文档 "a b c d e"
//   a -> b c
//   b -> a c d
//   c -> a b d e
//   d -> b c e
//   e -> c d
//
// 只保留 2*span+1 个词的窗口：
//   - 中心词后面的 span 个词读入（或文档结束）之后，该中心词才会产出样本
//   - 文档开头/结尾的词窗口不完整，只和存在的上下文配对
//   - 文档比窗口短时同样成立
//   - 每个文档开始时清空窗口，不跨文档配对
// =============================================================================
template <typename Token>
class WindowPairGenerator : public PairStream<Token> {
public:
    WindowPairGenerator(TokenStream<Token>& source, int span)
        : source_(source), span_(CheckSpan(span)), window_(2 * static_cast<size_t>(span_) + 1) {}

    bool Next(WordPair<Token>* pair) override {
        while (true) {
            if (!in_document_) {
                if (!source_.NextDocument()) return false;
                StartDocument();
            }

            // 保证 center_ 之后的 span 个词已经在窗口里
            Fill();

            // 当前文档的所有中心词都处理完了
            if (center_ >= loaded_) {
                in_document_ = false;
                continue;
            }

            long long last = std::min(loaded_ - 1, center_ + span_);
            if (context_ == center_) context_++;
            if (context_ <= last) {
                pair->center = Get(center_);
                pair->context = Get(context_);
                context_++;
                return true;
            }

            // 下一个中心词
            center_++;
            context_ = std::max(0LL, center_ - span_);
        }
    }

private:
    TokenStream<Token>& source_;
    int span_;
    RingWindow<Token> window_;

    bool in_document_ = false;
    bool exhausted_ = false;   // 当前文档已读完
    long long loaded_ = 0;     // 当前文档已读入的词数（= 下一个词的位置）
    long long center_ = 0;
    long long context_ = 0;

    static int CheckSpan(int span) {
        if (span < 1) {
            throw ConfigurationError("Window span must be >= 1, got " + std::to_string(span));
        }
        return span;
    }

    void StartDocument() {
        window_.Clear();
        in_document_ = true;
        exhausted_ = false;
        loaded_ = 0;
        center_ = 0;
        context_ = 0;
    }

    void Fill() {
        Token token;
        while (!exhausted_ && loaded_ <= center_ + span_) {
            if (source_.NextToken(&token)) {
                window_.Push(token);
                loaded_++;
            } else {
                exhausted_ = true;
            }
        }
    }

    // 按文档内的绝对位置取词，位置必须在窗口内
    const Token& Get(long long pos) const {
        long long oldest = loaded_ - static_cast<long long>(window_.Size());
        return window_.At(static_cast<size_t>(pos - oldest));
    }
};

} // namespace skipgram
