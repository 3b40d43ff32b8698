#pragma once

#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace skipgram {

// 两级拉取接口：文档 -> 词
// 调用方先 NextDocument()，再反复 NextToken() 直到返回 false
template <typename Token>
class TokenStream {
public:
    virtual ~TokenStream() = default;

    // 前进到下一个文档，没有更多文档时返回 false
    virtual bool NextDocument() = 0;

    // 读取当前文档的下一个词，文档结束时返回 false
    virtual bool NextToken(Token* token) = 0;
};

// 语料：可以在每个 epoch 开始时重新读取
class Corpus : public TokenStream<std::string> {
public:
    virtual void Rewind() = 0;
};

// 内存语料，主要用于测试和小数据
class InMemoryCorpus : public Corpus {
public:
    InMemoryCorpus() = default;
    explicit InMemoryCorpus(std::vector<std::vector<std::string>> docs);

    void Rewind() override;
    bool NextDocument() override;
    bool NextToken(std::string* token) override;

private:
    std::vector<std::vector<std::string>> docs_;
    size_t doc_ = 0;
    size_t pos_ = 0;
    bool started_ = false;
};

// 文本文件语料：每行一个文档，词之间以空白分隔
// 每次只在内存中保留当前行
class TextFileCorpus : public Corpus {
public:
    explicit TextFileCorpus(const std::string& filename);

    void Rewind() override;
    bool NextDocument() override;
    bool NextToken(std::string* token) override;

private:
    std::string filename_;
    std::ifstream file_;
    std::string line_;
    std::istringstream tokens_;
    bool in_document_ = false;
};

} // namespace skipgram
