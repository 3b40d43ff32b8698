#include "skipgram/corpus.hpp"

#include <stdexcept>
#include <utility>

namespace skipgram {

InMemoryCorpus::InMemoryCorpus(std::vector<std::vector<std::string>> docs)
    : docs_(std::move(docs)) {}

void InMemoryCorpus::Rewind() {
    doc_ = 0;
    pos_ = 0;
    started_ = false;
}

bool InMemoryCorpus::NextDocument() {
    if (started_) {
        if (doc_ < docs_.size()) doc_++;
    } else {
        started_ = true;
    }
    pos_ = 0;
    return doc_ < docs_.size();
}

bool InMemoryCorpus::NextToken(std::string* token) {
    if (!started_ || doc_ >= docs_.size()) return false;
    const auto& doc = docs_[doc_];
    if (pos_ >= doc.size()) return false;
    *token = doc[pos_++];
    return true;
}

TextFileCorpus::TextFileCorpus(const std::string& filename)
    : filename_(filename), file_(filename) {
    if (!file_) {
        throw std::runtime_error("Cannot open training file: " + filename);
    }
}

void TextFileCorpus::Rewind() {
    file_.clear();
    file_.seekg(0);
    if (!file_) {
        throw std::runtime_error("Cannot rewind training file: " + filename_);
    }
    in_document_ = false;
}

bool TextFileCorpus::NextDocument() {
    if (!std::getline(file_, line_)) {
        // 读取失败但不是EOF：磁盘或流错误，不能当作语料结束
        if (file_.bad()) {
            throw std::runtime_error("Error reading training file: " + filename_);
        }
        in_document_ = false;
        return false;
    }
    tokens_.clear();
    tokens_.str(line_);
    in_document_ = true;
    return true;
}

bool TextFileCorpus::NextToken(std::string* token) {
    if (!in_document_) return false;
    if (tokens_ >> *token) return true;
    in_document_ = false;
    return false;
}

} // namespace skipgram
