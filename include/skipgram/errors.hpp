#pragma once

#include <stdexcept>
#include <string>

namespace skipgram {

// 在调用 SubsampledReader::CountWords()/Fit() 之前读取
class NotFittedError : public std::logic_error {
public:
    explicit NotFittedError(const std::string& what) : std::logic_error(what) {}
};

// 参数非法：窗口 < 1、batch < 1、负采样数 >= 词表大小 等
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& what) : std::invalid_argument(what) {}
};

// 词索引越界 [0, vocab_size)
class IndexError : public std::out_of_range {
public:
    explicit IndexError(const std::string& what) : std::out_of_range(what) {}
};

// batch 的 inputs/labels/actual_size 不一致
class ShapeMismatchError : public std::length_error {
public:
    explicit ShapeMismatchError(const std::string& what) : std::length_error(what) {}
};

} // namespace skipgram
