#pragma once

#include <string>
#include <utility>
#include <vector>

#include <cstdint>
#include <random>
#include <stdexcept>

#include "skipgram/errors.hpp"
#include "skipgram/model.hpp"
#include "skipgram/window_pair_generator.hpp"

// 测试用的临时文件路径（位于全局环境创建的临时目录下）
std::string ScratchPath(const std::string& name);

// 由 vector 提供的样本流
class VectorPairStream : public skipgram::PairStream<int> {
public:
    explicit VectorPairStream(std::vector<skipgram::WordPair<int>> pairs)
        : pairs_(std::move(pairs)) {}

    bool Next(skipgram::WordPair<int>* pair) override {
        if (pos_ >= pairs_.size()) return false;
        *pair = pairs_[pos_++];
        return true;
    }

private:
    std::vector<skipgram::WordPair<int>> pairs_;
    size_t pos_ = 0;
};

// 参数可以直接读写的数值模型，记录 ApplyGradients 的调用次数
class TableModel : public skipgram::NumericModel {
public:
    TableModel(int vocab_size, int hidden_dim)
        : vocab_size_(vocab_size), hidden_dim_(hidden_dim),
          input(static_cast<size_t>(vocab_size) * hidden_dim, 0.0f),
          output(static_cast<size_t>(vocab_size) * hidden_dim, 0.0f),
          bias(vocab_size, 0.0f) {}

    // 所有参数取自 N(0, stddev)
    void Randomize(uint64_t seed, float stddev) {
        std::mt19937_64 rng(seed);
        std::normal_distribution<float> dist(0.0f, stddev);
        for (auto& v : input) v = dist(rng);
        for (auto& v : output) v = dist(rng);
        for (auto& v : bias) v = dist(rng);
    }

    int VocabSize() const override { return vocab_size_; }
    int HiddenDim() const override { return hidden_dim_; }

    const float* Lookup(skipgram::Table table, int index) const override {
        Check(index);
        const auto& data = table == skipgram::Table::kInput ? input : output;
        return data.data() + static_cast<size_t>(index) * hidden_dim_;
    }

    float Bias(int index) const override {
        Check(index);
        return bias[index];
    }

    void ApplyGradients(const skipgram::Gradients& grads) override {
        if (fail_after >= 0 && applied >= fail_after) {
            throw std::runtime_error("model update failed");
        }
        last_grads = grads;
        applied++;
    }

    float* Param(skipgram::Table table, int index) {
        auto& data = table == skipgram::Table::kInput ? input : output;
        return data.data() + static_cast<size_t>(index) * hidden_dim_;
    }

private:
    int vocab_size_;
    int hidden_dim_;

    void Check(int index) const {
        if (index < 0 || index >= vocab_size_) {
            throw skipgram::IndexError("index out of range");
        }
    }

public:
    std::vector<float> input;
    std::vector<float> output;
    std::vector<float> bias;
    skipgram::Gradients last_grads;
    int applied = 0;
    int fail_after = -1;   // >= 0 时，第 fail_after+1 次更新抛异常
};
