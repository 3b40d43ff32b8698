#include "skipgram/model.hpp"
#include "skipgram/errors.hpp"
#include "skipgram/vocabulary.hpp"
#include <cmath>
#include <algorithm>
#include <fstream>

namespace skipgram {

std::vector<float>& Gradients::Row(Table table, int index, int dim) {
    auto& rows = (table == Table::kInput) ? input : output;
    auto& row = rows[index];
    if (row.empty()) row.assign(dim, 0.0f);
    return row;
}

EmbeddingModel::EmbeddingModel(int vocab_size, const Config& config)
    : vocab_size_(vocab_size), config_(config), rng_(config.seed) {
    if (vocab_size_ < 1) {
        throw ConfigurationError("Vocabulary size must be >= 1, got " + std::to_string(vocab_size_));
    }
    if (config_.hidden_dim < 1) {
        throw ConfigurationError("Hidden dimension must be >= 1, got " +
                                 std::to_string(config_.hidden_dim));
    }
    if (!(config_.learning_rate > 0.0f)) {
        throw ConfigurationError("Learning rate must be positive");
    }
    InitNet();
}

void EmbeddingModel::InitNet() {
    size_t vocab_size = vocab_size_;
    size_t layer_size = config_.hidden_dim;

    // 初始化输入层 embedding：均匀分布 [-0.5/dim, 0.5/dim]
    input_.resize(vocab_size * layer_size);
    std::uniform_real_distribution<float> dist(-0.5f / layer_size, 0.5f / layer_size);
    for (auto& val : input_) {
        val = dist(rng_);
    }

    // 输出层权重和偏置初始化为 0
    output_.assign(vocab_size * layer_size, 0.0f);
    bias_.assign(vocab_size, 0.0f);

    if (config_.optimizer == Optimizer::kAdam) {
        input_m_.assign(input_.size(), 0.0f);
        input_v_.assign(input_.size(), 0.0f);
        output_m_.assign(output_.size(), 0.0f);
        output_v_.assign(output_.size(), 0.0f);
        bias_m_.assign(bias_.size(), 0.0f);
        bias_v_.assign(bias_.size(), 0.0f);
    }
}

void EmbeddingModel::CheckIndex(int index) const {
    if (index < 0 || index >= vocab_size_) {
        throw IndexError("Embedding index " + std::to_string(index) +
                         " out of range [0, " + std::to_string(vocab_size_) + ")");
    }
}

const float* EmbeddingModel::Lookup(Table table, int index) const {
    CheckIndex(index);
    size_t offset = static_cast<size_t>(index) * config_.hidden_dim;
    return (table == Table::kInput ? input_.data() : output_.data()) + offset;
}

float EmbeddingModel::Bias(int index) const {
    CheckIndex(index);
    return bias_[index];
}

void EmbeddingModel::Update(float* param, float* m, float* v, const float* grad, size_t n,
                            float bias_correction1, float bias_correction2) {
    float lr = config_.learning_rate;
    if (config_.optimizer == Optimizer::kSgd) {
        for (size_t c = 0; c < n; ++c) {
            param[c] -= lr * grad[c];
        }
        return;
    }

    // Adam：只更新本批次出现过的行（稀疏/lazy 更新）
    for (size_t c = 0; c < n; ++c) {
        m[c] = config_.beta1 * m[c] + (1.0f - config_.beta1) * grad[c];
        v[c] = config_.beta2 * v[c] + (1.0f - config_.beta2) * grad[c] * grad[c];
        float m_hat = m[c] / bias_correction1;
        float v_hat = v[c] / bias_correction2;
        param[c] -= lr * m_hat / (std::sqrt(v_hat) + config_.epsilon);
    }
}

void EmbeddingModel::ApplyGradients(const Gradients& grads) {
    // 先检查所有索引和形状，避免更新到一半才失败
    size_t layer_size = config_.hidden_dim;
    for (const auto* rows : {&grads.input, &grads.output}) {
        for (const auto& entry : *rows) {
            CheckIndex(entry.first);
            if (entry.second.size() != layer_size) {
                throw ShapeMismatchError("Gradient row has " + std::to_string(entry.second.size()) +
                                         " entries, expected " + std::to_string(layer_size));
            }
        }
    }
    for (const auto& entry : grads.bias) {
        CheckIndex(entry.first);
    }

    step_++;
    float bc1 = 1.0f, bc2 = 1.0f;
    if (config_.optimizer == Optimizer::kAdam) {
        bc1 = 1.0f - std::pow(config_.beta1, static_cast<float>(step_));
        bc2 = 1.0f - std::pow(config_.beta2, static_cast<float>(step_));
    }
    bool adam = config_.optimizer == Optimizer::kAdam;

    for (const auto& entry : grads.input) {
        size_t offset = static_cast<size_t>(entry.first) * layer_size;
        Update(input_.data() + offset,
               adam ? input_m_.data() + offset : nullptr,
               adam ? input_v_.data() + offset : nullptr,
               entry.second.data(), layer_size, bc1, bc2);
    }
    for (const auto& entry : grads.output) {
        size_t offset = static_cast<size_t>(entry.first) * layer_size;
        Update(output_.data() + offset,
               adam ? output_m_.data() + offset : nullptr,
               adam ? output_v_.data() + offset : nullptr,
               entry.second.data(), layer_size, bc1, bc2);
    }
    for (const auto& entry : grads.bias) {
        size_t offset = entry.first;
        Update(bias_.data() + offset,
               adam ? bias_m_.data() + offset : nullptr,
               adam ? bias_v_.data() + offset : nullptr,
               &entry.second, 1, bc1, bc2);
    }
}

std::vector<float> EmbeddingModel::GetWordVector(int word_index) const {
    const float* vec = Lookup(Table::kInput, word_index);
    return std::vector<float>(vec, vec + config_.hidden_dim);
}

void EmbeddingModel::SaveVectors(const Vocabulary& vocab, const std::string& filename,
                                 bool binary) const {
    if (vocab.Size() != static_cast<size_t>(vocab_size_)) {
        throw ConfigurationError("Vocabulary has " + std::to_string(vocab.Size()) +
                                 " words, model has " + std::to_string(vocab_size_));
    }

    std::ofstream file(filename, binary ? std::ios::binary : std::ios::out);
    if (!file) {
        throw std::runtime_error("Cannot open vector file for writing: " + filename);
    }

    file << vocab_size_ << " " << config_.hidden_dim << "\n";

    for (int i = 0; i < vocab_size_; ++i) {
        file << vocab.GetWord(i).word << " ";
        const float* vec = Lookup(Table::kInput, i);

        if (binary) {
            file.write(reinterpret_cast<const char*>(vec),
                       config_.hidden_dim * sizeof(float));
        } else {
            for (int c = 0; c < config_.hidden_dim; ++c) {
                file << vec[c] << " ";
            }
        }
        file << "\n";
    }

    if (!file) {
        throw std::runtime_error("Error writing vector file: " + filename);
    }
}

void EmbeddingModel::LoadVectors(const Vocabulary& vocab, const std::string& filename,
                                 bool binary) {
    std::ifstream file(filename, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open vector file: " + filename);
    }

    size_t file_vocab_size;
    size_t vector_size;
    if (!(file >> file_vocab_size >> vector_size)) {
        throw std::runtime_error("Malformed vector file header: " + filename);
    }

    if (vector_size != static_cast<size_t>(config_.hidden_dim)) {
        throw std::runtime_error("Vector size mismatch: file has " +
                                 std::to_string(vector_size) + ", config has " +
                                 std::to_string(config_.hidden_dim));
    }

    std::vector<float> vec(vector_size);
    std::string word;
    for (size_t i = 0; i < file_vocab_size; ++i) {
        if (!(file >> word)) {
            throw std::runtime_error("Unexpected end of vector file: " + filename);
        }

        if (binary) {
            file.get();  // 跳过词后面的空格
            file.read(reinterpret_cast<char*>(vec.data()), vector_size * sizeof(float));
        } else {
            for (size_t j = 0; j < vector_size; ++j) {
                file >> vec[j];
            }
        }
        if (!file) {
            throw std::runtime_error("Truncated vector for '" + word + "' in " + filename);
        }

        // 词表中没有的词直接忽略
        int index = vocab.GetWordIndex(word);
        if (index < 0 || index >= vocab_size_) continue;
        std::copy(vec.begin(), vec.end(), input_.begin() + static_cast<size_t>(index) * vector_size);
    }
}

} // namespace skipgram
