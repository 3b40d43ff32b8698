#pragma once

#include <cstdint>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

namespace skipgram {

class Vocabulary;

// 两张独立的参数表：输入词向量 / 输出(上下文)词向量
enum class Table { kInput, kOutput };

// 稀疏梯度：只记录本批次涉及到的行
struct Gradients {
    std::unordered_map<int, std::vector<float>> input;
    std::unordered_map<int, std::vector<float>> output;
    std::unordered_map<int, float> bias;

    // 取某一行的梯度，不存在时按 dim 初始化为 0
    std::vector<float>& Row(Table table, int index, int dim);

    bool Empty() const { return input.empty() && output.empty() && bias.empty(); }
};

// 训练用的数值模型接口：查表 + 应用梯度
class NumericModel {
public:
    virtual ~NumericModel() = default;

    virtual int VocabSize() const = 0;
    virtual int HiddenDim() const = 0;

    // 返回长度为 HiddenDim() 的向量，越界抛 IndexError
    virtual const float* Lookup(Table table, int index) const = 0;
    virtual float Bias(int index) const = 0;

    // 沿梯度下降方向更新参数
    virtual void ApplyGradients(const Gradients& grads) = 0;
};

class EmbeddingModel : public NumericModel {
public:
    enum class Optimizer { kSgd, kAdam };

    struct Config {
        int hidden_dim = 300;            // 向量维度
        float learning_rate = 0.001f;    // 学习率
        Optimizer optimizer = Optimizer::kAdam;
        float beta1 = 0.9f;              // Adam 参数
        float beta2 = 0.999f;
        float epsilon = 1e-8f;
        uint64_t seed = 1;

        Config() = default;
    };

    EmbeddingModel(int vocab_size, const Config& config);

    int VocabSize() const override { return vocab_size_; }
    int HiddenDim() const override { return config_.hidden_dim; }
    const float* Lookup(Table table, int index) const override;
    float Bias(int index) const override;
    void ApplyGradients(const Gradients& grads) override;

    long long steps() const { return step_; }

    // 获取词向量（输入表）
    std::vector<float> GetWordVector(int word_index) const;

    // 保存/加载模型，格式与 word2vec 的向量文件相同
    void SaveVectors(const Vocabulary& vocab, const std::string& filename, bool binary = false) const;
    void LoadVectors(const Vocabulary& vocab, const std::string& filename, bool binary = false);

private:
    int vocab_size_;
    Config config_;

    // 网络权重
    std::vector<float> input_;     // 输入层 embedding  [vocab_size × hidden_dim]
    std::vector<float> output_;    // 输出层权重        [vocab_size × hidden_dim]
    std::vector<float> bias_;      // 输出层偏置        [vocab_size]

    // Adam 一阶/二阶矩，与参数同形
    std::vector<float> input_m_, input_v_;
    std::vector<float> output_m_, output_v_;
    std::vector<float> bias_m_, bias_v_;
    long long step_ = 0;

    std::mt19937_64 rng_;

    void InitNet();
    void CheckIndex(int index) const;
    void Update(float* param, float* m, float* v, const float* grad, size_t n,
                float bias_correction1, float bias_correction2);
};

} // namespace skipgram
