#pragma once

#include <cstdint>
#include <random>
#include <vector>

#include "skipgram/batch_assembler.hpp"
#include "skipgram/model.hpp"
#include "skipgram/unigram_sampler.hpp"

namespace skipgram {

// 训练目标：给定一批 (input, label)，计算标量损失及其梯度
class Objective {
public:
    virtual ~Objective() = default;

    // grads 为 nullptr 时只计算损失
    virtual float Loss(const Batch& batch, const NumericModel& model, Gradients* grads) = 0;

    // 计算损失并更新模型，返回本批次的损失
    float Minimize(const Batch& batch, NumericModel* model);

protected:
    // 检查 batch 的形状和索引范围
    static void CheckBatch(const Batch& batch, const NumericModel& model);
};

// =============================================================================
// 负采样（Negative Sampling）
// =============================================================================
//
// 每个批次从 count^0.75 分布中不放回地抽 k 个负样本，整批共享：
//
//   true_logit[b]   = in[b] · out[label[b]] + bias[label[b]]
//   neg_logit[b][n] = in[b] · out[neg[n]]   + bias[neg[n]]
//
//   loss = ( Σ_b -log σ(true_logit[b]) + Σ_b Σ_n -log(1 - σ(neg_logit[b][n])) ) / batch
//
// 只有输入词、真实标签和负样本对应的行会得到梯度。
// =============================================================================
class NegativeSamplingObjective : public Objective {
public:
    NegativeSamplingObjective(const std::vector<long long>& counts, int num_sampled,
                              uint64_t seed = 1,
                              size_t table_size = UnigramSampler::kDefaultTableSize);

    float Loss(const Batch& batch, const NumericModel& model, Gradients* grads) override;

    // 使用给定的负样本计算损失
    float LossWithNegatives(const Batch& batch, const NumericModel& model,
                            const std::vector<int>& negatives, Gradients* grads) const;

    const UnigramSampler& sampler() const { return sampler_; }
    const std::vector<int>& last_negatives() const { return negatives_; }

private:
    int num_sampled_;
    int vocab_size_;
    UnigramSampler sampler_;
    std::mt19937_64 rng_;
    std::vector<int> negatives_;
};

// 完整 softmax：对整个词表计算 logits，再做交叉熵
// 代价 O(vocab_size)，用于关闭负采样时以及作为正确性参照
class FullSoftmaxObjective : public Objective {
public:
    float Loss(const Batch& batch, const NumericModel& model, Gradients* grads) override;
};

// 数值稳定的 log(1 + exp(x))
float Softplus(float x);
float Sigmoid(float x);

} // namespace skipgram
