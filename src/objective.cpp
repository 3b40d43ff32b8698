#include "skipgram/objective.hpp"
#include "skipgram/errors.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

namespace skipgram {

namespace {

float Dot(const float* a, const float* b, int n) {
    float f = 0.0f;
    for (int c = 0; c < n; ++c) {
        f += a[c] * b[c];
    }
    return f;
}

// row += g * vec
void Axpy(std::vector<float>& row, float g, const float* vec) {
    for (size_t c = 0; c < row.size(); ++c) {
        row[c] += g * vec[c];
    }
}

}  // namespace

float Softplus(float x) {
    return std::max(x, 0.0f) + std::log1p(std::exp(-std::fabs(x)));
}

float Sigmoid(float x) {
    if (x >= 0.0f) {
        return 1.0f / (1.0f + std::exp(-x));
    }
    float e = std::exp(x);
    return e / (1.0f + e);
}

float Objective::Minimize(const Batch& batch, NumericModel* model) {
    Gradients grads;
    float loss = Loss(batch, *model, &grads);
    model->ApplyGradients(grads);
    return loss;
}

void Objective::CheckBatch(const Batch& batch, const NumericModel& model) {
    if (batch.actual_size == 0 ||
        batch.inputs.size() != batch.actual_size ||
        batch.labels.size() != batch.actual_size ||
        batch.actual_size > batch.batch_size) {
        throw ShapeMismatchError("Inconsistent batch: actual_size=" +
                                 std::to_string(batch.actual_size) +
                                 " batch_size=" + std::to_string(batch.batch_size) +
                                 " inputs=" + std::to_string(batch.inputs.size()) +
                                 " labels=" + std::to_string(batch.labels.size()));
    }

    int vocab_size = model.VocabSize();
    for (size_t b = 0; b < batch.actual_size; ++b) {
        for (int index : {batch.inputs[b], batch.labels[b]}) {
            if (index < 0 || index >= vocab_size) {
                throw IndexError("Batch references word index " + std::to_string(index) +
                                 " outside [0, " + std::to_string(vocab_size) + ")");
            }
        }
    }
}

NegativeSamplingObjective::NegativeSamplingObjective(const std::vector<long long>& counts,
                                                     int num_sampled, uint64_t seed,
                                                     size_t table_size)
    : num_sampled_(num_sampled),
      vocab_size_(static_cast<int>(counts.size())),
      sampler_(counts, UnigramSampler::kDistortion, table_size),
      rng_(seed) {
    if (num_sampled_ < 0) {
        throw ConfigurationError("Negative sample count must be >= 0, got " +
                                 std::to_string(num_sampled_));
    }
    if (num_sampled_ > 0 && num_sampled_ >= vocab_size_) {
        throw ConfigurationError("Negative sample count " + std::to_string(num_sampled_) +
                                 " must be smaller than the vocabulary size " +
                                 std::to_string(vocab_size_));
    }
    if (num_sampled_ > sampler_.NumSampleable()) {
        throw ConfigurationError("Only " + std::to_string(sampler_.NumSampleable()) +
                                 " words can be sampled, " + std::to_string(num_sampled_) +
                                 " negatives requested");
    }
}

float NegativeSamplingObjective::Loss(const Batch& batch, const NumericModel& model,
                                      Gradients* grads) {
    if (model.VocabSize() != vocab_size_) {
        throw ConfigurationError("Model vocabulary size " + std::to_string(model.VocabSize()) +
                                 " does not match sampler vocabulary size " +
                                 std::to_string(vocab_size_));
    }
    CheckBatch(batch, model);

    // 整个批次共享同一组负样本
    negatives_ = sampler_.SampleUnique(num_sampled_, rng_);
    return LossWithNegatives(batch, model, negatives_, grads);
}

float NegativeSamplingObjective::LossWithNegatives(const Batch& batch, const NumericModel& model,
                                                   const std::vector<int>& negatives,
                                                   Gradients* grads) const {
    CheckBatch(batch, model);

    int dim = model.HiddenDim();
    float scale = 1.0f / batch.actual_size;

    // 负样本的输出向量和偏置，整批复用
    std::vector<const float*> neg_w;
    std::vector<float> neg_b;
    neg_w.reserve(negatives.size());
    neg_b.reserve(negatives.size());
    for (int neg : negatives) {
        neg_w.push_back(model.Lookup(Table::kOutput, neg));
        neg_b.push_back(model.Bias(neg));
    }

    double total = 0.0;
    for (size_t b = 0; b < batch.actual_size; ++b) {
        int input = batch.inputs[b];
        int label = batch.labels[b];
        const float* in = model.Lookup(Table::kInput, input);

        // -------------------------------------------------------------------------
        // 正样本：label = 1，loss = softplus(-x)，dloss/dx = σ(x) - 1
        // -------------------------------------------------------------------------
        const float* true_w = model.Lookup(Table::kOutput, label);
        float true_logit = Dot(in, true_w, dim) + model.Bias(label);
        total += Softplus(-true_logit);

        std::vector<float>* in_grad = nullptr;
        if (grads) {
            float g = (Sigmoid(true_logit) - 1.0f) * scale;
            in_grad = &grads->Row(Table::kInput, input, dim);
            Axpy(*in_grad, g, true_w);
            Axpy(grads->Row(Table::kOutput, label, dim), g, in);
            grads->bias[label] += g;
        }

        // -------------------------------------------------------------------------
        // 负样本：label = 0，loss = softplus(x)，dloss/dx = σ(x)
        // -------------------------------------------------------------------------
        for (size_t n = 0; n < negatives.size(); ++n) {
            float neg_logit = Dot(in, neg_w[n], dim) + neg_b[n];
            total += Softplus(neg_logit);

            if (grads) {
                float g = Sigmoid(neg_logit) * scale;
                Axpy(*in_grad, g, neg_w[n]);
                Axpy(grads->Row(Table::kOutput, negatives[n], dim), g, in);
                grads->bias[negatives[n]] += g;
            }
        }
    }

    return static_cast<float>(total * scale);
}

float FullSoftmaxObjective::Loss(const Batch& batch, const NumericModel& model,
                                 Gradients* grads) {
    CheckBatch(batch, model);

    int dim = model.HiddenDim();
    int vocab_size = model.VocabSize();
    float scale = 1.0f / batch.actual_size;

    std::vector<float> logits(vocab_size);
    double total = 0.0;

    for (size_t b = 0; b < batch.actual_size; ++b) {
        int input = batch.inputs[b];
        int label = batch.labels[b];
        const float* in = model.Lookup(Table::kInput, input);

        // logits[v] = in · out[v] + bias[v]
        float max_logit = -std::numeric_limits<float>::infinity();
        for (int v = 0; v < vocab_size; ++v) {
            logits[v] = Dot(in, model.Lookup(Table::kOutput, v), dim) + model.Bias(v);
            max_logit = std::max(max_logit, logits[v]);
        }

        // log-sum-exp
        double sum = 0.0;
        for (int v = 0; v < vocab_size; ++v) {
            sum += std::exp(static_cast<double>(logits[v] - max_logit));
        }
        double log_z = max_logit + std::log(sum);
        total += log_z - logits[label];

        if (grads) {
            // dloss/dlogit[v] = softmax[v] - onehot[v]
            auto& in_grad = grads->Row(Table::kInput, input, dim);
            for (int v = 0; v < vocab_size; ++v) {
                float g = static_cast<float>(std::exp(logits[v] - log_z));
                if (v == label) g -= 1.0f;
                g *= scale;
                const float* out = model.Lookup(Table::kOutput, v);
                Axpy(in_grad, g, out);
                Axpy(grads->Row(Table::kOutput, v, dim), g, in);
                grads->bias[v] += g;
            }
        }
    }

    return static_cast<float>(total * scale);
}

} // namespace skipgram
