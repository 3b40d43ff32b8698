#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "skipgram/corpus.hpp"
#include "skipgram/model.hpp"
#include "skipgram/objective.hpp"
#include "skipgram/subsampled_reader.hpp"

namespace skipgram {

class Vocabulary;

struct TrainingStats {
    int epochs = 0;                    // 完成的 epoch 数
    long long updates = 0;             // 模型更新次数（批次数）
    long long pairs = 0;               // 处理过的样本数
    float last_loss = 0.0f;
    std::vector<float> epoch_loss;     // 每个 epoch 的平均损失
};

class Trainer {
public:
    struct Config {
        int window = 5;                  // 窗口半径 span
        double sample = 1e-3;            // 下采样阈值，0 表示不下采样
        int negative = 5;                // 负采样数量
        bool sampling = true;            // false 时使用完整 softmax
        int batch_size = 128;
        int epochs = 10;
        int report_every = 0;            // 每 N 个批次打印一次进度，0 表示不打印
        uint64_t seed = 1;
        size_t unigram_table_size = UnigramSampler::kDefaultTableSize;
        EmbeddingModel::Config model_config;

        Config() = default;

        // 参数非法时抛 ConfigurationError
        void Validate() const;
    };

    Trainer(const Vocabulary& vocab, const Config& config);

    // 使用外部提供的数值模型
    Trainer(const Vocabulary& vocab, const Config& config, std::unique_ptr<NumericModel> model);

    // 开始训练，每个 epoch 从头读一遍语料
    TrainingStats Train(Corpus& corpus);

    NumericModel& model() { return *model_; }
    const NumericModel& model() const { return *model_; }

private:
    const Vocabulary& vocab_;
    Config config_;
    std::unique_ptr<NumericModel> model_;
    std::unique_ptr<Objective> objective_;
    SubsampledReader reader_;

    void InitObjective();
    float TrainEpoch(Corpus& corpus, int epoch, TrainingStats* stats);
};

} // namespace skipgram
