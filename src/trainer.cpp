#include "skipgram/trainer.hpp"
#include "skipgram/batch_assembler.hpp"
#include "skipgram/errors.hpp"
#include "skipgram/subsampled_reader.hpp"
#include "skipgram/vocabulary.hpp"
#include "skipgram/window_pair_generator.hpp"
#include <chrono>
#include <cstdio>
#include <iostream>

namespace skipgram {

void Trainer::Config::Validate() const {
    if (window < 1) {
        throw ConfigurationError("window must be >= 1, got " + std::to_string(window));
    }
    if (batch_size < 1) {
        throw ConfigurationError("batch_size must be >= 1, got " + std::to_string(batch_size));
    }
    if (negative < 0) {
        throw ConfigurationError("negative must be >= 0, got " + std::to_string(negative));
    }
    if (epochs < 0) {
        throw ConfigurationError("epochs must be >= 0, got " + std::to_string(epochs));
    }
    if (report_every < 0) {
        throw ConfigurationError("report_every must be >= 0, got " + std::to_string(report_every));
    }
    if (!(sample >= 0.0 && sample < 1.0)) {
        throw ConfigurationError("sample must be in [0, 1), got " + std::to_string(sample));
    }
    if (model_config.hidden_dim < 1) {
        throw ConfigurationError("hidden_dim must be >= 1, got " +
                                 std::to_string(model_config.hidden_dim));
    }
    if (!(model_config.learning_rate > 0.0f)) {
        throw ConfigurationError("learning_rate must be positive");
    }
}

Trainer::Trainer(const Vocabulary& vocab, const Config& config)
    : vocab_(vocab), config_(config), reader_(config.sample, config.seed) {
    config_.Validate();
    if (vocab_.Size() == 0) {
        throw ConfigurationError("Cannot train on an empty vocabulary");
    }
    model_ = std::make_unique<EmbeddingModel>(static_cast<int>(vocab_.Size()), config_.model_config);
    InitObjective();
}

Trainer::Trainer(const Vocabulary& vocab, const Config& config,
                 std::unique_ptr<NumericModel> model)
    : vocab_(vocab), config_(config), model_(std::move(model)),
      reader_(config.sample, config.seed) {
    config_.Validate();
    if (!model_) {
        throw ConfigurationError("Trainer requires a model");
    }
    if (static_cast<size_t>(model_->VocabSize()) != vocab_.Size()) {
        throw ConfigurationError("Model vocabulary size " + std::to_string(model_->VocabSize()) +
                                 " does not match vocabulary size " +
                                 std::to_string(vocab_.Size()));
    }
    InitObjective();
}

void Trainer::InitObjective() {
    reader_.Fit(vocab_);

    if (config_.sampling) {
        objective_ = std::make_unique<NegativeSamplingObjective>(
            vocab_.Counts(), config_.negative, config_.seed, config_.unigram_table_size);
    } else {
        objective_ = std::make_unique<FullSoftmaxObjective>();
    }
}

TrainingStats Trainer::Train(Corpus& corpus) {
    TrainingStats stats;
    if (config_.epochs == 0) return stats;

    auto start_time = std::chrono::steady_clock::now();

    if (config_.report_every > 0) {
        std::cout << "Starting training...\n";
        std::cout << "Vocabulary size: " << vocab_.Size() << "\n";
        std::cout << "Objective: "
                  << (config_.sampling ? "negative sampling (k=" + std::to_string(config_.negative) + ")"
                                       : std::string("full softmax"))
                  << "\n";
    }

    for (int epoch = 1; epoch <= config_.epochs; ++epoch) {
        float mean_loss = TrainEpoch(corpus, epoch, &stats);
        stats.epoch_loss.push_back(mean_loss);
        stats.epochs = epoch;
    }

    if (config_.report_every > 0) {
        auto end_time = std::chrono::steady_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::seconds>(end_time - start_time);
        std::cout << "\nTraining completed in " << duration.count() << " seconds, "
                  << stats.updates << " updates\n";
    }
    return stats;
}

float Trainer::TrainEpoch(Corpus& corpus, int epoch, TrainingStats* stats) {
    corpus.Rewind();

    // =============================================================================
    // 流水线：语料 -> 下采样 -> 词索引 -> 窗口样本 -> 批次
    // 每一级都按需拉取，内存只与窗口和批次大小有关
    // =============================================================================
    SubsampledStream words = reader_.Read(corpus);
    IndexedTokenStream indices(words, vocab_);
    WindowPairGenerator<int> pairs(indices, config_.window);
    BatchAssembler batches(pairs, config_.batch_size);

    Batch batch;
    double loss_sum = 0.0;
    long long epoch_batches = 0;

    while (batches.Next(&batch)) {
        // 模型更新失败直接向上抛出，不重试
        float loss = objective_->Minimize(batch, model_.get());

        stats->updates++;
        stats->pairs += batch.actual_size;
        stats->last_loss = loss;
        loss_sum += loss;
        epoch_batches++;

        if (config_.report_every > 0 && stats->updates % config_.report_every == 0) {
            printf("\rEpoch %i iter %lld loss: %.3f  ", epoch, stats->updates, loss);
            fflush(stdout);
        }
    }

    return epoch_batches > 0 ? static_cast<float>(loss_sum / epoch_batches) : 0.0f;
}

} // namespace skipgram
