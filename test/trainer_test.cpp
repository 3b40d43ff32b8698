#include <gtest/gtest.h>
#include "skipgram/errors.hpp"
#include "skipgram/trainer.hpp"
#include "skipgram/vocabulary.hpp"
#include "test_util.hpp"
#include <fstream>
#include <cstdlib>
#include <memory>

using namespace skipgram;

namespace {

// 记录 Rewind 次数的语料
class CountingCorpus : public InMemoryCorpus {
public:
    using InMemoryCorpus::InMemoryCorpus;

    void Rewind() override {
        rewinds++;
        InMemoryCorpus::Rewind();
    }

    int rewinds = 0;
};

std::vector<std::vector<std::string>> ToyDocs() {
    return {
        {"the", "cat", "sat", "on", "the", "mat"},
        {"the", "dog", "sat", "on", "the", "log"},
        {"a", "cat", "and", "a", "dog"},
        {"mat"},
        {},
    };
}

}  // namespace

class TrainerTest : public ::testing::Test {
protected:
    void SetUp() override {
        corpus = std::make_unique<CountingCorpus>(ToyDocs());
        vocab.Learn(*corpus);

        config.window = 2;
        config.sample = 0.0;
        config.negative = 3;
        config.batch_size = 4;
        config.epochs = 2;
        config.unigram_table_size = 10000;
        config.model_config.hidden_dim = 8;
        config.model_config.learning_rate = 0.05f;
    }

    std::unique_ptr<TableModel> MakeTableModel() {
        return std::make_unique<TableModel>(static_cast<int>(vocab.Size()), 8);
    }

    // 不下采样时每个 epoch 的样本数：|i-j| <= 2 的有序位置对
    long long PairsPerEpoch() const {
        long long pairs = 0;
        for (const auto& doc : ToyDocs()) {
            long long n = doc.size();
            for (long long i = 0; i < n; ++i) {
                for (long long j = 0; j < n; ++j) {
                    if (i != j && std::llabs(i - j) <= config.window) pairs++;
                }
            }
        }
        return pairs;
    }

    std::unique_ptr<CountingCorpus> corpus;
    Vocabulary vocab;
    Trainer::Config config;
};

TEST_F(TrainerTest, ZeroEpochsPerformsNoUpdates) {
    config.epochs = 0;
    auto model = MakeTableModel();
    TableModel* table = model.get();
    Trainer trainer(vocab, config, std::move(model));
    corpus->rewinds = 0;

    TrainingStats stats = trainer.Train(*corpus);
    EXPECT_EQ(stats.updates, 0);
    EXPECT_EQ(stats.epochs, 0);
    EXPECT_EQ(table->applied, 0);
    EXPECT_EQ(corpus->rewinds, 0);
}

TEST_F(TrainerTest, EveryPairReachesTheModelEachEpoch) {
    config.epochs = 3;
    auto model = MakeTableModel();
    TableModel* table = model.get();
    Trainer trainer(vocab, config, std::move(model));

    TrainingStats stats = trainer.Train(*corpus);
    long long pairs = PairsPerEpoch();
    long long batches = (pairs + config.batch_size - 1) / config.batch_size;

    EXPECT_EQ(stats.epochs, 3);
    EXPECT_EQ(stats.pairs, 3 * pairs);
    EXPECT_EQ(stats.updates, 3 * batches);
    EXPECT_EQ(table->applied, 3 * batches);
    EXPECT_EQ(stats.epoch_loss.size(), 3u);
}

TEST_F(TrainerTest, SubsamplingDropsWords) {
    config.sample = 1e-3;
    config.epochs = 1;
    Trainer trainer(vocab, config, MakeTableModel());
    TrainingStats stats = trainer.Train(*corpus);
    // 小语料里每个词都是高频词，下采样后样本明显变少
    EXPECT_LT(stats.pairs, PairsPerEpoch());
}

TEST_F(TrainerTest, ModelFailureAbortsTraining) {
    auto model = MakeTableModel();
    model->fail_after = 1;
    TableModel* table = model.get();
    Trainer trainer(vocab, config, std::move(model));

    EXPECT_THROW(trainer.Train(*corpus), std::runtime_error);
    EXPECT_EQ(table->applied, 1);
}

TEST_F(TrainerTest, ReportsProgress) {
    config.epochs = 1;
    config.report_every = 2;
    Trainer trainer(vocab, config, MakeTableModel());

    ::testing::internal::CaptureStdout();
    trainer.Train(*corpus);
    std::string output = ::testing::internal::GetCapturedStdout();

    EXPECT_NE(output.find("Epoch 1 iter 2 loss:"), std::string::npos);
    EXPECT_NE(output.find("Epoch 1 iter 4 loss:"), std::string::npos);
    EXPECT_EQ(output.find("iter 3 loss:"), std::string::npos);
}

TEST_F(TrainerTest, SilentWhenReportingDisabled) {
    config.report_every = 0;
    Trainer trainer(vocab, config, MakeTableModel());

    ::testing::internal::CaptureStdout();
    trainer.Train(*corpus);
    EXPECT_TRUE(::testing::internal::GetCapturedStdout().empty());
}

TEST_F(TrainerTest, LossDecreasesWithEmbeddingModel) {
    config.epochs = 30;
    Trainer trainer(vocab, config);
    TrainingStats stats = trainer.Train(*corpus);

    ASSERT_EQ(stats.epoch_loss.size(), 30u);
    EXPECT_LT(stats.epoch_loss.back(), stats.epoch_loss.front());
    EXPECT_EQ(trainer.model().VocabSize(), static_cast<int>(vocab.Size()));
}

TEST_F(TrainerTest, FullSoftmaxObjective) {
    config.sampling = false;
    config.negative = 0;
    config.epochs = 30;
    Trainer trainer(vocab, config);
    TrainingStats stats = trainer.Train(*corpus);
    EXPECT_LT(stats.epoch_loss.back(), stats.epoch_loss.front());
}

TEST_F(TrainerTest, TrainsFromTextFile) {
    std::string path = ScratchPath("trainer_corpus.txt");
    {
        std::ofstream file(path);
        for (const auto& doc : ToyDocs()) {
            for (size_t i = 0; i < doc.size(); ++i) {
                file << (i ? " " : "") << doc[i];
            }
            file << "\n";
        }
    }

    TextFileCorpus file_corpus(path);
    auto model = MakeTableModel();
    TableModel* table = model.get();
    Trainer trainer(vocab, config, std::move(model));
    TrainingStats stats = trainer.Train(file_corpus);

    EXPECT_EQ(stats.pairs, config.epochs * PairsPerEpoch());
    EXPECT_EQ(table->applied, stats.updates);
    std::remove(path.c_str());
}

TEST_F(TrainerTest, InvalidConfigurationThrows) {
    Trainer::Config bad = config;
    bad.window = 0;
    EXPECT_THROW(Trainer(vocab, bad), ConfigurationError);

    bad = config;
    bad.batch_size = 0;
    EXPECT_THROW(Trainer(vocab, bad), ConfigurationError);

    bad = config;
    bad.sample = 1.5;
    EXPECT_THROW(Trainer(vocab, bad), ConfigurationError);

    bad = config;
    bad.negative = static_cast<int>(vocab.Size());
    EXPECT_THROW(Trainer(vocab, bad), ConfigurationError);

    bad = config;
    bad.model_config.hidden_dim = 0;
    EXPECT_THROW(Trainer(vocab, bad), ConfigurationError);

    EXPECT_THROW(Trainer(vocab, config, std::make_unique<TableModel>(3, 8)), ConfigurationError);
    EXPECT_THROW(Trainer(vocab, config, nullptr), ConfigurationError);
}
