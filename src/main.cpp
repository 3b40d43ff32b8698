#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <getopt.h>
#include "skipgram/skipgram.hpp"

void PrintUsage(const char* prog_name) {
    std::cout << "Skip-gram with negative sampling - word embedding trainer\n\n";
    std::cout << "Usage:\n";
    std::cout << "  " << prog_name << " -t <file> -o <file> [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -t, --train <file>      训练文件路径，每行一个文档 (必需)\n";
    std::cout << "  -o, --output <file>     输出向量文件路径 (必需)\n";
    std::cout << "  -s, --size <int>        向量维度 (默认: 300)\n";
    std::cout << "  -w, --window <int>      窗口半径 (默认: 5)\n";
    std::cout << "  -n, --negative <int>    负采样数量 (默认: 5, 0=完整softmax)\n";
    std::cout << "  -m, --min-count <int>   最小词频 (默认: 1)\n";
    std::cout << "  -i, --iter <int>        迭代次数 (默认: 10)\n";
    std::cout << "  -B, --batch <int>       批次大小 (默认: 128)\n";
    std::cout << "  -a, --alpha <float>     学习率 (默认: 0.001)\n";
    std::cout << "  -O, --optimizer <name>  adam 或 sgd (默认: adam)\n";
    std::cout << "  -S, --sample <float>    下采样阈值 (默认: 1e-3, 0=不下采样)\n";
    std::cout << "  -r, --report <int>      每N个批次打印进度 (默认: 500, 0=不打印)\n";
    std::cout << "  -z, --seed <int>        随机种子 (默认: 1)\n";
    std::cout << "  -b, --binary <0|1>      二进制格式保存 (默认: 0)\n";
    std::cout << "      --save-vocab <file> 保存词汇表\n";
    std::cout << "      --read-vocab <file> 从文件读取词汇表，跳过词频统计\n";
    std::cout << "  -h, --help              显示帮助信息\n";
}

int main(int argc, char** argv) {
    skipgram::Trainer::Config config;
    config.report_every = 500;

    std::string train_file;
    std::string output_file;
    std::string save_vocab_file;
    std::string read_vocab_file;
    int min_count = 1;
    bool binary = false;

    enum { kSaveVocab = 1000, kReadVocab };

    static struct option long_options[] = {
        {"train",      required_argument, 0, 't'},
        {"output",     required_argument, 0, 'o'},
        {"size",       required_argument, 0, 's'},
        {"window",     required_argument, 0, 'w'},
        {"negative",   required_argument, 0, 'n'},
        {"min-count",  required_argument, 0, 'm'},
        {"iter",       required_argument, 0, 'i'},
        {"batch",      required_argument, 0, 'B'},
        {"alpha",      required_argument, 0, 'a'},
        {"optimizer",  required_argument, 0, 'O'},
        {"sample",     required_argument, 0, 'S'},
        {"report",     required_argument, 0, 'r'},
        {"seed",       required_argument, 0, 'z'},
        {"binary",     required_argument, 0, 'b'},
        {"save-vocab", required_argument, 0, kSaveVocab},
        {"read-vocab", required_argument, 0, kReadVocab},
        {"help",       no_argument,       0, 'h'},
        {0, 0, 0, 0}
    };

    int opt;
    int option_index = 0;

    try {
        while ((opt = getopt_long(argc, argv, "t:o:s:w:n:m:i:B:a:O:S:r:z:b:h",
                                  long_options, &option_index)) != -1) {
            switch (opt) {
                case 't':
                    train_file = optarg;
                    break;
                case 'o':
                    output_file = optarg;
                    break;
                case 's':
                    config.model_config.hidden_dim = std::stoi(optarg);
                    break;
                case 'w':
                    config.window = std::stoi(optarg);
                    break;
                case 'n':
                    config.negative = std::stoi(optarg);
                    config.sampling = config.negative > 0;
                    break;
                case 'm':
                    min_count = std::stoi(optarg);
                    break;
                case 'i':
                    config.epochs = std::stoi(optarg);
                    break;
                case 'B':
                    config.batch_size = std::stoi(optarg);
                    break;
                case 'a':
                    config.model_config.learning_rate = std::stof(optarg);
                    break;
                case 'O': {
                    std::string name = optarg;
                    if (name == "adam") {
                        config.model_config.optimizer = skipgram::EmbeddingModel::Optimizer::kAdam;
                    } else if (name == "sgd") {
                        config.model_config.optimizer = skipgram::EmbeddingModel::Optimizer::kSgd;
                    } else {
                        std::cerr << "Error: unknown optimizer '" << name << "'\n";
                        return 1;
                    }
                    break;
                }
                case 'S':
                    config.sample = std::stod(optarg);
                    break;
                case 'r':
                    config.report_every = std::stoi(optarg);
                    break;
                case 'z':
                    config.seed = std::stoull(optarg);
                    config.model_config.seed = config.seed;
                    break;
                case 'b':
                    binary = (std::stoi(optarg) != 0);
                    break;
                case kSaveVocab:
                    save_vocab_file = optarg;
                    break;
                case kReadVocab:
                    read_vocab_file = optarg;
                    break;
                case 'h':
                default:
                    PrintUsage(argv[0]);
                    return (opt == 'h') ? 0 : 1;
            }
        }
    } catch (const std::logic_error&) {
        // std::stoi/stof 解析失败
        std::cerr << "Error: invalid numeric argument for -" << static_cast<char>(opt) << "\n";
        return 1;
    }

    // 验证必需参数
    if (train_file.empty() || output_file.empty()) {
        std::cerr << "Error: -train and -output are required\n";
        PrintUsage(argv[0]);
        return 1;
    }

    try {
        config.Validate();

        skipgram::TextFileCorpus corpus(train_file);

        // 学习词汇表
        skipgram::Vocabulary vocab;
        if (!read_vocab_file.empty()) {
            vocab.Load(read_vocab_file);
            std::cout << "Vocabulary loaded from " << read_vocab_file
                      << ": " << vocab.Size() << " words\n";
        } else {
            std::cout << "Learning vocabulary from " << train_file << "...\n";
            vocab.Learn(corpus, min_count, false);
        }
        if (!save_vocab_file.empty()) {
            vocab.Save(save_vocab_file);
        }

        // 训练模型
        auto model = std::make_unique<skipgram::EmbeddingModel>(
            static_cast<int>(vocab.Size()), config.model_config);
        skipgram::EmbeddingModel* vectors = model.get();

        skipgram::Trainer trainer(vocab, config, std::move(model));
        trainer.Train(corpus);

        vectors->SaveVectors(vocab, output_file, binary);
        std::cout << "Vectors saved to " << output_file << "\n";

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
