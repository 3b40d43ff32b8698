#pragma once

#include <vector>

#include "skipgram/window_pair_generator.hpp"

namespace skipgram {

// 一批训练样本，inputs 为中心词，labels 为上下文词
// 最后一批可能不满：actual_size < batch_size，inputs/labels 的长度都等于 actual_size
struct Batch {
    std::vector<int> inputs;
    std::vector<int> labels;
    size_t actual_size = 0;
    size_t batch_size = 0;

    bool Full() const { return actual_size == batch_size; }

    void Clear() {
        inputs.clear();
        labels.clear();
        actual_size = 0;
    }
};

class BatchAssembler {
public:
    BatchAssembler(PairStream<int>& pairs, int batch_size);

    // 取下一批，样本流已经耗尽时返回 false
    bool Next(Batch* batch);

    int batch_size() const { return batch_size_; }
    long long pairs_read() const { return pairs_read_; }

private:
    PairStream<int>& pairs_;
    int batch_size_;
    long long pairs_read_ = 0;
};

} // namespace skipgram
