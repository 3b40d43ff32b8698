#include "skipgram/batch_assembler.hpp"
#include "skipgram/errors.hpp"

#include <string>

namespace skipgram {

BatchAssembler::BatchAssembler(PairStream<int>& pairs, int batch_size)
    : pairs_(pairs), batch_size_(batch_size) {
    if (batch_size_ < 1) {
        throw ConfigurationError("Batch size must be >= 1, got " + std::to_string(batch_size_));
    }
}

bool BatchAssembler::Next(Batch* batch) {
    batch->Clear();
    batch->batch_size = batch_size_;
    batch->inputs.reserve(batch_size_);
    batch->labels.reserve(batch_size_);

    WordPair<int> pair;
    while (batch->actual_size < batch->batch_size && pairs_.Next(&pair)) {
        batch->inputs.push_back(pair.center);
        batch->labels.push_back(pair.context);
        batch->actual_size++;
    }
    pairs_read_ += batch->actual_size;
    return batch->actual_size > 0;
}

} // namespace skipgram
