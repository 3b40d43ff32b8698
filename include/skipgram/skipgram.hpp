#pragma once

#include "skipgram/errors.hpp"
#include "skipgram/corpus.hpp"
#include "skipgram/vocabulary.hpp"
#include "skipgram/subsampled_reader.hpp"
#include "skipgram/window_pair_generator.hpp"
#include "skipgram/batch_assembler.hpp"
#include "skipgram/unigram_sampler.hpp"
#include "skipgram/model.hpp"
#include "skipgram/objective.hpp"
#include "skipgram/trainer.hpp"
