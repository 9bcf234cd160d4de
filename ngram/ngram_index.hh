#ifndef NGRAM_NGRAM_INDEX_H
#define NGRAM_NGRAM_INDEX_H

#include <limits>

#include <stdint.h>

namespace ngram {
// 1-based position of a record in the input.
typedef uint64_t RecordId;
// Dense n-gram identifier in first-observation order, starting at 0.
typedef uint32_t NgramId;

const NgramId kMaxNgramId = std::numeric_limits<NgramId>::max();
} // namespace ngram

#endif // NGRAM_NGRAM_INDEX_H
