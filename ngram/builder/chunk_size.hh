#ifndef NGRAM_BUILDER_CHUNK_SIZE_H
#define NGRAM_BUILDER_CHUNK_SIZE_H

#include "ngram/builder/memory_monitor.hh"

#include <cstddef>

namespace ngram { namespace builder {

enum OperationKind {
  OPERATION_DEFAULT,
  OPERATION_TOKENIZATION,
  // Costlier per record, so windows shrink.
  OPERATION_NGRAM_GENERATION,
  // Cheaper per value, so partitions grow.
  OPERATION_UNIQUE_EXTRACTION
};

// Base window sizes used by the engine.
const std::size_t kGenerationBaseSize = 50000;
const std::size_t kSpillBaseSize = 5000;
const std::size_t kExtractionBaseSize = 10000;

float TierFactor(PressureTier tier);
float OperationFactor(OperationKind kind);

// max(1000, base / 10)
std::size_t MinimumChunkSize(std::size_t base);

// base * TierFactor * OperationFactor, never below MinimumChunkSize(base).
std::size_t EffectiveChunkSize(std::size_t base, OperationKind kind, PressureTier tier);

}} // namespaces

#endif // NGRAM_BUILDER_CHUNK_SIZE_H
