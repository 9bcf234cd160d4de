#include "ngram/builder/chunk_size.hh"

#include <algorithm>

namespace ngram { namespace builder {

float TierFactor(PressureTier tier) {
  switch (tier) {
    case PRESSURE_LOW:
      return 1.0;
    case PRESSURE_MEDIUM:
      return 0.8;
    case PRESSURE_HIGH:
      return 0.6;
    case PRESSURE_CRITICAL:
      return 0.4;
  }
  return 1.0;
}

float OperationFactor(OperationKind kind) {
  switch (kind) {
    case OPERATION_NGRAM_GENERATION:
      return 0.6;
    case OPERATION_UNIQUE_EXTRACTION:
      return 1.2;
    case OPERATION_TOKENIZATION:
    case OPERATION_DEFAULT:
      return 1.0;
  }
  return 1.0;
}

std::size_t MinimumChunkSize(std::size_t base) {
  return std::max<std::size_t>(1000, base / 10);
}

std::size_t EffectiveChunkSize(std::size_t base, OperationKind kind, PressureTier tier) {
  double scaled = static_cast<double>(base) * TierFactor(tier) * OperationFactor(kind);
  return std::max(MinimumChunkSize(base), static_cast<std::size_t>(scaled));
}

}} // namespaces
