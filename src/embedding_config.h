#ifndef FACEWATCH_EMBEDDING_CONFIG_H
#define FACEWATCH_EMBEDDING_CONFIG_H

#include <cstddef>
#include <vector>

namespace facewatch {

// Face embeddings are plain float vectors (one per detected face)
using Embedding = std::vector<float>;

// ============================================================================
// EMBEDDING WIDTH - FALLBACK DEFAULT
// ============================================================================
// Used for classifier artifacts whose internal structure cannot be
// introspected (unsupported model kinds). SVM and kNN classifiers report the
// width they were fit on, and that value always wins.
// ============================================================================
constexpr size_t DEFAULT_EMBEDDING_SIZE = 512;

// Embedding network input (square RGB crop)
constexpr int EMBEDDER_INPUT_SIZE = 160;

} // namespace facewatch

#endif // FACEWATCH_EMBEDDING_CONFIG_H
