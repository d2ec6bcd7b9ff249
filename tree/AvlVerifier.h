#ifndef BT_TRACKER_AVL_VERIFIER_H
#define BT_TRACKER_AVL_VERIFIER_H

#include "BatchProof.h"

#include <vector>

namespace bt {
namespace tree {

/**
 * Stateless checker for BatchProof. It needs nothing but the proof: the
 * revealed nodes are rebuilt, hashed up to startDigest, and the operations
 * are replayed over them with the same AVL code the tracker runs.
 */
class AvlVerifier {
public:
  // Deeper than any AVL tree over 2^64 keys
  constexpr static size_t MAX_DEPTH = 128;

  /**
   * @return results of the LOOKUP operations in proof order, or
   *         E_INVALID_PROOF
   */
  static Roe<std::vector<LookupResult>> verify(const BatchProof &proof);
};

} // namespace tree
} // namespace bt

#endif // BT_TRACKER_AVL_VERIFIER_H
