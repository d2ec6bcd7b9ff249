#ifndef BT_TRACKER_NODE_SOURCE_H
#define BT_TRACKER_NODE_SOURCE_H

#include "AvlNode.h"

namespace bt {
namespace tree {

/**
 * NodeSource - content-addressed access to tree nodes.
 *
 * Tree algorithms never hold node pointers; every child is reached by
 * resolving its label. A prover resolves from its node map (a miss is
 * E_TREE_CORRUPTION), a verifier from the nodes revealed by a proof (a miss
 * is E_INVALID_PROOF).
 */
class NodeSource {
public:
  virtual ~NodeSource() = default;

  /**
   * Fetch the node a non-empty reference points to
   */
  virtual Roe<AvlNode> resolve(const ChildRef &ref) = 0;

  /**
   * Record a node and return its reference
   */
  virtual ChildRef store(const AvlNode &node) = 0;
};

} // namespace tree
} // namespace bt

#endif // BT_TRACKER_NODE_SOURCE_H
