#ifndef BT_TRACKER_AVL_OPS_H
#define BT_TRACKER_AVL_OPS_H

#include "NodeSource.h"

#include <optional>
#include <string>

namespace bt {
namespace tree {

/**
 * Persistent AVL operations. Each mutation takes the current root reference
 * and returns the new root; untouched subtrees are shared by reference.
 * The same code runs in the prover and in the verifier, so both resolve
 * exactly the same set of nodes for a given operation sequence.
 */
namespace avl {

/**
 * E_DUPLICATE_KEY if the key is present
 */
Roe<ChildRef> insert(NodeSource &source, const ChildRef &root,
                     const std::string &key, const std::string &value);

/**
 * E_KEY_NOT_FOUND if the key is absent
 */
Roe<ChildRef> update(NodeSource &source, const ChildRef &root,
                     const std::string &key, const std::string &value);

/**
 * E_KEY_NOT_FOUND if the key is absent
 */
Roe<ChildRef> remove(NodeSource &source, const ChildRef &root,
                     const std::string &key);

Roe<std::optional<std::string>> lookup(NodeSource &source, const ChildRef &root,
                                       const std::string &key);

} // namespace avl
} // namespace tree
} // namespace bt

#endif // BT_TRACKER_AVL_OPS_H
