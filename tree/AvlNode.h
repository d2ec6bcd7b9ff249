#ifndef BT_TRACKER_AVL_NODE_H
#define BT_TRACKER_AVL_NODE_H

#include "../lib/Utilities.h"

#include <cstdint>
#include <string>

namespace bt {
namespace tree {

constexpr size_t KEY_SIZE = 64;
constexpr size_t LABEL_SIZE = 32;
constexpr size_t DIGEST_SIZE = LABEL_SIZE + 1;

/**
 * Reference to a subtree by content address. The empty subtree has height 0
 * and an all-zero label.
 */
struct ChildRef {
  std::string label = std::string(LABEL_SIZE, '\0');
  uint8_t height{ 0 };

  bool isEmpty() const { return height == 0; }

  /**
   * label(32) || height(1)
   */
  std::string digest() const;

  static ChildRef empty() { return ChildRef(); }
  static Roe<ChildRef> fromDigest(const std::string &digest);

  bool operator==(const ChildRef &other) const {
    return height == other.height && label == other.label;
  }
  bool operator!=(const ChildRef &other) const { return !(*this == other); }

  template <typename Archive> void serialize(Archive &ar) { ar & label & height; }
};

/**
 * Immutable tree node. A node never changes once stored; an update produces
 * a new node with a new label.
 */
struct AvlNode {
  std::string key;
  std::string value;
  ChildRef left;
  ChildRef right;

  uint8_t height() const;
  int balanceFactor() const {
    return static_cast<int>(left.height) - static_cast<int>(right.height);
  }

  /**
   * H(0x01 || key || len_be32(value) || value ||
   *   leftLabel || leftHeight || rightLabel || rightHeight)
   */
  std::string computeLabel() const;

  ChildRef ref() const { return ChildRef{ computeLabel(), height() }; }

  template <typename Archive> void serialize(Archive &ar) {
    ar & key & value & left & right;
  }

  std::string ltsToString() const;
  bool ltsFromString(const std::string &str);
};

/**
 * Digest of the empty tree: 33 zero bytes
 */
const std::string &emptyDigest();

} // namespace tree
} // namespace bt

#endif // BT_TRACKER_AVL_NODE_H
