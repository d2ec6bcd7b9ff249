#ifndef BT_TRACKER_BATCH_PROOF_H
#define BT_TRACKER_BATCH_PROOF_H

#include "../lib/Utilities.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace bt {
namespace tree {

struct TreeOp {
  constexpr static uint8_t INSERT = 1;
  constexpr static uint8_t UPDATE = 2;
  constexpr static uint8_t REMOVE = 3;
  constexpr static uint8_t LOOKUP = 4;

  uint8_t type{ INSERT };
  std::string key;
  std::string value; // empty for REMOVE and LOOKUP

  static const char *typeName(uint8_t type);

  template <typename Archive> void serialize(Archive &ar) {
    ar & type & key & value;
  }
};

/**
 * BatchProof - evidence that applying operations, in order, to the tree with
 * digest startDigest yields endDigest.
 *
 * proofBytes is the pre-batch tree pruned to the nodes the batch visits,
 * written in pre-order:
 *   0x00                                       empty subtree
 *   0x01 label(32) height(1)                   unvisited subtree (stub)
 *   0x02 key(64) len_be32 value <left> <right>  visited node
 */
struct BatchProof {
  constexpr static uint8_t TAG_EMPTY = 0x00;
  constexpr static uint8_t TAG_STUB = 0x01;
  constexpr static uint8_t TAG_NODE = 0x02;

  std::string startDigest;
  std::string endDigest;
  std::vector<TreeOp> operations;
  std::string proofBytes;

  template <typename Archive> void serialize(Archive &ar) {
    ar & startDigest & endDigest & operations & proofBytes;
  }

  std::string ltsToString() const;
  bool ltsFromString(const std::string &str);
};

struct LookupResult {
  std::string key;
  std::optional<std::string> value;
};

} // namespace tree
} // namespace bt

#endif // BT_TRACKER_BATCH_PROOF_H
