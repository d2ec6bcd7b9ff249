#ifndef BT_TRACKER_COMMITMENT_TREE_H
#define BT_TRACKER_COMMITMENT_TREE_H

#include "AvlNode.h"
#include "BatchProof.h"
#include "../lib/Module.h"
#include "../store/FileStore.h"
#include "../store/KeyValueStore.h"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace bt {
namespace tree {

/**
 * CommitmentTree - the tracker-side (prover) authenticated AVL tree.
 *
 * Every accepted mutation is appended to an operation log before it becomes
 * visible. checkpoint() persists the nodes reachable from the current root
 * and commits the checkpoint metadata by atomic rename, after which the log
 * is reset. open() rebuilds the tree from the last checkpoint and replays
 * the log, checking every stored node against its label and every logged
 * operation against its recorded digests.
 *
 * Mutations since the last generateProof() form the pending batch.
 *
 * A missing or mismatching node latches the tree into a halted state; every
 * later call fails with E_TREE_CORRUPTION.
 */
class CommitmentTree : public Module {
public:
  /**
   * Marker for rollback(). Only valid until the next generateProof() or
   * checkpoint().
   */
  struct Savepoint {
    ChildRef root;
    size_t pendingOperations{ 0 };
    size_t visitedNodes{ 0 };
    uint64_t logRecords{ 0 };
    uint64_t sequence{ 0 };
  };

  constexpr static const char *NODES_FILE = "tree_nodes.kv";
  constexpr static const char *LOG_FILE = "tree_ops.log";
  constexpr static const char *CHECKPOINT_FILE = "tree_checkpoint.dat";

  CommitmentTree();
  ~CommitmentTree() override = default;

  /**
   * Open or create the tree under dirPath and recover its state
   */
  Roe<void> open(const std::string &dirPath);
  void close();

  Roe<void> insert(const std::string &key, const std::string &value);
  Roe<void> update(const std::string &key, const std::string &value);
  Roe<void> remove(const std::string &key);

  /**
   * Read without recording the key in the pending batch
   */
  Roe<std::optional<std::string>> lookup(const std::string &key) const;

  std::string rootDigest() const;

  /**
   * Every key/value pair in key order
   */
  Roe<std::vector<std::pair<std::string, std::string>>> entries() const;

  /**
   * Proof for every mutation since the previous call; starts a new batch
   */
  Roe<BatchProof> generateProof();

  /**
   * Proof of a single lookup against the current root. The pending batch is
   * left untouched.
   */
  Roe<BatchProof> proveLookup(const std::string &key) const;

  size_t pendingOperationCount() const;
  uint64_t getOperationSequence() const;
  uint64_t operationsSinceCheckpoint() const;
  uint64_t getCheckpointId() const;
  size_t getNodeCount() const;

  Roe<void> checkpoint();

  Savepoint savepoint() const;
  Roe<void> rollback(const Savepoint &point);

  bool isHalted() const;

private:
  struct LoggedOperation {
    uint64_t sequence{ 0 };
    uint8_t type{ TreeOp::INSERT };
    std::string key;
    std::string value;
    std::string rootBefore;
    std::string rootAfter;

    template <typename Archive> void serialize(Archive &ar) {
      ar & sequence & type & key & value & rootBefore & rootAfter;
    }
  };

  struct CheckpointInfo {
    constexpr static uint32_t MAGIC = 0x42544350; // "BTCP"
    constexpr static uint16_t CURRENT_VERSION = 1;

    uint32_t magic{ MAGIC };
    uint16_t version{ CURRENT_VERSION };
    uint64_t checkpointId{ 0 };
    std::string rootDigest;
    uint64_t operationSequence{ 0 };
    uint64_t nodeCount{ 0 };

    template <typename Archive> void serialize(Archive &ar) {
      ar & magic & version & checkpointId & rootDigest & operationSequence &
          nodeCount;
    }
  };

  constexpr static size_t WRITE_CHUNK = 1024;

  Roe<void> applyLocked(const TreeOp &op, bool writeLog);
  Roe<void> loadCheckpointLocked();
  Roe<void> replayLogLocked();
  Roe<std::unordered_set<std::string>> collectReachableLocked(const ChildRef &root) const;
  Roe<void> encodeLocked(const ChildRef &ref,
                         const std::unordered_set<std::string> &revealed,
                         std::string &out) const;
  void collectGarbageLocked();
  Error corruption(const std::string &message) const;

  std::string dirPath_;
  KeyValueStore nodeStore_;
  FileStore opLog_;
  bool isOpen_{ false };
  mutable bool halted_{ false };

  std::unordered_map<std::string, AvlNode> nodes_;
  ChildRef root_;

  // Pending batch
  ChildRef batchStart_;
  std::vector<TreeOp> pending_;
  std::unordered_set<std::string> visited_;
  std::vector<std::string> visitedOrder_;

  uint64_t sequence_{ 0 };
  uint64_t checkpointSequence_{ 0 };
  uint64_t checkpointId_{ 0 };

  mutable std::mutex mutex_;
};

} // namespace tree
} // namespace bt

#endif // BT_TRACKER_COMMITMENT_TREE_H
