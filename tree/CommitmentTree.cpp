#include "CommitmentTree.h"
#include "AvlOps.h"
#include "NodeSource.h"
#include "../lib/BinaryPack.hpp"

#include <filesystem>

namespace bt {
namespace tree {

namespace {

// Resolves from the in-memory node map and records every resolved label,
// which is what the batch proof later reveals
class RecordingNodeSource : public NodeSource {
public:
  RecordingNodeSource(std::unordered_map<std::string, AvlNode> &nodes,
                      std::unordered_set<std::string> &visited,
                      std::vector<std::string> &visitedOrder)
      : nodes_(nodes), visited_(visited), visitedOrder_(visitedOrder) {}

  Roe<AvlNode> resolve(const ChildRef &ref) override {
    auto it = nodes_.find(ref.label);
    if (it == nodes_.end()) {
      return Error(E_TREE_CORRUPTION,
                   "Missing tree node " + utl::hexEncode(ref.label));
    }
    if (it->second.height() != ref.height) {
      return Error(E_TREE_CORRUPTION,
                   "Height mismatch for tree node " + utl::hexEncode(ref.label));
    }
    if (visited_.insert(ref.label).second) {
      visitedOrder_.push_back(ref.label);
    }
    return it->second;
  }

  ChildRef store(const AvlNode &node) override {
    ChildRef ref = node.ref();
    nodes_.emplace(ref.label, node);
    return ref;
  }

private:
  std::unordered_map<std::string, AvlNode> &nodes_;
  std::unordered_set<std::string> &visited_;
  std::vector<std::string> &visitedOrder_;
};

void appendU32(std::string &out, uint32_t value) {
  for (int shift = 24; shift >= 0; shift -= 8) {
    out.push_back(static_cast<char>((value >> shift) & 0xff));
  }
}

} // namespace

CommitmentTree::CommitmentTree()
    : Module("tracker.tree"), nodeStore_("tracker.tree.nodes") {}

Error CommitmentTree::corruption(const std::string &message) const {
  if (!halted_) {
    log().error << "Tree corruption, halting: " << message;
  }
  halted_ = true;
  return Error(E_TREE_CORRUPTION, message);
}

Roe<void> CommitmentTree::open(const std::string &dirPath) {
  std::lock_guard<std::mutex> lock(mutex_);
  dirPath_ = dirPath;
  isOpen_ = false;
  halted_ = false;
  nodes_.clear();
  root_ = ChildRef::empty();
  pending_.clear();
  visited_.clear();
  visitedOrder_.clear();
  sequence_ = 0;
  checkpointSequence_ = 0;
  checkpointId_ = 0;

  std::error_code ec;
  std::filesystem::create_directories(dirPath_, ec);
  if (ec) {
    return Error(E_STORAGE, "Failed to create tree directory " + dirPath_ + ": " +
                                ec.message());
  }

  auto kvResult = nodeStore_.open(dirPath_ + "/" + NODES_FILE);
  if (!kvResult) {
    return Error(E_STORAGE, "Failed to open node store: " + kvResult.error().message);
  }

  auto checkpointResult = loadCheckpointLocked();
  if (!checkpointResult) {
    return checkpointResult;
  }

  auto logResult = opLog_.openOrInit(dirPath_ + "/" + LOG_FILE);
  if (!logResult) {
    return Error(E_STORAGE, "Failed to open operation log: " + logResult.error().message);
  }

  auto replayResult = replayLogLocked();
  if (!replayResult) {
    return replayResult;
  }

  // The pending batch restarts from the recovered root
  batchStart_ = root_;
  pending_.clear();
  visited_.clear();
  visitedOrder_.clear();
  isOpen_ = true;

  log().info << "Tree opened at sequence " << sequence_ << " (checkpoint "
             << checkpointId_ << ", " << nodes_.size() << " nodes), root "
             << utl::hexEncode(root_.digest());
  return {};
}

void CommitmentTree::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  opLog_.close();
  nodeStore_.close();
  isOpen_ = false;
}

Roe<void> CommitmentTree::loadCheckpointLocked() {
  std::string path = dirPath_ + "/" + CHECKPOINT_FILE;
  if (!std::filesystem::exists(path)) {
    log().debug << "No checkpoint at " << path << ", starting from empty tree";
    return {};
  }

  auto content = utl::readFile(path);
  if (!content) {
    return content.error();
  }
  auto info = utl::binaryUnpack<CheckpointInfo>(content.value());
  if (!info) {
    return Error(E_STORAGE_FORMAT, "Malformed checkpoint file: " + info.error().message);
  }
  if (info.value().magic != CheckpointInfo::MAGIC ||
      info.value().version != CheckpointInfo::CURRENT_VERSION) {
    return Error(E_STORAGE_FORMAT, "Unsupported checkpoint file " + path);
  }

  auto root = ChildRef::fromDigest(info.value().rootDigest);
  if (!root) {
    return corruption("Invalid checkpoint root digest");
  }

  // Load and verify every node reachable from the checkpoint root
  std::vector<ChildRef> stack;
  if (!root.value().isEmpty()) {
    stack.push_back(root.value());
  }
  while (!stack.empty()) {
    ChildRef ref = stack.back();
    stack.pop_back();
    if (nodes_.count(ref.label) > 0) {
      continue;
    }

    auto stored = nodeStore_.get(ref.label);
    if (!stored) {
      return corruption("Checkpoint node missing: " + utl::hexEncode(ref.label));
    }
    AvlNode node;
    if (!node.ltsFromString(stored.value())) {
      return corruption("Checkpoint node malformed: " + utl::hexEncode(ref.label));
    }
    if (node.computeLabel() != ref.label || node.height() != ref.height) {
      return corruption("Checkpoint node does not match its label: " +
                        utl::hexEncode(ref.label));
    }
    if (!node.left.isEmpty()) {
      stack.push_back(node.left);
    }
    if (!node.right.isEmpty()) {
      stack.push_back(node.right);
    }
    nodes_.emplace(ref.label, std::move(node));
  }

  root_ = root.value();
  sequence_ = info.value().operationSequence;
  checkpointSequence_ = info.value().operationSequence;
  checkpointId_ = info.value().checkpointId;
  log().debug << "Loaded checkpoint " << checkpointId_ << " with " << nodes_.size()
              << " nodes";
  return {};
}

Roe<void> CommitmentTree::replayLogLocked() {
  uint64_t replayed = 0;
  for (uint64_t i = 0; i < opLog_.getRecordCount(); ++i) {
    auto record = opLog_.readRecord(i);
    if (!record) {
      return Error(E_STORAGE, "Failed to read operation " + std::to_string(i) + ": " +
                                  record.error().message);
    }
    auto logged = utl::binaryUnpack<LoggedOperation>(record.value());
    if (!logged) {
      return corruption("Malformed operation log record " + std::to_string(i));
    }
    const LoggedOperation &entry = logged.value();

    // Already covered by the checkpoint
    if (entry.sequence <= checkpointSequence_) {
      continue;
    }
    if (entry.sequence != sequence_ + 1) {
      return corruption("Operation log gap at sequence " + std::to_string(entry.sequence));
    }
    if (entry.rootBefore != root_.digest()) {
      return corruption("Operation " + std::to_string(entry.sequence) +
                        " does not follow the current root");
    }

    TreeOp op;
    op.type = entry.type;
    op.key = entry.key;
    op.value = entry.value;
    auto applied = applyLocked(op, false);
    if (!applied) {
      return corruption("Replay of operation " + std::to_string(entry.sequence) +
                        " failed: " + applied.error().message);
    }
    if (root_.digest() != entry.rootAfter) {
      return corruption("Replay of operation " + std::to_string(entry.sequence) +
                        " produced a different root");
    }
    ++replayed;
  }
  if (replayed > 0) {
    log().info << "Replayed " << replayed << " logged operations";
  }
  return {};
}

Roe<void> CommitmentTree::applyLocked(const TreeOp &op, bool writeLog) {
  if (halted_) {
    return Error(E_TREE_CORRUPTION, "Tree is halted after corruption");
  }

  size_t visitedMark = visitedOrder_.size();
  RecordingNodeSource source(nodes_, visited_, visitedOrder_);
  Roe<ChildRef> next = Error(E_INTERNAL, "Unsupported tree operation");
  switch (op.type) {
  case TreeOp::INSERT:
    next = avl::insert(source, root_, op.key, op.value);
    break;
  case TreeOp::UPDATE:
    next = avl::update(source, root_, op.key, op.value);
    break;
  case TreeOp::REMOVE:
    next = avl::remove(source, root_, op.key);
    break;
  default:
    break;
  }

  if (!next) {
    while (visitedOrder_.size() > visitedMark) {
      visited_.erase(visitedOrder_.back());
      visitedOrder_.pop_back();
    }
    if (next.error().code == E_TREE_CORRUPTION) {
      return corruption(next.error().message);
    }
    return next.error();
  }

  if (writeLog) {
    LoggedOperation entry;
    entry.sequence = sequence_ + 1;
    entry.type = op.type;
    entry.key = op.key;
    entry.value = op.value;
    entry.rootBefore = root_.digest();
    entry.rootAfter = next.value().digest();
    auto appended = opLog_.appendRecord(utl::binaryPack(entry));
    if (!appended) {
      while (visitedOrder_.size() > visitedMark) {
        visited_.erase(visitedOrder_.back());
        visitedOrder_.pop_back();
      }
      return Error(E_STORAGE, "Failed to log tree operation: " +
                                  appended.error().message);
    }
  }

  ++sequence_;
  root_ = next.value();
  pending_.push_back(op);
  return {};
}

Roe<void> CommitmentTree::insert(const std::string &key, const std::string &value) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!isOpen_) {
    return Error(E_STORAGE, "Tree is not open");
  }
  return applyLocked(TreeOp{ TreeOp::INSERT, key, value }, true);
}

Roe<void> CommitmentTree::update(const std::string &key, const std::string &value) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!isOpen_) {
    return Error(E_STORAGE, "Tree is not open");
  }
  return applyLocked(TreeOp{ TreeOp::UPDATE, key, value }, true);
}

Roe<void> CommitmentTree::remove(const std::string &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!isOpen_) {
    return Error(E_STORAGE, "Tree is not open");
  }
  return applyLocked(TreeOp{ TreeOp::REMOVE, key, "" }, true);
}

Roe<std::optional<std::string>> CommitmentTree::lookup(const std::string &key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (halted_) {
    return Error(E_TREE_CORRUPTION, "Tree is halted after corruption");
  }
  if (key.size() != KEY_SIZE) {
    return Error(E_INVALID_KEY, "Tree keys must be " + std::to_string(KEY_SIZE) + " bytes");
  }

  ChildRef current = root_;
  while (!current.isEmpty()) {
    auto it = nodes_.find(current.label);
    if (it == nodes_.end()) {
      return corruption("Missing tree node " + utl::hexEncode(current.label));
    }
    int cmp = key.compare(it->second.key);
    if (cmp == 0) {
      return std::optional<std::string>(it->second.value);
    }
    current = cmp < 0 ? it->second.left : it->second.right;
  }
  return std::optional<std::string>();
}

std::string CommitmentTree::rootDigest() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return root_.digest();
}

Roe<std::vector<std::pair<std::string, std::string>>> CommitmentTree::entries() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (halted_) {
    return Error(E_TREE_CORRUPTION, "Tree is halted after corruption");
  }

  // In-order walk
  std::vector<std::pair<std::string, std::string>> result;
  std::vector<const AvlNode *> stack;
  ChildRef current = root_;
  while (!current.isEmpty() || !stack.empty()) {
    while (!current.isEmpty()) {
      auto it = nodes_.find(current.label);
      if (it == nodes_.end()) {
        return corruption("Missing tree node " + utl::hexEncode(current.label));
      }
      stack.push_back(&it->second);
      current = it->second.left;
    }
    const AvlNode *node = stack.back();
    stack.pop_back();
    result.emplace_back(node->key, node->value);
    current = node->right;
  }
  return result;
}

Roe<void> CommitmentTree::encodeLocked(const ChildRef &ref,
                                       const std::unordered_set<std::string> &revealed,
                                       std::string &out) const {
  if (ref.isEmpty()) {
    out.push_back(static_cast<char>(BatchProof::TAG_EMPTY));
    return {};
  }
  if (revealed.count(ref.label) == 0) {
    out.push_back(static_cast<char>(BatchProof::TAG_STUB));
    out += ref.digest();
    return {};
  }

  auto it = nodes_.find(ref.label);
  if (it == nodes_.end()) {
    return corruption("Missing tree node " + utl::hexEncode(ref.label));
  }
  const AvlNode &node = it->second;
  out.push_back(static_cast<char>(BatchProof::TAG_NODE));
  out += node.key;
  appendU32(out, static_cast<uint32_t>(node.value.size()));
  out += node.value;

  auto left = encodeLocked(node.left, revealed, out);
  if (!left) {
    return left;
  }
  return encodeLocked(node.right, revealed, out);
}

Roe<BatchProof> CommitmentTree::generateProof() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (halted_) {
    return Error(E_TREE_CORRUPTION, "Tree is halted after corruption");
  }

  BatchProof proof;
  proof.startDigest = batchStart_.digest();
  proof.endDigest = root_.digest();
  proof.operations = pending_;
  auto encoded = encodeLocked(batchStart_, visited_, proof.proofBytes);
  if (!encoded) {
    return encoded.error();
  }

  log().debug << "Generated proof for " << pending_.size() << " operations, "
              << proof.proofBytes.size() << " bytes";

  batchStart_ = root_;
  pending_.clear();
  visited_.clear();
  visitedOrder_.clear();
  collectGarbageLocked();
  return proof;
}

Roe<BatchProof> CommitmentTree::proveLookup(const std::string &key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (halted_) {
    return Error(E_TREE_CORRUPTION, "Tree is halted after corruption");
  }
  if (key.size() != KEY_SIZE) {
    return Error(E_INVALID_KEY, "Tree keys must be " + std::to_string(KEY_SIZE) + " bytes");
  }

  // Reveal the search path only
  std::unordered_set<std::string> path;
  ChildRef current = root_;
  while (!current.isEmpty()) {
    auto it = nodes_.find(current.label);
    if (it == nodes_.end()) {
      return corruption("Missing tree node " + utl::hexEncode(current.label));
    }
    path.insert(current.label);
    int cmp = key.compare(it->second.key);
    if (cmp == 0) {
      break;
    }
    current = cmp < 0 ? it->second.left : it->second.right;
  }

  BatchProof proof;
  proof.startDigest = root_.digest();
  proof.endDigest = root_.digest();
  proof.operations.push_back(TreeOp{ TreeOp::LOOKUP, key, "" });
  auto encoded = encodeLocked(root_, path, proof.proofBytes);
  if (!encoded) {
    return encoded.error();
  }
  return proof;
}

size_t CommitmentTree::pendingOperationCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.size();
}

uint64_t CommitmentTree::getOperationSequence() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sequence_;
}

uint64_t CommitmentTree::operationsSinceCheckpoint() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sequence_ - checkpointSequence_;
}

uint64_t CommitmentTree::getCheckpointId() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return checkpointId_;
}

size_t CommitmentTree::getNodeCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return nodes_.size();
}

bool CommitmentTree::isHalted() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return halted_;
}

Roe<std::unordered_set<std::string>>
CommitmentTree::collectReachableLocked(const ChildRef &root) const {
  std::unordered_set<std::string> reachable;
  std::vector<ChildRef> stack;
  if (!root.isEmpty()) {
    stack.push_back(root);
  }
  while (!stack.empty()) {
    ChildRef ref = stack.back();
    stack.pop_back();
    if (!reachable.insert(ref.label).second) {
      continue;
    }
    auto it = nodes_.find(ref.label);
    if (it == nodes_.end()) {
      return corruption("Missing tree node " + utl::hexEncode(ref.label));
    }
    if (!it->second.left.isEmpty()) {
      stack.push_back(it->second.left);
    }
    if (!it->second.right.isEmpty()) {
      stack.push_back(it->second.right);
    }
  }
  return reachable;
}

void CommitmentTree::collectGarbageLocked() {
  auto reachable = collectReachableLocked(root_);
  if (!reachable) {
    return;
  }
  size_t before = nodes_.size();
  for (auto it = nodes_.begin(); it != nodes_.end();) {
    // Nodes revealed by the pending batch stay until its proof is taken
    if (reachable.value().count(it->first) == 0 && visited_.count(it->first) == 0) {
      it = nodes_.erase(it);
    } else {
      ++it;
    }
  }
  if (before != nodes_.size()) {
    log().debug << "Released " << (before - nodes_.size()) << " unreachable nodes";
  }
}

Roe<void> CommitmentTree::checkpoint() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!isOpen_) {
    return Error(E_STORAGE, "Tree is not open");
  }
  if (halted_) {
    return Error(E_TREE_CORRUPTION, "Tree is halted after corruption");
  }

  auto reachable = collectReachableLocked(root_);
  if (!reachable) {
    return reachable.error();
  }

  // 1. Persist reachable nodes not yet in the node store
  std::vector<KeyValueStore::Mutation> batch;
  for (const auto &label : reachable.value()) {
    if (nodeStore_.contains(label)) {
      continue;
    }
    batch.push_back({ label, nodes_.at(label).ltsToString() });
    if (batch.size() >= WRITE_CHUNK) {
      auto written = nodeStore_.writeBatch(batch);
      if (!written) {
        return Error(E_STORAGE, "Failed to persist tree nodes: " + written.error().message);
      }
      batch.clear();
    }
  }
  if (!batch.empty()) {
    auto written = nodeStore_.writeBatch(batch);
    if (!written) {
      return Error(E_STORAGE, "Failed to persist tree nodes: " + written.error().message);
    }
    batch.clear();
  }

  // 2. Commit the checkpoint; recovery starts here from now on
  CheckpointInfo info;
  info.checkpointId = checkpointId_ + 1;
  info.rootDigest = root_.digest();
  info.operationSequence = sequence_;
  info.nodeCount = reachable.value().size();
  auto committed = utl::writeFileAtomic(dirPath_ + "/" + CHECKPOINT_FILE,
                                        utl::binaryPack(info));
  if (!committed) {
    return committed.error();
  }
  checkpointId_ = info.checkpointId;
  checkpointSequence_ = sequence_;

  // 3. Drop nodes the committed checkpoint no longer needs
  std::vector<std::string> stale;
  nodeStore_.forEach([&](const std::string &label, const std::string &) {
    if (reachable.value().count(label) == 0) {
      stale.push_back(label);
    }
  });
  for (const auto &label : stale) {
    batch.push_back({ label, std::nullopt });
    if (batch.size() >= WRITE_CHUNK) {
      auto written = nodeStore_.writeBatch(batch);
      if (!written) {
        log().warning << "Failed to drop stale tree nodes: " << written.error().message;
      }
      batch.clear();
    }
  }
  if (!batch.empty()) {
    auto written = nodeStore_.writeBatch(batch);
    if (!written) {
      log().warning << "Failed to drop stale tree nodes: " << written.error().message;
    }
  }

  // 4. Logged operations are now covered by the checkpoint
  auto rewound = opLog_.rewindTo(0);
  if (!rewound) {
    log().warning << "Failed to reset operation log: " << rewound.error().message;
  }

  collectGarbageLocked();
  log().info << "Checkpoint " << checkpointId_ << " at sequence " << sequence_
             << " (" << info.nodeCount << " nodes)";
  return {};
}

CommitmentTree::Savepoint CommitmentTree::savepoint() const {
  std::lock_guard<std::mutex> lock(mutex_);
  Savepoint point;
  point.root = root_;
  point.pendingOperations = pending_.size();
  point.visitedNodes = visitedOrder_.size();
  point.logRecords = opLog_.getRecordCount();
  point.sequence = sequence_;
  return point;
}

Roe<void> CommitmentTree::rollback(const Savepoint &point) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (point.pendingOperations > pending_.size() ||
      point.visitedNodes > visitedOrder_.size() || point.sequence > sequence_) {
    return Error(E_INTERNAL, "Savepoint is newer than the tree state");
  }

  auto rewound = opLog_.rewindTo(point.logRecords);
  if (!rewound) {
    // The log now holds an operation the caller is abandoning
    return corruption("Failed to rewind operation log: " + rewound.error().message);
  }

  root_ = point.root;
  sequence_ = point.sequence;
  pending_.resize(point.pendingOperations);
  while (visitedOrder_.size() > point.visitedNodes) {
    visited_.erase(visitedOrder_.back());
    visitedOrder_.pop_back();
  }
  log().debug << "Rolled back to sequence " << sequence_;
  return {};
}

} // namespace tree
} // namespace bt
