#include "AvlVerifier.h"
#include "AvlOps.h"
#include "NodeSource.h"

#include <unordered_map>

namespace bt {
namespace tree {

namespace {

// Nodes revealed by the proof plus those created while replaying it
class ProofNodeSource : public NodeSource {
public:
  Roe<AvlNode> resolve(const ChildRef &ref) override {
    auto it = nodes_.find(ref.label);
    if (it == nodes_.end() || it->second.height() != ref.height) {
      return Error(E_INVALID_PROOF, "Proof does not reveal a required node");
    }
    return it->second;
  }

  ChildRef store(const AvlNode &node) override {
    ChildRef ref = node.ref();
    nodes_.emplace(ref.label, node);
    return ref;
  }

private:
  std::unordered_map<std::string, AvlNode> nodes_;
};

Roe<uint32_t> readU32(const std::string &bytes, size_t &pos) {
  if (bytes.size() - pos < 4) {
    return Error(E_INVALID_PROOF, "Truncated proof");
  }
  uint32_t value = 0;
  for (int i = 0; i < 4; ++i) {
    value = (value << 8) | static_cast<uint8_t>(bytes[pos + i]);
  }
  pos += 4;
  return value;
}

Roe<ChildRef> decodeSubtree(const std::string &bytes, size_t &pos, size_t depth,
                            ProofNodeSource &source) {
  if (depth > AvlVerifier::MAX_DEPTH) {
    return Error(E_INVALID_PROOF, "Proof tree too deep");
  }
  if (pos >= bytes.size()) {
    return Error(E_INVALID_PROOF, "Truncated proof");
  }

  uint8_t tag = static_cast<uint8_t>(bytes[pos++]);
  switch (tag) {
  case BatchProof::TAG_EMPTY:
    return ChildRef::empty();

  case BatchProof::TAG_STUB: {
    if (bytes.size() - pos < DIGEST_SIZE) {
      return Error(E_INVALID_PROOF, "Truncated proof stub");
    }
    auto ref = ChildRef::fromDigest(bytes.substr(pos, DIGEST_SIZE));
    pos += DIGEST_SIZE;
    if (!ref) {
      return ref;
    }
    if (ref.value().isEmpty()) {
      return Error(E_INVALID_PROOF, "Stub for empty subtree");
    }
    return ref;
  }

  case BatchProof::TAG_NODE: {
    if (bytes.size() - pos < KEY_SIZE) {
      return Error(E_INVALID_PROOF, "Truncated proof node key");
    }
    AvlNode node;
    node.key = bytes.substr(pos, KEY_SIZE);
    pos += KEY_SIZE;

    auto len = readU32(bytes, pos);
    if (!len) {
      return len.error();
    }
    if (bytes.size() - pos < len.value()) {
      return Error(E_INVALID_PROOF, "Truncated proof node value");
    }
    node.value = bytes.substr(pos, len.value());
    pos += len.value();

    auto left = decodeSubtree(bytes, pos, depth + 1, source);
    if (!left) {
      return left;
    }
    auto right = decodeSubtree(bytes, pos, depth + 1, source);
    if (!right) {
      return right;
    }
    node.left = left.value();
    node.right = right.value();
    if (node.height() > AvlVerifier::MAX_DEPTH) {
      return Error(E_INVALID_PROOF, "Proof node height out of range");
    }
    return source.store(node);
  }

  default:
    return Error(E_INVALID_PROOF, "Unknown proof tag " + std::to_string(tag));
  }
}

} // namespace

Roe<std::vector<LookupResult>> AvlVerifier::verify(const BatchProof &proof) {
  auto start = ChildRef::fromDigest(proof.startDigest);
  if (!start) {
    return Error(E_INVALID_PROOF, "Invalid start digest: " + start.error().message);
  }
  auto end = ChildRef::fromDigest(proof.endDigest);
  if (!end) {
    return Error(E_INVALID_PROOF, "Invalid end digest: " + end.error().message);
  }

  ProofNodeSource source;
  size_t pos = 0;
  auto decoded = decodeSubtree(proof.proofBytes, pos, 0, source);
  if (!decoded) {
    return decoded.error();
  }
  if (pos != proof.proofBytes.size()) {
    return Error(E_INVALID_PROOF, "Trailing bytes after proof tree");
  }
  if (decoded.value() != start.value()) {
    return Error(E_INVALID_PROOF, "Proof does not hash to start digest");
  }

  std::vector<LookupResult> lookups;
  ChildRef root = start.value();
  for (size_t i = 0; i < proof.operations.size(); ++i) {
    const TreeOp &op = proof.operations[i];
    std::string where = "operation " + std::to_string(i) + " (" +
                        TreeOp::typeName(op.type) + ")";

    if (op.type == TreeOp::LOOKUP) {
      auto found = avl::lookup(source, root, op.key);
      if (!found) {
        return Error(E_INVALID_PROOF, where + ": " + found.error().message);
      }
      lookups.push_back({ op.key, found.value() });
      continue;
    }

    Roe<ChildRef> next = Error(E_INVALID_PROOF, where + ": unknown operation type");
    switch (op.type) {
    case TreeOp::INSERT:
      next = avl::insert(source, root, op.key, op.value);
      break;
    case TreeOp::UPDATE:
      next = avl::update(source, root, op.key, op.value);
      break;
    case TreeOp::REMOVE:
      next = avl::remove(source, root, op.key);
      break;
    default:
      break;
    }
    if (!next) {
      return Error(E_INVALID_PROOF, where + ": " + next.error().message);
    }
    root = next.value();
  }

  if (root != end.value()) {
    return Error(E_INVALID_PROOF, "Replayed operations do not reach end digest");
  }
  return lookups;
}

} // namespace tree
} // namespace bt
