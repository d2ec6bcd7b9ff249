#include "AvlNode.h"
#include "../crypto/Hash.h"
#include "../lib/BinaryPack.hpp"

#include <algorithm>

namespace bt {
namespace tree {

namespace {
constexpr char NODE_PREFIX = 0x01;
}

std::string ChildRef::digest() const {
  std::string out = label;
  out.push_back(static_cast<char>(height));
  return out;
}

Roe<ChildRef> ChildRef::fromDigest(const std::string &digest) {
  if (digest.size() != DIGEST_SIZE) {
    return Error(E_INVALID_PROOF,
                 "Digest must be " + std::to_string(DIGEST_SIZE) + " bytes");
  }
  ChildRef ref;
  ref.label = digest.substr(0, LABEL_SIZE);
  ref.height = static_cast<uint8_t>(digest[LABEL_SIZE]);
  if (ref.height == 0 && ref.label != std::string(LABEL_SIZE, '\0')) {
    return Error(E_INVALID_PROOF, "Empty digest with non-zero label");
  }
  return ref;
}

uint8_t AvlNode::height() const {
  return static_cast<uint8_t>(1 + std::max(left.height, right.height));
}

std::string AvlNode::computeLabel() const {
  std::string preimage;
  preimage.reserve(1 + key.size() + 4 + value.size() + 2 * DIGEST_SIZE);
  preimage.push_back(NODE_PREFIX);
  preimage += key;
  uint32_t len = static_cast<uint32_t>(value.size());
  for (int shift = 24; shift >= 0; shift -= 8) {
    preimage.push_back(static_cast<char>((len >> shift) & 0xff));
  }
  preimage += value;
  preimage += left.label;
  preimage.push_back(static_cast<char>(left.height));
  preimage += right.label;
  preimage.push_back(static_cast<char>(right.height));
  return crypto::blake2b256(preimage);
}

std::string AvlNode::ltsToString() const { return utl::binaryPack(*this); }

bool AvlNode::ltsFromString(const std::string &str) {
  auto result = utl::binaryUnpack<AvlNode>(str);
  if (!result) {
    return false;
  }
  *this = result.value();
  return key.size() == KEY_SIZE && left.label.size() == LABEL_SIZE &&
         right.label.size() == LABEL_SIZE;
}

const std::string &emptyDigest() {
  static const std::string digest(DIGEST_SIZE, '\0');
  return digest;
}

} // namespace tree
} // namespace bt
