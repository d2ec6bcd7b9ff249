#include "AvlOps.h"

#include <utility>

namespace bt {
namespace tree {
namespace avl {

namespace {

// Rotations return the new subtree top unstored; the caller stores it
Roe<AvlNode> rotateRight(NodeSource &source, AvlNode node) {
  auto leftResult = source.resolve(node.left);
  if (!leftResult) {
    return leftResult.error();
  }
  AvlNode top = leftResult.value();
  node.left = top.right;
  top.right = source.store(node);
  return top;
}

Roe<AvlNode> rotateLeft(NodeSource &source, AvlNode node) {
  auto rightResult = source.resolve(node.right);
  if (!rightResult) {
    return rightResult.error();
  }
  AvlNode top = rightResult.value();
  node.right = top.left;
  top.left = source.store(node);
  return top;
}

Roe<ChildRef> balance(NodeSource &source, AvlNode node) {
  int factor = node.balanceFactor();

  if (factor > 1) {
    auto leftResult = source.resolve(node.left);
    if (!leftResult) {
      return leftResult.error();
    }
    if (leftResult.value().balanceFactor() < 0) {
      auto rotated = rotateLeft(source, leftResult.value());
      if (!rotated) {
        return rotated.error();
      }
      node.left = source.store(rotated.value());
    }
    auto top = rotateRight(source, node);
    if (!top) {
      return top.error();
    }
    return source.store(top.value());
  }

  if (factor < -1) {
    auto rightResult = source.resolve(node.right);
    if (!rightResult) {
      return rightResult.error();
    }
    if (rightResult.value().balanceFactor() > 0) {
      auto rotated = rotateRight(source, rightResult.value());
      if (!rotated) {
        return rotated.error();
      }
      node.right = source.store(rotated.value());
    }
    auto top = rotateLeft(source, node);
    if (!top) {
      return top.error();
    }
    return source.store(top.value());
  }

  return source.store(node);
}

Roe<ChildRef> insertAt(NodeSource &source, const ChildRef &ref,
                       const std::string &key, const std::string &value) {
  if (ref.isEmpty()) {
    AvlNode leaf;
    leaf.key = key;
    leaf.value = value;
    return source.store(leaf);
  }

  auto nodeResult = source.resolve(ref);
  if (!nodeResult) {
    return nodeResult.error();
  }
  AvlNode node = nodeResult.value();

  int cmp = key.compare(node.key);
  if (cmp == 0) {
    return Error(E_DUPLICATE_KEY, "Key already exists in tree");
  }

  auto child = insertAt(source, cmp < 0 ? node.left : node.right, key, value);
  if (!child) {
    return child;
  }
  if (cmp < 0) {
    node.left = child.value();
  } else {
    node.right = child.value();
  }
  return balance(source, node);
}

Roe<ChildRef> updateAt(NodeSource &source, const ChildRef &ref,
                       const std::string &key, const std::string &value) {
  if (ref.isEmpty()) {
    return Error(E_KEY_NOT_FOUND, "Key not found in tree");
  }

  auto nodeResult = source.resolve(ref);
  if (!nodeResult) {
    return nodeResult.error();
  }
  AvlNode node = nodeResult.value();

  int cmp = key.compare(node.key);
  if (cmp == 0) {
    node.value = value;
    return source.store(node);
  }

  auto child = updateAt(source, cmp < 0 ? node.left : node.right, key, value);
  if (!child) {
    return child;
  }
  // Shape is unchanged, no rebalancing needed
  if (cmp < 0) {
    node.left = child.value();
  } else {
    node.right = child.value();
  }
  return source.store(node);
}

// Detach the smallest node of a non-empty subtree
Roe<std::pair<ChildRef, AvlNode>> removeMin(NodeSource &source, const ChildRef &ref) {
  auto nodeResult = source.resolve(ref);
  if (!nodeResult) {
    return nodeResult.error();
  }
  AvlNode node = nodeResult.value();

  if (node.left.isEmpty()) {
    return std::make_pair(node.right, node);
  }

  auto removed = removeMin(source, node.left);
  if (!removed) {
    return removed.error();
  }
  node.left = removed.value().first;
  auto balanced = balance(source, node);
  if (!balanced) {
    return balanced.error();
  }
  return std::make_pair(balanced.value(), removed.value().second);
}

Roe<ChildRef> removeAt(NodeSource &source, const ChildRef &ref,
                       const std::string &key) {
  if (ref.isEmpty()) {
    return Error(E_KEY_NOT_FOUND, "Key not found in tree");
  }

  auto nodeResult = source.resolve(ref);
  if (!nodeResult) {
    return nodeResult.error();
  }
  AvlNode node = nodeResult.value();

  int cmp = key.compare(node.key);
  if (cmp != 0) {
    auto child = removeAt(source, cmp < 0 ? node.left : node.right, key);
    if (!child) {
      return child;
    }
    if (cmp < 0) {
      node.left = child.value();
    } else {
      node.right = child.value();
    }
    return balance(source, node);
  }

  if (node.left.isEmpty()) {
    return node.right;
  }
  if (node.right.isEmpty()) {
    return node.left;
  }

  // Two children: the in-order successor takes this node's place
  auto removed = removeMin(source, node.right);
  if (!removed) {
    return removed.error();
  }
  AvlNode successor = removed.value().second;
  successor.left = node.left;
  successor.right = removed.value().first;
  return balance(source, successor);
}

} // namespace

Roe<ChildRef> insert(NodeSource &source, const ChildRef &root,
                     const std::string &key, const std::string &value) {
  if (key.size() != KEY_SIZE) {
    return Error(E_INVALID_KEY, "Tree keys must be " + std::to_string(KEY_SIZE) + " bytes");
  }
  return insertAt(source, root, key, value);
}

Roe<ChildRef> update(NodeSource &source, const ChildRef &root,
                     const std::string &key, const std::string &value) {
  if (key.size() != KEY_SIZE) {
    return Error(E_INVALID_KEY, "Tree keys must be " + std::to_string(KEY_SIZE) + " bytes");
  }
  return updateAt(source, root, key, value);
}

Roe<ChildRef> remove(NodeSource &source, const ChildRef &root,
                     const std::string &key) {
  if (key.size() != KEY_SIZE) {
    return Error(E_INVALID_KEY, "Tree keys must be " + std::to_string(KEY_SIZE) + " bytes");
  }
  return removeAt(source, root, key);
}

Roe<std::optional<std::string>> lookup(NodeSource &source, const ChildRef &root,
                                       const std::string &key) {
  ChildRef current = root;
  while (!current.isEmpty()) {
    auto nodeResult = source.resolve(current);
    if (!nodeResult) {
      return nodeResult.error();
    }
    const AvlNode &node = nodeResult.value();
    int cmp = key.compare(node.key);
    if (cmp == 0) {
      return std::optional<std::string>(node.value);
    }
    current = cmp < 0 ? node.left : node.right;
  }
  return std::optional<std::string>();
}

} // namespace avl
} // namespace tree
} // namespace bt
