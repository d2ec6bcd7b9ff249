#include "BatchProof.h"
#include "../lib/BinaryPack.hpp"

namespace bt {
namespace tree {

const char *TreeOp::typeName(uint8_t type) {
  switch (type) {
  case INSERT:
    return "insert";
  case UPDATE:
    return "update";
  case REMOVE:
    return "remove";
  case LOOKUP:
    return "lookup";
  default:
    return "unknown";
  }
}

std::string BatchProof::ltsToString() const { return utl::binaryPack(*this); }

bool BatchProof::ltsFromString(const std::string &str) {
  auto result = utl::binaryUnpack<BatchProof>(str);
  if (!result) {
    return false;
  }
  *this = result.value();
  return true;
}

} // namespace tree
} // namespace bt
