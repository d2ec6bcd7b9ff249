#ifndef BT_TRACKER_HASH_H
#define BT_TRACKER_HASH_H

#include <cstddef>
#include <string>

namespace bt {
namespace crypto {

constexpr size_t HASH_SIZE = 32;

/**
 * Blake2b-512 (OpenSSL EVP) truncated to its first 32 bytes.
 * Used for Schnorr challenges, NoteKey halves and tree node labels.
 * @throws std::runtime_error if the digest cannot be computed
 */
std::string blake2b256(const std::string &input);

} // namespace crypto
} // namespace bt

#endif // BT_TRACKER_HASH_H
