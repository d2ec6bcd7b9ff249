#ifndef BT_TRACKER_SCHNORR_H
#define BT_TRACKER_SCHNORR_H

#include "../lib/Utilities.h"

#include <cstdint>
#include <string>

namespace bt {
namespace crypto {

// Raw binary sizes
constexpr size_t PUBLIC_KEY_SIZE = 33; // compressed secp256k1 point
constexpr size_t SECRET_KEY_SIZE = 32; // big-endian scalar
constexpr size_t SIGNATURE_SIZE = 65;  // a (33, compressed point) || z (32)
constexpr size_t SIGNING_MESSAGE_SIZE = PUBLIC_KEY_SIZE + 8 + 8;

struct KeyPair {
  std::string secretKey;
  std::string publicKey;
};

/**
 * Message an issuer signs for a note:
 * recipient_pubkey(33) || amount_be(8) || timestamp_be(8)
 */
std::string signingMessage(const std::string &recipientPubkey, uint64_t amount,
                           uint64_t timestamp);

/**
 * E_INVALID_PUBLIC_KEY unless pubkey is a 33-byte compressed point on
 * secp256k1. The leading byte is checked before any curve arithmetic.
 */
Roe<void> validatePublicKey(const std::string &pubkey);

/**
 * E_INVALID_SIGNATURE_FORMAT for a wrong length, a commitment prefix other
 * than 0x02/0x03, or a response scalar z that is zero or not below the
 * group order.
 */
Roe<void> validateSignatureFormat(const std::string &signature);

/**
 * Fresh random key pair
 */
Roe<KeyPair> generateKeyPair();

Roe<std::string> publicKeyFromSecret(const std::string &secretKey);

/**
 * Schnorr signature with a random nonce k:
 * a = k*G, e = H(a || message || pubkey), z = k + e*s mod n.
 * Signing the same input twice yields different, equally valid signatures.
 */
Roe<std::string> sign(const std::string &message, const std::string &secretKey,
                      const std::string &pubkey);

/**
 * Checks z*G == a + e*X.
 * Fails with E_INVALID_PUBLIC_KEY, E_INVALID_SIGNATURE_FORMAT or
 * E_INVALID_SIGNATURE.
 */
Roe<void> verify(const std::string &signature, const std::string &message,
                 const std::string &pubkey);

/**
 * Decode and validate a hex-encoded public key
 */
Roe<std::string> publicKeyFromHex(const std::string &hex);

/**
 * Decode and format-check a hex-encoded signature
 */
Roe<std::string> signatureFromHex(const std::string &hex);

} // namespace crypto
} // namespace bt

#endif // BT_TRACKER_SCHNORR_H
