#ifndef BT_TRACKER_ERROR_CODES_H
#define BT_TRACKER_ERROR_CODES_H

#include <cstdint>

namespace bt {

// Error code groups shared by every tracker component.
// Codes cross layer boundaries unchanged so callers can discriminate them.

// Signature scheme errors (10-19)
constexpr static int32_t E_INVALID_PUBLIC_KEY = 10;       // Malformed, zero or off-curve key
constexpr static int32_t E_INVALID_SIGNATURE_FORMAT = 11; // Wrong length or non-canonical encoding
constexpr static int32_t E_INVALID_SIGNATURE = 12;        // Verification equation does not hold
constexpr static int32_t E_INVALID_SECRET_KEY = 13;       // Secret scalar out of range
constexpr static int32_t E_CRYPTO_INTERNAL = 19;          // Curve library failure

// Note ledger errors (20-39)
constexpr static int32_t E_INVALID_NOTE = 20;        // Field sizes or amounts malformed
constexpr static int32_t E_AMOUNT_OVERFLOW = 21;     // Amount arithmetic would overflow u64
constexpr static int32_t E_FUTURE_TIMESTAMP = 22;    // Timestamp beyond the clock skew bound
constexpr static int32_t E_DUPLICATE_NONCE = 23;     // Same or older timestamp for an existing pair
constexpr static int32_t E_AMOUNT_DECREASE = 24;     // Replacement note lowers the collected amount
constexpr static int32_t E_NOTE_NOT_FOUND = 25;      // No note for the (issuer, recipient) pair
constexpr static int32_t E_STATE_INCONSISTENT = 26;  // Note store and tree disagree
constexpr static int32_t E_NOTE_FULLY_REDEEMED = 27; // Nothing left to redeem
constexpr static int32_t E_INVALID_COMMITMENT_HEIGHT = 28; // Commitment height went backwards

// Redemption errors (40-49)
constexpr static int32_t E_REDEMPTION_TOO_EARLY = 40;    // Time lock not yet elapsed, retryable
constexpr static int32_t E_AMOUNT_EXCEEDS_DEBT = 41;     // Amount above outstanding debt
constexpr static int32_t E_INVALID_REDEMPTION_AMOUNT = 42; // Zero redemption amount
constexpr static int32_t E_PROOF_MISMATCH = 43;          // Proof does not commit to the note

// Reserve errors (50-59)
constexpr static int32_t E_RESERVE_NOT_FOUND = 50;
constexpr static int32_t E_RESERVE_OWNER_MISMATCH = 51;
constexpr static int32_t E_INSUFFICIENT_COLLATERAL = 52;
constexpr static int32_t E_INVALID_RESERVE = 53;

// Commitment tree errors (60-79)
constexpr static int32_t E_DUPLICATE_KEY = 60;
constexpr static int32_t E_KEY_NOT_FOUND = 61;
constexpr static int32_t E_INVALID_PROOF = 62;
constexpr static int32_t E_TREE_CORRUPTION = 63; // Fatal, halts the tree instance
constexpr static int32_t E_INVALID_KEY = 64;

// Storage errors (80-89)
constexpr static int32_t E_STORAGE = 80;
constexpr static int32_t E_STORAGE_FORMAT = 81;
constexpr static int32_t E_CONFIG = 85;

// Actor errors (90-99)
constexpr static int32_t E_ACTOR_STOPPED = 90;
constexpr static int32_t E_INTERNAL = 99;

/**
 * Expected outcomes the caller may resubmit later without changing input.
 */
inline bool isRetryable(int32_t code) {
  return code == E_REDEMPTION_TOO_EARLY || code == E_ACTOR_STOPPED;
}

/**
 * Conditions that must stop further mutation until operator recovery.
 */
inline bool isFatal(int32_t code) { return code == E_TREE_CORRUPTION; }

} // namespace bt

#endif // BT_TRACKER_ERROR_CODES_H
