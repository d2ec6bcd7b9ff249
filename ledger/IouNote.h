#ifndef BT_TRACKER_IOU_NOTE_H
#define BT_TRACKER_IOU_NOTE_H

#include "../lib/Utilities.h"

#include <cstdint>
#include <string>

namespace bt {

/**
 * IouNote - an issuer's signed acknowledgement that it owes the recipient
 * amountCollected, of which amountRedeemed has already been paid out.
 *
 * The signature covers recipient, amountCollected and timestamp only;
 * amountRedeemed is tracker-side state.
 */
struct IouNote {
  std::string recipientPubkey; // 33 bytes
  uint64_t amountCollected{ 0 };
  uint64_t amountRedeemed{ 0 };
  uint64_t timestamp{ 0 };
  std::string signature; // 65 bytes

  // Fixed width value encoding used by the note store and the tree:
  // issuer(33) || collected(8) || redeemed(8) || timestamp(8) ||
  // signature(65) || recipient(33), integers big-endian
  constexpr static size_t ENCODED_SIZE = 33 + 8 + 8 + 8 + 65 + 33;

  uint64_t outstandingDebt() const {
    return amountRedeemed >= amountCollected ? 0 : amountCollected - amountRedeemed;
  }

  bool isFullyRedeemed() const { return amountRedeemed >= amountCollected; }

  std::string signingMessage() const;

  Roe<void> verifySignature(const std::string &issuerPubkey) const;

  /**
   * Build and sign a fresh note with no redemptions
   */
  static Roe<IouNote> create(const std::string &issuerSecret,
                             const std::string &issuerPubkey,
                             const std::string &recipientPubkey,
                             uint64_t amountCollected, uint64_t timestamp);

  std::string encode(const std::string &issuerPubkey) const;

  bool operator==(const IouNote &other) const {
    return recipientPubkey == other.recipientPubkey &&
           amountCollected == other.amountCollected &&
           amountRedeemed == other.amountRedeemed && timestamp == other.timestamp &&
           signature == other.signature;
  }
  bool operator!=(const IouNote &other) const { return !(*this == other); }
};

/**
 * A note together with the issuer that signed it
 */
struct NoteRecord {
  std::string issuerPubkey;
  IouNote note;

  static Roe<NoteRecord> decode(const std::string &value);
};

/**
 * NoteKey: H(issuer) || H(recipient), 64 bytes. All notes of one issuer
 * share the first 32 bytes.
 */
std::string noteKey(const std::string &issuerPubkey, const std::string &recipientPubkey);

std::string issuerKeyPrefix(const std::string &issuerPubkey);

} // namespace bt

#endif // BT_TRACKER_IOU_NOTE_H
