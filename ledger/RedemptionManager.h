#ifndef BT_TRACKER_REDEMPTION_MANAGER_H
#define BT_TRACKER_REDEMPTION_MANAGER_H

#include "IouNote.h"
#include "ReserveTracker.h"
#include "TrackerStateManager.h"
#include "../lib/Module.h"
#include "../tree/BatchProof.h"

#include <cstdint>
#include <string>
#include <vector>

namespace bt {

struct RedemptionRequest {
  std::string issuerPubkey;    // 33 bytes
  std::string recipientPubkey; // 33 bytes
  uint64_t amount{ 0 };
  uint64_t timestamp{ 0 }; // timestamp of the note being redeemed
  std::string reserveBoxId;
  std::string recipientAddress;
};

/**
 * Proposal for a redemption transaction. Nothing is applied until
 * completeRedemption().
 */
struct RedemptionData {
  std::string redemptionId;
  IouNote note;
  tree::BatchProof proof;
  std::string unsignedPayload;
  std::vector<std::string> requiredSigners;
  uint64_t estimatedFee{ 0 };
  uint64_t redemptionTime{ 0 };
};

enum class NoteStatus {
  OUTSTANDING,
  REDEEMABLE,
  PARTIALLY_REDEEMED,
  FULLY_REDEEMED,
};

const char *noteStatusName(NoteStatus status);

/**
 * RedemptionManager - note redemption protocol.
 *
 * A note becomes redeemable once redemptionLockSeconds have passed since its
 * timestamp. initiateRedemption() validates a request and returns the
 * unsigned transaction payload; completeRedemption() records the payout.
 */
class RedemptionManager : public Module {
public:
  struct Config {
    uint64_t redemptionLockSeconds{ 7 * 24 * 3600 };
    uint64_t estimatedFee{ 1000000 };
    std::string trackerPublicKey; // 33 bytes, may be empty
  };

  RedemptionManager(TrackerStateManager &state, ReserveTracker &reserves,
                    const Config &config);

  /**
   * E_REDEMPTION_TOO_EARLY is retryable, every other failure is final
   */
  Roe<RedemptionData> initiateRedemption(const RedemptionRequest &request) const;

  /**
   * Record a payout of amount against the note. A zero amount or a fully
   * redeemed note is an error.
   */
  Roe<IouNote> completeRedemption(const std::string &issuerPubkey,
                                  const std::string &recipientPubkey, uint64_t amount);

  /**
   * Check that proof shows note, signed by issuerPubkey, under the current
   * commitment root
   */
  Roe<void> verifyRedemptionProof(const tree::BatchProof &proof, const IouNote &note,
                                  const std::string &issuerPubkey) const;

  NoteStatus noteStatus(const IouNote &note, uint64_t now) const;

  const Config &getConfig() const { return config_; }

private:
  struct RedemptionPayload {
    std::string reserveBoxId;
    std::string recipientAddress;
    std::string issuerPubkey;
    std::string recipientPubkey;
    uint64_t amount{ 0 };
    uint64_t noteTimestamp{ 0 };
    std::string commitmentRoot;

    template <typename Archive> void serialize(Archive &ar) {
      ar & reserveBoxId & recipientAddress & issuerPubkey & recipientPubkey & amount &
          noteTimestamp & commitmentRoot;
    }
  };

  static std::string makeRedemptionId(const RedemptionRequest &request);

  TrackerStateManager &state_;
  ReserveTracker &reserves_;
  Config config_;
};

} // namespace bt

#endif // BT_TRACKER_REDEMPTION_MANAGER_H
