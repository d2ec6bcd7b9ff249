#ifndef BT_TRACKER_RESERVE_TRACKER_H
#define BT_TRACKER_RESERVE_TRACKER_H

#include "ReserveEvent.h"
#include "../lib/Module.h"
#include "../lib/Utilities.h"
#include "../store/KeyValueStore.h"

#include <cstdint>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace bt {

/**
 * On-chain collateral reserve as seen by the tracker, plus the debt the
 * tracker has assigned to it
 */
struct ExtendedReserveInfo {
  std::string boxId;
  std::string ownerPubkey;
  uint64_t collateralAmount{ 0 };
  std::string tokenId; // empty unless token-backed
  uint64_t tokenAmount{ 0 };
  std::string trackerNftId;
  uint64_t totalDebt{ 0 };
  uint64_t lastUpdatedHeight{ 0 };
  uint64_t lastUpdatedTimestamp{ 0 };

  bool isTokenBacked() const { return !tokenId.empty(); }

  /**
   * Value backing the debt: tokenAmount when token-backed, else collateral
   */
  uint64_t backingAmount() const {
    return isTokenBacked() ? tokenAmount : collateralAmount;
  }

  /**
   * backing / totalDebt, +infinity when there is no debt
   */
  double collateralizationRatio() const;

  /**
   * Exact backing / totalDebt <= threshold, with threshold resolved to
   * millionths. False when there is no debt.
   */
  bool ratioAtOrBelow(double threshold) const;

  template <typename Archive> void serialize(Archive &ar) {
    ar & boxId & ownerPubkey & collateralAmount & tokenId & tokenAmount &
        trackerNftId & totalDebt & lastUpdatedHeight & lastUpdatedTimestamp;
  }
};

struct SystemTotals {
  uint64_t totalCollateral{ 0 };
  uint64_t totalDebt{ 0 };
};

/**
 * ReserveTracker - reserve map keyed by box id with an owner index.
 *
 * Every change is written to the reserve keyspace before the in-memory map
 * is updated. The owner index is rebuilt when the keyspace is opened.
 */
class ReserveTracker : public Module {
public:
  struct Config {
    double warningRatio{ 1.25 };
    double criticalRatio{ 1.0 };
  };

  constexpr static const char *RESERVES_FILE = "reserves.kv";

  ReserveTracker();
  ~ReserveTracker() override = default;

  Roe<void> open(const std::string &filepath, const Config &config);
  void close();

  /**
   * Insert or replace a reserve
   */
  Roe<void> updateReserve(const ExtendedReserveInfo &info);

  Roe<ExtendedReserveInfo> getReserve(const std::string &boxId) const;
  std::vector<ExtendedReserveInfo> getReserveByOwner(const std::string &ownerPubkey) const;
  std::vector<ExtendedReserveInfo> getAllReserves() const;
  size_t getReserveCount() const;

  /**
   * Assign more debt to a reserve. Rejected with E_INSUFFICIENT_COLLATERAL,
   * leaving the reserve unchanged, when the resulting ratio would be at or
   * below the critical ratio.
   */
  Roe<ExtendedReserveInfo> addDebt(const std::string &boxId, uint64_t amount);

  /**
   * E_AMOUNT_EXCEEDS_DEBT if amount is more than the reserve's debt
   */
  Roe<ExtendedReserveInfo> reduceDebt(const std::string &boxId, uint64_t amount);

  Roe<void> applyEvent(const ReserveEvent &event);

  bool isWarning(const ExtendedReserveInfo &info) const;
  bool isCritical(const ExtendedReserveInfo &info) const;
  std::vector<ExtendedReserveInfo> getWarningReserves() const;
  std::vector<ExtendedReserveInfo> getCriticalReserves() const;

  /**
   * Sums over the current reserve map
   */
  SystemTotals getSystemTotals() const;

  const Config &getConfig() const { return config_; }

private:
  Roe<void> storeLocked(const ExtendedReserveInfo &info);
  Roe<void> eraseLocked(const std::string &boxId);

  Roe<void> applyLocked(const ReserveCreated &event);
  Roe<void> applyLocked(const ReserveToppedUp &event);
  Roe<void> applyLocked(const ReserveRedeemed &event);
  Roe<void> applyLocked(const ReserveSpent &event);

  Config config_;
  KeyValueStore store_;
  std::map<std::string, ExtendedReserveInfo> reserves_;
  std::map<std::string, std::set<std::string>> ownerIndex_;
  mutable std::mutex mutex_;
};

} // namespace bt

#endif // BT_TRACKER_RESERVE_TRACKER_H
