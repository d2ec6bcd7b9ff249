#ifndef BT_TRACKER_RESERVE_EVENT_H
#define BT_TRACKER_RESERVE_EVENT_H

#include "../lib/Utilities.h"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <variant>

namespace bt {

struct ReserveCreated {
  std::string boxId;
  std::string ownerPubkey; // 33 bytes
  uint64_t collateralAmount{ 0 };
  std::string tokenId; // empty for native-backed reserves
  uint64_t tokenAmount{ 0 };
  uint64_t height{ 0 };
};

struct ReserveToppedUp {
  std::string boxId;
  uint64_t additionalCollateral{ 0 };
  uint64_t height{ 0 };
};

struct ReserveRedeemed {
  std::string boxId;
  uint64_t redeemedAmount{ 0 };
  uint64_t height{ 0 };
};

struct ReserveSpent {
  std::string boxId;
  uint64_t height{ 0 };
};

/**
 * On-chain reserve change reported by the chain scanner
 */
using ReserveEvent =
    std::variant<ReserveCreated, ReserveToppedUp, ReserveRedeemed, ReserveSpent>;

/**
 * Decode one event of the JSON event feed:
 *   {"type": "created", "boxId": "...", "ownerPubkey": "<hex>",
 *    "collateralAmount": N, "height": N [, "tokenId": "...", "tokenAmount": N]}
 *   {"type": "toppedUp", "boxId": "...", "additionalCollateral": N, "height": N}
 *   {"type": "redeemed", "boxId": "...", "redeemedAmount": N, "height": N}
 *   {"type": "spent", "boxId": "...", "height": N}
 */
Roe<ReserveEvent> reserveEventFromJson(const nlohmann::json &jd);

const std::string &reserveEventBoxId(const ReserveEvent &event);

} // namespace bt

#endif // BT_TRACKER_RESERVE_EVENT_H
