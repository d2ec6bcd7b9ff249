#include "ReserveEvent.h"
#include "../crypto/Schnorr.h"

namespace bt {

Roe<ReserveEvent> reserveEventFromJson(const nlohmann::json &jd) {
  try {
    if (!jd.is_object()) {
      return Error(E_INVALID_RESERVE, "Reserve event must be a JSON object");
    }
    if (!jd.contains("type") || !jd.contains("boxId")) {
      return Error(E_INVALID_RESERVE, "Reserve event needs 'type' and 'boxId'");
    }
    std::string type = jd["type"].get<std::string>();
    std::string boxId = jd["boxId"].get<std::string>();
    if (boxId.empty()) {
      return Error(E_INVALID_RESERVE, "Reserve event has empty boxId");
    }
    uint64_t height = jd.value("height", uint64_t(0));

    if (type == "created") {
      ReserveCreated event;
      event.boxId = boxId;
      auto owner = crypto::publicKeyFromHex(jd.at("ownerPubkey").get<std::string>());
      if (!owner) {
        return Error(E_INVALID_RESERVE, "Invalid owner: " + owner.error().message);
      }
      event.ownerPubkey = owner.value();
      event.collateralAmount = jd.at("collateralAmount").get<uint64_t>();
      event.tokenId = jd.value("tokenId", std::string());
      event.tokenAmount = jd.value("tokenAmount", uint64_t(0));
      event.height = height;
      return ReserveEvent(event);
    }
    if (type == "toppedUp") {
      ReserveToppedUp event;
      event.boxId = boxId;
      event.additionalCollateral = jd.at("additionalCollateral").get<uint64_t>();
      event.height = height;
      return ReserveEvent(event);
    }
    if (type == "redeemed") {
      ReserveRedeemed event;
      event.boxId = boxId;
      event.redeemedAmount = jd.at("redeemedAmount").get<uint64_t>();
      event.height = height;
      return ReserveEvent(event);
    }
    if (type == "spent") {
      ReserveSpent event;
      event.boxId = boxId;
      event.height = height;
      return ReserveEvent(event);
    }
    return Error(E_INVALID_RESERVE, "Unknown reserve event type: " + type);
  } catch (const nlohmann::json::exception &e) {
    return Error(E_INVALID_RESERVE, std::string("Malformed reserve event: ") + e.what());
  }
}

const std::string &reserveEventBoxId(const ReserveEvent &event) {
  return std::visit([](const auto &e) -> const std::string & { return e.boxId; }, event);
}

} // namespace bt
