#include "ReserveTracker.h"
#include "../lib/BinaryPack.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace bt {

double ExtendedReserveInfo::collateralizationRatio() const {
  if (totalDebt == 0) {
    return std::numeric_limits<double>::infinity();
  }
  return static_cast<double>(backingAmount()) / static_cast<double>(totalDebt);
}

bool ExtendedReserveInfo::ratioAtOrBelow(double threshold) const {
  constexpr uint64_t RATIO_SCALE = 1000000;
  if (totalDebt == 0) {
    return false;
  }
  double scaled = std::round(threshold * static_cast<double>(RATIO_SCALE));
  if (scaled <= 0) {
    return false;
  }
  if (scaled >= static_cast<double>(std::numeric_limits<uint64_t>::max())) {
    return true;
  }
  // backing * SCALE <= debt * scaledThreshold, both sides below 2^128
  unsigned __int128 lhs = static_cast<unsigned __int128>(backingAmount()) * RATIO_SCALE;
  unsigned __int128 rhs =
      static_cast<unsigned __int128>(totalDebt) * static_cast<uint64_t>(scaled);
  return lhs <= rhs;
}

ReserveTracker::ReserveTracker()
    : Module("tracker.reserve"), store_("tracker.reserve.store") {}

Roe<void> ReserveTracker::open(const std::string &filepath, const Config &config) {
  std::lock_guard<std::mutex> lock(mutex_);
  config_ = config;
  reserves_.clear();
  ownerIndex_.clear();

  auto opened = store_.open(filepath);
  if (!opened) {
    return Error(E_STORAGE, "Failed to open reserve store: " + opened.error().message);
  }

  Roe<void> result;
  store_.forEach([&](const std::string &boxId, const std::string &value) {
    if (!result) {
      return;
    }
    auto info = utl::binaryUnpack<ExtendedReserveInfo>(value);
    if (!info) {
      result = Error(E_STORAGE_FORMAT, "Corrupt reserve record " + boxId + ": " +
                                           info.error().message);
      return;
    }
    ownerIndex_[info.value().ownerPubkey].insert(boxId);
    reserves_[boxId] = info.value();
  });
  if (!result) {
    return result;
  }

  log().info << "Loaded " << reserves_.size() << " reserves";
  return {};
}

void ReserveTracker::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  store_.close();
}

Roe<void> ReserveTracker::storeLocked(const ExtendedReserveInfo &info) {
  auto written = store_.put(info.boxId, utl::binaryPack(info));
  if (!written) {
    log().error << "Failed to persist reserve " << info.boxId << ": "
                << written.error().message;
    return Error(E_STORAGE, "Failed to persist reserve: " + written.error().message);
  }

  auto it = reserves_.find(info.boxId);
  if (it != reserves_.end() && it->second.ownerPubkey != info.ownerPubkey) {
    auto owner = ownerIndex_.find(it->second.ownerPubkey);
    if (owner != ownerIndex_.end()) {
      owner->second.erase(info.boxId);
      if (owner->second.empty()) {
        ownerIndex_.erase(owner);
      }
    }
  }
  ownerIndex_[info.ownerPubkey].insert(info.boxId);
  reserves_[info.boxId] = info;
  return {};
}

Roe<void> ReserveTracker::eraseLocked(const std::string &boxId) {
  auto it = reserves_.find(boxId);
  if (it == reserves_.end()) {
    return Error(E_RESERVE_NOT_FOUND, "Reserve not found: " + boxId);
  }
  auto erased = store_.erase(boxId);
  if (!erased) {
    return Error(E_STORAGE, "Failed to remove reserve: " + erased.error().message);
  }
  auto owner = ownerIndex_.find(it->second.ownerPubkey);
  if (owner != ownerIndex_.end()) {
    owner->second.erase(boxId);
    if (owner->second.empty()) {
      ownerIndex_.erase(owner);
    }
  }
  reserves_.erase(it);
  return {};
}

Roe<void> ReserveTracker::updateReserve(const ExtendedReserveInfo &info) {
  if (info.boxId.empty()) {
    return Error(E_INVALID_RESERVE, "Reserve box id must not be empty");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  auto result = storeLocked(info);
  if (result) {
    log().debug << "Updated reserve " << info.boxId << " collateral "
                << info.collateralAmount << " debt " << info.totalDebt;
  }
  return result;
}

Roe<ExtendedReserveInfo> ReserveTracker::getReserve(const std::string &boxId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = reserves_.find(boxId);
  if (it == reserves_.end()) {
    return Error(E_RESERVE_NOT_FOUND, "Reserve not found: " + boxId);
  }
  return it->second;
}

std::vector<ExtendedReserveInfo>
ReserveTracker::getReserveByOwner(const std::string &ownerPubkey) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ExtendedReserveInfo> result;
  auto owner = ownerIndex_.find(ownerPubkey);
  if (owner == ownerIndex_.end()) {
    return result;
  }
  for (const auto &boxId : owner->second) {
    auto it = reserves_.find(boxId);
    if (it != reserves_.end()) {
      result.push_back(it->second);
    }
  }
  return result;
}

std::vector<ExtendedReserveInfo> ReserveTracker::getAllReserves() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ExtendedReserveInfo> result;
  result.reserve(reserves_.size());
  for (const auto &entry : reserves_) {
    result.push_back(entry.second);
  }
  return result;
}

size_t ReserveTracker::getReserveCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return reserves_.size();
}

Roe<ExtendedReserveInfo> ReserveTracker::addDebt(const std::string &boxId,
                                                 uint64_t amount) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = reserves_.find(boxId);
  if (it == reserves_.end()) {
    return Error(E_RESERVE_NOT_FOUND, "Reserve not found: " + boxId);
  }

  ExtendedReserveInfo updated = it->second;
  if (amount > std::numeric_limits<uint64_t>::max() - updated.totalDebt) {
    return Error(E_AMOUNT_OVERFLOW, "Reserve debt would overflow");
  }
  updated.totalDebt += amount;

  double ratio = updated.collateralizationRatio();
  if (updated.ratioAtOrBelow(config_.criticalRatio)) {
    log().debug << "Rejected debt " << amount << " on " << boxId << ", ratio would be "
                << ratio;
    return Error(E_INSUFFICIENT_COLLATERAL,
                 "Collateralization ratio would drop to " + std::to_string(ratio));
  }
  updated.lastUpdatedTimestamp = static_cast<uint64_t>(utl::getCurrentTime());

  auto stored = storeLocked(updated);
  if (!stored) {
    return stored.error();
  }
  if (updated.ratioAtOrBelow(config_.warningRatio)) {
    log().warning << "Reserve " << boxId << " at warning level, ratio " << ratio;
  }
  return updated;
}

Roe<ExtendedReserveInfo> ReserveTracker::reduceDebt(const std::string &boxId,
                                                    uint64_t amount) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = reserves_.find(boxId);
  if (it == reserves_.end()) {
    return Error(E_RESERVE_NOT_FOUND, "Reserve not found: " + boxId);
  }
  if (amount > it->second.totalDebt) {
    return Error(E_AMOUNT_EXCEEDS_DEBT, "Reduction " + std::to_string(amount) +
                                            " exceeds reserve debt " +
                                            std::to_string(it->second.totalDebt));
  }

  ExtendedReserveInfo updated = it->second;
  updated.totalDebt -= amount;
  updated.lastUpdatedTimestamp = static_cast<uint64_t>(utl::getCurrentTime());
  auto stored = storeLocked(updated);
  if (!stored) {
    return stored.error();
  }
  return updated;
}

Roe<void> ReserveTracker::applyEvent(const ReserveEvent &event) {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::visit([this](const auto &e) { return applyLocked(e); }, event);
}

Roe<void> ReserveTracker::applyLocked(const ReserveCreated &event) {
  ExtendedReserveInfo info;
  auto it = reserves_.find(event.boxId);
  if (it != reserves_.end()) {
    // Re-announced box keeps the debt already assigned to it
    info = it->second;
  }
  info.boxId = event.boxId;
  info.ownerPubkey = event.ownerPubkey;
  info.collateralAmount = event.collateralAmount;
  info.tokenId = event.tokenId;
  info.tokenAmount = event.tokenAmount;
  info.lastUpdatedHeight = event.height;
  info.lastUpdatedTimestamp = static_cast<uint64_t>(utl::getCurrentTime());

  auto stored = storeLocked(info);
  if (stored) {
    log().info << "Reserve created " << event.boxId << " collateral "
               << event.collateralAmount << " at height " << event.height;
  }
  return stored;
}

Roe<void> ReserveTracker::applyLocked(const ReserveToppedUp &event) {
  auto it = reserves_.find(event.boxId);
  if (it == reserves_.end()) {
    return Error(E_RESERVE_NOT_FOUND, "Top-up for unknown reserve " + event.boxId);
  }
  ExtendedReserveInfo info = it->second;
  if (event.additionalCollateral >
      std::numeric_limits<uint64_t>::max() - info.collateralAmount) {
    return Error(E_AMOUNT_OVERFLOW, "Reserve collateral would overflow");
  }
  info.collateralAmount += event.additionalCollateral;
  info.lastUpdatedHeight = event.height;
  info.lastUpdatedTimestamp = static_cast<uint64_t>(utl::getCurrentTime());
  return storeLocked(info);
}

Roe<void> ReserveTracker::applyLocked(const ReserveRedeemed &event) {
  auto it = reserves_.find(event.boxId);
  if (it == reserves_.end()) {
    return Error(E_RESERVE_NOT_FOUND, "Redemption for unknown reserve " + event.boxId);
  }
  ExtendedReserveInfo info = it->second;
  if (event.redeemedAmount > info.collateralAmount) {
    return Error(E_INVALID_RESERVE, "Redeemed amount exceeds reserve collateral");
  }
  info.collateralAmount -= event.redeemedAmount;
  // The payout settles the same amount of debt
  info.totalDebt -= std::min(info.totalDebt, event.redeemedAmount);
  info.lastUpdatedHeight = event.height;
  info.lastUpdatedTimestamp = static_cast<uint64_t>(utl::getCurrentTime());
  return storeLocked(info);
}

Roe<void> ReserveTracker::applyLocked(const ReserveSpent &event) {
  auto erased = eraseLocked(event.boxId);
  if (erased) {
    log().info << "Reserve spent " << event.boxId << " at height " << event.height;
  }
  return erased;
}

bool ReserveTracker::isWarning(const ExtendedReserveInfo &info) const {
  return info.ratioAtOrBelow(config_.warningRatio);
}

bool ReserveTracker::isCritical(const ExtendedReserveInfo &info) const {
  return info.ratioAtOrBelow(config_.criticalRatio);
}

std::vector<ExtendedReserveInfo> ReserveTracker::getWarningReserves() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ExtendedReserveInfo> result;
  for (const auto &entry : reserves_) {
    if (isWarning(entry.second)) {
      result.push_back(entry.second);
    }
  }
  return result;
}

std::vector<ExtendedReserveInfo> ReserveTracker::getCriticalReserves() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ExtendedReserveInfo> result;
  for (const auto &entry : reserves_) {
    if (isCritical(entry.second)) {
      result.push_back(entry.second);
    }
  }
  return result;
}

SystemTotals ReserveTracker::getSystemTotals() const {
  std::lock_guard<std::mutex> lock(mutex_);
  SystemTotals totals;
  for (const auto &entry : reserves_) {
    totals.totalCollateral += entry.second.collateralAmount;
    totals.totalDebt += entry.second.totalDebt;
  }
  return totals;
}

} // namespace bt
