#include "RedemptionManager.h"
#include "../crypto/Schnorr.h"
#include "../lib/BinaryPack.hpp"
#include "../tree/AvlVerifier.h"

namespace bt {

const char *noteStatusName(NoteStatus status) {
  switch (status) {
  case NoteStatus::OUTSTANDING:
    return "outstanding";
  case NoteStatus::REDEEMABLE:
    return "redeemable";
  case NoteStatus::PARTIALLY_REDEEMED:
    return "partially_redeemed";
  case NoteStatus::FULLY_REDEEMED:
    return "fully_redeemed";
  }
  return "unknown";
}

RedemptionManager::RedemptionManager(TrackerStateManager &state,
                                     ReserveTracker &reserves, const Config &config)
    : Module("tracker.redemption"), state_(state), reserves_(reserves),
      config_(config) {}

std::string RedemptionManager::makeRedemptionId(const RedemptionRequest &request) {
  return "redeem_" + utl::hexEncode(request.issuerPubkey).substr(0, 16) + "_" +
         utl::hexEncode(request.recipientPubkey).substr(0, 16) + "_" +
         std::to_string(request.timestamp);
}

Roe<RedemptionData>
RedemptionManager::initiateRedemption(const RedemptionRequest &request) const {
  auto issuerCheck = crypto::validatePublicKey(request.issuerPubkey);
  if (!issuerCheck) {
    return issuerCheck.error();
  }
  auto recipientCheck = crypto::validatePublicKey(request.recipientPubkey);
  if (!recipientCheck) {
    return recipientCheck.error();
  }

  auto reserve = reserves_.getReserve(request.reserveBoxId);
  if (!reserve) {
    return reserve.error();
  }
  if (reserve.value().ownerPubkey != request.issuerPubkey) {
    return Error(E_RESERVE_OWNER_MISMATCH,
                 "Reserve " + request.reserveBoxId + " is not owned by the issuer");
  }

  auto found = state_.lookupNote(request.issuerPubkey, request.recipientPubkey);
  if (!found) {
    return found.error();
  }
  const IouNote &note = found.value();
  auto signatureCheck = note.verifySignature(request.issuerPubkey);
  if (!signatureCheck) {
    return signatureCheck.error();
  }
  if (request.timestamp != note.timestamp) {
    return Error(E_INVALID_NOTE, "Request timestamp " + std::to_string(request.timestamp) +
                                     " does not match the current note " +
                                     std::to_string(note.timestamp));
  }

  if (request.amount == 0) {
    return Error(E_INVALID_REDEMPTION_AMOUNT, "Redemption amount must be positive");
  }
  if (request.amount > note.outstandingDebt()) {
    return Error(E_AMOUNT_EXCEEDS_DEBT, "Redemption amount " +
                                            std::to_string(request.amount) +
                                            " exceeds outstanding debt " +
                                            std::to_string(note.outstandingDebt()));
  }
  if (reserve.value().backingAmount() < request.amount) {
    return Error(E_INSUFFICIENT_COLLATERAL,
                 "Reserve backing " + std::to_string(reserve.value().backingAmount()) +
                     " is below the redemption amount");
  }

  uint64_t now = static_cast<uint64_t>(utl::getCurrentTime());
  uint64_t unlockTime = note.timestamp + config_.redemptionLockSeconds;
  if (now < unlockTime) {
    log().debug << "Redemption too early, unlocks at " << unlockTime;
    return Error(E_REDEMPTION_TOO_EARLY, "Note is redeemable from " +
                                             std::to_string(unlockTime) + ", now " +
                                             std::to_string(now));
  }

  auto proof = state_.proveNote(request.issuerPubkey, request.recipientPubkey);
  if (!proof) {
    return proof.error();
  }

  RedemptionPayload payload;
  payload.reserveBoxId = request.reserveBoxId;
  payload.recipientAddress = request.recipientAddress;
  payload.issuerPubkey = request.issuerPubkey;
  payload.recipientPubkey = request.recipientPubkey;
  payload.amount = request.amount;
  payload.noteTimestamp = note.timestamp;
  payload.commitmentRoot = proof.value().endDigest;

  RedemptionData data;
  data.redemptionId = makeRedemptionId(request);
  data.note = note;
  data.proof = proof.value();
  data.unsignedPayload = utl::binaryPack(payload);
  data.requiredSigners.push_back(request.issuerPubkey);
  if (!config_.trackerPublicKey.empty()) {
    data.requiredSigners.push_back(config_.trackerPublicKey);
  }
  data.estimatedFee = config_.estimatedFee;
  data.redemptionTime = now;

  log().info << "Redemption " << data.redemptionId << " prepared for amount "
             << request.amount;
  return data;
}

Roe<IouNote> RedemptionManager::completeRedemption(const std::string &issuerPubkey,
                                                   const std::string &recipientPubkey,
                                                   uint64_t amount) {
  if (amount == 0) {
    return Error(E_INVALID_REDEMPTION_AMOUNT, "Redemption amount must be positive");
  }
  auto found = state_.lookupNote(issuerPubkey, recipientPubkey);
  if (!found) {
    return found;
  }
  if (found.value().isFullyRedeemed()) {
    return Error(E_NOTE_FULLY_REDEEMED, "Note is already fully redeemed");
  }

  auto updated = state_.applyRedemption(issuerPubkey, recipientPubkey, amount);
  if (!updated) {
    return updated;
  }
  log().info << "Redeemed " << amount << ", outstanding debt now "
             << updated.value().outstandingDebt();
  return updated;
}

Roe<void> RedemptionManager::verifyRedemptionProof(const tree::BatchProof &proof,
                                                   const IouNote &note,
                                                   const std::string &issuerPubkey) const {
  auto signatureCheck = note.verifySignature(issuerPubkey);
  if (!signatureCheck) {
    return signatureCheck;
  }

  auto lookups = tree::AvlVerifier::verify(proof);
  if (!lookups) {
    return lookups.error();
  }
  if (proof.endDigest != state_.rootDigest()) {
    return Error(E_PROOF_MISMATCH, "Proof is not against the current commitment root");
  }

  std::string key = noteKey(issuerPubkey, note.recipientPubkey);
  std::string expected = note.encode(issuerPubkey);
  for (const auto &lookup : lookups.value()) {
    if (lookup.key != key) {
      continue;
    }
    if (!lookup.value || lookup.value.value() != expected) {
      return Error(E_PROOF_MISMATCH, "Committed value differs from the note");
    }
    return {};
  }
  return Error(E_PROOF_MISMATCH, "Proof does not look up the note");
}

NoteStatus RedemptionManager::noteStatus(const IouNote &note, uint64_t now) const {
  if (note.isFullyRedeemed()) {
    return NoteStatus::FULLY_REDEEMED;
  }
  if (note.amountRedeemed > 0) {
    return NoteStatus::PARTIALLY_REDEEMED;
  }
  if (now >= note.timestamp + config_.redemptionLockSeconds) {
    return NoteStatus::REDEEMABLE;
  }
  return NoteStatus::OUTSTANDING;
}

} // namespace bt
