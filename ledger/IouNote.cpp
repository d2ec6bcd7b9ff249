#include "IouNote.h"
#include "../crypto/Hash.h"
#include "../crypto/Schnorr.h"
#include "../lib/Serialize.hpp"

#include <sstream>

namespace bt {

std::string IouNote::signingMessage() const {
  return crypto::signingMessage(recipientPubkey, amountCollected, timestamp);
}

Roe<void> IouNote::verifySignature(const std::string &issuerPubkey) const {
  auto keyCheck = crypto::validatePublicKey(recipientPubkey);
  if (!keyCheck) {
    return Error(keyCheck.error().code,
                 "Invalid recipient public key: " + keyCheck.error().message);
  }
  return crypto::verify(signature, signingMessage(), issuerPubkey);
}

Roe<IouNote> IouNote::create(const std::string &issuerSecret,
                             const std::string &issuerPubkey,
                             const std::string &recipientPubkey,
                             uint64_t amountCollected, uint64_t timestamp) {
  IouNote note;
  note.recipientPubkey = recipientPubkey;
  note.amountCollected = amountCollected;
  note.amountRedeemed = 0;
  note.timestamp = timestamp;

  auto keyCheck = crypto::validatePublicKey(recipientPubkey);
  if (!keyCheck) {
    return keyCheck.error();
  }
  auto signature = crypto::sign(note.signingMessage(), issuerSecret, issuerPubkey);
  if (!signature) {
    return signature.error();
  }
  note.signature = signature.value();
  return note;
}

std::string IouNote::encode(const std::string &issuerPubkey) const {
  std::ostringstream oss;
  OutputArchive ar(oss);
  ar.writeRaw(issuerPubkey);
  ar & amountCollected & amountRedeemed & timestamp;
  ar.writeRaw(signature);
  ar.writeRaw(recipientPubkey);
  return oss.str();
}

Roe<NoteRecord> NoteRecord::decode(const std::string &value) {
  if (value.size() != IouNote::ENCODED_SIZE) {
    return Error(E_INVALID_NOTE, "Encoded note must be " +
                                     std::to_string(IouNote::ENCODED_SIZE) + " bytes, got " +
                                     std::to_string(value.size()));
  }
  std::istringstream iss(value);
  InputArchive ar(iss);
  NoteRecord record;
  ar.readRaw(record.issuerPubkey, crypto::PUBLIC_KEY_SIZE);
  ar & record.note.amountCollected & record.note.amountRedeemed & record.note.timestamp;
  ar.readRaw(record.note.signature, crypto::SIGNATURE_SIZE);
  ar.readRaw(record.note.recipientPubkey, crypto::PUBLIC_KEY_SIZE);
  if (ar.failed()) {
    return Error(E_INVALID_NOTE, "Truncated note encoding");
  }
  return record;
}

std::string noteKey(const std::string &issuerPubkey, const std::string &recipientPubkey) {
  return crypto::blake2b256(issuerPubkey) + crypto::blake2b256(recipientPubkey);
}

std::string issuerKeyPrefix(const std::string &issuerPubkey) {
  return crypto::blake2b256(issuerPubkey);
}

} // namespace bt
