#include "../IouNote.h"
#include "../../crypto/Schnorr.h"
#include <gtest/gtest.h>

using namespace bt;

class IouNoteTest : public ::testing::Test {
protected:
  void SetUp() override {
    auto issuer = crypto::generateKeyPair();
    auto recipient = crypto::generateKeyPair();
    ASSERT_TRUE(issuer.isOk());
    ASSERT_TRUE(recipient.isOk());
    issuer_ = issuer.value();
    recipient_ = recipient.value();
  }

  crypto::KeyPair issuer_;
  crypto::KeyPair recipient_;
};

TEST_F(IouNoteTest, CreateProducesVerifiableNote) {
  auto note = IouNote::create(issuer_.secretKey, issuer_.publicKey, recipient_.publicKey,
                              1000, 1700000000);
  ASSERT_TRUE(note.isOk()) << note.error().message;
  EXPECT_EQ(note->amountCollected, 1000u);
  EXPECT_EQ(note->amountRedeemed, 0u);
  EXPECT_EQ(note->outstandingDebt(), 1000u);
  EXPECT_FALSE(note->isFullyRedeemed());
  EXPECT_TRUE(note->verifySignature(issuer_.publicKey).isOk());
}

TEST_F(IouNoteTest, SignatureBindsAmountAndTimestamp) {
  auto note = IouNote::create(issuer_.secretKey, issuer_.publicKey, recipient_.publicKey,
                              1000, 1700000000);
  ASSERT_TRUE(note.isOk());

  IouNote raised = note.value();
  raised.amountCollected = 1001;
  auto amountCheck = raised.verifySignature(issuer_.publicKey);
  ASSERT_TRUE(amountCheck.isError());
  EXPECT_EQ(amountCheck.error().code, E_INVALID_SIGNATURE);

  IouNote moved = note.value();
  moved.timestamp += 1;
  EXPECT_TRUE(moved.verifySignature(issuer_.publicKey).isError());

  // The redeemed amount is tracker state and is not signed
  IouNote redeemed = note.value();
  redeemed.amountRedeemed = 400;
  EXPECT_TRUE(redeemed.verifySignature(issuer_.publicKey).isOk());
  EXPECT_EQ(redeemed.outstandingDebt(), 600u);
}

TEST_F(IouNoteTest, SignatureFromOtherIssuerFails) {
  auto note = IouNote::create(issuer_.secretKey, issuer_.publicKey, recipient_.publicKey,
                              10, 5);
  ASSERT_TRUE(note.isOk());
  EXPECT_TRUE(note->verifySignature(recipient_.publicKey).isError());
}

TEST_F(IouNoteTest, InvalidRecipientIsRejected) {
  std::string badRecipient(crypto::PUBLIC_KEY_SIZE, '\0');
  auto note = IouNote::create(issuer_.secretKey, issuer_.publicKey, badRecipient, 10, 5);
  ASSERT_TRUE(note.isError());
  EXPECT_EQ(note.error().code, E_INVALID_PUBLIC_KEY);
}

TEST_F(IouNoteTest, EncodeDecodeKeepsIssuer) {
  auto note = IouNote::create(issuer_.secretKey, issuer_.publicKey, recipient_.publicKey,
                              123456789, 1700000001);
  ASSERT_TRUE(note.isOk());
  IouNote stored = note.value();
  stored.amountRedeemed = 42;

  std::string encoded = stored.encode(issuer_.publicKey);
  EXPECT_EQ(encoded.size(), IouNote::ENCODED_SIZE);
  EXPECT_EQ(encoded.substr(0, crypto::PUBLIC_KEY_SIZE), issuer_.publicKey);

  auto record = NoteRecord::decode(encoded);
  ASSERT_TRUE(record.isOk()) << record.error().message;
  EXPECT_EQ(record->issuerPubkey, issuer_.publicKey);
  EXPECT_EQ(record->note, stored);

  EXPECT_TRUE(NoteRecord::decode(encoded.substr(1)).isError());
  EXPECT_TRUE(NoteRecord::decode(encoded + "x").isError());
}

TEST_F(IouNoteTest, NoteKeyIsTwoHashes) {
  std::string key = noteKey(issuer_.publicKey, recipient_.publicKey);
  EXPECT_EQ(key.size(), 64u);
  EXPECT_EQ(key.substr(0, 32), issuerKeyPrefix(issuer_.publicKey));
  EXPECT_NE(key, noteKey(recipient_.publicKey, issuer_.publicKey));
}

TEST_F(IouNoteTest, RedeemedBeyondCollectedHasNoDebt) {
  IouNote note;
  note.amountCollected = 100;
  note.amountRedeemed = 100;
  EXPECT_TRUE(note.isFullyRedeemed());
  EXPECT_EQ(note.outstandingDebt(), 0u);
}
