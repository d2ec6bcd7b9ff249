#include "../TrackerStateManager.h"
#include "../../crypto/Schnorr.h"
#include "../../tree/AvlVerifier.h"
#include <gtest/gtest.h>
#include <filesystem>

using namespace bt;

namespace {

// Lets a test take the note keyspace away under an open manager
class DetachableStateManager : public TrackerStateManager {
public:
  void closeNoteStore() { noteStore().close(); }
};

} // namespace

class TrackerStateManagerTest : public ::testing::Test {
protected:
  void SetUp() override {
    testDir_ = std::filesystem::temp_directory_path() / "state_manager_test";
    cleanupTestDir();
    std::filesystem::create_directories(testDir_);
    config_.workDir = testDir_.string();

    auto issuer = crypto::generateKeyPair();
    auto recipient = crypto::generateKeyPair();
    ASSERT_TRUE(issuer.isOk());
    ASSERT_TRUE(recipient.isOk());
    issuer_ = issuer.value();
    recipient_ = recipient.value();
    now_ = static_cast<uint64_t>(utl::getCurrentTime());
  }

  void TearDown() override {
    cleanupTestDir();
  }

  void cleanupTestDir() {
    std::error_code ec;
    if (std::filesystem::exists(testDir_, ec)) {
      std::filesystem::remove_all(testDir_, ec);
    }
  }

  IouNote makeNote(const crypto::KeyPair &issuer, const std::string &recipientPubkey,
                   uint64_t amount, uint64_t timestamp) {
    auto note = IouNote::create(issuer.secretKey, issuer.publicKey, recipientPubkey,
                                amount, timestamp);
    EXPECT_TRUE(note.isOk());
    return note.value();
  }

  std::filesystem::path testDir_;
  TrackerStateManager::Config config_;
  crypto::KeyPair issuer_;
  crypto::KeyPair recipient_;
  uint64_t now_{ 0 };
};

TEST_F(TrackerStateManagerTest, OpenCreatesEmptyState) {
  TrackerStateManager manager;
  auto result = manager.open(config_);
  ASSERT_TRUE(result.isOk()) << result.error().message;
  EXPECT_EQ(manager.getState().commitmentRoot, tree::emptyDigest());
  EXPECT_EQ(manager.getState().lastCommitHeight, 0u);
  EXPECT_TRUE(manager.getAllNotes().value().empty());
  EXPECT_TRUE(std::filesystem::exists(testDir_ / TrackerStateManager::STATE_FILE));
}

TEST_F(TrackerStateManagerTest, AddNoteThenLookup) {
  TrackerStateManager manager;
  ASSERT_TRUE(manager.open(config_).isOk());

  IouNote note = makeNote(issuer_, recipient_.publicKey, 1000, now_);
  auto added = manager.addNote(issuer_.publicKey, note);
  ASSERT_TRUE(added.isOk()) << added.error().message;

  auto found = manager.lookupNote(issuer_.publicKey, recipient_.publicKey);
  ASSERT_TRUE(found.isOk());
  EXPECT_EQ(found.value(), note);
  EXPECT_NE(manager.getState().commitmentRoot, tree::emptyDigest());
  EXPECT_EQ(manager.getState().commitmentRoot, manager.rootDigest());
}

TEST_F(TrackerStateManagerTest, LookupMissingNote) {
  TrackerStateManager manager;
  ASSERT_TRUE(manager.open(config_).isOk());
  auto found = manager.lookupNote(issuer_.publicKey, recipient_.publicKey);
  ASSERT_TRUE(found.isError());
  EXPECT_EQ(found.error().code, E_NOTE_NOT_FOUND);
}

TEST_F(TrackerStateManagerTest, BadSignatureLeavesStateUnchanged) {
  TrackerStateManager manager;
  ASSERT_TRUE(manager.open(config_).isOk());
  std::string rootBefore = manager.rootDigest();

  IouNote note = makeNote(issuer_, recipient_.publicKey, 1000, now_);
  note.amountCollected = 2000;
  auto added = manager.addNote(issuer_.publicKey, note);
  ASSERT_TRUE(added.isError());
  EXPECT_EQ(added.error().code, E_INVALID_SIGNATURE);
  EXPECT_EQ(manager.rootDigest(), rootBefore);
  EXPECT_TRUE(manager.lookupNote(issuer_.publicKey, recipient_.publicKey).isError());
}

TEST_F(TrackerStateManagerTest, InvalidIssuerKeyIsRejected) {
  TrackerStateManager manager;
  ASSERT_TRUE(manager.open(config_).isOk());
  IouNote note = makeNote(issuer_, recipient_.publicKey, 1000, now_);
  auto added = manager.addNote(std::string(crypto::PUBLIC_KEY_SIZE, '\0'), note);
  ASSERT_TRUE(added.isError());
  EXPECT_EQ(added.error().code, E_INVALID_PUBLIC_KEY);
}

TEST_F(TrackerStateManagerTest, FutureTimestampIsRejected) {
  TrackerStateManager manager;
  ASSERT_TRUE(manager.open(config_).isOk());
  IouNote note = makeNote(issuer_, recipient_.publicKey, 1000, now_ + 3600);
  auto added = manager.addNote(issuer_.publicKey, note);
  ASSERT_TRUE(added.isError());
  EXPECT_EQ(added.error().code, E_FUTURE_TIMESTAMP);

  // Inside the allowed skew
  IouNote skewed = makeNote(issuer_, recipient_.publicKey, 1000, now_ + 60);
  EXPECT_TRUE(manager.addNote(issuer_.publicKey, skewed).isOk());
}

TEST_F(TrackerStateManagerTest, ReplacementNeedsNewerTimestamp) {
  TrackerStateManager manager;
  ASSERT_TRUE(manager.open(config_).isOk());
  ASSERT_TRUE(manager.addNote(issuer_.publicKey,
                              makeNote(issuer_, recipient_.publicKey, 1000, now_ - 100))
                  .isOk());

  auto sameTimestamp = manager.addNote(
      issuer_.publicKey, makeNote(issuer_, recipient_.publicKey, 1500, now_ - 100));
  ASSERT_TRUE(sameTimestamp.isError());
  EXPECT_EQ(sameTimestamp.error().code, E_DUPLICATE_NONCE);

  auto older = manager.addNote(issuer_.publicKey,
                               makeNote(issuer_, recipient_.publicKey, 1500, now_ - 200));
  ASSERT_TRUE(older.isError());
  EXPECT_EQ(older.error().code, E_DUPLICATE_NONCE);

  auto decreased = manager.addNote(
      issuer_.publicKey, makeNote(issuer_, recipient_.publicKey, 900, now_ - 50));
  ASSERT_TRUE(decreased.isError());
  EXPECT_EQ(decreased.error().code, E_AMOUNT_DECREASE);

  ASSERT_TRUE(manager.addNote(issuer_.publicKey,
                              makeNote(issuer_, recipient_.publicKey, 1500, now_ - 50))
                  .isOk());
  EXPECT_EQ(manager.lookupNote(issuer_.publicKey, recipient_.publicKey)->amountCollected,
            1500u);
}

TEST_F(TrackerStateManagerTest, ReplacementKeepsRedeemedAmount) {
  TrackerStateManager manager;
  ASSERT_TRUE(manager.open(config_).isOk());
  ASSERT_TRUE(manager.addNote(issuer_.publicKey,
                              makeNote(issuer_, recipient_.publicKey, 1000, now_ - 100))
                  .isOk());
  auto redeemed = manager.applyRedemption(issuer_.publicKey, recipient_.publicKey, 300);
  ASSERT_TRUE(redeemed.isOk());
  EXPECT_EQ(redeemed->amountRedeemed, 300u);

  ASSERT_TRUE(manager.addNote(issuer_.publicKey,
                              makeNote(issuer_, recipient_.publicKey, 2000, now_ - 10))
                  .isOk());
  auto current = manager.lookupNote(issuer_.publicKey, recipient_.publicKey);
  ASSERT_TRUE(current.isOk());
  EXPECT_EQ(current->amountCollected, 2000u);
  EXPECT_EQ(current->amountRedeemed, 300u);
  EXPECT_EQ(current->outstandingDebt(), 1700u);
}

TEST_F(TrackerStateManagerTest, SubmittedRedeemedAmountIsRejected) {
  TrackerStateManager manager;
  ASSERT_TRUE(manager.open(config_).isOk());

  IouNote note = makeNote(issuer_, recipient_.publicKey, 1000, now_);
  note.amountRedeemed = 1000;
  ASSERT_TRUE(note.verifySignature(issuer_.publicKey).isOk());

  auto result = manager.addNote(issuer_.publicKey, note);
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, E_INVALID_NOTE);
  EXPECT_EQ(manager.rootDigest(), tree::emptyDigest());
  EXPECT_TRUE(manager.lookupNote(issuer_.publicKey, recipient_.publicKey).isError());

  // Same for a replacement of an existing pair
  ASSERT_TRUE(manager.addNote(issuer_.publicKey,
                              makeNote(issuer_, recipient_.publicKey, 1000, now_ - 10))
                  .isOk());
  IouNote replacement = makeNote(issuer_, recipient_.publicKey, 1200, now_);
  replacement.amountRedeemed = 1200;
  auto replaced = manager.addNote(issuer_.publicKey, replacement);
  ASSERT_TRUE(replaced.isError());
  EXPECT_EQ(replaced.error().code, E_INVALID_NOTE);
  auto current = manager.lookupNote(issuer_.publicKey, recipient_.publicKey);
  ASSERT_TRUE(current.isOk());
  EXPECT_EQ(current->amountRedeemed, 0u);
  EXPECT_EQ(current->outstandingDebt(), 1000u);
}

TEST_F(TrackerStateManagerTest, RedemptionIsClampedAtCollected) {
  TrackerStateManager manager;
  ASSERT_TRUE(manager.open(config_).isOk());
  ASSERT_TRUE(manager.addNote(issuer_.publicKey,
                              makeNote(issuer_, recipient_.publicKey, 100, now_))
                  .isOk());
  auto redeemed = manager.applyRedemption(issuer_.publicKey, recipient_.publicKey, 250);
  ASSERT_TRUE(redeemed.isOk());
  EXPECT_EQ(redeemed->amountRedeemed, 100u);
  EXPECT_TRUE(redeemed->isFullyRedeemed());
}

TEST_F(TrackerStateManagerTest, QueriesByIssuerAndRecipient) {
  TrackerStateManager manager;
  ASSERT_TRUE(manager.open(config_).isOk());

  auto otherIssuer = crypto::generateKeyPair();
  auto otherRecipient = crypto::generateKeyPair();
  ASSERT_TRUE(otherIssuer.isOk());
  ASSERT_TRUE(otherRecipient.isOk());

  ASSERT_TRUE(
      manager.addNote(issuer_.publicKey, makeNote(issuer_, recipient_.publicKey, 10, now_))
          .isOk());
  ASSERT_TRUE(manager
                  .addNote(issuer_.publicKey,
                           makeNote(issuer_, otherRecipient->publicKey, 20, now_))
                  .isOk());
  ASSERT_TRUE(manager
                  .addNote(otherIssuer->publicKey,
                           makeNote(otherIssuer.value(), recipient_.publicKey, 30, now_))
                  .isOk());

  auto byIssuer = manager.getIssuerNotes(issuer_.publicKey);
  ASSERT_TRUE(byIssuer.isOk());
  EXPECT_EQ(byIssuer->size(), 2u);
  for (const auto &record : byIssuer.value()) {
    EXPECT_EQ(record.issuerPubkey, issuer_.publicKey);
  }

  auto byRecipient = manager.getRecipientNotes(recipient_.publicKey);
  ASSERT_TRUE(byRecipient.isOk());
  EXPECT_EQ(byRecipient->size(), 2u);
  for (const auto &record : byRecipient.value()) {
    EXPECT_EQ(record.note.recipientPubkey, recipient_.publicKey);
  }

  EXPECT_EQ(manager.getAllNotes()->size(), 3u);
}

TEST_F(TrackerStateManagerTest, NoteProofVerifiesAgainstRoot) {
  TrackerStateManager manager;
  ASSERT_TRUE(manager.open(config_).isOk());
  IouNote note = makeNote(issuer_, recipient_.publicKey, 777, now_);
  ASSERT_TRUE(manager.addNote(issuer_.publicKey, note).isOk());

  auto proof = manager.proveNote(issuer_.publicKey, recipient_.publicKey);
  ASSERT_TRUE(proof.isOk()) << proof.error().message;
  EXPECT_EQ(proof->endDigest, manager.rootDigest());

  auto lookups = tree::AvlVerifier::verify(proof.value());
  ASSERT_TRUE(lookups.isOk()) << lookups.error().message;
  ASSERT_EQ(lookups->size(), 1u);
  EXPECT_EQ(lookups.value()[0].value.value(), note.encode(issuer_.publicKey));
}

TEST_F(TrackerStateManagerTest, BatchProofCoversAddedNotes) {
  TrackerStateManager manager;
  ASSERT_TRUE(manager.open(config_).isOk());
  ASSERT_TRUE(
      manager.addNote(issuer_.publicKey, makeNote(issuer_, recipient_.publicKey, 5, now_))
          .isOk());
  auto proof = manager.generateProof();
  ASSERT_TRUE(proof.isOk());
  EXPECT_EQ(proof->operations.size(), 1u);
  EXPECT_EQ(proof->endDigest, manager.rootDigest());
  EXPECT_TRUE(tree::AvlVerifier::verify(proof.value()).isOk());
}

TEST_F(TrackerStateManagerTest, CommitmentHeightOnlyMovesForward) {
  TrackerStateManager manager;
  ASSERT_TRUE(manager.open(config_).isOk());
  ASSERT_TRUE(manager.recordCommitment(100).isOk());
  EXPECT_EQ(manager.getState().lastCommitHeight, 100u);
  ASSERT_TRUE(manager.recordCommitment(100).isOk());

  auto backwards = manager.recordCommitment(99);
  ASSERT_TRUE(backwards.isError());
  EXPECT_EQ(backwards.error().code, E_INVALID_COMMITMENT_HEIGHT);
  EXPECT_EQ(manager.getState().lastCommitHeight, 100u);
}

TEST_F(TrackerStateManagerTest, StateSurvivesReopen) {
  std::string root;
  {
    TrackerStateManager manager;
    ASSERT_TRUE(manager.open(config_).isOk());
    for (int i = 0; i < 5; ++i) {
      auto recipient = crypto::generateKeyPair();
      ASSERT_TRUE(recipient.isOk());
      ASSERT_TRUE(manager
                      .addNote(issuer_.publicKey,
                               makeNote(issuer_, recipient->publicKey, 100 + i, now_))
                      .isOk());
    }
    ASSERT_TRUE(manager.recordCommitment(42).isOk());
    root = manager.rootDigest();
  }

  TrackerStateManager reopened;
  auto result = reopened.open(config_);
  ASSERT_TRUE(result.isOk()) << result.error().message;
  EXPECT_EQ(reopened.rootDigest(), root);
  EXPECT_EQ(reopened.getState().commitmentRoot, root);
  EXPECT_EQ(reopened.getState().lastCommitHeight, 42u);
  EXPECT_EQ(reopened.getIssuerNotes(issuer_.publicKey)->size(), 5u);
}

TEST_F(TrackerStateManagerTest, AutomaticCheckpointAfterInterval) {
  config_.checkpointInterval = 3;
  TrackerStateManager manager;
  ASSERT_TRUE(manager.open(config_).isOk());
  for (int i = 0; i < 3; ++i) {
    auto recipient = crypto::generateKeyPair();
    ASSERT_TRUE(recipient.isOk());
    ASSERT_TRUE(manager
                    .addNote(issuer_.publicKey,
                             makeNote(issuer_, recipient->publicKey, 1, now_))
                    .isOk());
  }
  EXPECT_EQ(manager.getTree().getCheckpointId(), 1u);
  EXPECT_EQ(manager.getTree().operationsSinceCheckpoint(), 0u);
}

TEST_F(TrackerStateManagerTest, MissingStoreEntryIsRestoredFromTree) {
  {
    TrackerStateManager manager;
    ASSERT_TRUE(manager.open(config_).isOk());
    ASSERT_TRUE(manager
                    .addNote(issuer_.publicKey,
                             makeNote(issuer_, recipient_.publicKey, 64, now_))
                    .isOk());
  }
  // Lose the note store, as if the process died between the tree and store writes
  std::filesystem::remove(testDir_ / TrackerStateManager::NOTES_FILE);

  TrackerStateManager reopened;
  auto result = reopened.open(config_);
  ASSERT_TRUE(result.isOk()) << result.error().message;
  auto found = reopened.lookupNote(issuer_.publicKey, recipient_.publicKey);
  ASSERT_TRUE(found.isOk());
  EXPECT_EQ(found->amountCollected, 64u);
}

TEST_F(TrackerStateManagerTest, StoreFailureLeavesTreeUnchanged) {
  std::string rootBefore;
  uint64_t sequenceBefore = 0;
  {
    DetachableStateManager manager;
    ASSERT_TRUE(manager.open(config_).isOk());
    ASSERT_TRUE(manager.addNote(issuer_.publicKey,
                                makeNote(issuer_, recipient_.publicKey, 1000, now_ - 10))
                    .isOk());
    rootBefore = manager.rootDigest();
    sequenceBefore = manager.getTree().getOperationSequence();
    size_t pendingBefore = manager.getTree().pendingOperationCount();

    manager.closeNoteStore();

    auto other = crypto::generateKeyPair();
    ASSERT_TRUE(other.isOk());
    auto inserted =
        manager.addNote(issuer_.publicKey, makeNote(issuer_, other->publicKey, 50, now_));
    ASSERT_TRUE(inserted.isError());
    EXPECT_EQ(inserted.error().code, E_STORAGE);

    auto replaced = manager.addNote(issuer_.publicKey,
                                    makeNote(issuer_, recipient_.publicKey, 2000, now_));
    ASSERT_TRUE(replaced.isError());
    EXPECT_EQ(replaced.error().code, E_STORAGE);

    EXPECT_EQ(manager.rootDigest(), rootBefore);
    EXPECT_EQ(manager.getState().commitmentRoot, rootBefore);
    EXPECT_EQ(manager.getTree().getOperationSequence(), sequenceBefore);
    EXPECT_EQ(manager.getTree().pendingOperationCount(), pendingBefore);
    auto notes = manager.getAllNotes();
    ASSERT_TRUE(notes.isOk());
    ASSERT_EQ(notes->size(), 1u);
    EXPECT_EQ(notes->front().note.amountCollected, 1000u);
  }

  // Nothing of the failed writes is replayed on reopen
  TrackerStateManager reopened;
  auto opened = reopened.open(config_);
  ASSERT_TRUE(opened.isOk()) << opened.error().message;
  EXPECT_EQ(reopened.rootDigest(), rootBefore);
  EXPECT_EQ(reopened.getTree().getOperationSequence(), sequenceBefore);
  EXPECT_EQ(reopened.getAllNotes()->size(), 1u);
}
