#include "../AvlVerifier.h"
#include "../CommitmentTree.h"
#include <gtest/gtest.h>
#include <filesystem>

using namespace bt;
using namespace bt::tree;

namespace {

std::string makeKey(uint32_t i) {
  std::string key(KEY_SIZE, '\0');
  for (size_t b = 0; b < KEY_SIZE; b += 4) {
    key[b] = static_cast<char>((i * 2654435761u) >> 24);
  }
  key[KEY_SIZE - 2] = static_cast<char>((i >> 8) & 0xff);
  key[KEY_SIZE - 1] = static_cast<char>(i & 0xff);
  return key;
}

} // namespace

class TreeRecoveryTest : public ::testing::Test {
protected:
  void SetUp() override {
    testDir_ = std::filesystem::temp_directory_path() / "tree_recovery_test";
    cleanupTestDir();
    std::filesystem::create_directories(testDir_);
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

  std::string dir() const { return testDir_.string(); }

  std::filesystem::path testDir_;
};

TEST_F(TreeRecoveryTest, CheckpointThenReopenGivesSameDigest) {
  std::string digest;
  {
    CommitmentTree tree;
    ASSERT_TRUE(tree.open(dir()).isOk());
    for (uint32_t i = 0; i < 300; ++i) {
      ASSERT_TRUE(tree.insert(makeKey(i), "value_" + std::to_string(i)).isOk());
    }
    ASSERT_TRUE(tree.checkpoint().isOk());
    EXPECT_EQ(tree.getCheckpointId(), 1u);
    EXPECT_EQ(tree.operationsSinceCheckpoint(), 0u);
    digest = tree.rootDigest();
  }

  CommitmentTree reopened;
  auto result = reopened.open(dir());
  ASSERT_TRUE(result.isOk()) << result.error().message;
  EXPECT_EQ(reopened.rootDigest(), digest);
  EXPECT_EQ(reopened.getCheckpointId(), 1u);
  EXPECT_EQ(reopened.getOperationSequence(), 300u);
  EXPECT_EQ(reopened.getNodeCount(), 300u);
  EXPECT_EQ(*reopened.lookup(makeKey(42)).value(), "value_42");
}

TEST_F(TreeRecoveryTest, OperationsAfterCheckpointAreReplayed) {
  std::string digest;
  {
    CommitmentTree tree;
    ASSERT_TRUE(tree.open(dir()).isOk());
    for (uint32_t i = 0; i < 100; ++i) {
      ASSERT_TRUE(tree.insert(makeKey(i), "v").isOk());
    }
    ASSERT_TRUE(tree.checkpoint().isOk());
    for (uint32_t i = 100; i < 150; ++i) {
      ASSERT_TRUE(tree.insert(makeKey(i), "v").isOk());
    }
    ASSERT_TRUE(tree.update(makeKey(5), "changed").isOk());
    ASSERT_TRUE(tree.remove(makeKey(6)).isOk());
    EXPECT_EQ(tree.operationsSinceCheckpoint(), 52u);
    digest = tree.rootDigest();
  }

  CommitmentTree reopened;
  auto result = reopened.open(dir());
  ASSERT_TRUE(result.isOk()) << result.error().message;
  EXPECT_EQ(reopened.rootDigest(), digest);
  EXPECT_EQ(reopened.getOperationSequence(), 152u);
  EXPECT_EQ(*reopened.lookup(makeKey(5)).value(), "changed");
  EXPECT_FALSE(reopened.lookup(makeKey(6)).value().has_value());
}

TEST_F(TreeRecoveryTest, LogAloneRebuildsTree) {
  std::string digest;
  {
    CommitmentTree tree;
    ASSERT_TRUE(tree.open(dir()).isOk());
    for (uint32_t i = 0; i < 40; ++i) {
      ASSERT_TRUE(tree.insert(makeKey(i), std::to_string(i)).isOk());
    }
    digest = tree.rootDigest();
  }

  CommitmentTree reopened;
  ASSERT_TRUE(reopened.open(dir()).isOk());
  EXPECT_EQ(reopened.rootDigest(), digest);
  EXPECT_EQ(reopened.getCheckpointId(), 0u);
}

TEST_F(TreeRecoveryTest, RepeatedCheckpointsKeepOnlyLiveNodes) {
  CommitmentTree tree;
  ASSERT_TRUE(tree.open(dir()).isOk());
  for (uint32_t i = 0; i < 64; ++i) {
    ASSERT_TRUE(tree.insert(makeKey(i), "first").isOk());
  }
  ASSERT_TRUE(tree.checkpoint().isOk());
  for (uint32_t i = 0; i < 64; ++i) {
    ASSERT_TRUE(tree.update(makeKey(i), "second").isOk());
  }
  ASSERT_TRUE(tree.generateProof().isOk());
  ASSERT_TRUE(tree.checkpoint().isOk());
  EXPECT_EQ(tree.getCheckpointId(), 2u);
  EXPECT_EQ(tree.getNodeCount(), 64u);

  std::string digest = tree.rootDigest();
  tree.close();

  CommitmentTree reopened;
  ASSERT_TRUE(reopened.open(dir()).isOk());
  EXPECT_EQ(reopened.rootDigest(), digest);
  EXPECT_EQ(reopened.getNodeCount(), 64u);
}

TEST_F(TreeRecoveryTest, ProofAfterReopenStartsAtRecoveredRoot) {
  std::string digest;
  {
    CommitmentTree tree;
    ASSERT_TRUE(tree.open(dir()).isOk());
    for (uint32_t i = 0; i < 30; ++i) {
      ASSERT_TRUE(tree.insert(makeKey(i), "v").isOk());
    }
    ASSERT_TRUE(tree.checkpoint().isOk());
    digest = tree.rootDigest();
  }

  CommitmentTree reopened;
  ASSERT_TRUE(reopened.open(dir()).isOk());
  ASSERT_TRUE(reopened.insert(makeKey(1000), "after").isOk());
  auto proof = reopened.generateProof();
  ASSERT_TRUE(proof.isOk());
  EXPECT_EQ(proof->startDigest, digest);
  EXPECT_TRUE(AvlVerifier::verify(proof.value()).isOk());
}

TEST_F(TreeRecoveryTest, MissingCheckpointNodesHaltTheTree) {
  {
    CommitmentTree tree;
    ASSERT_TRUE(tree.open(dir()).isOk());
    for (uint32_t i = 0; i < 10; ++i) {
      ASSERT_TRUE(tree.insert(makeKey(i), "v").isOk());
    }
    ASSERT_TRUE(tree.checkpoint().isOk());
  }
  std::filesystem::remove(testDir_ / CommitmentTree::NODES_FILE);

  CommitmentTree reopened;
  auto result = reopened.open(dir());
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, E_TREE_CORRUPTION);
  EXPECT_TRUE(reopened.isHalted());
  EXPECT_TRUE(reopened.generateProof().isError());
}
