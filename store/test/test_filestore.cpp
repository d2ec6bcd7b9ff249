#include "../FileStore.h"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace bt;

class FileStoreTest : public ::testing::Test {
protected:
  void SetUp() override {
    testDir_ = std::filesystem::temp_directory_path() / "filestore_test";
    cleanupTestDir();
    std::filesystem::create_directories(testDir_);
    path_ = (testDir_ / "records.log").string();
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

  std::filesystem::path testDir_;
  std::string path_;
};

TEST_F(FileStoreTest, InitCreatesEmptyFile) {
  FileStore store;
  auto result = store.init(path_);
  ASSERT_TRUE(result.isOk()) << result.error().message;
  EXPECT_TRUE(store.isOpen());
  EXPECT_EQ(store.getRecordCount(), 0u);
  EXPECT_TRUE(std::filesystem::exists(path_));
}

TEST_F(FileStoreTest, InitFailsWhenFileExists) {
  {
    FileStore store;
    ASSERT_TRUE(store.init(path_).isOk());
  }
  FileStore store;
  EXPECT_TRUE(store.init(path_).isError());
}

TEST_F(FileStoreTest, MountFailsForMissingFile) {
  FileStore store;
  EXPECT_TRUE(store.mount(path_).isError());
}

TEST_F(FileStoreTest, AppendAndReadRecords) {
  FileStore store;
  ASSERT_TRUE(store.openOrInit(path_).isOk());

  auto first = store.appendRecord("first");
  auto second = store.appendRecord(std::string("\x00\x01\x02", 3));
  ASSERT_TRUE(first.isOk());
  ASSERT_TRUE(second.isOk());
  EXPECT_EQ(first.value(), 0u);
  EXPECT_EQ(second.value(), 1u);

  auto read = store.readRecord(1);
  ASSERT_TRUE(read.isOk());
  EXPECT_EQ(read.value(), std::string("\x00\x01\x02", 3));
  EXPECT_TRUE(store.readRecord(2).isError());
}

TEST_F(FileStoreTest, RecordsSurviveRemount) {
  {
    FileStore store;
    ASSERT_TRUE(store.init(path_).isOk());
    for (int i = 0; i < 10; ++i) {
      ASSERT_TRUE(store.appendRecord("record_" + std::to_string(i)).isOk());
    }
  }

  FileStore store;
  auto result = store.mount(path_);
  ASSERT_TRUE(result.isOk()) << result.error().message;
  EXPECT_EQ(store.getRecordCount(), 10u);
  EXPECT_EQ(store.readRecord(7).value(), "record_7");
}

TEST_F(FileStoreTest, RewindDropsTail) {
  FileStore store;
  ASSERT_TRUE(store.init(path_).isOk());
  for (int i = 0; i < 5; ++i) {
    ASSERT_TRUE(store.appendRecord("r" + std::to_string(i)).isOk());
  }

  ASSERT_TRUE(store.rewindTo(2).isOk());
  EXPECT_EQ(store.getRecordCount(), 2u);
  EXPECT_TRUE(store.readRecord(2).isError());

  auto appended = store.appendRecord("after");
  ASSERT_TRUE(appended.isOk());
  EXPECT_EQ(appended.value(), 2u);
  EXPECT_EQ(store.readRecord(2).value(), "after");
  EXPECT_TRUE(store.rewindTo(10).isError());
}

TEST_F(FileStoreTest, TornTailIsCutOnMount) {
  uintmax_t goodSize = 0;
  {
    FileStore store;
    ASSERT_TRUE(store.init(path_).isOk());
    ASSERT_TRUE(store.appendRecord("complete").isOk());
    goodSize = store.getCurrentSize();
  }

  // Half of a size prefix, as left by a crash mid-append
  {
    std::ofstream out(path_, std::ios::binary | std::ios::app);
    out.write("\x10\x00\x00", 3);
  }
  ASSERT_EQ(std::filesystem::file_size(path_), goodSize + 3);

  FileStore store;
  auto result = store.mount(path_);
  ASSERT_TRUE(result.isOk()) << result.error().message;
  EXPECT_EQ(store.getRecordCount(), 1u);
  EXPECT_EQ(store.readRecord(0).value(), "complete");
  EXPECT_EQ(std::filesystem::file_size(path_), goodSize);
}

TEST_F(FileStoreTest, BadMagicIsRejected) {
  {
    std::ofstream out(path_, std::ios::binary);
    out << std::string(64, 'x');
  }
  FileStore store;
  EXPECT_TRUE(store.mount(path_).isError());
}
