#include "../ReserveTracker.h"
#include "../../crypto/Schnorr.h"
#include <gtest/gtest.h>
#include <cmath>
#include <filesystem>

using namespace bt;

class ReserveTrackerTest : public ::testing::Test {
protected:
  void SetUp() override {
    testDir_ = std::filesystem::temp_directory_path() / "reserve_tracker_test";
    cleanupTestDir();
    std::filesystem::create_directories(testDir_);
    path_ = (testDir_ / ReserveTracker::RESERVES_FILE).string();

    auto owner = crypto::generateKeyPair();
    ASSERT_TRUE(owner.isOk());
    owner_ = owner->publicKey;
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

  ExtendedReserveInfo makeReserve(const std::string &boxId, uint64_t collateral) {
    ExtendedReserveInfo info;
    info.boxId = boxId;
    info.ownerPubkey = owner_;
    info.collateralAmount = collateral;
    return info;
  }

  std::filesystem::path testDir_;
  std::string path_;
  std::string owner_;
};

TEST_F(ReserveTrackerTest, RatioIsInfiniteWithoutDebt) {
  ExtendedReserveInfo info = makeReserve("box", 100);
  EXPECT_TRUE(std::isinf(info.collateralizationRatio()));
  info.totalDebt = 50;
  EXPECT_DOUBLE_EQ(info.collateralizationRatio(), 2.0);
}

TEST_F(ReserveTrackerTest, TokenBackingOverridesCollateral) {
  ExtendedReserveInfo info = makeReserve("box", 1000);
  info.tokenId = "token";
  info.tokenAmount = 300;
  info.totalDebt = 300;
  EXPECT_TRUE(info.isTokenBacked());
  EXPECT_EQ(info.backingAmount(), 300u);
  EXPECT_DOUBLE_EQ(info.collateralizationRatio(), 1.0);
}

TEST_F(ReserveTrackerTest, DebtScenarioRejectsUndercollateralizedDebt) {
  ReserveTracker tracker;
  ASSERT_TRUE(tracker.open(path_, ReserveTracker::Config()).isOk());
  ASSERT_TRUE(tracker.updateReserve(makeReserve("box1", 1000000000)).isOk());

  auto first = tracker.addDebt("box1", 500000000);
  ASSERT_TRUE(first.isOk()) << first.error().message;
  EXPECT_DOUBLE_EQ(first->collateralizationRatio(), 2.0);
  EXPECT_FALSE(tracker.isWarning(first.value()));

  auto second = tracker.addDebt("box1", 600000000);
  ASSERT_TRUE(second.isError());
  EXPECT_EQ(second.error().code, E_INSUFFICIENT_COLLATERAL);
  EXPECT_EQ(tracker.getReserve("box1")->totalDebt, 500000000u);
}

TEST_F(ReserveTrackerTest, DebtAtExactlyFullCollateralIsRejected) {
  ReserveTracker tracker;
  ASSERT_TRUE(tracker.open(path_, ReserveTracker::Config()).isOk());
  ASSERT_TRUE(tracker.updateReserve(makeReserve("box", 100)).isOk());
  auto result = tracker.addDebt("box", 100);
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, E_INSUFFICIENT_COLLATERAL);
  EXPECT_TRUE(tracker.addDebt("box", 99).isOk());
}

TEST_F(ReserveTrackerTest, LargeAmountsCompareExactly) {
  ReserveTracker tracker;
  ASSERT_TRUE(tracker.open(path_, ReserveTracker::Config()).isOk());
  const uint64_t twoPow53 = 1ULL << 53;
  ASSERT_TRUE(tracker.updateReserve(makeReserve("big", twoPow53 + 1)).isOk());

  // The ratio is just above 1 even though a double rounds it to 1.0
  auto accepted = tracker.addDebt("big", twoPow53);
  ASSERT_TRUE(accepted.isOk()) << accepted.error().message;
  EXPECT_FALSE(tracker.isCritical(accepted.value()));
  EXPECT_TRUE(tracker.isWarning(accepted.value()));

  auto atOne = tracker.addDebt("big", 1);
  ASSERT_TRUE(atOne.isError());
  EXPECT_EQ(atOne.error().code, E_INSUFFICIENT_COLLATERAL);
  EXPECT_EQ(tracker.getReserve("big")->totalDebt, twoPow53);
}

TEST_F(ReserveTrackerTest, RatioComparisonAtThresholds) {
  ExtendedReserveInfo info = makeReserve("box", 125);
  EXPECT_FALSE(info.ratioAtOrBelow(1.25));
  info.totalDebt = 100;
  EXPECT_TRUE(info.ratioAtOrBelow(1.25));
  EXPECT_FALSE(info.ratioAtOrBelow(1.0));
  info.collateralAmount = 126;
  EXPECT_FALSE(info.ratioAtOrBelow(1.25));
}

TEST_F(ReserveTrackerTest, WarningAndCriticalClassification) {
  ReserveTracker tracker;
  ASSERT_TRUE(tracker.open(path_, ReserveTracker::Config()).isOk());

  ExtendedReserveInfo healthy = makeReserve("healthy", 200);
  healthy.totalDebt = 100;
  ExtendedReserveInfo warning = makeReserve("warning", 120);
  warning.totalDebt = 100;
  ExtendedReserveInfo critical = makeReserve("critical", 90);
  critical.totalDebt = 100;
  ASSERT_TRUE(tracker.updateReserve(healthy).isOk());
  ASSERT_TRUE(tracker.updateReserve(warning).isOk());
  ASSERT_TRUE(tracker.updateReserve(critical).isOk());

  EXPECT_FALSE(tracker.isWarning(healthy));
  EXPECT_TRUE(tracker.isWarning(warning));
  EXPECT_FALSE(tracker.isCritical(warning));
  EXPECT_TRUE(tracker.isWarning(critical));
  EXPECT_TRUE(tracker.isCritical(critical));

  EXPECT_EQ(tracker.getWarningReserves().size(), 2u);
  auto criticalReserves = tracker.getCriticalReserves();
  ASSERT_EQ(criticalReserves.size(), 1u);
  EXPECT_EQ(criticalReserves[0].boxId, "critical");
}

TEST_F(ReserveTrackerTest, ConfiguredThresholdsApply) {
  ReserveTracker::Config config;
  config.warningRatio = 3.0;
  config.criticalRatio = 2.0;
  ReserveTracker tracker;
  ASSERT_TRUE(tracker.open(path_, config).isOk());
  ASSERT_TRUE(tracker.updateReserve(makeReserve("box", 1000)).isOk());

  EXPECT_TRUE(tracker.addDebt("box", 400).isOk());
  auto rejected = tracker.addDebt("box", 100);
  ASSERT_TRUE(rejected.isError());
  EXPECT_EQ(rejected.error().code, E_INSUFFICIENT_COLLATERAL);
  EXPECT_TRUE(tracker.isWarning(tracker.getReserve("box").value()));
}

TEST_F(ReserveTrackerTest, ReduceDebtBounds) {
  ReserveTracker tracker;
  ASSERT_TRUE(tracker.open(path_, ReserveTracker::Config()).isOk());
  ASSERT_TRUE(tracker.updateReserve(makeReserve("box", 1000)).isOk());
  ASSERT_TRUE(tracker.addDebt("box", 300).isOk());

  auto tooMuch = tracker.reduceDebt("box", 301);
  ASSERT_TRUE(tooMuch.isError());
  EXPECT_EQ(tooMuch.error().code, E_AMOUNT_EXCEEDS_DEBT);

  auto reduced = tracker.reduceDebt("box", 300);
  ASSERT_TRUE(reduced.isOk());
  EXPECT_EQ(reduced->totalDebt, 0u);
}

TEST_F(ReserveTrackerTest, UnknownReserve) {
  ReserveTracker tracker;
  ASSERT_TRUE(tracker.open(path_, ReserveTracker::Config()).isOk());
  auto missing = tracker.getReserve("nope");
  ASSERT_TRUE(missing.isError());
  EXPECT_EQ(missing.error().code, E_RESERVE_NOT_FOUND);
  EXPECT_EQ(tracker.addDebt("nope", 1).error().code, E_RESERVE_NOT_FOUND);
  EXPECT_EQ(tracker.updateReserve(makeReserve("", 1)).error().code, E_INVALID_RESERVE);
}

TEST_F(ReserveTrackerTest, OwnerIndexFollowsUpdates) {
  ReserveTracker tracker;
  ASSERT_TRUE(tracker.open(path_, ReserveTracker::Config()).isOk());
  auto other = crypto::generateKeyPair();
  ASSERT_TRUE(other.isOk());

  ASSERT_TRUE(tracker.updateReserve(makeReserve("a", 10)).isOk());
  ASSERT_TRUE(tracker.updateReserve(makeReserve("b", 20)).isOk());
  EXPECT_EQ(tracker.getReserveByOwner(owner_).size(), 2u);

  ExtendedReserveInfo moved = makeReserve("b", 20);
  moved.ownerPubkey = other->publicKey;
  ASSERT_TRUE(tracker.updateReserve(moved).isOk());
  EXPECT_EQ(tracker.getReserveByOwner(owner_).size(), 1u);
  auto otherReserves = tracker.getReserveByOwner(other->publicKey);
  ASSERT_EQ(otherReserves.size(), 1u);
  EXPECT_EQ(otherReserves[0].boxId, "b");
}

TEST_F(ReserveTrackerTest, SystemTotalsMatchSumOverManyReserves) {
  ReserveTracker tracker;
  ASSERT_TRUE(tracker.open(path_, ReserveTracker::Config()).isOk());

  for (uint64_t i = 0; i < 10000; ++i) {
    ASSERT_TRUE(
        tracker.updateReserve(makeReserve("box_" + std::to_string(i), 1000000000)).isOk());
  }

  SystemTotals totals = tracker.getSystemTotals();
  EXPECT_EQ(tracker.getReserveCount(), 10000u);
  EXPECT_EQ(totals.totalCollateral, 10000ULL * 1000000000ULL);
  EXPECT_EQ(totals.totalDebt, 0u);

  ASSERT_TRUE(tracker.addDebt("box_7", 10).isOk());
  ASSERT_TRUE(tracker.addDebt("box_9999", 25).isOk());
  EXPECT_EQ(tracker.getSystemTotals().totalDebt, 35u);
}

TEST_F(ReserveTrackerTest, ReservesSurviveReopen) {
  {
    ReserveTracker tracker;
    ASSERT_TRUE(tracker.open(path_, ReserveTracker::Config()).isOk());
    ASSERT_TRUE(tracker.updateReserve(makeReserve("persisted", 5000)).isOk());
    ASSERT_TRUE(tracker.addDebt("persisted", 1000).isOk());
  }

  ReserveTracker tracker;
  ASSERT_TRUE(tracker.open(path_, ReserveTracker::Config()).isOk());
  auto info = tracker.getReserve("persisted");
  ASSERT_TRUE(info.isOk());
  EXPECT_EQ(info->collateralAmount, 5000u);
  EXPECT_EQ(info->totalDebt, 1000u);
  EXPECT_EQ(tracker.getReserveByOwner(owner_).size(), 1u);
}

TEST_F(ReserveTrackerTest, EventsDriveReserveLifecycle) {
  ReserveTracker tracker;
  ASSERT_TRUE(tracker.open(path_, ReserveTracker::Config()).isOk());

  ReserveCreated created;
  created.boxId = "box";
  created.ownerPubkey = owner_;
  created.collateralAmount = 1000;
  created.height = 10;
  ASSERT_TRUE(tracker.applyEvent(created).isOk());
  ASSERT_TRUE(tracker.addDebt("box", 400).isOk());

  ReserveToppedUp toppedUp;
  toppedUp.boxId = "box";
  toppedUp.additionalCollateral = 500;
  toppedUp.height = 11;
  ASSERT_TRUE(tracker.applyEvent(toppedUp).isOk());
  EXPECT_EQ(tracker.getReserve("box")->collateralAmount, 1500u);
  EXPECT_EQ(tracker.getReserve("box")->lastUpdatedHeight, 11u);

  ReserveRedeemed redeemed;
  redeemed.boxId = "box";
  redeemed.redeemedAmount = 300;
  redeemed.height = 12;
  ASSERT_TRUE(tracker.applyEvent(redeemed).isOk());
  auto afterRedeem = tracker.getReserve("box");
  ASSERT_TRUE(afterRedeem.isOk());
  EXPECT_EQ(afterRedeem->collateralAmount, 1200u);
  EXPECT_EQ(afterRedeem->totalDebt, 100u);

  // A repeated creation event keeps the assigned debt
  created.collateralAmount = 2000;
  ASSERT_TRUE(tracker.applyEvent(created).isOk());
  EXPECT_EQ(tracker.getReserve("box")->totalDebt, 100u);

  ReserveSpent spent;
  spent.boxId = "box";
  spent.height = 13;
  ASSERT_TRUE(tracker.applyEvent(spent).isOk());
  EXPECT_TRUE(tracker.getReserve("box").isError());
  EXPECT_TRUE(tracker.getReserveByOwner(owner_).empty());
}

TEST_F(ReserveTrackerTest, EventsForUnknownReserveFail) {
  ReserveTracker tracker;
  ASSERT_TRUE(tracker.open(path_, ReserveTracker::Config()).isOk());
  ReserveToppedUp toppedUp;
  toppedUp.boxId = "ghost";
  toppedUp.additionalCollateral = 1;
  auto result = tracker.applyEvent(toppedUp);
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, E_RESERVE_NOT_FOUND);
}

TEST_F(ReserveTrackerTest, EventJsonParsing) {
  std::string ownerHex = utl::hexEncode(owner_);
  auto created = reserveEventFromJson(nlohmann::json{ { "type", "created" },
                                                      { "boxId", "b1" },
                                                      { "ownerPubkey", ownerHex },
                                                      { "collateralAmount", 42 },
                                                      { "height", 7 } });
  ASSERT_TRUE(created.isOk()) << created.error().message;
  ASSERT_TRUE(std::holds_alternative<ReserveCreated>(created.value()));
  EXPECT_EQ(std::get<ReserveCreated>(created.value()).collateralAmount, 42u);
  EXPECT_EQ(reserveEventBoxId(created.value()), "b1");

  auto spent = reserveEventFromJson(nlohmann::json{ { "type", "spent" }, { "boxId", "b1" } });
  ASSERT_TRUE(spent.isOk());
  EXPECT_TRUE(std::holds_alternative<ReserveSpent>(spent.value()));

  auto unknown = reserveEventFromJson(nlohmann::json{ { "type", "burned" }, { "boxId", "b1" } });
  ASSERT_TRUE(unknown.isError());
  EXPECT_EQ(unknown.error().code, E_INVALID_RESERVE);

  auto wrongType = reserveEventFromJson(nlohmann::json{
      { "type", "toppedUp" }, { "boxId", "b1" }, { "additionalCollateral", "many" } });
  ASSERT_TRUE(wrongType.isError());
  EXPECT_EQ(wrongType.error().code, E_INVALID_RESERVE);

  auto badOwner = reserveEventFromJson(nlohmann::json{ { "type", "created" },
                                                       { "boxId", "b1" },
                                                       { "ownerPubkey", "00" },
                                                       { "collateralAmount", 1 } });
  EXPECT_TRUE(badOwner.isError());
}
