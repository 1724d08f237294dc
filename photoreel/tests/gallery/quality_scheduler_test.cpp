#include "gallery/quality_scheduler.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <vector>

#include "gallery/gallery_test_fixture.hpp"
#include "gallery/window_scheduler.hpp"

namespace photoreel {
namespace {

using test::FakeHost;
using test::FakeSurface;
using test::MakeItems;
using test::MakeSections;
using test::ProcessEvents;

class QualitySchedulerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    config_.quality_debounce_ms_ = 40;
    store_.Install(MakeSections({30, 10, 10, 10, 10, 10, 10, 10}), config_.header_height_, 300.0,
                   surface_.ContentWidth());
    windows_ = std::make_unique<WindowScheduler>(store_, surface_, host_, config_,
                                                 test::TestResolver());
    windows_->SetIdealHeight(300.0);
    windows_->SetFragmentRequester(
        [this](section_idx_t section, fragment_ref_t, uint64_t generation) {
          generations_[section] = generation;
        });
    quality_ = std::make_unique<QualityScheduler>(store_, surface_, config_, test::TestResolver(),
                                                  [this]() { return windows_->Band(); });

    windows_->Tick();
    // 30 squares: nine rows at 1000/3 and a free last row at 300.
    windows_->Receive(0, generations_[0],
                      std::make_shared<const std::vector<ItemEntry>>(MakeItems(30, 400, 400)));
    windows_->Tick();
    quality_->Reset(0.0, 0);
  }

  auto Tiers() -> std::map<size_t, QualityTier>& { return surface_.Record(0).tiers_; }

  FakeSurface                       surface_{1000.0, 800.0};
  FakeHost                          host_;
  GalleryConfig                     config_;
  SectionStore                      store_;
  std::unique_ptr<WindowScheduler>  windows_;
  std::unique_ptr<QualityScheduler> quality_;
  std::map<section_idx_t, uint64_t> generations_;
};

TEST_F(QualitySchedulerTest, AtRest_PromotesRowsNearViewport) {
  ASSERT_EQ(store_.Rows(0).size(), 10u);
  quality_->OnTick(0.0, 1000, 300.0);

  // Window (-800, 1600) relative to the section; rows start at 50 + k * 333.3.
  for (size_t k = 0; k < 5; ++k) {
    EXPECT_EQ(Tiers()[k], QualityTier::Medium) << "row " << k;
  }
  EXPECT_EQ(Tiers().count(5), 0u);
  EXPECT_EQ(surface_.Record(0).source_updates_, 5);
  EXPECT_EQ(surface_.Record(0).rows_[0].tiles_[0].locator_, QString("medium/img0"));
  EXPECT_EQ(quality_->DesiredTier(0, 5), QualityTier::Small);
  EXPECT_EQ(quality_->DesiredTier(0, 4), QualityTier::Medium);
}

TEST_F(QualitySchedulerTest, DesiredTier_RowOutOfRange_Throws) {
  EXPECT_THROW(quality_->DesiredTier(0, store_.Rows(0).size()), std::out_of_range);
}

TEST_F(QualitySchedulerTest, SlowScroll_OnlyChangedRowsUpdated) {
  quality_->OnTick(0.0, 1000, 300.0);
  ASSERT_EQ(surface_.Record(0).source_updates_, 5);

  surface_.scroll_ = 1000.0;
  quality_->OnTick(1000.0, 2000, 300.0);
  EXPECT_FALSE(quality_->IsPending());
  EXPECT_DOUBLE_EQ(quality_->LastVelocity(), 1.0);
  // Window (200, 2600): rows 5..7 join, nothing leaves.
  EXPECT_EQ(surface_.Record(0).source_updates_, 8);
  EXPECT_EQ(Tiers()[7], QualityTier::Medium);
}

TEST_F(QualitySchedulerTest, FastScroll_DefersUntilQuiet) {
  quality_->OnTick(0.0, 1000, 300.0);
  const int before = surface_.Record(0).source_updates_;

  surface_.scroll_ = 5000.0;
  quality_->OnTick(5000.0, 1010, 300.0);
  EXPECT_TRUE(quality_->IsPending());
  EXPECT_EQ(surface_.Record(0).source_updates_, before);

  ProcessEvents(config_.quality_debounce_ms_ + 100);
  EXPECT_FALSE(quality_->IsPending());
  for (size_t k = 0; k < 5; ++k) {
    EXPECT_EQ(Tiers()[k], QualityTier::Small) << "row " << k;
  }
}

TEST_F(QualitySchedulerTest, MovementWithoutElapsedTime_CountsAsFast) {
  quality_->OnTick(300.0, 0, 300.0);
  EXPECT_TRUE(quality_->IsPending());
  quality_->Cancel();
  EXPECT_FALSE(quality_->IsPending());
}

}  // namespace
}  // namespace photoreel
