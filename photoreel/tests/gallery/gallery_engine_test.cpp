/// @file gallery_engine_test.cpp
/// @brief End-to-end behaviour of GalleryEngine on a fake surface.
///
/// Covers: install and listing failure, teardown before the listing resolves,
/// fragment delivery through the frame timer, failure and retry, resize,
/// selection refresh and the fullscreen wiring.

#include "gallery/gallery_engine.hpp"

#include <gtest/gtest.h>

#include <QSignalSpy>

#include <map>
#include <memory>
#include <vector>

#include "gallery/gallery_test_fixture.hpp"

namespace photoreel::test {
namespace {

constexpr fragment_ref_t kHead = 7;

class GalleryEngineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    config_.resize_debounce_ms_  = 30;
    config_.quality_debounce_ms_ = 30;
    service_                     = std::make_shared<FakeFragmentService>();
    engine_ = std::make_unique<GalleryEngine>(surface_, service_, TestResolver(), config_);

    sections_                    = MakeSections(std::vector<size_t>(20, 10));
    for (size_t i = 0; i < sections_.size(); ++i) {
      data_[sections_[i].fragment_ref_] = MakeItems(10, 400, 400);
    }
  }

  void Install() {
    engine_->Start(kHead);
    service_->ResolveListing(sections_);
  }

  FakeSurface                                       surface_{1000.0, 800.0};
  GalleryConfig                                     config_;
  std::shared_ptr<FakeFragmentService>              service_;
  std::unique_ptr<GalleryEngine>                    engine_;
  std::vector<SectionEntry>                         sections_;
  std::map<fragment_ref_t, std::vector<ItemEntry>> data_;
};

TEST_F(GalleryEngineTest, Start_ListingResolves_InstallsAndRequestsBand) {
  QSignalSpy installed(engine_.get(), &GalleryEngine::Installed);
  engine_->Start(kHead);
  ASSERT_EQ(service_->listing_requests_, std::vector<fragment_ref_t>{kHead});
  EXPECT_FALSE(engine_->IsInstalled());

  service_->ResolveListing(sections_);
  ASSERT_EQ(installed.count(), 1);
  EXPECT_EQ(installed.takeFirst().at(0).toInt(), 20);
  EXPECT_TRUE(engine_->IsInstalled());
  EXPECT_GT(engine_->Store().BoundCount(), 0);
  EXPECT_EQ(service_->PendingFragments(), static_cast<size_t>(engine_->Store().BoundCount()));
  EXPECT_DOUBLE_EQ(surface_.content_height_, engine_->Store().TotalHeight());
  // min(350, 1000 / 3)
  EXPECT_NEAR(engine_->Windows().IdealHeight(), 1000.0 / 3.0, 1e-9);
}

TEST_F(GalleryEngineTest, ListingFailure_EmitsInstallFailed) {
  QSignalSpy failed(engine_.get(), &GalleryEngine::InstallFailed);
  engine_->Start(kHead);
  service_->FailListing("listing unavailable");

  ASSERT_EQ(failed.count(), 1);
  EXPECT_EQ(failed.takeFirst().at(0).toString(), QString("listing unavailable"));
  EXPECT_FALSE(engine_->IsInstalled());
  EXPECT_EQ(surface_.AliveCount(), 0);
}

TEST_F(GalleryEngineTest, UninstallBeforeListing_InstallsNothing) {
  QSignalSpy installed(engine_.get(), &GalleryEngine::Installed);
  engine_->Start(kHead);
  engine_->Uninstall();
  service_->ResolveListing(sections_);

  EXPECT_EQ(installed.count(), 0);
  EXPECT_FALSE(engine_->IsInstalled());
  EXPECT_EQ(service_->PendingFragments(), 0u);
  EXPECT_EQ(surface_.AliveCount(), 0);
}

TEST_F(GalleryEngineTest, EngineDestroyed_LateFragmentsIgnored) {
  Install();
  ASSERT_GT(service_->PendingFragments(), 0u);
  engine_.reset();
  EXPECT_EQ(surface_.AliveCount(), 0);

  EXPECT_GT(service_->ResolveAll(data_), 0);
  EXPECT_EQ(surface_.Record(0).set_rows_count_, 0);
}

TEST_F(GalleryEngineTest, FragmentDelivered_LaidOutOnNextFrame) {
  Install();
  ASSERT_TRUE(service_->ResolveFragment(sections_[0].fragment_ref_, data_[100]));
  EXPECT_TRUE(engine_->IsFramePending());
  EXPECT_EQ(surface_.Record(0).set_rows_count_, 0);

  ProcessEvents(50);
  const auto& record = surface_.Record(0);
  EXPECT_EQ(record.set_rows_count_, 1);
  EXPECT_FALSE(record.rows_.empty());
  // The first rows sit in the viewport, so they are promoted right away.
  EXPECT_EQ(record.tiers_.at(0), QualityTier::Medium);
  EXPECT_DOUBLE_EQ(surface_.content_height_, engine_->Store().TotalHeight());
}

TEST_F(GalleryEngineTest, FragmentFailure_ShowsErrorAndRetryRecovers) {
  Install();
  QSignalSpy failed(engine_.get(), &GalleryEngine::SectionFailed);
  ASSERT_TRUE(service_->FailFragment(sections_[1].fragment_ref_, "timeout"));

  ASSERT_EQ(failed.count(), 1);
  EXPECT_EQ(failed.takeFirst().at(0).toInt(), 1);
  EXPECT_EQ(surface_.Record(1).error_, QString("timeout"));

  const size_t before = service_->fragment_requests_.size();
  engine_->OnRetryRequested(1);
  ASSERT_EQ(service_->fragment_requests_.size(), before + 1);
  EXPECT_EQ(service_->fragment_requests_.back(), sections_[1].fragment_ref_);

  ASSERT_TRUE(service_->ResolveFragment(sections_[1].fragment_ref_, data_[101]));
  ProcessEvents(50);
  EXPECT_EQ(surface_.Record(1).set_rows_count_, 1);
}

TEST_F(GalleryEngineTest, ScrollNotification_MovesBand) {
  Install();
  ASSERT_TRUE(engine_->Store().IsBound(0));

  surface_.UserScroll(15000.0);
  EXPECT_TRUE(engine_->IsFramePending());
  ProcessEvents(50);

  EXPECT_FALSE(engine_->Store().IsBound(0));
  EXPECT_TRUE(engine_->Windows().Band().Contains(15));
}

TEST_F(GalleryEngineTest, WidthChange_ReestimatesAndRelayouts) {
  Install();
  ASSERT_TRUE(service_->ResolveFragment(sections_[0].fragment_ref_, data_[100]));
  ProcessEvents(50);
  const double loaded_height = engine_->Store().Height(0);

  surface_.UserResize(600.0, 800.0);
  EXPECT_TRUE(engine_->IsResizePending());
  ProcessEvents(config_.resize_debounce_ms_ + 100);

  EXPECT_DOUBLE_EQ(engine_->Windows().IdealHeight(), 200.0);
  // Unloaded: header + max(ideal, ideal^2 / width * count)
  EXPECT_NEAR(engine_->Store().Height(5), 50.0 + 200.0 * 200.0 / 600.0 * 10.0, 1e-9);
  EXPECT_EQ(surface_.Record(0).set_rows_count_, 2);
  EXPECT_NE(engine_->Store().Height(0), loaded_height);
}

TEST_F(GalleryEngineTest, HeightOnlyResize_KeepsLayout) {
  Install();
  ASSERT_TRUE(service_->ResolveFragment(sections_[0].fragment_ref_, data_[100]));
  ProcessEvents(50);

  surface_.UserResize(1000.0, 600.0);
  ProcessEvents(config_.resize_debounce_ms_ + 100);
  EXPECT_EQ(surface_.Record(0).set_rows_count_, 1);
}

TEST_F(GalleryEngineTest, WidthChangeAtThreshold_KeepsLayout) {
  Install();
  ASSERT_TRUE(service_->ResolveFragment(sections_[0].fragment_ref_, data_[100]));
  ProcessEvents(50);

  surface_.UserResize(1000.0 + config_.resize_threshold_px_, 800.0);
  ProcessEvents(config_.resize_debounce_ms_ + 100);
  EXPECT_EQ(surface_.Record(0).set_rows_count_, 1);
  EXPECT_NEAR(engine_->Windows().IdealHeight(), 1000.0 / 3.0, 1e-9);
}

TEST_F(GalleryEngineTest, SelectorClick_RefreshesBoundViews) {
  Install();
  QSignalSpy changed(engine_.get(), &GalleryEngine::SelectionChanged);
  engine_->OnSelectorClicked({2, ItemLocation::kHeader}, false);

  EXPECT_EQ(changed.count(), 1);
  EXPECT_TRUE(engine_->IsSectionSelected(2));
  EXPECT_TRUE(engine_->IsItemSelected(2, "img4"));
  ProcessEvents(50);
  EXPECT_EQ(surface_.Record(2).refresh_count_, 1);
  EXPECT_EQ(surface_.Record(3).refresh_count_, 0);
}

TEST_F(GalleryEngineTest, ItemActivated_OpensFullscreenAtLargeTier) {
  Install();
  ASSERT_TRUE(service_->ResolveFragment(sections_[0].fragment_ref_, data_[100]));
  ProcessEvents(50);

  QSignalSpy visible(engine_.get(), &GalleryEngine::FullscreenVisibilityChanged);
  QSignalSpy source(engine_.get(), &GalleryEngine::FullscreenSourceChanged);
  engine_->OnItemActivated({0, 1});

  ASSERT_EQ(visible.count(), 1);
  EXPECT_TRUE(visible.takeFirst().at(0).toBool());
  ASSERT_EQ(source.count(), 1);
  EXPECT_EQ(source.takeFirst().at(0).toString(), QString("large/img1"));
  EXPECT_FALSE(surface_.scroll_enabled_);
  EXPECT_FALSE(surface_.scroll_requests_.empty());

  EXPECT_TRUE(engine_->Fullscreen().HandleKey(Qt::Key_Right));
  ASSERT_EQ(source.count(), 1);
  EXPECT_EQ(source.takeFirst().at(0).toString(), QString("large/img2"));

  engine_->Fullscreen().HandleKey(Qt::Key_Space);
  EXPECT_TRUE(surface_.scroll_enabled_);
}

TEST_F(GalleryEngineTest, Uninstall_StopsReactingToSurface) {
  Install();
  engine_->Uninstall();
  EXPECT_EQ(surface_.AliveCount(), 0);
  EXPECT_EQ(engine_->Store().Count(), 0);

  surface_.UserScroll(4000.0);
  EXPECT_FALSE(engine_->IsFramePending());

  // Fetches issued before the teardown are dropped.
  service_->ResolveAll(data_);
  ProcessEvents(50);
  EXPECT_EQ(surface_.Record(0).set_rows_count_, 0);
}

}  // namespace
}  // namespace photoreel::test
