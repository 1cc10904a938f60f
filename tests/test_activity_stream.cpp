#include "capture/activity_stream.h"
#include "support/fake_sources.h"
#include <gtest/gtest.h>
#include <vector>

using namespace tripsense;
using tripsense::test::FakeActivitySource;

class ActivityStreamTest : public ::testing::Test {
protected:
  void SetUp() override {
    stream_.set_callback(
        [this](const ActivityObservation &obs) { seen_.push_back(obs); });
    ASSERT_TRUE(stream_.init());
  }

  std::shared_ptr<FakeActivitySource> source_ =
      std::make_shared<FakeActivitySource>();
  ActivityStream stream_{source_, 75};
  std::vector<ActivityObservation> seen_;
};

TEST_F(ActivityStreamTest, MapsPlatformCodes) {
  EXPECT_EQ(ActivityStream::map_activity_code(activity_code::IN_VEHICLE),
            ActivityType::IN_VEHICLE);
  EXPECT_EQ(ActivityStream::map_activity_code(activity_code::ON_BICYCLE),
            ActivityType::ON_BICYCLE);
  EXPECT_EQ(ActivityStream::map_activity_code(activity_code::ON_FOOT),
            ActivityType::WALKING);
  EXPECT_EQ(ActivityStream::map_activity_code(activity_code::WALKING),
            ActivityType::WALKING);
  EXPECT_EQ(ActivityStream::map_activity_code(activity_code::RUNNING),
            ActivityType::RUNNING);
  EXPECT_EQ(ActivityStream::map_activity_code(activity_code::STILL),
            ActivityType::STILL);
  EXPECT_EQ(ActivityStream::map_activity_code(activity_code::TILTING),
            ActivityType::TILTING);
  EXPECT_EQ(ActivityStream::map_activity_code(activity_code::UNKNOWN),
            ActivityType::UNKNOWN);
  EXPECT_EQ(ActivityStream::map_activity_code(6), ActivityType::UNKNOWN);
  EXPECT_EQ(ActivityStream::map_activity_code(-3), ActivityType::UNKNOWN);
}

TEST_F(ActivityStreamTest, PublishesTypedObservations) {
  ASSERT_TRUE(stream_.start());
  EXPECT_TRUE(source_->registered());

  source_->fire(activity_code::ON_BICYCLE, transition_code::ENTER, 123456789,
                64);
  source_->fire(activity_code::ON_BICYCLE, transition_code::EXIT, 223456789);

  ASSERT_EQ(seen_.size(), 2u);
  EXPECT_EQ(seen_[0].activity_type, ActivityType::ON_BICYCLE);
  EXPECT_EQ(seen_[0].transition_kind, TransitionKind::ENTER);
  EXPECT_EQ(seen_[0].observed_at_nanos, 123456789);
  EXPECT_EQ(seen_[0].confidence, 64);
  EXPECT_EQ(seen_[1].transition_kind, TransitionKind::EXIT);
  EXPECT_EQ(seen_[1].confidence, 75);
}

TEST_F(ActivityStreamTest, CapsConfidenceAt100) {
  ASSERT_TRUE(stream_.start());
  source_->fire(activity_code::WALKING, transition_code::ENTER, 1, 250);
  ASSERT_EQ(seen_.size(), 1u);
  EXPECT_EQ(seen_[0].confidence, 100);
}

TEST_F(ActivityStreamTest, DropsExactDuplicates) {
  ASSERT_TRUE(stream_.start());
  source_->fire(activity_code::WALKING, transition_code::ENTER, 1000);
  source_->fire(activity_code::WALKING, transition_code::ENTER, 1000);
  source_->fire(activity_code::WALKING, transition_code::ENTER, 2000);

  EXPECT_EQ(seen_.size(), 2u);
  EXPECT_EQ(stream_.get_stats().duplicates, 1u);
}

TEST_F(ActivityStreamTest, DropsUnknownTransitionCodes) {
  ASSERT_TRUE(stream_.start());
  source_->fire(activity_code::WALKING, 7, 1000);
  EXPECT_TRUE(seen_.empty());
  EXPECT_EQ(stream_.get_stats().malformed, 1u);
}

TEST_F(ActivityStreamTest, RegistrationFailureFailsStart) {
  source_->fail_register = true;
  EXPECT_FALSE(stream_.start());
  EXPECT_FALSE(stream_.running());

  source_->fail_register = false;
  source_->throw_on_register = true;
  EXPECT_FALSE(stream_.start());

  source_->throw_on_register = false;
  EXPECT_TRUE(stream_.start());
  EXPECT_EQ(source_->registrations.load(), 3);
}

TEST_F(ActivityStreamTest, StopUnregistersAndSilences) {
  ASSERT_TRUE(stream_.start());
  ASSERT_TRUE(stream_.stop());
  EXPECT_FALSE(source_->registered());
  EXPECT_EQ(source_->unregistrations.load(), 1);
  EXPECT_FALSE(source_->fire(activity_code::WALKING, transition_code::ENTER, 1));
  EXPECT_TRUE(seen_.empty());
}

TEST(ActivityStreamNoSourceTest, InitFailsWithoutSource) {
  ActivityStream stream(nullptr, 75);
  EXPECT_FALSE(stream.init());
  EXPECT_FALSE(stream.start());
}
