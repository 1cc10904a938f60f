#include "detection/detection_controller.h"
#include "replay/replay_source.h"
#include "storage/sqlite_journey_store.h"
#include <atomic>
#include <condition_variable>
#include <gtest/gtest.h>
#include <mutex>
#include <sstream>

using namespace tripsense;

namespace {

std::vector<TraceEvent> load(const std::string &text) {
  std::istringstream in(text);
  TraceReader reader("inline");
  EXPECT_TRUE(reader.read(in));
  return reader.events();
}

// 10 minute walk heading north, one fix every 30 s
std::string walking_trace() {
  std::ostringstream oss;
  oss << "activity,0,WALKING,ENTER,90\n";
  for (int i = 1; i < 20; ++i) {
    oss << "gps," << i * 30000 << "," << 48.8500 + i * 0.0005
        << ",2.3500,10\n";
  }
  oss << "activity,600000,STILL,ENTER,95\n";
  return oss.str();
}

} // namespace

TEST(ReplaySourceTest, DeliversEventsOnTheirOffsets) {
  auto clock = std::make_shared<ScaledClock>(1000.0);
  ReplaySource source(load("activity,0,IN_VEHICLE,ENTER,70\n"
                           "gps,1000,48.85,2.35,5\n"
                           "activity,2000,IN_VEHICLE,EXIT\n"),
                      clock);

  std::vector<std::pair<int, int64_t>> transitions;
  std::mutex mutex;
  source.register_transitions(
      [&](int code, int transition, int64_t nanos, int confidence) {
        std::lock_guard<std::mutex> lock(mutex);
        transitions.emplace_back(code, nanos);
        if (transition == transition_code::ENTER)
          EXPECT_EQ(confidence, 70);
        else
          EXPECT_EQ(confidence, -1);
      });

  ASSERT_TRUE(source.init());
  ASSERT_TRUE(source.start());
  ASSERT_TRUE(source.wait_until_finished(std::chrono::seconds(5)));
  source.stop();

  std::lock_guard<std::mutex> lock(mutex);
  ASSERT_EQ(transitions.size(), 2u);
  EXPECT_EQ(transitions[0].first, activity_code::IN_VEHICLE);
  EXPECT_EQ(transitions[1].second - transitions[0].second, 2000000000LL);

  auto stats = source.get_stats();
  EXPECT_EQ(stats.activity_delivered, 2u);
  // no location request was active
  EXPECT_EQ(stats.fixes_delivered, 0u);
  EXPECT_EQ(stats.fixes_dropped, 1u);
}

TEST(ReplaySourceTest, StopInterruptsPlayback) {
  auto clock = std::make_shared<ScaledClock>(1.0);
  ReplaySource source(load("activity,0,WALKING,ENTER\n"
                           "activity,3600000,STILL,ENTER\n"),
                      clock);
  std::atomic<int> delivered{0};
  source.register_transitions([&](int, int, int64_t, int) { delivered++; });

  ASSERT_TRUE(source.start());
  EXPECT_FALSE(source.wait_until_finished(std::chrono::milliseconds(100)));
  EXPECT_TRUE(source.stop());
  EXPECT_FALSE(source.finished());
  EXPECT_EQ(delivered.load(), 1);
}

TEST(ReplaySourceTest, MapsActivityCodes) {
  EXPECT_EQ(ReplaySource::to_activity_code(ActivityType::WALKING),
            activity_code::WALKING);
  EXPECT_EQ(ReplaySource::to_activity_code(ActivityType::ON_BICYCLE),
            activity_code::ON_BICYCLE);
  EXPECT_EQ(ReplaySource::to_activity_code(ActivityType::STILL),
            activity_code::STILL);
}

TEST(ReplaySourceTest, RecordedWalkBecomesGpsJourney) {
  auto clock = std::make_shared<ScaledClock>(1000.0);
  auto store = std::make_shared<SqliteJourneyStore>(":memory:", clock);
  auto replay = std::make_shared<ReplaySource>(load(walking_trace()), clock);

  DetectionConfig config;
  DetectionController controller(config, store, replay, replay, nullptr,
                                 clock);

  std::mutex mutex;
  std::condition_variable cv;
  std::vector<LocalJourney> detected;
  controller.on_trip_detected([&](const LocalJourney &journey) {
    std::lock_guard<std::mutex> lock(mutex);
    detected.push_back(journey);
    cv.notify_all();
  });

  ASSERT_EQ(controller.start(), StartMode::FULL);
  ASSERT_TRUE(replay->init());
  ASSERT_TRUE(replay->start());
  ASSERT_TRUE(replay->wait_until_finished(std::chrono::seconds(10)));

  {
    std::unique_lock<std::mutex> lock(mutex);
    ASSERT_TRUE(cv.wait_for(lock, std::chrono::seconds(10),
                            [&] { return !detected.empty(); }));
  }
  replay->stop();
  controller.stop();

  const LocalJourney &journey = detected.front();
  EXPECT_EQ(journey.detected_transport_type, TransportType::MARCHE);
  EXPECT_EQ(journey.duration_minutes, 10);
  EXPECT_TRUE(journey.is_gps_based_distance);
  EXPECT_GE(journey.gps_points_count, 18);
  EXPECT_NEAR(journey.distance_km, 1.0, 0.1);
  ASSERT_TRUE(journey.start_latitude.has_value());
  EXPECT_LT(*journey.start_latitude, *journey.end_latitude);
  EXPECT_EQ(journey.place_departure.rfind("GPS: (", 0), 0u);
  EXPECT_EQ(controller.get_pending_count(), 1);
}
