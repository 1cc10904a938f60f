#include "replay/trace_reader.h"
#include <gtest/gtest.h>
#include <sstream>

using namespace tripsense;

TEST(TraceReaderTest, ParsesActivityLines) {
  auto event = TraceReader::parse_line("activity,1500,WALKING,ENTER,88");
  ASSERT_TRUE(event.has_value());
  EXPECT_EQ(event->kind, TraceEventKind::ACTIVITY);
  EXPECT_EQ(event->offset_ms, 1500);
  EXPECT_EQ(event->activity, ActivityType::WALKING);
  EXPECT_EQ(event->transition, TransitionKind::ENTER);
  EXPECT_EQ(event->confidence, 88);

  auto no_confidence = TraceReader::parse_line("activity, 0, STILL, EXIT");
  ASSERT_TRUE(no_confidence.has_value());
  EXPECT_EQ(no_confidence->activity, ActivityType::STILL);
  EXPECT_EQ(no_confidence->transition, TransitionKind::EXIT);
  EXPECT_EQ(no_confidence->confidence, -1);
}

TEST(TraceReaderTest, ParsesGpsLines) {
  auto event = TraceReader::parse_line("gps,60000,48.8566,2.3522,12.5");
  ASSERT_TRUE(event.has_value());
  EXPECT_EQ(event->kind, TraceEventKind::GPS);
  EXPECT_EQ(event->offset_ms, 60000);
  EXPECT_DOUBLE_EQ(event->latitude, 48.8566);
  EXPECT_DOUBLE_EQ(event->longitude, 2.3522);
  EXPECT_FLOAT_EQ(event->accuracy_m, 12.5f);
}

TEST(TraceReaderTest, LocationErrorKeepsCommasInMessage) {
  auto event =
      TraceReader::parse_line("location_error,900,provider lost, retrying");
  ASSERT_TRUE(event.has_value());
  EXPECT_EQ(event->kind, TraceEventKind::LOCATION_ERROR);
  EXPECT_EQ(event->message, "provider lost, retrying");
}

TEST(TraceReaderTest, RejectsMalformedLines) {
  EXPECT_FALSE(TraceReader::parse_line("activity,10,DRIVING,ENTER").has_value());
  EXPECT_FALSE(TraceReader::parse_line("activity,10,WALKING,START").has_value());
  EXPECT_FALSE(TraceReader::parse_line("activity,abc,WALKING,ENTER").has_value());
  EXPECT_FALSE(TraceReader::parse_line("activity,10,WALKING,ENTER,high").has_value());
  EXPECT_FALSE(TraceReader::parse_line("activity,-5,WALKING,ENTER").has_value());
  EXPECT_FALSE(TraceReader::parse_line("gps,10,48.85,2.35").has_value());
  EXPECT_FALSE(TraceReader::parse_line("gps,10,north,2.35,5").has_value());
  EXPECT_FALSE(TraceReader::parse_line("wifi,10,home").has_value());
  EXPECT_FALSE(TraceReader::parse_line("nonsense").has_value());
}

TEST(TraceReaderTest, ReadsSortsAndCountsMalformed) {
  std::istringstream in("# walk to the station\n"
                        "\n"
                        "activity,0,WALKING,ENTER,90\n"
                        "gps,30000,48.8566,2.3522,8\n"
                        "gps,20000,48.8570,2.3530,8\n"
                        "bogus line\n"
                        "activity,30000,STILL,ENTER\n"
                        "location_error,25000,timeout\n");
  TraceReader reader("unused");
  ASSERT_TRUE(reader.read(in));

  const auto &events = reader.events();
  ASSERT_EQ(events.size(), 5u);
  EXPECT_EQ(reader.malformed_lines(), 1u);
  EXPECT_EQ(reader.duration_ms(), 30000);

  EXPECT_EQ(events[0].offset_ms, 0);
  EXPECT_EQ(events[1].offset_ms, 20000);
  EXPECT_EQ(events[2].kind, TraceEventKind::LOCATION_ERROR);
  // equal offsets keep file order
  EXPECT_EQ(events[3].kind, TraceEventKind::GPS);
  EXPECT_EQ(events[4].kind, TraceEventKind::ACTIVITY);
  EXPECT_EQ(events[4].activity, ActivityType::STILL);
}

TEST(TraceReaderTest, EmptyTraceHasZeroDuration) {
  std::istringstream in("# nothing recorded\n");
  TraceReader reader("unused");
  ASSERT_TRUE(reader.read(in));
  EXPECT_TRUE(reader.events().empty());
  EXPECT_EQ(reader.duration_ms(), 0);
}

TEST(TraceReaderTest, MissingFileFailsToOpen) {
  TraceReader reader("/nonexistent/trace.csv");
  EXPECT_FALSE(reader.open());
}
